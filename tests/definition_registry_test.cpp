#include <gtest/gtest.h>

#include <algorithm>
#include <any>
#include <string>
#include <vector>

#include "wireup/definition_registry.hpp"
#include "wireup/errors.hpp"

using wireup::DefinitionRegistry;
using wireup::ObjectDefinition;
using wireup::Scope;
using wireup::ValueSpec;

TEST(DefinitionRegistryTest, RegistersInOrder)
{
    DefinitionRegistry registry;
    ASSERT_TRUE(registry.registerDefinition("b", ObjectDefinition("test.B")));
    ASSERT_TRUE(registry.registerDefinition("a", ObjectDefinition("test.A")));

    EXPECT_EQ(registry.names(), (std::vector<std::string>{"b", "a"}));
    EXPECT_EQ(registry.count(), 2u);
    EXPECT_TRUE(registry.containsDefinition("a"));
    EXPECT_FALSE(registry.containsDefinition("c"));
    EXPECT_EQ(registry.definition("a")->typeName(), "test.A");
    EXPECT_EQ(registry.definition("c"), nullptr);
}

TEST(DefinitionRegistryTest, RejectsInvalidDefinitions)
{
    DefinitionRegistry registry;

    EXPECT_EQ(registry.registerDefinition("", ObjectDefinition("test.A")).code(), ResultCode::InvalidArgument);
    EXPECT_EQ(registry.registerDefinition("empty", ObjectDefinition()).code(), ResultCode::DefinitionError);
    EXPECT_EQ(registry.registerDefinition("self", ObjectDefinition::child("self")).code(),
              ResultCode::DefinitionError);
    EXPECT_EQ(registry.registerDefinition("orphan", ObjectDefinition().setFactoryObject("factory")).code(),
              ResultCode::DefinitionError);

    // type 없는 abstract template 은 허용된다.
    EXPECT_TRUE(registry.registerDefinition("template", ObjectDefinition().setAbstract(true)));
}

TEST(DefinitionRegistryTest, OverridingCanBeDisabled)
{
    DefinitionRegistry registry;
    ASSERT_TRUE(registry.registerDefinition("a", ObjectDefinition("test.A")));
    ASSERT_TRUE(registry.registerDefinition("a", ObjectDefinition("test.B")));
    EXPECT_EQ(registry.definition("a")->typeName(), "test.B");
    EXPECT_EQ(registry.names(), std::vector<std::string>{"a"});

    registry.setAllowDefinitionOverriding(false);
    auto result = registry.registerDefinition("a", ObjectDefinition("test.C"));
    EXPECT_EQ(result.code(), ResultCode::AlreadyExists);
    EXPECT_EQ(registry.definition("a")->typeName(), "test.B");
}

TEST(DefinitionRegistryTest, FrozenRegistryRejectsChanges)
{
    DefinitionRegistry registry;
    ASSERT_TRUE(registry.registerDefinition("a", ObjectDefinition("test.A")));
    registry.freeze();

    EXPECT_TRUE(registry.isFrozen());
    EXPECT_EQ(registry.registerDefinition("b", ObjectDefinition("test.B")).code(), ResultCode::InvalidState);
    EXPECT_EQ(registry.removeDefinition("a").code(), ResultCode::InvalidState);
    EXPECT_EQ(registry.updateDefinition("a", [](ObjectDefinition& def) { def.setTypeName("test.C"); }).code(),
              ResultCode::InvalidState);
    EXPECT_EQ(registry.definition("a")->typeName(), "test.A");
}

// What: updateDefinition 은 등록된 definition 객체를 교체하지 않는다.
TEST(DefinitionRegistryTest, UpdateKeepsDefinitionIdentity)
{
    DefinitionRegistry registry;
    ASSERT_TRUE(registry.registerDefinition("a", ObjectDefinition("test.A")));
    auto before = registry.definition("a");
    auto merged_before = registry.merged("a");

    ASSERT_TRUE(registry.updateDefinition("a", [](ObjectDefinition& def) { def.setTypeName("test.B"); }));

    EXPECT_EQ(registry.definition("a"), before);
    EXPECT_EQ(before->typeName(), "test.B");
    // 병합 결과는 다시 만들어진다.
    EXPECT_NE(registry.merged("a"), merged_before);
    EXPECT_EQ(registry.merged("a")->definition.typeName(), "test.B");

    EXPECT_EQ(registry.updateDefinition("missing", [](ObjectDefinition&) {}).code(), ResultCode::NotFound);
}

TEST(DefinitionRegistryTest, RemoveDefinition)
{
    DefinitionRegistry registry;
    ASSERT_TRUE(registry.registerDefinition("a", ObjectDefinition("test.A")));
    ASSERT_TRUE(registry.registerDefinition("b", ObjectDefinition("test.B")));

    EXPECT_TRUE(registry.removeDefinition("a"));
    EXPECT_EQ(registry.names(), std::vector<std::string>{"b"});
    EXPECT_EQ(registry.removeDefinition("a").code(), ResultCode::NotFound);
}

// What: child definition 은 parent 의 값을 물려받고 명시한 값으로 덮어쓴다.
// How:  abstract parent 에 scope / property / init method 를 두고 child 에서 일부를 바꾼다.
TEST(DefinitionRegistryTest, MergesParentIntoChild)
{
    DefinitionRegistry registry;
    ASSERT_TRUE(registry.registerDefinition("base", ObjectDefinition("test.Base")
                                                        .setAbstract(true)
                                                        .setScope(Scope::Prototype)
                                                        .setInitMethod("start")
                                                        .setPrimary(true)
                                                        .property("host", ValueSpec::of(std::string("localhost")))
                                                        .property("port", ValueSpec::of(80))));
    ASSERT_TRUE(registry.registerDefinition("child", ObjectDefinition::child("base")
                                                         .property("port", ValueSpec::of(8080))));

    auto merged = registry.merged("child");
    const ObjectDefinition& def = merged->definition;

    EXPECT_EQ(merged->name, "child");
    EXPECT_EQ(def.typeName(), "test.Base");
    EXPECT_TRUE(def.isPrototype());
    EXPECT_EQ(def.initMethod(), "start");
    EXPECT_TRUE(def.parentName().empty());
    // abstract / primary 는 상속되지 않는다.
    EXPECT_FALSE(def.isAbstract());
    EXPECT_FALSE(def.isPrimary());

    ASSERT_NE(def.properties().get("host"), nullptr);
    ASSERT_NE(def.properties().get("port"), nullptr);
    EXPECT_EQ(std::any_cast<int>(def.properties().get("port")->literalValue()), 8080);
    EXPECT_EQ(def.properties().size(), 2u);
}

TEST(DefinitionRegistryTest, MergeResolvesParentThroughAlias)
{
    DefinitionRegistry registry;
    ASSERT_TRUE(registry.registerDefinition("base", ObjectDefinition("test.Base").setAbstract(true)));
    ASSERT_TRUE(registry.registerAlias("base", "template"));
    ASSERT_TRUE(registry.registerDefinition("child", ObjectDefinition::child("template")));

    EXPECT_EQ(registry.merged("child")->definition.typeName(), "test.Base");
}

TEST(DefinitionRegistryTest, MergeFailures)
{
    DefinitionRegistry registry;
    ASSERT_TRUE(registry.registerDefinition("a", ObjectDefinition::child("b")));
    ASSERT_TRUE(registry.registerDefinition("b", ObjectDefinition::child("a")));
    ASSERT_TRUE(registry.registerDefinition("lost", ObjectDefinition::child("nowhere")));

    EXPECT_THROW(registry.merged("a"), wireup::DefinitionError);
    EXPECT_THROW(registry.merged("lost"), wireup::DefinitionError);
    EXPECT_THROW(registry.merged("unknown"), wireup::NoSuchDefinitionError);
}

TEST(AliasRegistryTest, ResolvesAliasChains)
{
    DefinitionRegistry registry;
    ASSERT_TRUE(registry.registerAlias("service", "svc"));
    ASSERT_TRUE(registry.registerAlias("svc", "s"));

    EXPECT_TRUE(registry.isAlias("s"));
    EXPECT_FALSE(registry.isAlias("service"));
    EXPECT_EQ(registry.canonicalName("s"), "service");
    EXPECT_EQ(registry.canonicalName("service"), "service");

    auto aliases = registry.aliasesOf("service");
    std::sort(aliases.begin(), aliases.end());
    EXPECT_EQ(aliases, (std::vector<std::string>{"s", "svc"}));
}

TEST(AliasRegistryTest, RejectsCyclesAndConflicts)
{
    DefinitionRegistry registry;
    ASSERT_TRUE(registry.registerAlias("a", "b"));

    EXPECT_EQ(registry.registerAlias("b", "a").code(), ResultCode::InvalidArgument);
    EXPECT_EQ(registry.registerAlias("a", "b").code(), ResultCode::DuplicateIgnored);
    EXPECT_EQ(registry.registerAlias("", "x").code(), ResultCode::InvalidArgument);

    registry.setAllowAliasOverriding(false);
    EXPECT_EQ(registry.registerAlias("c", "b").code(), ResultCode::AlreadyExists);
    EXPECT_EQ(registry.canonicalName("b"), "a");

    registry.setAllowAliasOverriding(true);
    EXPECT_TRUE(registry.registerAlias("c", "b"));
    EXPECT_EQ(registry.canonicalName("b"), "c");

    EXPECT_TRUE(registry.removeAlias("b"));
    EXPECT_EQ(registry.removeAlias("b").code(), ResultCode::NotFound);
}
