#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "wireup/container_config.hpp"

using wireup::ContainerConfigLoader;
using wireup::ContainerSettings;
using wireup::aop::AutoProxyMode;

TEST(ContainerConfigTest, MissingSectionUsesDefaults)
{
    auto result = ContainerConfigLoader::loadString("log:\n  \"*\":\n    level: info\n");
    ASSERT_TRUE(result);

    const ContainerSettings& s = result.value();
    EXPECT_TRUE(s.allow_circular_references);
    EXPECT_FALSE(s.allow_raw_injection);
    EXPECT_TRUE(s.allow_definition_overriding);
    EXPECT_TRUE(s.allow_alias_overriding);
    EXPECT_EQ(s.auto_proxy, AutoProxyMode::None);
    EXPECT_FALSE(s.proxy_target_class);
    EXPECT_FALSE(s.expose_proxy);
}

TEST(ContainerConfigTest, ReadsFullSection)
{
    const char* yaml =
        "container:\n"
        "  allow_circular_references: false\n"
        "  allow_raw_injection: true\n"
        "  allow_definition_overriding: false\n"
        "  allow_alias_overriding: false\n"
        "  auto_proxy:\n"
        "    mode: aspect\n"
        "    proxy_target_class: true\n"
        "    expose_proxy: true\n";

    auto result = ContainerConfigLoader::loadString(yaml);
    ASSERT_TRUE(result);

    const ContainerSettings& s = result.value();
    EXPECT_FALSE(s.allow_circular_references);
    EXPECT_TRUE(s.allow_raw_injection);
    EXPECT_FALSE(s.allow_definition_overriding);
    EXPECT_FALSE(s.allow_alias_overriding);
    EXPECT_EQ(s.auto_proxy, AutoProxyMode::Aspect);
    EXPECT_TRUE(s.proxy_target_class);
    EXPECT_TRUE(s.expose_proxy);
}

TEST(ContainerConfigTest, PartialSectionKeepsDefaults)
{
    auto result = ContainerConfigLoader::loadString("container:\n  allow_raw_injection: true\n");
    ASSERT_TRUE(result);

    EXPECT_TRUE(result.value().allow_raw_injection);
    EXPECT_TRUE(result.value().allow_circular_references);
    EXPECT_EQ(result.value().auto_proxy, AutoProxyMode::None);
}

TEST(ContainerConfigTest, RejectsInvalidValues)
{
    auto bad_mode = ContainerConfigLoader::loadString("container:\n  auto_proxy:\n    mode: sometimes\n");
    EXPECT_EQ(bad_mode.code(), ResultCode::InvalidArgument);

    auto bad_yaml = ContainerConfigLoader::loadString("container: [unclosed\n");
    EXPECT_EQ(bad_yaml.code(), ResultCode::InvalidArgument);
}

TEST(ContainerConfigTest, ParsesModeCaseInsensitively)
{
    EXPECT_EQ(ContainerConfigLoader::parseAutoProxyMode("Annotation").value(), AutoProxyMode::Annotation);
    EXPECT_EQ(ContainerConfigLoader::parseAutoProxyMode("INFRASTRUCTURE").value(), AutoProxyMode::Infrastructure);
    EXPECT_EQ(ContainerConfigLoader::parseAutoProxyMode("").value(), AutoProxyMode::None);
    EXPECT_FALSE(ContainerConfigLoader::parseAutoProxyMode("proxy"));
}

TEST(ContainerConfigTest, LoadsFromFile)
{
    EXPECT_EQ(ContainerConfigLoader::loadFile("/nonexistent/wireup/container.yaml").code(), ResultCode::NotFound);

    std::string path = ::testing::TempDir() + "wireup_container_config_test.yaml";
    {
        std::ofstream out(path);
        out << "container:\n  auto_proxy:\n    mode: annotation\n";
    }

    auto result = ContainerConfigLoader::loadFile(path);
    std::remove(path.c_str());

    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().auto_proxy, AutoProxyMode::Annotation);
}
