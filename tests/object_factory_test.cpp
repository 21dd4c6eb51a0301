#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "test_support.hpp"
#include "wireup/errors.hpp"
#include "wireup/object_factory.hpp"

using namespace testing_support;
using wireup::ObjectDefinition;
using wireup::ObjectFactory;
using wireup::Scope;
using wireup::Value;
using wireup::ValueSpec;

namespace {

    class Tracked
    {
    public:
        Tracked() { ++constructed; }
        static std::atomic<int> constructed;
    };
    std::atomic<int> Tracked::constructed{0};

    class Slow
    {
    public:
        Slow()
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            ++constructed;
        }
        static std::atomic<int> constructed;
    };
    std::atomic<int> Slow::constructed{0};

    class Repository
    {
    public:
        void setUrl(std::string url) { url_ = std::move(url); }
        const std::string& url() const { return url_; }

    private:
        std::string url_ = "memory://";
    };

    class Service : public wireup::InitializingObject
    {
    public:
        explicit Service(std::shared_ptr<Repository> repository) : repository_(std::move(repository)) {}

        void setTimeout(int timeout) { timeout_ = timeout; }
        void setJournal(std::shared_ptr<Journal> journal) { journal_ = std::move(journal); }
        void setGreeters(std::vector<std::shared_ptr<Greeter>> greeters) { greeters_ = std::move(greeters); }
        void setLabel(std::string label) { label_ = std::move(label); }

        void afterPropertiesSet() override
        {
            if (journal_) journal_->add("afterPropertiesSet");
        }
        void start()
        {
            if (journal_) journal_->add("start");
        }
        void stop()
        {
            if (journal_) journal_->add("stop");
        }

        const std::shared_ptr<Repository>& repository() const { return repository_; }
        int timeout() const { return timeout_; }
        const std::vector<std::shared_ptr<Greeter>>& greeters() const { return greeters_; }
        const std::string& label() const { return label_; }

    private:
        std::shared_ptr<Repository> repository_;
        std::shared_ptr<Journal> journal_;
        std::vector<std::shared_ptr<Greeter>> greeters_;
        int timeout_ = 0;
        std::string label_;
    };

    class Connection
    {
    public:
        Connection() = default;
        explicit Connection(std::string url) : url_(std::move(url)) {}
        const std::string& url() const { return url_; }

    private:
        std::string url_;
    };

    class ConnectionFactory
    {
    public:
        static std::shared_ptr<Connection> open(std::string url)
        {
            return std::make_shared<Connection>("static:" + url);
        }

        std::shared_ptr<Connection> connect(std::string url)
        {
            ++connections_;
            return std::make_shared<Connection>("pooled:" + url);
        }

        int connections() const { return connections_; }

    private:
        int connections_ = 0;
    };

    class Exploding
    {
    public:
        Exploding() { throw std::runtime_error("boom"); }
    };

    class FailingInit : public wireup::InitializingObject
    {
    public:
        void afterPropertiesSet() override { throw std::runtime_error("not ready"); }
    };

    // peer 를 주입받은 뒤 초기화에 실패한다.
    class BrokenPeer : public wireup::InitializingObject
    {
    public:
        void setPeer(std::shared_ptr<Node> peer) { peer_ = std::move(peer); }
        void afterPropertiesSet() override { throw std::runtime_error("peer rejected"); }

    private:
        std::shared_ptr<Node> peer_;
    };

    // early reference 요청과 폐기를 기록한다.
    class EarlyReferenceRecorder : public wireup::EarlyReferenceHook
    {
    public:
        wireup::Object earlyReference(const wireup::Object& object, const std::string& name) override
        {
            journal.add("early:" + name);
            return object;
        }

        void discardEarlyReference(const std::string& name) override { journal.add("discard:" + name); }

        Journal journal;
    };

    class ObjectFactoryTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            defineCommonTypes(factory.types());
            auto& types = factory.types();
            types.define<Tracked>("test.Tracked");
            types.define<Slow>("test.Slow");
            types.define<Repository>("test.Repository")
                .property("url", &Repository::setUrl);
            types.define<Service>("test.Service")
                .constructor<std::shared_ptr<Repository>>()
                .property("timeout", &Service::setTimeout)
                .property("journal", &Service::setJournal)
                .property("greeters", &Service::setGreeters)
                .property("label", &Service::setLabel)
                .method("start", &Service::start)
                .method("stop", &Service::stop);
            types.define<Connection>("test.Connection")
                .constructor<std::string>();
            types.define<ConnectionFactory>("test.ConnectionFactory")
                .staticFactory("open", &ConnectionFactory::open)
                .factoryMethod("connect", &ConnectionFactory::connect);
            types.define<Exploding>("test.Exploding");
            types.define<FailingInit>("test.FailingInit");
            types.define<BrokenPeer>("test.BrokenPeer")
                .property("peer", &BrokenPeer::setPeer);

            Tracked::constructed = 0;
            Slow::constructed = 0;
        }

        void define(const std::string& name, ObjectDefinition definition)
        {
            auto result = factory.registerDefinition(name, std::move(definition));
            ASSERT_TRUE(result) << result.c_str();
        }

        ObjectFactory factory;
    };

    // target 이름의 객체를 초기화 이후 다른 Node 로 바꾸는 hook
    class Replacer : public wireup::LifecycleHook
    {
    public:
        Replacer(wireup::TypeRegistry& types, std::string target) : types_(types), target_(std::move(target)) {}

        wireup::Object afterInitialization(const wireup::Object& object, const std::string& name) override
        {
            if (name != target_) return object;
            original_ = object;
            auto replacement = std::make_shared<Node>();
            replacement->setLabel("replacement");
            return types_.wrap(replacement);
        }

        const wireup::Object& original() const { return original_; }

    private:
        wireup::TypeRegistry& types_;
        std::string target_;
        wireup::Object original_;
    };

} // namespace

TEST_F(ObjectFactoryTest, SingletonIsCreatedOnce)
{
    define("tracked", ObjectDefinition("test.Tracked"));

    auto first = factory.resolve("tracked");
    auto second = factory.resolve("tracked");

    EXPECT_EQ(first, second);
    EXPECT_EQ(Tracked::constructed.load(), 1);
    EXPECT_TRUE(factory.isSingleton("tracked"));
    EXPECT_FALSE(factory.isPrototype("tracked"));
}

TEST_F(ObjectFactoryTest, PrototypeIsCreatedPerRequest)
{
    define("tracked", ObjectDefinition("test.Tracked").setScope(Scope::Prototype));

    auto first = factory.resolve("tracked");
    auto second = factory.resolve("tracked");

    EXPECT_NE(first, second);
    EXPECT_EQ(Tracked::constructed.load(), 2);
    EXPECT_TRUE(factory.isPrototype("tracked"));
    EXPECT_EQ(factory.cache().count(), 0u);
}

// What: prototype 은 요청마다 property 와 inner 객체를 새로 적용받는다.
// How:  한 인스턴스를 바꿔도 다른 인스턴스는 그대로이고, 반복 resolve 해도 dependency 기록은 늘지 않는다.
TEST_F(ObjectFactoryTest, PrototypePropertiesAreAppliedPerInstance)
{
    auto journal = std::make_shared<Journal>();
    ASSERT_TRUE(factory.registerSingleton("journal", journal));

    auto repository = std::make_shared<ObjectDefinition>("test.Repository");
    repository->property("url", ValueSpec::computed([](wireup::DependencyResolver& resolver) {
        resolver.resolve("journal");
        return Value::of(std::string("db://inner"));
    }));
    define("service", ObjectDefinition("test.Service")
                          .setScope(Scope::Prototype)
                          .arg(ValueSpec::inner(repository))
                          .property("timeout", ValueSpec::of(30))
                          .property("journal", ValueSpec::ref("journal")));

    auto first = factory.get<Service>("service");
    auto second = factory.get<Service>("service");

    ASSERT_NE(first, second);
    ASSERT_NE(first->repository(), second->repository());
    first->setTimeout(5);
    first->repository()->setUrl("db://changed");
    EXPECT_EQ(second->timeout(), 30);
    EXPECT_EQ(second->repository()->url(), "db://inner");
    EXPECT_EQ(journal->entries(), (std::vector<std::string>{"afterPropertiesSet", "afterPropertiesSet"}));

    for (int i = 0; i < 100; ++i) {
        factory.resolve("service");
    }

    EXPECT_EQ(factory.cache().dependenciesOf("service"), std::vector<std::string>{"journal"});
    EXPECT_EQ(factory.cache().dependentsOf("journal"), std::vector<std::string>{"service"});
    EXPECT_EQ(factory.cache().count(), 1u);
}

TEST_F(ObjectFactoryTest, ResolvesThroughAliases)
{
    define("tracked", ObjectDefinition("test.Tracked"));
    ASSERT_TRUE(factory.registerAlias("tracked", "t"));

    EXPECT_EQ(factory.resolve("t"), factory.resolve("tracked"));
    EXPECT_EQ(factory.aliasesOf("tracked"), std::vector<std::string>{"t"});
    EXPECT_TRUE(factory.containsObject("t"));
}

TEST_F(ObjectFactoryTest, InjectsConstructorArgumentsAndProperties)
{
    auto journal = std::make_shared<Journal>();
    ASSERT_TRUE(factory.registerSingleton("journal", journal));
    define("repository", ObjectDefinition("test.Repository")
                             .property("url", ValueSpec::of(std::string("db://main"))));
    define("service", ObjectDefinition("test.Service")
                          .arg(ValueSpec::ref("repository"))
                          .property("timeout", ValueSpec::of(30))
                          .property("journal", ValueSpec::ref("journal"))
                          .setInitMethod("start"));

    auto service = factory.get<Service>("service");

    EXPECT_EQ(service->repository(), factory.get<Repository>("repository"));
    EXPECT_EQ(service->repository()->url(), "db://main");
    EXPECT_EQ(service->timeout(), 30);
    EXPECT_EQ(journal->entries(), (std::vector<std::string>{"afterPropertiesSet", "start"}));

    // 주입 관계는 dependency 로 기록된다.
    EXPECT_EQ(factory.cache().dependentsOf("repository"), std::vector<std::string>{"service"});
}

TEST_F(ObjectFactoryTest, ExplicitArgumentsSelectConstructor)
{
    define("connection", ObjectDefinition("test.Connection").setScope(Scope::Prototype));

    auto plain = factory.get<Connection>("connection");
    auto object = factory.resolve("connection", {Value::of(std::string("tcp://peer"))});

    EXPECT_TRUE(plain->url().empty());
    EXPECT_EQ(object.as<Connection>()->url(), "tcp://peer");
}

TEST_F(ObjectFactoryTest, StaticAndInstanceFactoryMethods)
{
    define("factory", ObjectDefinition("test.ConnectionFactory"));
    define("primary", ObjectDefinition("test.ConnectionFactory")
                          .setFactoryMethod("open")
                          .arg(ValueSpec::of(std::string("main"))));
    define("pooled", ObjectDefinition()
                         .setFactoryObject("factory")
                         .setFactoryMethod("connect")
                         .arg(ValueSpec::of(std::string("replica"))));

    EXPECT_EQ(factory.typeOf("primary"), wireup::getTypeId<Connection>());
    EXPECT_EQ(factory.get<Connection>("primary")->url(), "static:main");
    EXPECT_EQ(factory.get<Connection>("pooled")->url(), "pooled:replica");
    EXPECT_EQ(factory.get<Connection>("pooled"), factory.get<Connection>("pooled"));
    EXPECT_EQ(factory.get<ConnectionFactory>("factory")->connections(), 1);
    EXPECT_EQ(factory.cache().dependentsOf("factory"), std::vector<std::string>{"pooled"});
}

TEST_F(ObjectFactoryTest, InnerListAndComputedValues)
{
    define("english", ObjectDefinition("test.PoliteGreeter"));
    define("korean", ObjectDefinition("test.PoliteGreeter")
                         .property("prefix", ValueSpec::of(std::string("안녕"))));
    define("service", ObjectDefinition("test.Service")
                          .arg(ValueSpec::inner(std::make_shared<ObjectDefinition>("test.Repository")))
                          .property("greeters", ValueSpec::list({ValueSpec::ref("korean"), ValueSpec::ref("english")}))
                          .property("label", ValueSpec::computed([](wireup::DependencyResolver& resolver) {
                              auto greeter = resolver.resolve("english").as<Greeter>();
                              return Value::of(greeter->greet(resolver.requestingName()));
                          })));

    auto service = factory.get<Service>("service");

    ASSERT_NE(service->repository(), nullptr);
    EXPECT_EQ(factory.cache().count(), 3u);   // inner 객체는 cache 되지 않는다.
    ASSERT_EQ(service->greeters().size(), 2u);
    EXPECT_EQ(service->greeters()[0]->greet("you"), "안녕, you");
    EXPECT_EQ(service->greeters()[1]->greet("you"), "Hello, you");
    EXPECT_EQ(service->label(), "Hello, service");

    auto dependencies = factory.cache().dependenciesOf("service");
    EXPECT_EQ(dependencies.size(), 3u);   // english, korean, inner repository
}

// What: setter 로만 이루어진 cycle 은 early reference 로 해소된다.
TEST_F(ObjectFactoryTest, SetterCycleResolvesToSameInstances)
{
    define("a", ObjectDefinition("test.Node").property("next", ValueSpec::ref("b")));
    define("b", ObjectDefinition("test.Node").property("next", ValueSpec::ref("a")));

    auto a = factory.get<Node>("a");
    auto b = factory.get<Node>("b");

    EXPECT_EQ(a->next(), b);
    EXPECT_EQ(b->next(), a);
    EXPECT_EQ(a->next()->next(), a);
    EXPECT_TRUE(factory.cache().isFinished("a"));
    EXPECT_TRUE(factory.cache().isFinished("b"));
}

TEST_F(ObjectFactoryTest, SetterCycleFailsWhenCircularReferencesDisabled)
{
    factory.setAllowCircularReferences(false);
    define("a", ObjectDefinition("test.Node").property("next", ValueSpec::ref("b")));
    define("b", ObjectDefinition("test.Node").property("next", ValueSpec::ref("a")));

    EXPECT_THROW(factory.resolve("a"), wireup::CircularConstructionError);
    EXPECT_EQ(factory.cache().count(), 0u);
}

// What: 생성자로만 이루어진 cycle 은 경로 전체를 담은 오류로 실패한다.
// How:  a(b) -> b(c) -> c(a) 를 정의하고 cycle / resolution path 를 확인한다.
TEST_F(ObjectFactoryTest, ConstructorCycleReportsFullCycle)
{
    define("a", ObjectDefinition("test.Link").arg(ValueSpec::ref("b")));
    define("b", ObjectDefinition("test.Link").arg(ValueSpec::ref("c")));
    define("c", ObjectDefinition("test.Link").arg(ValueSpec::ref("a")));

    try {
        factory.resolve("a");
        FAIL() << "constructor cycle was not detected";
    } catch (const wireup::CircularConstructionError& e) {
        EXPECT_EQ(e.cycle(), (std::vector<std::string>{"a", "b", "c", "a"}));
        EXPECT_EQ(e.resolutionPath(), (std::vector<std::string>{"a", "b", "c", "a"}));
        EXPECT_EQ(e.code(), ResultCode::CircularReference);
    }

    // 실패한 생성은 모두 rollback 된다.
    EXPECT_EQ(factory.cache().count(), 0u);
    EXPECT_EQ(factory.cache().state("a"), wireup::InstanceCache::State::Absent);
    EXPECT_EQ(factory.cache().state("b"), wireup::InstanceCache::State::Absent);
}

TEST_F(ObjectFactoryTest, PrototypeCycleIsDetected)
{
    define("a", ObjectDefinition("test.Link").setScope(Scope::Prototype).arg(ValueSpec::ref("b")));
    define("b", ObjectDefinition("test.Link").setScope(Scope::Prototype).arg(ValueSpec::ref("a")));

    try {
        factory.resolve("a");
        FAIL() << "prototype cycle was not detected";
    } catch (const wireup::CircularConstructionError& e) {
        EXPECT_EQ(e.cycle(), (std::vector<std::string>{"a", "b", "a"}));
    }
}

TEST_F(ObjectFactoryTest, DependsOnCreatesDependenciesFirst)
{
    auto journal = std::make_shared<Journal>();
    ASSERT_TRUE(factory.registerSingleton("journal", journal));
    define("first", ObjectDefinition("test.Resource")
                        .property("journal", ValueSpec::ref("journal"))
                        .setDependsOn({"second"}));
    define("second", ObjectDefinition("test.Resource").property("journal", ValueSpec::ref("journal")));

    factory.resolve("first");
    EXPECT_EQ(factory.cache().names(), (std::vector<std::string>{"journal", "second", "first"}));

    factory.destroySingletons();
    EXPECT_EQ(journal->entries(), (std::vector<std::string>{"destroy:first", "destroy:second"}));
}

TEST_F(ObjectFactoryTest, DependsOnCycleAndMissingDependency)
{
    define("a", ObjectDefinition("test.Tracked").setDependsOn({"b"}));
    define("b", ObjectDefinition("test.Tracked").setDependsOn({"a"}));
    define("lonely", ObjectDefinition("test.Tracked").setDependsOn({"ghost"}));

    EXPECT_THROW(factory.resolve("a"), wireup::CircularConstructionError);
    EXPECT_THROW(factory.resolve("lonely"), wireup::NoSuchDefinitionError);
}

TEST_F(ObjectFactoryTest, FailedCreationRollsBackAndReportsPath)
{
    define("a", ObjectDefinition("test.Node").property("next", ValueSpec::ref("missing")));

    try {
        factory.resolve("a");
        FAIL() << "missing reference was not reported";
    } catch (const wireup::NoSuchDefinitionError& e) {
        EXPECT_EQ(e.objectName(), "missing");
        EXPECT_EQ(e.resolutionPath(), (std::vector<std::string>{"a", "missing"}));
    }
    EXPECT_EQ(factory.cache().state("a"), wireup::InstanceCache::State::Absent);

    // 이후 정의가 보완되면 다시 만들 수 있다.
    define("missing", ObjectDefinition("test.Node"));
    EXPECT_NO_THROW(factory.resolve("a"));
}

TEST_F(ObjectFactoryTest, ConstructorAndInitFailuresAreWrapped)
{
    define("exploding", ObjectDefinition("test.Exploding"));
    define("failing", ObjectDefinition("test.FailingInit"));

    try {
        factory.resolve("exploding");
        FAIL() << "constructor failure was not reported";
    } catch (const wireup::InstantiationFailure& e) {
        EXPECT_EQ(e.rootCauseMessage(), "boom");
    }
    try {
        factory.resolve("failing");
        FAIL() << "init failure was not reported";
    } catch (const wireup::InitializationFailure& e) {
        EXPECT_EQ(e.rootCauseMessage(), "not ready");
        EXPECT_EQ(e.code(), ResultCode::InitializationFailed);
    }
    EXPECT_EQ(factory.cache().count(), 0u);
}

TEST_F(ObjectFactoryTest, InvalidDefinitionsFailOnResolve)
{
    define("unknown", ObjectDefinition("test.Unknown"));
    define("interface", ObjectDefinition("test.Greeter"));
    define("template", ObjectDefinition("test.Tracked").setAbstract(true));
    define("typo", ObjectDefinition("test.Repository").property("uri", ValueSpec::of(std::string("x"))));

    EXPECT_THROW(factory.resolve("unknown"), wireup::DefinitionError);
    EXPECT_THROW(factory.resolve("interface"), wireup::DefinitionError);
    EXPECT_THROW(factory.resolve("template"), wireup::DefinitionError);
    EXPECT_THROW(factory.resolve("typo"), wireup::DefinitionError);
    EXPECT_THROW(factory.resolve("nothing"), wireup::NoSuchDefinitionError);

    auto result = factory.tryGet<Tracked>("nothing");
    EXPECT_EQ(result.code(), ResultCode::NotFound);
}

TEST_F(ObjectFactoryTest, WrongTypeRequestIsRejected)
{
    define("tracked", ObjectDefinition("test.Tracked"));
    EXPECT_THROW(factory.get<Repository>("tracked"), wireup::ContainerError);
}

// What: 여러 thread 가 동시에 같은 singleton 을 요청해도 한 번만 생성된다.
TEST_F(ObjectFactoryTest, ConcurrentResolutionCreatesSingletonOnce)
{
    define("slow", ObjectDefinition("test.Slow"));

    std::vector<std::shared_ptr<Slow>> results(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([this, &results, i]() { results[i] = factory.get<Slow>("slow"); });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(Slow::constructed.load(), 1);
    for (const auto& r : results) {
        EXPECT_EQ(r, results.front());
    }
}

TEST_F(ObjectFactoryTest, DestroysInReverseCreationOrderWithDependentsFirst)
{
    auto journal = std::make_shared<Journal>();
    ASSERT_TRUE(factory.registerSingleton("journal", journal));
    define("leaf", ObjectDefinition("test.Resource").property("journal", ValueSpec::ref("journal")));
    define("branch", ObjectDefinition("test.Resource")
                         .property("journal", ValueSpec::ref("journal"))
                         .property("dependency", ValueSpec::ref("leaf")));
    define("root", ObjectDefinition("test.Resource")
                       .property("journal", ValueSpec::ref("journal"))
                       .property("dependency", ValueSpec::ref("branch")));

    factory.preInstantiateSingletons();
    factory.cache().destroySingleton("leaf");
    EXPECT_EQ(journal->entries(), (std::vector<std::string>{"destroy:root", "destroy:branch", "destroy:leaf"}));
    EXPECT_EQ(factory.cache().names(), std::vector<std::string>{"journal"});
}

TEST_F(ObjectFactoryTest, DestroyMethodIsInvoked)
{
    auto journal = std::make_shared<Journal>();
    ASSERT_TRUE(factory.registerSingleton("journal", journal));
    define("repository", ObjectDefinition("test.Repository"));
    define("service", ObjectDefinition("test.Service")
                          .arg(ValueSpec::ref("repository"))
                          .property("journal", ValueSpec::ref("journal"))
                          .setDestroyMethod("stop"));

    factory.resolve("service");
    journal->clear();
    factory.destroySingletons();

    EXPECT_EQ(journal->entries(), std::vector<std::string>{"stop"});
    EXPECT_EQ(factory.cache().count(), 0u);
}

TEST_F(ObjectFactoryTest, OverridingDefinitionDropsCachedSingleton)
{
    define("repository", ObjectDefinition("test.Repository")
                             .property("url", ValueSpec::of(std::string("one"))));
    EXPECT_EQ(factory.get<Repository>("repository")->url(), "one");

    define("repository", ObjectDefinition("test.Repository")
                             .property("url", ValueSpec::of(std::string("two"))));
    EXPECT_EQ(factory.get<Repository>("repository")->url(), "two");
}

// What: 노출될 객체가 wrap 되었는데 raw 버전이 이미 다른 객체에 주입되었으면 실패한다.
// How:  a <-> b setter cycle 에서 a 의 after-initialization 을 다른 객체로 바꾼다.
TEST_F(ObjectFactoryTest, RawReferenceLeakIsRejected)
{
    factory.addPostProcessor(std::make_shared<Replacer>(factory.types(), "a"));
    define("a", ObjectDefinition("test.Node").property("next", ValueSpec::ref("b")));
    define("b", ObjectDefinition("test.Node").property("next", ValueSpec::ref("a")));

    try {
        factory.resolve("a");
        FAIL() << "raw reference leak was not detected";
    } catch (const wireup::RawReferenceLeakedError& e) {
        EXPECT_EQ(e.dependents(), std::vector<std::string>{"b"});
        EXPECT_EQ(e.code(), ResultCode::RawReferenceLeaked);
    }
    EXPECT_EQ(factory.cache().state("a"), wireup::InstanceCache::State::Absent);
    EXPECT_EQ(factory.cache().state("b"), wireup::InstanceCache::State::Absent);
}

TEST_F(ObjectFactoryTest, RawReferenceLeakCanBeAllowed)
{
    factory.setAllowRawInjectionDespiteWrapping(true);
    auto replacer = std::make_shared<Replacer>(factory.types(), "a");
    factory.addPostProcessor(replacer);
    define("a", ObjectDefinition("test.Node").property("next", ValueSpec::ref("b")));
    define("b", ObjectDefinition("test.Node").property("next", ValueSpec::ref("a")));

    auto a = factory.get<Node>("a");
    auto b = factory.get<Node>("b");

    // b 는 wrap 되기 전의 a 를 그대로 갖는다.
    EXPECT_EQ(a->label(), "replacement");
    EXPECT_NE(b->next(), a);
    EXPECT_EQ(b->next(), replacer->original().as<Node>());
}

// What: early reference 를 내준 singleton 의 생성이 실패하면 hook 에 폐기를 알린다.
TEST_F(ObjectFactoryTest, FailedCreationDiscardsEarlyReference)
{
    auto recorder = std::make_shared<EarlyReferenceRecorder>();
    factory.addPostProcessor(recorder);
    define("a", ObjectDefinition("test.Node").property("next", ValueSpec::ref("b")));
    define("b", ObjectDefinition("test.BrokenPeer").property("peer", ValueSpec::ref("a")));

    EXPECT_THROW(factory.resolve("a"), wireup::InitializationFailure);

    EXPECT_EQ(recorder->journal.entries(), (std::vector<std::string>{"early:a", "discard:b", "discard:a"}));
    EXPECT_EQ(factory.cache().state("a"), wireup::InstanceCache::State::Absent);
}
