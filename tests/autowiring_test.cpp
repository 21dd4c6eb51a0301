#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "wireup/errors.hpp"
#include "wireup/lifecycle.hpp"
#include "wireup/object_factory.hpp"

using wireup::AutowireMode;
using wireup::DependencyCheck;
using wireup::ObjectDefinition;
using wireup::ObjectFactory;
using wireup::ValueSpec;

namespace {

    class Printer
    {
    public:
        virtual ~Printer() = default;
        virtual std::string name() const = 0;
    };

    class ConsolePrinter : public Printer
    {
    public:
        std::string name() const override { return "console"; }
    };

    class FilePrinter : public Printer, public wireup::Ordered
    {
    public:
        std::string name() const override { return "file"; }
        int order() const override { return order_; }
        void setOrder(int order) { order_ = order; }

    private:
        int order_ = 1;
    };

    class Report
    {
    public:
        void setPrinter(std::shared_ptr<Printer> printer) { printer_ = std::move(printer); }
        void setPrinters(std::vector<std::shared_ptr<Printer>> printers) { printers_ = std::move(printers); }
        void setTitle(std::string title) { title_ = std::move(title); }

        const std::shared_ptr<Printer>& printer() const { return printer_; }
        const std::vector<std::shared_ptr<Printer>>& printers() const { return printers_; }

    private:
        std::shared_ptr<Printer> printer_;
        std::vector<std::shared_ptr<Printer>> printers_;
        std::string title_;
    };

    class Editor
    {
    public:
        explicit Editor(std::shared_ptr<Printer> printer) : printer_(std::move(printer)) {}
        Editor(std::shared_ptr<Printer> printer, std::vector<std::shared_ptr<Printer>> all)
            : printer_(std::move(printer)), all_(std::move(all)) {}

        const std::shared_ptr<Printer>& printer() const { return printer_; }
        const std::vector<std::shared_ptr<Printer>>& all() const { return all_; }

    private:
        std::shared_ptr<Printer> printer_;
        std::vector<std::shared_ptr<Printer>> all_;
    };

    class AutowiringTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            auto& types = factory.types();
            types.define<Printer>("test.Printer");
            types.define<ConsolePrinter>("test.ConsolePrinter")
                .implements<Printer>();
            types.define<FilePrinter>("test.FilePrinter")
                .implements<Printer>()
                .property("order", &FilePrinter::setOrder);
            types.define<Report>("test.Report")
                .property("printer", &Report::setPrinter)
                .property("printers", &Report::setPrinters)
                .property("title", &Report::setTitle);
            types.define<Editor>("test.Editor")
                .constructor<std::shared_ptr<Printer>>()
                .constructor<std::shared_ptr<Printer>, std::vector<std::shared_ptr<Printer>>>();
        }

        void define(const std::string& name, ObjectDefinition definition)
        {
            auto result = factory.registerDefinition(name, std::move(definition));
            ASSERT_TRUE(result) << result.c_str();
        }

        ObjectFactory factory;
    };

} // namespace

TEST_F(AutowiringTest, ByNameMatchesPropertyNames)
{
    define("printer", ObjectDefinition("test.ConsolePrinter"));
    define("report", ObjectDefinition("test.Report").setAutowireMode(AutowireMode::ByName));

    auto report = factory.get<Report>("report");

    ASSERT_NE(report->printer(), nullptr);
    EXPECT_EQ(report->printer()->name(), "console");
    // 같은 이름의 객체가 없는 property 는 비워 둔다.
    EXPECT_TRUE(report->printers().empty());
    EXPECT_EQ(factory.cache().dependentsOf("printer"), std::vector<std::string>{"report"});
}

TEST_F(AutowiringTest, ExplicitValuesWinOverAutowiring)
{
    define("printer", ObjectDefinition("test.ConsolePrinter"));
    define("file", ObjectDefinition("test.FilePrinter"));
    define("report", ObjectDefinition("test.Report")
                         .setAutowireMode(AutowireMode::ByName)
                         .property("printer", ValueSpec::ref("file")));

    EXPECT_EQ(factory.get<Report>("report")->printer()->name(), "file");
}

TEST_F(AutowiringTest, ByTypeInjectsSingleCandidate)
{
    define("console", ObjectDefinition("test.ConsolePrinter"));
    define("report", ObjectDefinition("test.Report").setAutowireMode(AutowireMode::ByType));

    auto report = factory.get<Report>("report");

    EXPECT_EQ(report->printer(), factory.get<Printer>("console"));
    ASSERT_EQ(report->printers().size(), 1u);
}

TEST_F(AutowiringTest, ByTypeWithoutCandidatesLeavesPropertyUnset)
{
    define("report", ObjectDefinition("test.Report").setAutowireMode(AutowireMode::ByType));

    auto report = factory.get<Report>("report");
    EXPECT_EQ(report->printer(), nullptr);
    EXPECT_TRUE(report->printers().empty());
}

// What: 후보가 여럿이면 primary, 그 다음 property 이름으로 고르고, 그래도 모호하면 실패한다.
TEST_F(AutowiringTest, ByTypeDisambiguation)
{
    define("console", ObjectDefinition("test.ConsolePrinter"));
    define("file", ObjectDefinition("test.FilePrinter"));
    define("report", ObjectDefinition("test.Report").setAutowireMode(AutowireMode::ByType));

    try {
        factory.resolve("report");
        FAIL() << "ambiguous dependency was not reported";
    } catch (const wireup::UnsatisfiedDependencyError& e) {
        EXPECT_EQ(e.objectName(), "report");
        EXPECT_EQ(e.code(), ResultCode::UnsatisfiedDependency);
    }
    EXPECT_EQ(factory.cache().state("report"), wireup::InstanceCache::State::Absent);
}

TEST_F(AutowiringTest, ByTypePrefersPrimary)
{
    define("console", ObjectDefinition("test.ConsolePrinter"));
    define("file", ObjectDefinition("test.FilePrinter").setPrimary(true));
    define("report", ObjectDefinition("test.Report").setAutowireMode(AutowireMode::ByType));

    EXPECT_EQ(factory.get<Report>("report")->printer()->name(), "file");
}

TEST_F(AutowiringTest, ByTypeFallsBackToPropertyName)
{
    define("printer", ObjectDefinition("test.ConsolePrinter"));
    define("file", ObjectDefinition("test.FilePrinter"));
    define("report", ObjectDefinition("test.Report").setAutowireMode(AutowireMode::ByType));

    EXPECT_EQ(factory.get<Report>("report")->printer()->name(), "console");
}

TEST_F(AutowiringTest, MultiplePrimariesAreAmbiguous)
{
    define("console", ObjectDefinition("test.ConsolePrinter").setPrimary(true));
    define("file", ObjectDefinition("test.FilePrinter").setPrimary(true));
    define("report", ObjectDefinition("test.Report").setAutowireMode(AutowireMode::ByType));

    EXPECT_THROW(factory.resolve("report"), wireup::UnsatisfiedDependencyError);
}

TEST_F(AutowiringTest, NonCandidatesAreSkipped)
{
    define("console", ObjectDefinition("test.ConsolePrinter").setAutowireCandidate(false));
    define("file", ObjectDefinition("test.FilePrinter"));
    define("report", ObjectDefinition("test.Report").setAutowireMode(AutowireMode::ByType));

    auto report = factory.get<Report>("report");
    EXPECT_EQ(report->printer()->name(), "file");
    EXPECT_EQ(report->printers().size(), 1u);
}

// What: collection 주입은 모든 후보를 Ordered 순서로 정렬한다.
TEST_F(AutowiringTest, CollectionsAreSortedByOrder)
{
    define("console", ObjectDefinition("test.ConsolePrinter"));
    define("late", ObjectDefinition("test.FilePrinter").property("order", ValueSpec::of(10)));
    define("early", ObjectDefinition("test.FilePrinter").property("order", ValueSpec::of(-10)));
    define("report", ObjectDefinition("test.Report")
                         .setAutowireMode(AutowireMode::ByType)
                         .property("printer", ValueSpec::ref("console")));

    auto report = factory.get<Report>("report");

    ASSERT_EQ(report->printers().size(), 3u);
    EXPECT_EQ(report->printers()[0], factory.get<Printer>("early"));
    EXPECT_EQ(report->printers()[1], factory.get<Printer>("late"));
    EXPECT_EQ(report->printers()[2], factory.get<Printer>("console"));
}

TEST_F(AutowiringTest, ConstructorAutowiringPrefersGreediestSatisfiableConstructor)
{
    define("console", ObjectDefinition("test.ConsolePrinter").setPrimary(true));
    define("file", ObjectDefinition("test.FilePrinter"));
    define("editor", ObjectDefinition("test.Editor").setAutowireMode(AutowireMode::Constructor));

    auto editor = factory.get<Editor>("editor");

    EXPECT_EQ(editor->printer()->name(), "console");
    ASSERT_EQ(editor->all().size(), 2u);
    EXPECT_EQ(editor->all()[0]->name(), "file");
    EXPECT_EQ(editor->all()[1]->name(), "console");
}

TEST_F(AutowiringTest, ConstructorAutowiringFailsWithoutCandidates)
{
    define("editor", ObjectDefinition("test.Editor").setAutowireMode(AutowireMode::Constructor));

    EXPECT_THROW(factory.resolve("editor"), wireup::UnsatisfiedDependencyError);
}

TEST_F(AutowiringTest, DependencyCheckReportsUnsetProperties)
{
    define("console", ObjectDefinition("test.ConsolePrinter"));
    define("simple", ObjectDefinition("test.Report")
                         .setAutowireMode(AutowireMode::ByType)
                         .setDependencyCheck(DependencyCheck::Simple));
    define("objects", ObjectDefinition("test.Report")
                          .setDependencyCheck(DependencyCheck::Objects)
                          .property("printer", ValueSpec::ref("console")));
    define("complete", ObjectDefinition("test.Report")
                           .setAutowireMode(AutowireMode::ByType)
                           .setDependencyCheck(DependencyCheck::All)
                           .property("title", ValueSpec::of(std::string("weekly"))));

    EXPECT_THROW(factory.resolve("simple"), wireup::UnsatisfiedDependencyError);
    EXPECT_THROW(factory.resolve("objects"), wireup::UnsatisfiedDependencyError);
    EXPECT_NO_THROW(factory.resolve("complete"));
}

TEST_F(AutowiringTest, ResolveByType)
{
    EXPECT_THROW(factory.resolve(wireup::getTypeId<Printer>()), wireup::NoSuchDefinitionError);

    define("console", ObjectDefinition("test.ConsolePrinter"));
    EXPECT_EQ(factory.get<Printer>()->name(), "console");

    define("file", ObjectDefinition("test.FilePrinter"));
    EXPECT_THROW(factory.get<Printer>(), wireup::NoSuchDefinitionError);

    ASSERT_TRUE(factory.definitions().updateDefinition("file", [](ObjectDefinition& def) { def.setPrimary(true); }));
    EXPECT_EQ(factory.get<Printer>()->name(), "file");
}

TEST_F(AutowiringTest, NamesForTypeIncludesManualSingletons)
{
    define("console", ObjectDefinition("test.ConsolePrinter"));
    define("report", ObjectDefinition("test.Report"));
    ASSERT_TRUE(factory.registerSingleton("manual", std::make_shared<FilePrinter>()));

    EXPECT_EQ(factory.namesForType<Printer>(), (std::vector<std::string>{"console", "manual"}));
    EXPECT_TRUE(factory.isTypeMatch("console", wireup::getTypeId<Printer>()));
    EXPECT_FALSE(factory.isTypeMatch("report", wireup::getTypeId<Printer>()));

    auto printers = factory.objectsOfType<Printer>();
    ASSERT_EQ(printers.size(), 2u);
    EXPECT_EQ(printers.at("manual")->name(), "file");
}
