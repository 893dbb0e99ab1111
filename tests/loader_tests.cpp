#include <algorithm>
#include <map>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "core/context.hpp"
#include "model/descriptor_source.hpp"
#include "model/errors.hpp"
#include "model/loader.hpp"

using nlohmann::json;

namespace
{

    class MemorySource : public modgraph::model::DescriptorSource
    {
    public:
        json readApplication(const std::string &applicationName) const override
        {
            auto it = applications.find(applicationName);
            if (it == applications.end())
            {
                throw modgraph::model::NotFoundError("no application " + applicationName, applicationName, applicationName);
            }
            return it->second;
        }

        json readModule(const std::string &moduleName, const std::string &applicationName) const override
        {
            auto it = modules.find(moduleName);
            if (it == modules.end())
            {
                throw modgraph::model::NotFoundError("no module " + moduleName, moduleName, applicationName);
            }
            return it->second;
        }

        void addApplication(const std::string &name, const std::vector<std::string> &moduleNames, const std::string &extends = {})
        {
            json doc = json::object();
            doc["modules"] = json::array();
            for (const auto &moduleName : moduleNames)
            {
                doc["modules"].push_back(json{{"name", moduleName}});
            }
            if (!extends.empty())
            {
                doc["extends"] = extends;
            }
            applications[name] = doc;
        }

        void addModule(const std::string &name, const std::vector<std::string> &dependencies = {})
        {
            json doc = json::object();
            if (!dependencies.empty())
            {
                doc["dependencies"] = dependencies;
            }
            modules[name] = doc;
        }

        std::map<std::string, json> applications;
        std::map<std::string, json> modules;
    };

    modgraph::Context makeContext()
    {
        return modgraph::Context(false);
    }

} // namespace

TEST(DescriptorLoader, LoadsExtendedApplication)
{
    MemorySource source;
    source.addApplication("app2", {"base"});
    source.addApplication("app1", {"feature"}, "app2");
    source.addModule("base");
    source.addModule("feature", {"base"});

    const auto ctx = makeContext();
    const modgraph::model::DescriptorLoader loader(source, ctx);
    const auto descriptors = loader.loadApplication("app1");

    EXPECT_EQ(descriptors.applicationName(), "app1");
    ASSERT_TRUE(descriptors.extends().has_value());
    EXPECT_EQ(*descriptors.extends(), "app2");
    EXPECT_FALSE(descriptors.worker());
    ASSERT_EQ(descriptors.application().size(), 1U);
    EXPECT_EQ(descriptors.application()[0].name, "feature");
    EXPECT_EQ(descriptors.modules().size(), 2U);

    const std::vector<std::string> expected = {"base", "feature"};
    EXPECT_EQ(descriptors.topologicalOrder(), expected);
}

TEST(DescriptorLoader, ReadsWorkerFlag)
{
    MemorySource source;
    source.addApplication("worker_app", {"core"});
    source.applications["worker_app"]["worker"] = true;
    source.addModule("core");

    const auto ctx = makeContext();
    const modgraph::model::DescriptorLoader loader(source, ctx);
    EXPECT_TRUE(loader.loadApplication("worker_app").worker());
}

TEST(DescriptorLoader, InjectsModuleNameAndKeepsMetadata)
{
    MemorySource source;
    source.addApplication("app", {"feature"});
    source.modules["feature"] = json{{"name", "renamed"}, {"experiment", "flag"}, {"resources", {"a.css"}}};

    const auto ctx = makeContext();
    const modgraph::model::DescriptorLoader loader(source, ctx);
    const auto descriptors = loader.loadApplication("app");

    const auto &module = descriptors.modules().at("feature");
    EXPECT_EQ(module.name, "feature");
    EXPECT_EQ(module.raw["name"], "feature");
    EXPECT_EQ(module.raw["experiment"], "flag");

    const std::vector<std::string> resources = {"feature/a.css"};
    EXPECT_EQ(descriptors.resourceList("feature"), resources);
}

TEST(DescriptorLoader, MissingDependencyNamesModuleAndDependency)
{
    MemorySource source;
    source.addApplication("app", {"A"});
    source.addModule("A", {"B"});

    const auto ctx = makeContext();
    const modgraph::model::DescriptorLoader loader(source, ctx);
    try
    {
        loader.loadApplication("app");
        FAIL() << "expected MissingDependencyError";
    }
    catch (const modgraph::model::MissingDependencyError &e)
    {
        EXPECT_EQ(e.dependency(), "B");
        EXPECT_EQ(e.module(), "A");
        EXPECT_EQ(e.application(), "app");
    }
}

TEST(DescriptorLoader, ParentCannotDependOnChildModule)
{
    MemorySource source;
    source.addApplication("parent", {"base"});
    source.addApplication("child", {"feature"}, "parent");
    source.addModule("base", {"feature"});
    source.addModule("feature");

    const auto ctx = makeContext();
    const modgraph::model::DescriptorLoader loader(source, ctx);
    EXPECT_THROW(loader.loadApplication("child"), modgraph::model::MissingDependencyError);
}

TEST(DescriptorLoader, DuplicateAcrossExtendsChain)
{
    MemorySource source;
    source.addApplication("parent", {"x"});
    source.addApplication("child", {"x"}, "parent");
    source.addModule("x");

    const auto ctx = makeContext();
    const modgraph::model::DescriptorLoader loader(source, ctx);
    try
    {
        loader.loadApplication("child");
        FAIL() << "expected DuplicateModuleError";
    }
    catch (const modgraph::model::DuplicateModuleError &e)
    {
        EXPECT_EQ(e.module(), "x");
        EXPECT_EQ(e.application(), "child");
        EXPECT_EQ(e.previousApplication(), "parent");
    }
}

TEST(DescriptorLoader, DuplicateWithinOneDocument)
{
    MemorySource source;
    source.addApplication("app", {"x", "x"});
    source.addModule("x");

    const auto ctx = makeContext();
    const modgraph::model::DescriptorLoader loader(source, ctx);
    EXPECT_THROW(loader.loadApplication("app"), modgraph::model::DuplicateModuleError);
}

TEST(DescriptorLoader, MissingModuleDescriptorIsNotFound)
{
    MemorySource source;
    source.addApplication("app", {"ghost"});

    const auto ctx = makeContext();
    const modgraph::model::DescriptorLoader loader(source, ctx);
    EXPECT_THROW(loader.loadApplication("app"), modgraph::model::NotFoundError);
    EXPECT_THROW(loader.loadApplication("nothing"), modgraph::model::NotFoundError);
}

TEST(DescriptorLoader, MalformedDocumentsAreParseErrors)
{
    MemorySource source;
    source.applications["no_modules"] = json{{"extends", "x"}};
    source.applications["bad_extends"] = json{{"modules", json::array()}, {"extends", 3}};
    source.applications["bad_worker"] = json{{"modules", json::array()}, {"worker", "yes"}};
    source.applications["nameless"] = json{{"modules", json::array({json{{"type", "autostart"}}})}};
    source.addApplication("bad_deps", {"m"});
    source.modules["m"] = json{{"dependencies", "common"}};

    const auto ctx = makeContext();
    const modgraph::model::DescriptorLoader loader(source, ctx);
    EXPECT_THROW(loader.loadApplication("no_modules"), modgraph::model::ParseError);
    EXPECT_THROW(loader.loadApplication("bad_extends"), modgraph::model::ParseError);
    EXPECT_THROW(loader.loadApplication("bad_worker"), modgraph::model::ParseError);
    EXPECT_THROW(loader.loadApplication("nameless"), modgraph::model::ParseError);
    EXPECT_THROW(loader.loadApplication("bad_deps"), modgraph::model::ParseError);
}

TEST(DescriptorLoader, ExtendsLoopIsLoadError)
{
    MemorySource source;
    source.addApplication("a", {}, "b");
    source.addApplication("b", {}, "a");

    const auto ctx = makeContext();
    const modgraph::model::DescriptorLoader loader(source, ctx);
    EXPECT_THROW(loader.loadApplication("a"), modgraph::model::LoadError);
}

TEST(DescriptorLoader, LoadApplicationsMergesIndependentApplications)
{
    MemorySource source;
    source.addApplication("shell", {"platform"});
    source.addApplication("inspector", {"elements"}, "shell");
    source.addApplication("worker_app", {"heap"});
    source.applications["worker_app"]["worker"] = true;
    source.addModule("platform");
    source.addModule("elements", {"platform"});
    source.addModule("heap");

    const auto ctx = makeContext();
    const modgraph::model::DescriptorLoader loader(source, ctx);
    const auto descriptors = loader.loadApplications({"inspector", "worker_app"});

    EXPECT_EQ(descriptors.applicationName(), modgraph::model::kCombinedApplicationName);
    EXPECT_FALSE(descriptors.extends().has_value());
    EXPECT_FALSE(descriptors.worker());
    EXPECT_EQ(descriptors.modules().size(), 3U);
    ASSERT_EQ(descriptors.application().size(), 2U);
    EXPECT_EQ(descriptors.application()[0].name, "elements");
    EXPECT_EQ(descriptors.application()[1].name, "heap");

    const auto &order = descriptors.topologicalOrder();
    ASSERT_EQ(order.size(), 3U);
    const auto platform = std::find(order.begin(), order.end(), "platform");
    const auto elements = std::find(order.begin(), order.end(), "elements");
    EXPECT_LT(platform, elements);
}

TEST(DescriptorLoader, LoadApplicationsRejectsSharedParent)
{
    MemorySource source;
    source.addApplication("shell", {"platform"});
    source.addApplication("inspector", {"elements"}, "shell");
    source.addApplication("devtools_app", {"sources"}, "shell");
    source.addModule("platform");
    source.addModule("elements", {"platform"});
    source.addModule("sources", {"platform"});

    const auto ctx = makeContext();
    const modgraph::model::DescriptorLoader loader(source, ctx);
    try
    {
        loader.loadApplications({"inspector", "devtools_app"});
        FAIL() << "expected DuplicateModuleError";
    }
    catch (const modgraph::model::DuplicateModuleError &e)
    {
        EXPECT_EQ(e.module(), "platform");
        EXPECT_EQ(e.application(), "devtools_app");
        EXPECT_EQ(e.previousApplication(), "shell");
    }
}

TEST(DescriptorLoader, LoadApplicationsRejectsSharedModuleName)
{
    MemorySource source;
    source.addApplication("one", {"x"});
    source.addApplication("two", {"x"});
    source.addModule("x");

    const auto ctx = makeContext();
    const modgraph::model::DescriptorLoader loader(source, ctx);
    try
    {
        loader.loadApplications({"one", "two"});
        FAIL() << "expected DuplicateModuleError";
    }
    catch (const modgraph::model::DuplicateModuleError &e)
    {
        EXPECT_EQ(e.module(), "x");
        EXPECT_EQ(e.application(), "two");
        EXPECT_EQ(e.previousApplication(), "one");
    }
}
