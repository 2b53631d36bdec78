#include "config.hpp"
#include "registry.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

using QuiverTest::writeFile;

TEST(ConfigTest, MissingFileGivesDefaults) {
    Quiver::Config config = Quiver::Config::loadFromFile("/nonexistent/quiver/config.yaml");
    EXPECT_TRUE(config.registries.empty());
    EXPECT_EQ(config.python, "python3");
    EXPECT_EQ(config.runtime, "quiver-run");
    EXPECT_FALSE(config.pipUseTargetOption);
}

TEST(ConfigTest, LoadNormalizesRegistryUrls) {
    Quiver::TempPath scratch = QuiverTest::makeScratch("quiver-config-");
    auto path = scratch.path() / "config.yaml";
    writeFile(path,
              "registries:\n"
              "  - name: main\n"
              "    url: https://registry.example.com/quiver\n"
              "  - https://mirror.example.com/\n"
              "python: python3.11\n"
              "pip_use_target_option: true\n");

    Quiver::Config config = Quiver::Config::loadFromFile(path.string());
    ASSERT_EQ(config.registries.size(), 2u);
    EXPECT_EQ(config.registries[0].name, "main");
    EXPECT_EQ(config.registries[0].url, "https://registry.example.com/quiver/");
    EXPECT_EQ(config.registries[1].name, "https://mirror.example.com/");
    EXPECT_EQ(config.python, "python3.11");
    EXPECT_TRUE(config.pipUseTargetOption);
}

TEST(ConfigTest, AddRemoveAndSaveRoundTrip) {
    Quiver::TempPath scratch = QuiverTest::makeScratch("quiver-config-");
    auto path = (scratch.path() / "etc" / "config.yaml").string();

    Quiver::Config config;
    EXPECT_TRUE(config.addRegistry("main", "https://a.example.com"));
    EXPECT_FALSE(config.addRegistry("main", "https://b.example.com"));
    EXPECT_TRUE(config.addRegistry("backup", "https://b.example.com/"));
    EXPECT_TRUE(config.removeRegistry("main"));
    EXPECT_FALSE(config.removeRegistry("main"));
    ASSERT_TRUE(config.saveToFile(path));

    Quiver::Config loaded = Quiver::Config::loadFromFile(path);
    ASSERT_EQ(loaded.registries.size(), 1u);
    EXPECT_EQ(loaded.registries[0].name, "backup");
    EXPECT_EQ(loaded.registries[0].url, "https://b.example.com/");
    EXPECT_EQ(Quiver::loadRegistries(loaded).size(), 1u);
}

TEST(RegistryIndexTest, PicksHighestMatchingVersion) {
    YAML::Node index = YAML::Load(
        "packages:\n"
        "  - {name: foo, version: 1.0.0, file_name: foo-1.0.0.tar.gz}\n"
        "  - {name: foo, version: 1.2.0, file_name: foo-1.2.0.tar.gz}\n"
        "  - {name: foo, version: 2.0.0, file_name: foo-2.0.0.tar.gz}\n"
        "  - {name: bar, version: 9.0.0, file_name: bar-9.0.0.tar.gz}\n"
        "  - {name: foo}\n");

    auto found = Quiver::findInIndex(index, "foo", Quiver::Selector("^1.0.0"));
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->version, "1.2.0");
    EXPECT_EQ(found->fileName, "foo-1.2.0.tar.gz");

    EXPECT_FALSE(Quiver::findInIndex(index, "foo", Quiver::Selector(">=3.0")).has_value());
    EXPECT_FALSE(Quiver::findInIndex(index, "baz", Quiver::Selector()).has_value());
}
