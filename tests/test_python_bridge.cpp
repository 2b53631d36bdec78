#include "python_bridge.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <cstdlib>

namespace fs = std::filesystem;

using Quiver::InstallLocation;
using Quiver::PipOptions;
using Quiver::PythonBridge;
using QuiverTest::writeFile;

namespace {

    Quiver::Directories directoriesUnder(const fs::path& root, InstallLocation location)
    {
        Quiver::Environment env;
        env.projectDir = root / "project";
        env.homeDir = root / "home";
        env.systemPrefix = root / "prefix";
        env.pythonVersion = "3.11";
        return env.directories(location);
    }

} // end anonymous namespace

TEST(PythonBridgeTest, LocalInstallUsesPrefix) {
    auto dirs = directoriesUnder("/work", InstallLocation::Local);
    PythonBridge bridge(dirs, InstallLocation::Local, "python3", PipOptions{});

    auto args = bridge.pipArguments({{"requests", ">=2.0"}, {"six", ""}}, {"--no-deps"});
    std::vector<std::string> expected = {
        "--prefix", dirs.pipPrefix.string(), "--no-deps", "requests>=2.0", "six"
    };
    EXPECT_EQ(args, expected);
}

TEST(PythonBridgeTest, TargetOptionAndFlags) {
    auto dirs = directoriesUnder("/work", InstallLocation::Global);
    PipOptions options;
    options.useTargetOption = true;
    options.ignoreInstalled = true;
    options.upgrade = true;
    PythonBridge bridge(dirs, InstallLocation::Global, "python3", options);

    auto args = bridge.pipArguments({{"six", "==1.16"}}, {});
    std::vector<std::string> expected = {
        "--target", dirs.pipLib.string(), "six==1.16", "--ignore-installed", "--upgrade"
    };
    EXPECT_EQ(args, expected);
}

TEST(PythonBridgeTest, RootInstallHasNoLocationFlag) {
    auto dirs = directoriesUnder("/work", InstallLocation::Root);
    PythonBridge bridge(dirs, InstallLocation::Root, "python3", PipOptions{});
    EXPECT_EQ(bridge.pipArguments({{"six", ""}}, {}), std::vector<std::string>{"six"});
}

TEST(PythonBridgeTest, FindsDistInfoByNormalizedName) {
    Quiver::TempPath scratch = QuiverTest::makeScratch("quiver-pip-");
    auto dirs = directoriesUnder(scratch.path(), InstallLocation::Local);
    writeFile(dirs.pipLib / "Zope_Interface-5.4.0.dist-info" / "METADATA",
              "Metadata-Version: 2.1\nName: zope.interface\nVersion: 5.4.0\n\nDescription\n");

    PythonBridge bridge(dirs, InstallLocation::Local, "python3", PipOptions{});
    auto info = bridge.findDistInfo("zope-interface");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->name, "zope.interface");
    EXPECT_EQ(info->version, "5.4.0");
    EXPECT_FALSE(bridge.findDistInfo("requests").has_value());
}

TEST(PythonBridgeTest, FailingPipIsReported) {
    Quiver::TempPath scratch = QuiverTest::makeScratch("quiver-pip-");
    auto dirs = directoriesUnder(scratch.path(), InstallLocation::Local);
    PythonBridge bridge(dirs, InstallLocation::Local, "false", PipOptions{});

    const char* before = std::getenv("PYTHONPATH");
    std::string saved = before ? before : "";

    EXPECT_TRUE(bridge.install({}));
    EXPECT_FALSE(bridge.install({{"six", ""}}));
    EXPECT_TRUE(bridge.installedLibs().empty());

    const char* after = std::getenv("PYTHONPATH");
    EXPECT_EQ(after ? std::string(after) : std::string(), saved);
}

TEST(PythonBridgeTest, RelinkWrapsPipPrograms) {
    Quiver::TempPath scratch = QuiverTest::makeScratch("quiver-pip-");
    auto dirs = directoriesUnder(scratch.path(), InstallLocation::Local);
    writeFile(dirs.pipBin / "pytool", "#!/bin/sh\n");

    Quiver::ScriptMaker maker(dirs.bin, "quiver-run");
    maker.pythonpath.push_back(dirs.pipLib.string());
    PythonBridge bridge(dirs, InstallLocation::Local, "python3", PipOptions{});
    bridge.relinkScripts(maker);

    fs::path wrapper = dirs.bin / "pytool";
    ASSERT_TRUE(fs::is_regular_file(wrapper));
    std::string body = QuiverTest::readFile(wrapper);
    EXPECT_NE(body.find("PYTHONPATH="), std::string::npos);
    EXPECT_NE(body.find((dirs.pipBin / "pytool").string()), std::string::npos);
}
