#include "environment.hpp"
#include "errors.hpp"
#include "process.hpp"

#include <gtest/gtest.h>
#include <cstdlib>

using Quiver::InstallLocation;

namespace {

    Quiver::Environment fixedEnvironment()
    {
        Quiver::Environment env;
        env.projectDir = "/work/app";
        env.homeDir = "/home/user";
        env.systemPrefix = "/usr/local";
        env.pythonVersion = "3.11";
        return env;
    }

} // end anonymous namespace

TEST(LocationTest, LocalDirectories) {
    auto env = fixedEnvironment();
    auto dirs = env.directories(InstallLocation::Local);
    EXPECT_EQ(dirs.packages.string(), "/work/app/quiver_modules");
    EXPECT_EQ(dirs.bin.string(), "/work/app/quiver_modules/.bin");
    EXPECT_EQ(dirs.pipPrefix.string(), "/work/app/quiver_modules/.pip");
    EXPECT_EQ(dirs.pipLib.string(), "/work/app/quiver_modules/.pip/lib/python3.11/site-packages");
    EXPECT_EQ(dirs.pipBin.string(), "/work/app/quiver_modules/.pip/bin");
    EXPECT_EQ(dirs.referenceDir.string(), "/work/app");
}

TEST(LocationTest, GlobalAndRootDirectories) {
    auto env = fixedEnvironment();
    auto global = env.directories(InstallLocation::Global);
    EXPECT_EQ(global.packages.string(), "/home/user/.local/lib/quiver/modules");
    EXPECT_EQ(global.bin.string(), "/home/user/.local/bin");
    EXPECT_EQ(global.pipPrefix.string(), "/home/user/.local");

    auto root = env.directories(InstallLocation::Root);
    EXPECT_EQ(root.packages.string(), "/usr/local/lib/quiver/modules");
    EXPECT_EQ(root.bin.string(), "/usr/local/bin");
    EXPECT_EQ(root.pipLib.string(), "/usr/local/lib/python3.11/site-packages");
}

TEST(LocationTest, FlagsMapToLocations) {
    Quiver::ScopedEnvironment scoped;
    scoped.set("VIRTUAL_ENV", "");

    EXPECT_EQ(Quiver::resolveLocation(false, false), InstallLocation::Local);
    EXPECT_EQ(Quiver::resolveLocation(true, false), InstallLocation::Global);
    EXPECT_EQ(Quiver::resolveLocation(false, true), InstallLocation::Root);
    EXPECT_THROW(Quiver::resolveLocation(true, true), Quiver::UsageError);
}

TEST(LocationTest, GlobalInsideVirtualEnvBecomesRoot) {
    Quiver::ScopedEnvironment scoped;
    scoped.set("VIRTUAL_ENV", "/opt/venv");

    EXPECT_TRUE(Quiver::isVirtualEnv());
    EXPECT_EQ(Quiver::resolveLocation(true, false), InstallLocation::Root);
}
