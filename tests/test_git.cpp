#include "install.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <cstdlib>

namespace fs = std::filesystem;

using QuiverTest::writeFile;

class GitInstallTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!QuiverTest::haveTool("git")) {
            GTEST_SKIP() << "git is not available";
        }
        project_ = scratch_.path() / "project";
        repo_ = scratch_.path() / "repo";
        fs::create_directories(project_);
        fs::create_directories(repo_);

        ASSERT_TRUE(git("init -q"));
        writeFile(repo_ / "quiver.yaml", "name: remote\nversion: 2.0.0\n");
        writeFile(repo_ / "index.py", "print('two')\n");
        ASSERT_TRUE(git("add -A"));
        ASSERT_TRUE(git("commit -q -m v2"));
        ASSERT_TRUE(git("tag v2"));

        writeFile(repo_ / "quiver.yaml", "name: remote\nversion: 3.0.0\n");
        ASSERT_TRUE(git("commit -q -a -m v3"));
    }

    bool git(const std::string& args) {
        std::string cmd = "git -C '" + repo_.string() + "' -c user.name=quiver "
                          "-c user.email=quiver@localhost -c commit.gpgsign=false " +
                          args + " >/dev/null 2>&1";
        return std::system(cmd.c_str()) == 0;
    }

    Quiver::Installer makeInstaller(bool upgrade = false) {
        Quiver::Environment env;
        env.projectDir = project_;
        env.homeDir = scratch_.path() / "home";
        env.pythonVersion = "3.11";
        Quiver::InstallerOptions options;
        options.upgrade = upgrade;
        return Quiver::Installer(options, env, {});
    }

    fs::path packagesDir() const { return project_ / "quiver_modules"; }

    Quiver::TempPath scratch_ = QuiverTest::makeScratch("quiver-git-");
    fs::path project_;
    fs::path repo_;
};

TEST_F(GitInstallTest, InstallsTaggedRevision) {
    auto installer = makeInstaller();
    Quiver::InstallContext ctx;
    auto req = Quiver::Requirement::parse("git+" + repo_.string() + "@v2");
    ASSERT_EQ(req.ref, "v2");

    Quiver::InstallResult result = installer.installFromRequirement(
        req, project_, Quiver::DirectoryInstall{}, ctx);
    ASSERT_TRUE(result.success) << Quiver::errorName(result.error);
    EXPECT_EQ(result.name, "remote");
    EXPECT_EQ(result.version, "2.0.0");

    fs::path target = packagesDir() / "remote";
    EXPECT_TRUE(fs::is_regular_file(target / "index.py"));
    EXPECT_TRUE(Quiver::readLedger(target).has_value());

    // Only the installed package is left in the packages directory
    for (const auto& entry : fs::directory_iterator(packagesDir())) {
        EXPECT_EQ(entry.path().filename().string().rfind(".tmp-", 0), std::string::npos)
            << entry.path().string();
    }

    EXPECT_TRUE(installer.uninstall("remote"));
    EXPECT_FALSE(fs::exists(target));
}

TEST_F(GitInstallTest, UpgradeToDefaultBranch) {
    Quiver::InstallContext ctx;
    {
        auto installer = makeInstaller();
        ASSERT_TRUE(installer.installFromGit(repo_.string() + "@v2", false,
                                             Quiver::DirectoryInstall{}, ctx).success);
    }
    auto upgrader = makeInstaller(true);
    Quiver::InstallResult result = upgrader.installFromGit(repo_.string(), false,
                                                           Quiver::DirectoryInstall{}, ctx);
    ASSERT_TRUE(result.success) << Quiver::errorName(result.error);
    EXPECT_EQ(result.version, "3.0.0");
}

TEST_F(GitInstallTest, FailedCloneCleansUp) {
    auto installer = makeInstaller();
    Quiver::InstallContext ctx;
    Quiver::InstallResult result = installer.installFromGit(
        (scratch_.path() / "missing-repo").string(), false, Quiver::DirectoryInstall{}, ctx);
    EXPECT_EQ(result.error, Quiver::InstallError::CloneFailed);

    for (const auto& entry : fs::directory_iterator(packagesDir())) {
        ADD_FAILURE() << "left behind: " << entry.path().string();
    }
}

TEST_F(GitInstallTest, UnknownRefFails) {
    auto installer = makeInstaller();
    Quiver::InstallContext ctx;
    Quiver::InstallResult result = installer.installFromGit(
        repo_.string() + "@no-such-tag", false, Quiver::DirectoryInstall{}, ctx);
    EXPECT_EQ(result.error, Quiver::InstallError::CloneFailed);
    EXPECT_FALSE(fs::exists(packagesDir() / "remote"));
}
