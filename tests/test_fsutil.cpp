#include "fsutil.hpp"
#include "manifest.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;

using QuiverTest::readFile;
using QuiverTest::writeFile;

// ========================================================================
// Installed-files ledger
// ========================================================================

TEST(LedgerTest, PathsKeepSurroundingSpaces) {
    Quiver::TempPath scratch = QuiverTest::makeScratch("quiver-ledger-");
    const fs::path& dir = scratch.path();

    std::vector<fs::path> paths = {
        dir / "plain.txt",
        dir / "trailing space ",
        dir / " leading space"
    };
    ASSERT_TRUE(Quiver::writeLedger(dir, paths));

    auto ledger = Quiver::readLedger(dir);
    ASSERT_TRUE(ledger.has_value());
    ASSERT_EQ(ledger->size(), paths.size());
    for (size_t i = 0; i < paths.size(); ++i) {
        EXPECT_EQ((*ledger)[i].string(), paths[i].string());
    }
}

TEST(LedgerTest, WindowsLineEndingsAndBlankLines) {
    Quiver::TempPath scratch = QuiverTest::makeScratch("quiver-ledger-");
    const fs::path& dir = scratch.path();
    writeFile(dir / Quiver::LEDGER_FILE, "/opt/a\r\n\n/opt/b\n");

    auto ledger = Quiver::readLedger(dir);
    ASSERT_TRUE(ledger.has_value());
    ASSERT_EQ(ledger->size(), 2u);
    EXPECT_EQ((*ledger)[0].string(), "/opt/a");
    EXPECT_EQ((*ledger)[1].string(), "/opt/b");

    EXPECT_FALSE(Quiver::readLedger(dir / "missing").has_value());
}

// ========================================================================
// Starter manifests
// ========================================================================

TEST(StarterManifestTest, CreateWritesLoadableManifest) {
    Quiver::TempPath scratch = QuiverTest::makeScratch("quiver-init-");
    const fs::path manifestPath = scratch.path() / Quiver::MANIFEST_FILE;

    Quiver::StarterManifest fields;
    fields.name = "@tools/starter";
    fields.description = "A starter package";
    fields.authors = {"dev@example.com"};
    ASSERT_TRUE(Quiver::PackageManifest::create(manifestPath, fields));

    auto manifest = Quiver::PackageManifest::load(manifestPath);
    EXPECT_EQ(manifest.name, "@tools/starter");
    EXPECT_EQ(manifest.version, "1.0.0");
    EXPECT_EQ(manifest.get("license").as<std::string>(), "MIT");
    EXPECT_EQ(manifest.get("authors")[0].as<std::string>(), "dev@example.com");
    EXPECT_EQ(manifest.get("description").as<std::string>(), "A starter package");
}

TEST(StarterManifestTest, CreateRefusesExistingFileAndBadNames) {
    Quiver::TempPath scratch = QuiverTest::makeScratch("quiver-init-");
    const fs::path manifestPath = scratch.path() / Quiver::MANIFEST_FILE;
    writeFile(manifestPath, "name: keep\nversion: 0.1.0\n");

    Quiver::StarterManifest fields;
    fields.name = "other";
    EXPECT_FALSE(Quiver::PackageManifest::create(manifestPath, fields));
    EXPECT_EQ(readFile(manifestPath), "name: keep\nversion: 0.1.0\n");

    fields.name = "no spaces allowed";
    EXPECT_FALSE(Quiver::PackageManifest::create(scratch.path() / "fresh.yaml", fields));
    EXPECT_FALSE(fs::exists(scratch.path() / "fresh.yaml"));
}
