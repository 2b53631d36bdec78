#include "file_filter.hpp"
#include "manifest.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <algorithm>

using Quiver::FileFilter;
using QuiverTest::writeFile;

namespace {

    std::vector<std::string> relativePaths(const Quiver::PackageManifest& manifest)
    {
        std::vector<std::string> rels;
        for (const auto& entry : Quiver::walkPackageFiles(manifest)) {
            rels.push_back(entry.second);
        }
        return rels;
    }

    bool contains(const std::vector<std::string>& list, const std::string& value)
    {
        return std::find(list.begin(), list.end(), value) != list.end();
    }

} // end anonymous namespace

TEST(FileFilterTest, PatternForms) {
    EXPECT_TRUE(FileFilter::matches("docs", "docs/readme.md"));
    EXPECT_TRUE(FileFilter::matches("*.pyc", "pkg/mod.pyc"));
    EXPECT_TRUE(FileFilter::matches("quiver_modules/*", "quiver_modules/foo/quiver.yaml"));
    EXPECT_TRUE(FileFilter::matches(".git*", ".gitignore"));
    EXPECT_FALSE(FileFilter::matches("docs", "documentation.txt"));
    EXPECT_FALSE(FileFilter::matches("", "anything"));
}

TEST(FileFilterTest, ManifestIsAlwaysIncluded) {
    FileFilter onlySrc({"src"}, {});
    EXPECT_TRUE(onlySrc.includes("quiver.yaml"));
    EXPECT_TRUE(onlySrc.includes("src/main.py"));
    EXPECT_FALSE(onlySrc.includes("notes.txt"));

    FileFilter excludeAll({}, {"*"});
    EXPECT_TRUE(excludeAll.includes("quiver.yaml"));
    EXPECT_FALSE(excludeAll.includes("index.py"));
}

TEST(FileFilterTest, IncludeAndExcludeGlobs) {
    FileFilter include({"src/*"}, {});
    EXPECT_FALSE(include.includes("docs/readme.md"));
    EXPECT_TRUE(include.includes("src/main.ext"));

    FileFilter exclude({}, {"*.cache"});
    EXPECT_FALSE(exclude.includes("build.cache"));
    EXPECT_TRUE(exclude.includes("build.log"));
    EXPECT_TRUE(exclude.includes("src/main.ext"));
}

TEST(FileFilterTest, WalkSkipsDefaultsAndIgnoreFile) {
    Quiver::TempPath scratch = QuiverTest::makeScratch("quiver-filter-");
    const auto& dir = scratch.path();
    writeFile(dir / "quiver.yaml", "name: walker\nversion: 1.0.0\n");
    writeFile(dir / "index.py", "print('hi')\n");
    writeFile(dir / "lib" / "util.py", "\n");
    writeFile(dir / "lib" / "util.pyc", "\n");
    writeFile(dir / "quiver_modules" / "dep" / "quiver.yaml", "name: dep\nversion: 1.0.0\n");
    writeFile(dir / ".git" / "HEAD", "ref: refs/heads/main\n");
    writeFile(dir / "build" / "out.o", "\n");
    writeFile(dir / ".quiverignore", "# build output\n/build/\n");

    auto manifest = Quiver::PackageManifest::load(dir / "quiver.yaml");
    auto rels = relativePaths(manifest);

    EXPECT_TRUE(contains(rels, "quiver.yaml"));
    EXPECT_TRUE(contains(rels, "index.py"));
    EXPECT_TRUE(contains(rels, "lib/util.py"));
    EXPECT_FALSE(contains(rels, "lib/util.pyc"));
    EXPECT_FALSE(contains(rels, "quiver_modules/dep/quiver.yaml"));
    EXPECT_FALSE(contains(rels, ".git/HEAD"));
    EXPECT_FALSE(contains(rels, "build/out.o"));
    EXPECT_TRUE(std::is_sorted(rels.begin(), rels.end()));
}

TEST(FileFilterTest, IncludeListIgnoresIgnoreFiles) {
    Quiver::TempPath scratch = QuiverTest::makeScratch("quiver-filter-");
    const auto& dir = scratch.path();
    writeFile(dir / "quiver.yaml",
              "name: picky\nversion: 1.0.0\ndist:\n  include_files: [src]\n");
    writeFile(dir / "src" / "a.txt", "a\n");
    writeFile(dir / "other.txt", "b\n");
    writeFile(dir / ".gitignore", "src\n");

    auto rels = relativePaths(Quiver::PackageManifest::load(dir / "quiver.yaml"));
    EXPECT_TRUE(contains(rels, "src/a.txt"));
    EXPECT_TRUE(contains(rels, "quiver.yaml"));
    EXPECT_FALSE(contains(rels, "other.txt"));
}
