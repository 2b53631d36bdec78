#include "requirement.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

using Quiver::Requirement;

TEST(RequirementTest, RegistryNameAndSelector) {
    Requirement req = Requirement::parse("foo@^1.0.0");
    EXPECT_EQ(req.type, Requirement::Type::Registry);
    EXPECT_EQ(req.name, "foo");
    EXPECT_TRUE(req.selector("1.4.0"));
    EXPECT_FALSE(req.selector("2.0.0"));
    EXPECT_EQ(req.toString(), "foo@^1.0.0");
}

TEST(RequirementTest, ScopedNameKeepsLeadingAt) {
    Requirement req = Requirement::parse("@scope/pkg@1.0.0 --internal");
    EXPECT_EQ(req.name, "@scope/pkg");
    EXPECT_TRUE(req.internal);
    EXPECT_TRUE(req.selector("1.0.0"));

    Requirement bare = Requirement::parse("@scope/pkg");
    EXPECT_EQ(bare.name, "@scope/pkg");
    EXPECT_TRUE(bare.selector.isAny());
}

TEST(RequirementTest, GitUrlWithRef) {
    Requirement req = Requirement::parse("git+https://example.com/user/repo.git@v2 --recursive");
    EXPECT_EQ(req.type, Requirement::Type::Git);
    EXPECT_EQ(req.url, "https://example.com/user/repo.git");
    EXPECT_EQ(req.ref, "v2");
    EXPECT_TRUE(req.recursive);
    EXPECT_EQ(req.toString(), "git+https://example.com/user/repo.git@v2 --recursive");
}

TEST(RequirementTest, GitSshUserIsNotARef) {
    Requirement req = Requirement::parse("git+git@github.com:user/repo.git");
    EXPECT_EQ(req.url, "git@github.com:user/repo.git");
    EXPECT_TRUE(req.ref.empty());

    Requirement flat = Requirement::parse("git+git@host:repo.git");
    EXPECT_EQ(flat.url, "git@host:repo.git");
    EXPECT_TRUE(flat.ref.empty());

    Requirement pinned = Requirement::parse("git+git@host:repo.git@v1.2");
    EXPECT_EQ(pinned.url, "git@host:repo.git");
    EXPECT_EQ(pinned.ref, "v1.2");
}

TEST(RequirementTest, PathsAndArchives) {
    Requirement dir = Requirement::parse("./libs/bar --develop");
    EXPECT_EQ(dir.type, Requirement::Type::Path);
    EXPECT_EQ(dir.path, "./libs/bar");
    EXPECT_TRUE(dir.link);
    EXPECT_FALSE(dir.isArchive());

    Requirement archive = Requirement::parse("bar-1.0.0.tar.gz");
    EXPECT_EQ(archive.type, Requirement::Type::Path);
    EXPECT_TRUE(archive.isArchive());
}

TEST(RequirementTest, SelectorOnlyManifestValue) {
    Requirement req = Requirement::parse(">= 1.0 <2.0 --pure", false);
    EXPECT_EQ(req.type, Requirement::Type::Registry);
    EXPECT_TRUE(req.pure);
    EXPECT_TRUE(req.selector("1.9"));
    EXPECT_FALSE(req.selector("2.1"));
}

TEST(RequirementTest, UnknownFlagThrows) {
    EXPECT_THROW(Requirement::parse("foo --bogus"), std::invalid_argument);
    EXPECT_THROW(Requirement::parse(""), std::invalid_argument);
}

TEST(RequirementTest, FromManifestMap) {
    YAML::Node git = YAML::Load("{git: 'https://example.com/r.git', ref: main, internal: true}");
    Requirement fromGit = Requirement::fromManifestValue("r", git);
    EXPECT_EQ(fromGit.type, Requirement::Type::Git);
    EXPECT_EQ(fromGit.name, "r");
    EXPECT_EQ(fromGit.ref, "main");
    EXPECT_TRUE(fromGit.internal);

    YAML::Node path = YAML::Load("{path: ../bar, link: true}");
    Requirement fromPath = Requirement::fromManifestValue("bar", path);
    EXPECT_EQ(fromPath.type, Requirement::Type::Path);
    EXPECT_TRUE(fromPath.link);

    Requirement fromNull = Requirement::fromManifestValue("baz", YAML::Node());
    EXPECT_EQ(fromNull.type, Requirement::Type::Registry);
    EXPECT_TRUE(fromNull.selector.isAny());
}
