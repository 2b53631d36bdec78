#include "file_filter.hpp"
#include "fsutil.hpp"
#include "manifest.hpp"
#include "utils.hpp"

#include <algorithm>
#include <fnmatch.h>
#include <fstream>

namespace fs = std::filesystem;

namespace Quiver {

const std::vector<std::string>& defaultExcludePatterns()
{
    static const std::vector<std::string> patterns = {
        ".DS_Store", ".svn/*", ".git*", "quiver_modules/*",
        "*.pyc", "*.pyo", "dist/*", LINK_FILE, LEDGER_FILE
    };
    return patterns;
}

FileFilter::FileFilter(std::vector<std::string> include, std::vector<std::string> exclude)
    : include_(std::move(include)), exclude_(std::move(exclude))
{
}

FileFilter FileFilter::forManifest(const PackageManifest& manifest)
{
    std::vector<std::string> exclude = manifest.excludeFiles;
    const auto& defaults = defaultExcludePatterns();
    exclude.insert(exclude.end(), defaults.begin(), defaults.end());

    if (manifest.includeFiles.empty()) {
        for (const char* ignoreFile : {".quiverignore", ".gitignore"}) {
            auto lines = readIgnoreFile(manifest.directory / ignoreFile);
            exclude.insert(exclude.end(), lines.begin(), lines.end());
        }
    }
    return FileFilter(manifest.includeFiles, std::move(exclude));
}

bool FileFilter::matches(const std::string& pattern, const std::string& relPath)
{
    if (pattern.empty()) {
        return false;
    }
    if (pattern == relPath) {
        return true;
    }
    // "docs" covers "docs/readme.md"
    if (relPath.size() > pattern.size() &&
        relPath.compare(0, pattern.size(), pattern) == 0 &&
        relPath[pattern.size()] == '/') {
        return true;
    }
    if (fnmatch(pattern.c_str(), relPath.c_str(), 0) == 0) {
        return true;
    }
    if (pattern.find('/') == std::string::npos) {
        std::string base = fs::path(relPath).filename().string();
        if (!base.empty() && fnmatch(pattern.c_str(), base.c_str(), 0) == 0) {
            return true;
        }
    }
    return false;
}

bool FileFilter::excluded(const std::string& relPath) const
{
    return std::any_of(exclude_.begin(), exclude_.end(),
                       [&](const std::string& p) { return matches(p, relPath); });
}

bool FileFilter::includes(const std::string& relPath) const
{
    if (relPath == MANIFEST_FILE) {
        return true;
    }
    if (!include_.empty()) {
        return std::any_of(include_.begin(), include_.end(),
                           [&](const std::string& p) { return matches(p, relPath); });
    }
    return !excluded(relPath);
}

std::vector<std::string> readIgnoreFile(const fs::path& path)
{
    std::vector<std::string> patterns;
    std::ifstream in(path);
    if (!in.is_open()) {
        return patterns;
    }

    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty() || line[0] == '#' || line[0] == '!') {
            continue;
        }
        // Anchors and trailing slashes don't change the match here
        while (!line.empty() && line.front() == '/') {
            line.erase(0, 1);
        }
        while (!line.empty() && line.back() == '/') {
            line.pop_back();
        }
        if (!line.empty()) {
            patterns.push_back(line);
        }
    }
    return patterns;
}

std::vector<std::pair<fs::path, std::string>> walkPackageFiles(const PackageManifest& manifest)
{
    std::vector<std::pair<fs::path, std::string>> files;
    FileFilter filter = FileFilter::forManifest(manifest);
    bool hasIncludes = !filter.includePatterns().empty();

    fs::recursive_directory_iterator it(manifest.directory);
    for (; it != fs::recursive_directory_iterator(); ++it) {
        std::string rel = fs::relative(it->path(), manifest.directory).generic_string();

        if (it->is_directory() && !it->is_symlink()) {
            // Don't descend into excluded trees such as quiver_modules/ or .git/
            if (!hasIncludes && !filter.includes(rel + "/")) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (filter.includes(rel)) {
            files.emplace_back(it->path(), rel);
        }
    }

    std::sort(files.begin(), files.end(),
              [](const auto& a, const auto& b) { return a.second < b.second; });
    return files;
}

} // namespace Quiver
