#ifndef FILE_FILTER_HPP
#define FILE_FILTER_HPP

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace Quiver {

class PackageManifest;

/**
 * @brief Patterns excluded from every package.
 */
const std::vector<std::string>& defaultExcludePatterns();

/**
 * @class FileFilter
 * @brief Decides which package-relative paths are part of an install.
 *
 * With an include list a path must match one of its patterns; otherwise it
 * must match none of the exclude patterns. A pattern matches by exact path,
 * as a directory prefix, as an fnmatch(3) glob, or (for patterns without a
 * '/') as a glob against the basename.
 */
class FileFilter
{
public:
    FileFilter(std::vector<std::string> include, std::vector<std::string> exclude);

    /**
     * @brief Filter for a manifest: its dist rules, the defaults, and the
     *        .quiverignore / .gitignore lines when no include list is set.
     */
    static FileFilter forManifest(const PackageManifest& manifest);

    bool includes(const std::string& relPath) const;

    /**
     * @brief True if `pattern` matches `relPath`.
     */
    static bool matches(const std::string& pattern, const std::string& relPath);

    const std::vector<std::string>& includePatterns() const { return include_; }
    const std::vector<std::string>& excludePatterns() const { return exclude_; }

private:
    bool excluded(const std::string& relPath) const;

    std::vector<std::string> include_;
    std::vector<std::string> exclude_;
};

/**
 * @brief Reads the patterns of an ignore file; blank lines, comments and
 *        negations are skipped.
 */
std::vector<std::string> readIgnoreFile(const std::filesystem::path& path);

/**
 * @brief The files of a package as (absolute, relative) pairs. The manifest
 *        is always part of the result.
 */
std::vector<std::pair<std::filesystem::path, std::string>>
walkPackageFiles(const PackageManifest& manifest);

} // namespace Quiver

#endif // FILE_FILTER_HPP
