#ifndef FSUTIL_HPP
#define FSUTIL_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Quiver {

// Names of the per-package bookkeeping files.
inline const char* const LEDGER_FILE = "installed-files.txt";
inline const char* const LINK_FILE   = ".quiver-link";

/**
 * @class TempPath
 * @brief Owns a temporary file or directory and removes it on destruction.
 *
 * Removing a path that no longer exists (e.g. after it was moved away) is a no-op.
 */
class TempPath
{
public:
    explicit TempPath(std::filesystem::path path);
    ~TempPath();

    TempPath(const TempPath&) = delete;
    TempPath& operator=(const TempPath&) = delete;

    const std::filesystem::path& path() const { return path_; }

    /**
     * @brief Stops tracking the path; it is left on disk.
     */
    std::filesystem::path release();

private:
    std::filesystem::path path_;
    bool owned_ = true;
};

/**
 * @brief Creates a random temporary filename. If baseDir is empty, the
 *        system temporary directory is used.
 */
std::string generateTempFilename(const std::string& prefix, const std::string& baseDir);

/**
 * @brief Creates a fresh, empty temporary directory and returns its owner.
 * @throws std::filesystem::filesystem_error if the directory can't be created.
 */
TempPath makeTempDirectory(const std::string& prefix, const std::string& baseDir = "");

/**
 * @brief Removes a file or directory tree.
 *
 * When removal is denied, the offending entry and its parent are made
 * writable and removal is retried once.
 *
 * @return False (with a diagnostic) if the tree could not be removed.
 */
bool removeTree(const std::filesystem::path& path);

/**
 * @brief Writes `paths` as the installed-files ledger of `dir`.
 * @return False if the ledger could not be written.
 */
bool writeLedger(const std::filesystem::path& dir,
                 const std::vector<std::filesystem::path>& paths);

/**
 * @brief Reads the installed-files ledger of `dir`.
 * @return std::nullopt if there is no ledger.
 */
std::optional<std::vector<std::filesystem::path>> readLedger(const std::filesystem::path& dir);

/**
 * @brief Writes a develop-mode link marker in `dir` pointing at `target`.
 * @return The marker path.
 */
std::filesystem::path writeLink(const std::filesystem::path& dir,
                                const std::filesystem::path& target);

/**
 * @brief The directory a develop-mode link marker in `dir` points at, if any.
 */
std::optional<std::filesystem::path> readLink(const std::filesystem::path& dir);

/**
 * @brief `dir`, or the target of its link marker.
 */
std::filesystem::path resolveLink(const std::filesystem::path& dir);

} // namespace Quiver

#endif // FSUTIL_HPP
