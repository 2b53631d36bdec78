#ifndef ARCHIVE_HPP
#define ARCHIVE_HPP

#include <filesystem>
#include <string>

namespace Quiver {

/**
 * @brief True if `path` names a package archive by extension
 *        (.tar, .tar.gz, .tgz, .tar.bz2, .tar.xz, .zip).
 */
bool isArchiveFile(const std::string& path);

/**
 * @brief Extracts every entry of `archivePath` under `destDir`.
 *
 * Entries that would escape `destDir` (absolute paths, "..") are refused.
 *
 * @return False (with a diagnostic) on any read or write error.
 */
bool extractArchive(const std::filesystem::path& archivePath,
                    const std::filesystem::path& destDir);

} // namespace Quiver

#endif // ARCHIVE_HPP
