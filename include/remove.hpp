#ifndef REMOVE_HPP
#define REMOVE_HPP

#include <filesystem>
#include <vector>

namespace Quiver {

/**
 * @brief Removes the paths listed in a package's installed-files ledger.
 *
 * Missing paths and removal errors are reported and skipped. The package
 * directory itself is left for the caller, which removes it last.
 *
 * @param files      Absolute paths from the ledger.
 * @param packageDir The install directory the ledger belongs to.
 * @return The number of paths that could not be removed.
 */
size_t removeLedgerPaths(const std::vector<std::filesystem::path>& files,
                         const std::filesystem::path& packageDir);

} // namespace Quiver

#endif // REMOVE_HPP
