#include "remove.hpp"
#include "fsutil.hpp"
#include "install.hpp"     // Quiver::Installer uninstall methods
#include "lifecycle.hpp"
#include "utils.hpp"

#include <iostream>
#include <filesystem>
#include <vector>
#include <string>
#include <algorithm>

namespace fs = std::filesystem;

// ============================================================================
// Quiver Namespace
// ============================================================================
namespace Quiver {

size_t removeLedgerPaths(const std::vector<fs::path>& files, const fs::path& packageDir)
{
    // Sort descending by path length so deeper entries come first
    std::vector<fs::path> sortedFiles = files;
    std::sort(sortedFiles.begin(), sortedFiles.end(),
              [](const fs::path& a, const fs::path& b) {
                  return a.native().length() > b.native().length();
              });

    const fs::path normalizedPackageDir = packageDir.lexically_normal();
    size_t failures = 0;

    for (const auto& file : sortedFiles) {
        fs::path absPath = file.lexically_normal();
        if (absPath == normalizedPackageDir) {
            // Removed last, with the rest of the tree
            continue;
        }

        try {
            if (!fs::exists(fs::symlink_status(absPath))) {
                std::cerr << "  \"" << absPath.string() << "\": not found" << std::endl;
                continue;
            }

            if (fs::is_directory(fs::symlink_status(absPath))) {
                if (!removeTree(absPath)) {
                    ++failures;
                    continue;
                }
            } else {
                fs::remove(absPath);
            }
            std::cout << "  Removed \"" << absPath.string() << "\"..." << std::endl;
        } catch (const fs::filesystem_error& e) {
            std::cerr << "  Error removing path: " << absPath.string()
                      << " - " << e.what() << std::endl;
            ++failures;
        }
    }
    return failures;
}

namespace {

    // Package directories under <dir>/quiver_modules, descending into @scope dirs
    std::vector<fs::path> nestedPackageDirs(const fs::path& directory)
    {
        std::vector<fs::path> result;
        std::error_code ec;
        fs::path modules = directory / "quiver_modules";
        if (!fs::is_directory(modules, ec)) {
            return result;
        }
        for (const auto& entry : fs::directory_iterator(modules, ec)) {
            std::string name = entry.path().filename().string();
            if (name.empty() || name[0] == '.') {
                continue;
            }
            if (name[0] == '@') {
                for (const auto& scoped : fs::directory_iterator(entry.path(), ec)) {
                    result.push_back(scoped.path());
                }
            } else {
                result.push_back(entry.path());
            }
        }
        std::sort(result.begin(), result.end());
        return result;
    }

} // end anonymous namespace

bool Installer::uninstall(const std::string& name)
{
    fs::path dirname = dirs_.packages / name;
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(dirname, ec))) {
        std::cout << "Package \"" << name << "\" not installed" << std::endl;
        return false;
    }
    return uninstallDirectory(dirname);
}

bool Installer::uninstallDirectory(const fs::path& directory)
{
    fs::path manifestDir = resolveLink(directory);

    PackageManifest manifest;
    try {
        manifest = PackageManifest::load(manifestDir / MANIFEST_FILE, manifestDir);
    } catch (const ManifestNotFound&) {
        if (!options_.force) {
            std::cout << "Can not uninstall: directory \"" << directory.string()
                      << "\": No package manifest, please remove the directory manually "
                      << "or pass -f,--force" << std::endl;
            return false;
        }
        std::cout << "Removing previous directory: \"" << directory.string() << "\"" << std::endl;
        return removeTree(directory);
    } catch (const InvalidManifest& e) {
        std::cout << "Can not uninstall: directory \"" << directory.string()
                  << "\": Invalid manifest: " << e.what() << std::endl;
        return false;
    }

    std::cout << "Uninstalling \"" << manifest.identifier() << "\" from \""
              << directory.string() << "\""
              << (options_.upgrade ? " before upgrade" : "") << "..." << std::endl;

    PackageLifecycle plc(manifest);
    if (plc.run("pre-uninstall") == HookStatus::Failed) {
        std::cerr << "Error: pre-uninstall script failed." << std::endl;
        return false;
    }

    // Internal dependencies have their own ledgers and scripts
    for (const auto& nested : nestedPackageDirs(directory)) {
        if (!uninstallDirectory(nested)) {
            log_warning("Internal dependency \"" + nested.string() +
                        "\" was not uninstalled cleanly");
        }
    }

    auto installedFiles = readLedger(directory);
    if (!installedFiles) {
        log_warning(std::string("No `") + LEDGER_FILE + "` found in package directory");
    } else {
        removeLedgerPaths(*installedFiles, directory);
    }

    return removeTree(directory);
}

} // namespace Quiver
