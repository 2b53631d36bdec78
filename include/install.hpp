#ifndef INSTALL_HPP
#define INSTALL_HPP

#include "environment.hpp"
#include "errors.hpp"
#include "install_context.hpp"
#include "manifest.hpp"
#include "python_bridge.hpp"
#include "registry.hpp"
#include "requirement.hpp"
#include "script.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Quiver {

/**
 * @brief Installer-wide policy flags.
 */
struct InstallerOptions
{
    bool upgrade = false;
    InstallLocation location = InstallLocation::Local;
    bool recursive = false;
    bool verbose = false;
    bool force = false;
    bool pipUseTargetOption = false;
    bool pipIgnoreInstalled = false;
};

/**
 * @brief Per-call parameters of a directory (or archive, git, registry) install.
 */
struct DirectoryInstall
{
    /** Write a link marker instead of copying files. */
    bool develop = false;
    /** Also install dev_dependencies. */
    bool dev = false;
    /** (name, version) the directory must contain. */
    std::optional<std::pair<std::string, std::string>> expect;
    /** Move the directory into place instead of copying (git clones). */
    bool movedir = false;
    /** Install under the innermost package being installed. */
    bool internal = false;
    /** Skip entry-point scripts. */
    bool pure = false;
};

/**
 * @brief Outcome of one install step.
 */
struct InstallResult
{
    bool success = false;
    InstallError error = InstallError::None;
    std::optional<PackageManifest> manifest;
    std::string name;
    std::string version;

    static InstallResult ok(const PackageManifest& manifest);
    static InstallResult failed(InstallError error,
                                std::optional<PackageManifest> manifest = std::nullopt);
};

/**
 * @class Installer
 * @brief Resolves requirements, fetches packages from registries, git or the
 *        filesystem, and installs or uninstalls them with their dependencies.
 *
 * The package tree is assumed to be owned by a single Installer at a time.
 */
class Installer
{
public:
    Installer(InstallerOptions options,
              Environment env,
              std::vector<std::shared_ptr<Registry>> registries);

    /**
     * @brief Finds an installed package. With `internal` and a non-empty
     *        context it is looked for under the innermost package.
     * @throws InvalidManifest if the installed manifest can't be parsed.
     */
    std::optional<PackageManifest> findPackage(const std::string& name,
                                               bool internal,
                                               const InstallContext& ctx) const;

    /**
     * @brief Installs the requirements that are not installed yet, in order.
     *        Relative paths are resolved against `currentDir`.
     * @return False on the first failure.
     */
    bool installDependencies(const RequirementList& deps,
                             const std::filesystem::path& currentDir,
                             InstallContext& ctx);

    /**
     * @brief Installs a manifest's dependencies (and dev dependencies with
     *        `dev`), then its python dependencies.
     */
    bool installDependenciesFor(const PackageManifest& manifest, bool dev, InstallContext& ctx);

    /**
     * @brief Installs one requirement from whatever source it names.
     */
    InstallResult installFromRequirement(const Requirement& req,
                                         const std::filesystem::path& currentDir,
                                         DirectoryInstall params,
                                         InstallContext& ctx);

    InstallResult installFromDirectory(const std::filesystem::path& directory,
                                       const DirectoryInstall& params,
                                       InstallContext& ctx);

    InstallResult installFromArchive(const std::filesystem::path& archive,
                                     const DirectoryInstall& params,
                                     InstallContext& ctx);

    InstallResult installFromRegistry(const std::string& name,
                                      const Selector& selector,
                                      const DirectoryInstall& params,
                                      InstallContext& ctx);

    InstallResult installFromGit(const std::string& urlWithRef,
                                 bool recursive,
                                 const DirectoryInstall& params,
                                 InstallContext& ctx);

    /**
     * @brief Uninstalls a package by name from the packages directory.
     */
    bool uninstall(const std::string& name);

    /**
     * @brief Uninstalls the package installed in `directory`, after the
     *        internal dependencies nested under its quiver_modules/.
     */
    bool uninstallDirectory(const std::filesystem::path& directory);

    /**
     * @brief Where a package named `name` is installed.
     */
    std::filesystem::path targetDirectory(const std::string& name,
                                          bool internal,
                                          const InstallContext& ctx) const;

    const Directories& directories() const { return dirs_; }
    const InstallerOptions& options() const { return options_; }
    PythonBridge& pythonBridge() { return bridge_; }
    ScriptMaker& scriptMaker() { return script_; }

private:
    InstallResult installDirectoryChecked(const std::filesystem::path& directory,
                                          const DirectoryInstall& params,
                                          InstallContext& ctx);
    bool repairDependencies(const PackageManifest& manifest, InstallContext& ctx);
    std::vector<std::filesystem::path> installEntryScripts(const PackageManifest& manifest,
                                                           const std::filesystem::path& packageDir);

    InstallerOptions options_;
    Environment env_;
    Directories dirs_;
    std::vector<std::shared_ptr<Registry>> registries_;
    ScriptMaker script_;
    PythonBridge bridge_;
};

} // namespace Quiver

#endif // INSTALL_HPP
