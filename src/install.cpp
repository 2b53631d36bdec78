//============================================================================
// Includes
//============================================================================

#include "install.hpp"         // Installer and its parameter types
#include "archive.hpp"         // Archive extraction
#include "file_filter.hpp"     // walkPackageFiles
#include "fsutil.hpp"          // TempPath, ledger and link helpers
#include "lifecycle.hpp"       // pre-install / post-install scripts
#include "process.hpp"         // git subprocesses
#include "utils.hpp"           // Logging

#include <iostream>            // Standard I/O (cout, cerr)
#include <filesystem>          // Modern C++ filesystem operations
#include <algorithm>           // std::find_if, std::find
#include <system_error>        // std::error_code
#include <stdexcept>           // Standard exceptions

// Alias for easier filesystem usage
namespace fs = std::filesystem;

/**
 * ===========================================================================
 * Quiver Namespace
 * ===========================================================================
 */
namespace Quiver {

    namespace {

        /**
         * -------------------------------------------------------------------
         * expandUser
         *
         * Replaces a leading "~/" with the home directory.
         * -------------------------------------------------------------------
         */
        fs::path expandUser(const std::string& path, const fs::path& home) {
            if (path.rfind("~/", 0) == 0) {
                return home / path.substr(2);
            }
            return fs::path(path);
        }

        /**
         * -------------------------------------------------------------------
         * scriptNames
         *
         * Expands a "${py}" placeholder in an entry-point name to the
         * unversioned, major and major.minor variants.
         * -------------------------------------------------------------------
         */
        std::vector<std::string> scriptNames(const std::string& name,
                                             const std::string& pythonVersion) {
            const std::string placeholder = "${py}";
            size_t pos = name.find(placeholder);
            if (pos == std::string::npos) {
                return {name};
            }

            std::string major = pythonVersion.substr(0, pythonVersion.find('.'));
            std::vector<std::string> names;
            for (const std::string& suffix : {std::string(), major, pythonVersion}) {
                std::string expanded = name;
                expanded.replace(pos, placeholder.size(), suffix);
                if (std::find(names.begin(), names.end(), expanded) == names.end()) {
                    names.push_back(expanded);
                }
            }
            return names;
        }

    } // end anonymous namespace

    InstallResult InstallResult::ok(const PackageManifest& manifest) {
        InstallResult result;
        result.success = true;
        result.manifest = manifest;
        result.name = manifest.name;
        result.version = manifest.version;
        return result;
    }

    InstallResult InstallResult::failed(InstallError error,
                                        std::optional<PackageManifest> manifest) {
        InstallResult result;
        result.error = error;
        if (manifest) {
            result.name = manifest->name;
            result.version = manifest->version;
        }
        result.manifest = std::move(manifest);
        return result;
    }

    Installer::Installer(InstallerOptions options,
                         Environment env,
                         std::vector<std::shared_ptr<Registry>> registries)
        : options_(options),
          env_(std::move(env)),
          dirs_(env_.directories(options_.location)),
          registries_(std::move(registries)),
          script_(dirs_.bin, env_.runtimeExecutable),
          bridge_(dirs_, options_.location, env_.pythonExecutable,
                  PipOptions{options_.pipUseTargetOption, options_.pipIgnoreInstalled,
                             options_.upgrade, options_.verbose}) {

        // Generated scripts must see pip-installed programs and modules
        if (options_.location == InstallLocation::Local ||
            options_.location == InstallLocation::Global) {
            script_.path.push_back(dirs_.pipBin.string());
            script_.pythonpath.push_back(dirs_.pipLib.string());
        }
    }

    fs::path Installer::targetDirectory(const std::string& name,
                                        bool internal,
                                        const InstallContext& ctx) const {
        if (internal && !ctx.empty()) {
            return ctx.top().directory / "quiver_modules" / name;
        }
        return dirs_.packages / name;
    }

    /**
     * ------------------------------------------------------------------------
     * Installer::findPackage
     *
     * Looks for an installed package at the scope the requirement asks for.
     * A develop-mode link redirects the manifest lookup to the source tree.
     * ------------------------------------------------------------------------
     */
    std::optional<PackageManifest> Installer::findPackage(const std::string& name,
                                                          bool internal,
                                                          const InstallContext& ctx) const {
        fs::path dirname = targetDirectory(name, internal, ctx);
        std::error_code ec;
        if (!fs::is_directory(dirname, ec)) {
            return std::nullopt;
        }

        fs::path manifestPath = resolveLink(dirname) / MANIFEST_FILE;
        if (!fs::is_regular_file(manifestPath, ec)) {
            log_warning(std::string("found package directory without ") + MANIFEST_FILE +
                        "\n  at '" + dirname.string() + "'");
            return std::nullopt;
        }
        return PackageManifest::load(manifestPath, dirname);
    }

    /**
     * ------------------------------------------------------------------------
     * Installer::installDependencies
     *
     * Skips requirements that are already installed (warning when a
     * registry selector is not satisfied), then installs the rest in
     * declaration order. The first failure aborts the set.
     * ------------------------------------------------------------------------
     */
    bool Installer::installDependencies(const RequirementList& deps,
                                        const fs::path& currentDir,
                                        InstallContext& ctx) {
        RequirementList installDeps;

        for (const auto& [name, req] : deps) {
            auto dep = findPackage(name, req.internal, ctx);
            if (!dep) {
                installDeps.emplace_back(name, req);
                continue;
            }

            if (req.type == Requirement::Type::Registry) {
                if (!req.selector(dep->version)) {
                    log_warning("Dependency \"" + name + "@" + req.selector.toString() +
                                "\" unsatisfied, have \"" + dep->identifier() + "\" installed");
                } else {
                    std::cout << "  Skipping satisfied dependency \"" << name << "@"
                              << req.selector.toString() << "\", have \""
                              << dep->identifier() << "\" installed" << std::endl;
                }
            } else {
                std::cout << "  Skipping dependency \"" << name << "\" from \""
                          << req.toString(false) << "\", have \""
                          << dep->identifier() << "\" installed" << std::endl;
            }

            if (options_.recursive && !repairDependencies(*dep, ctx)) {
                return false;
            }
        }

        if (installDeps.empty()) {
            return true;
        }

        std::vector<std::string> names;
        for (const auto& dep : installDeps) {
            names.push_back(dep.second.type == Requirement::Type::Registry
                            ? dep.second.toString()
                            : dep.first + " (" + dep.second.toString(false) + ")");
        }
        std::cout << "  Installing dependencies: " << join(names, ", ") << std::endl;

        for (const auto& dep : installDeps) {
            InstallResult result = installFromRequirement(dep.second, currentDir, DirectoryInstall{}, ctx);
            if (!result.success) {
                log_error("Failed to install dependency \"" + dep.first + "\" (" +
                          errorName(result.error) + ")");
                return false;
            }
        }
        return true;
    }

    /**
     * ------------------------------------------------------------------------
     * Installer::repairDependencies
     *
     * Re-checks the dependencies of an installed package, inside its own
     * scope. Packages already on the stack are not visited again.
     * ------------------------------------------------------------------------
     */
    bool Installer::repairDependencies(const PackageManifest& manifest, InstallContext& ctx) {
        if (ctx.contains(manifest.directory)) {
            return true;
        }
        ScopedInstallFrame frame(ctx, manifest, manifest.directory);
        return installDependenciesFor(manifest, false, ctx);
    }

    bool Installer::installDependenciesFor(const PackageManifest& manifest,
                                           bool dev,
                                           InstallContext& ctx) {
        std::vector<std::string> contexts;
        if (dev) {
            contexts.push_back("dev");
        }

        // Dev entries override plain ones of the same name
        RequirementList deps = manifest.requirements("dependencies", contexts);
        if (dev) {
            for (auto& devDep : manifest.requirements("dev_dependencies", contexts)) {
                auto it = std::find_if(deps.begin(), deps.end(),
                                       [&](const auto& d) { return d.first == devDep.first; });
                if (it != deps.end()) {
                    it->second = devDep.second;
                } else {
                    deps.push_back(devDep);
                }
            }
        }

        if (!deps.empty()) {
            std::cout << "Installing dependencies for \"" << manifest.identifier() << "\""
                      << (dev ? " (dev)" : "") << "..." << std::endl;
            if (!installDependencies(deps, manifest.directory, ctx)) {
                return false;
            }
        }

        StringPairs pyDeps = manifest.pythonRequirements("python_dependencies", contexts);
        if (dev) {
            for (auto& devDep : manifest.pythonRequirements("dev_python_dependencies", contexts)) {
                auto it = std::find_if(pyDeps.begin(), pyDeps.end(),
                                       [&](const auto& d) { return d.first == devDep.first; });
                if (it != pyDeps.end()) {
                    it->second = devDep.second;
                } else {
                    pyDeps.push_back(devDep);
                }
            }
        }

        if (!pyDeps.empty()) {
            std::cout << "Installing Python dependencies for \"" << manifest.identifier() << "\""
                      << (dev ? " (dev)" : "") << "..." << std::endl;
            if (!bridge_.install(pyDeps)) {
                return false;
            }
        }
        return true;
    }

    InstallResult Installer::installFromRequirement(const Requirement& req,
                                                    const fs::path& currentDir,
                                                    DirectoryInstall params,
                                                    InstallContext& ctx) {
        params.internal = params.internal || req.internal;
        params.pure = params.pure || req.pure;

        switch (req.type) {
            case Requirement::Type::Git:
                return installFromGit(req.gitUrlWithRef(), req.recursive, params, ctx);

            case Requirement::Type::Path: {
                fs::path path = expandUser(req.path, env_.homeDir);
                if (path.is_relative()) {
                    path = currentDir / path;
                }
                path = path.lexically_normal();
                if (req.isArchive()) {
                    return installFromArchive(path, params, ctx);
                }
                params.develop = params.develop || req.link;
                return installFromDirectory(path, params, ctx);
            }

            case Requirement::Type::Registry:
                return installFromRegistry(req.name, req.selector, params, ctx);
        }
        return InstallResult::failed(InstallError::NotFound);
    }

    /**
     * ------------------------------------------------------------------------
     * Installer::installFromDirectory
     *
     * Converts exceptions raised while installing into a failed result.
     * ------------------------------------------------------------------------
     */
    InstallResult Installer::installFromDirectory(const fs::path& directory,
                                                  const DirectoryInstall& params,
                                                  InstallContext& ctx) {
        try {
            return installDirectoryChecked(directory, params, ctx);
        } catch (const InvalidManifest& e) {
            log_error(e.what());
            return InstallResult::failed(InstallError::InvalidManifest);
        } catch (const fs::filesystem_error& e) {
            log_error(std::string("Filesystem error while installing \"") +
                      directory.string() + "\": " + e.what());
            return InstallResult::failed(InstallError::CopyFailed);
        } catch (const std::exception& e) {
            log_error("Failed to install \"" + directory.string() + "\": " + e.what());
            return InstallResult::failed(InstallError::DependencyFailed);
        }
    }

    /**
     * ------------------------------------------------------------------------
     * Installer::installDirectoryChecked
     *
     * 1. load and verify the manifest
     * 2. handle an existing install (skip, or uninstall on upgrade)
     * 3. pre-install script, then dependencies
     * 4. move, link or copy the package files
     * 5. entry-point scripts, ledger, post-install script
     * ------------------------------------------------------------------------
     */
    InstallResult Installer::installDirectoryChecked(const fs::path& directory,
                                                     const DirectoryInstall& params,
                                                     InstallContext& ctx) {
        fs::path sourceDir = fs::absolute(directory).lexically_normal();
        if (!sourceDir.has_filename() && sourceDir.has_parent_path()) {
            sourceDir = sourceDir.parent_path();
        }

        PackageManifest manifest;
        try {
            manifest = PackageManifest::load(sourceDir / MANIFEST_FILE);
        } catch (const ManifestNotFound&) {
            std::cerr << "Error: directory \"" << directory.string()
                      << "\" contains no package manifest" << std::endl;
            return InstallResult::failed(InstallError::NoManifest);
        } catch (const InvalidManifest& e) {
            std::cerr << "Error: directory \"" << directory.string() << "\": "
                      << e.what() << std::endl;
            return InstallResult::failed(InstallError::InvalidManifest);
        }

        if (params.expect &&
            (manifest.name != params.expect->first || manifest.version != params.expect->second)) {
            std::cerr << "Error: Expected to install \"" << params.expect->first << "@"
                      << params.expect->second << "\" but got \"" << manifest.identifier()
                      << "\" in \"" << directory.string() << "\"" << std::endl;
            return InstallResult::failed(InstallError::IdentityMismatch, manifest);
        }

        std::cout << "Installing \"" << manifest.identifier() << "\"..." << std::endl;
        fs::path targetDir = targetDirectory(manifest.name, params.internal, ctx);

        // An existing install must be removed before it can be installed again
        std::error_code ec;
        if (fs::exists(fs::symlink_status(targetDir, ec))) {
            if (!options_.upgrade) {
                std::cout << "  Note: install directory \"" << targetDir.string()
                          << "\" already exists, specify --upgrade" << std::endl;
                auto existing = findPackage(manifest.name, params.internal, ctx);
                return InstallResult::ok(existing ? *existing : manifest);
            }
            if (!uninstallDirectory(targetDir)) {
                return InstallResult::failed(InstallError::UninstallFailed, manifest);
            }
        }

        ScopedInstallFrame frame(ctx, manifest, targetDir);

        PackageLifecycle plc(manifest);
        if (plc.run("pre-install") == HookStatus::Failed) {
            std::cerr << "Error: pre-install script failed." << std::endl;
            return InstallResult::failed(InstallError::HookFailed, manifest);
        }

        if (!installDependenciesFor(manifest, params.dev, ctx)) {
            return InstallResult::failed(InstallError::DependencyFailed, manifest);
        }

        std::vector<fs::path> installedFiles;

        if (params.movedir) {
            std::cout << "Moving \"" << manifest.identifier() << "\" to \""
                      << targetDir.string() << "\" ..." << std::endl;
            try {
                if (!fs::exists(targetDir)) {
                    fs::create_directories(targetDir.parent_path());
                    fs::rename(sourceDir, targetDir);
                } else {
                    // Internal dependencies were already placed in the target
                    for (const auto& entry : fs::directory_iterator(sourceDir)) {
                        fs::rename(entry.path(), targetDir / entry.path().filename());
                    }
                }
            } catch (const fs::filesystem_error& e) {
                log_error(std::string("Failed to move package into place: ") + e.what());
                return InstallResult::failed(InstallError::MoveFailed, manifest);
            }
            installedFiles.push_back(targetDir);
        } else {
            std::cout << "Installing \"" << manifest.identifier() << "\" to \""
                      << targetDir.string() << "\" ..." << std::endl;
            try {
                fs::create_directories(targetDir);
                if (params.develop) {
                    // The link marker holds the path of the real package directory
                    std::cout << "  Creating " << LINK_FILE << " to \""
                              << sourceDir.string() << "\"..." << std::endl;
                    installedFiles.push_back(writeLink(targetDir, sourceDir));
                } else {
                    for (const auto& [src, rel] : walkPackageFiles(manifest)) {
                        fs::path dst = targetDir / rel;
                        fs::create_directories(dst.parent_path());
                        if (options_.verbose) {
                            std::cout << "  Copying " << rel << " ..." << std::endl;
                        }
                        if (fs::is_symlink(src)) {
                            fs::copy_symlink(src, dst);
                        } else {
                            fs::copy_file(src, dst, fs::copy_options::overwrite_existing);
                        }
                        installedFiles.push_back(dst);
                    }
                }
            } catch (const std::exception& e) {
                log_error(std::string("Failed to copy package files: ") + e.what());
                return InstallResult::failed(InstallError::CopyFailed, manifest);
            }
        }

        // Scripts run the package from where its files really are
        fs::path packageDir = params.develop ? sourceDir : targetDir;

        if (!params.pure) {
            try {
                auto scripts = installEntryScripts(manifest, packageDir);
                installedFiles.insert(installedFiles.end(), scripts.begin(), scripts.end());
            } catch (const std::exception& e) {
                log_error(std::string("Failed to create entry-point scripts: ") + e.what());
                return InstallResult::failed(InstallError::CopyFailed, manifest);
            }
        }

        if (!writeLedger(targetDir, installedFiles)) {
            return InstallResult::failed(InstallError::LedgerWriteFailed, manifest);
        }

        PackageManifest installed = manifest;
        installed.directory = packageDir;
        if (PackageLifecycle(installed).run("post-install") == HookStatus::Failed) {
            std::cerr << "Error: post-install script failed; \"" << targetDir.string()
                      << "\" was left installed" << std::endl;
            return InstallResult::failed(InstallError::HookFailed, installed);
        }

        installed.directory = targetDir;
        return InstallResult::ok(installed);
    }

    std::vector<fs::path> Installer::installEntryScripts(const PackageManifest& manifest,
                                                         const fs::path& packageDir) {
        std::vector<fs::path> written;
        for (const auto& [binName, binFile] : manifest.bin) {
            std::vector<std::string> names = {binName};
            if (binName.find("${py}") != std::string::npos) {
                names = scriptNames(binName, env_.resolvePythonVersion());
            }

            fs::path filename = binFile;
            if (!manifest.resolveRoot.empty()) {
                filename = fs::path(manifest.resolveRoot) / binFile;
            }
            fs::path target = fs::absolute(packageDir / filename).lexically_normal();

            for (const auto& name : names) {
                std::cout << "  Installing script \"" << name << "\" to \""
                          << script_.binDir().string() << "\"..." << std::endl;
                auto files = script_.makeEntryScript(name, target, dirs_.referenceDir);
                written.insert(written.end(), files.begin(), files.end());
            }
        }
        return written;
    }

    /**
     * ------------------------------------------------------------------------
     * Installer::installFromArchive
     *
     * Unpacks into a temporary directory that is removed on every path out.
     * An archive wrapping the package in one top-level directory is
     * installed from that directory.
     * ------------------------------------------------------------------------
     */
    InstallResult Installer::installFromArchive(const fs::path& archive,
                                                const DirectoryInstall& params,
                                                InstallContext& ctx) {
        std::cout << "Unpacking \"" << archive.string() << "\"..." << std::endl;

        std::optional<TempPath> unpacked;
        try {
            unpacked.emplace(makeTempDirectory("quiver-unpack-").release());
        } catch (const fs::filesystem_error& e) {
            log_error(std::string("Unable to create a temporary directory: ") + e.what());
            return InstallResult::failed(InstallError::ExtractFailed);
        }

        if (!extractArchive(archive, unpacked->path())) {
            std::cerr << "Error: failed to extract \"" << archive.string() << "\"" << std::endl;
            return InstallResult::failed(InstallError::ExtractFailed);
        }

        fs::path root = unpacked->path();
        std::error_code ec;
        if (!fs::exists(root / MANIFEST_FILE, ec)) {
            std::vector<fs::path> entries;
            for (const auto& entry : fs::directory_iterator(root, ec)) {
                entries.push_back(entry.path());
            }
            if (entries.size() == 1 && fs::is_directory(entries[0], ec)) {
                root = entries[0];
            }
        }

        DirectoryInstall archiveParams = params;
        archiveParams.develop = false;
        archiveParams.movedir = false;
        return installFromDirectory(root, archiveParams, ctx);
    }

    /**
     * ------------------------------------------------------------------------
     * Installer::installFromRegistry
     *
     * Queries the registries in configured order; the first one offering a
     * matching release wins.
     * ------------------------------------------------------------------------
     */
    InstallResult Installer::installFromRegistry(const std::string& name,
                                                 const Selector& selector,
                                                 const DirectoryInstall& params,
                                                 InstallContext& ctx) {
        std::optional<PackageManifest> existing;
        try {
            existing = findPackage(name, params.internal, ctx);
        } catch (const InvalidManifest& e) {
            log_error(e.what());
            return InstallResult::failed(InstallError::InvalidManifest);
        }

        if (existing) {
            if (!selector(existing->version)) {
                log_warning("Dependency \"" + name + "@" + selector.toString() +
                            "\" unsatisfied, have \"" + existing->identifier() + "\" installed");
            }
            if (!options_.upgrade) {
                std::cout << "package \"" << existing->identifier()
                          << "\" already installed, specify --upgrade" << std::endl;
                return InstallResult::ok(*existing);
            }
        }

        std::cout << "Finding package matching \"" << name << "@" << selector.toString()
                  << "\"..." << std::endl;

        std::shared_ptr<Registry> source;
        RegistryPackage info;
        for (const auto& registry : registries_) {
            std::cout << "  Checking registry \"" << registry->name() << "\" ("
                      << registry->baseUrl() << ")... ";
            try {
                auto found = registry->findPackage(name, selector);
                if (found) {
                    std::cout << "FOUND (" << found->name << "@" << found->version << ")" << std::endl;
                    source = registry;
                    info = *found;
                    break;
                }
                std::cout << "NOT FOUND" << std::endl;
            } catch (const std::exception& e) {
                std::cout << "ERROR" << std::endl;
                log_warning(e.what());
            }
        }

        if (!source) {
            std::cerr << "Error: package \"" << name << "@" << selector.toString()
                      << "\" could not be located" << std::endl;
            InstallResult result = InstallResult::failed(InstallError::PackageNotFound);
            result.name = name;
            return result;
        }

        std::cout << "Downloading \"" << info.name << "@" << info.version << "\"..." << std::endl;
        TempPath download(generateTempFilename("quiver-download-", "") + "_" +
                          fs::path(info.fileName).filename().string());
        try {
            source->download(info.name, info.version, download.path().string());
        } catch (const std::exception& e) {
            log_error(e.what());
            InstallResult result = InstallResult::failed(InstallError::DownloadFailed);
            result.name = name;
            result.version = info.version;
            return result;
        }

        DirectoryInstall archiveParams = params;
        archiveParams.expect = std::make_pair(name, info.version);
        InstallResult result = installFromArchive(download.path(), archiveParams, ctx);
        result.name = name;
        result.version = info.version;
        return result;
    }

    /**
     * ------------------------------------------------------------------------
     * Installer::installFromGit
     *
     * Clones next to the installed packages so the final step is a rename.
     * The clone is removed on scope exit unless it was moved into place.
     * ------------------------------------------------------------------------
     */
    InstallResult Installer::installFromGit(const std::string& urlWithRef,
                                            bool recursive,
                                            const DirectoryInstall& params,
                                            InstallContext& ctx) {
        Requirement req = Requirement::parse("git+" + urlWithRef);

        std::error_code ec;
        fs::create_directories(dirs_.packages, ec);
        if (ec) {
            log_error("Unable to create " + dirs_.packages.string() + ": " + ec.message());
            return InstallResult::failed(InstallError::CloneFailed);
        }

        TempPath dest(generateTempFilename(".tmp-", dirs_.packages.string()));

        std::vector<std::string> cloneArgs = {"git", "clone"};
        if (recursive) {
            cloneArgs.push_back("--recurse-submodules");
        }
        cloneArgs.push_back(req.url);
        cloneArgs.push_back(dest.path().string());

        std::cout << "Cloning \"" << req.url << "\"..." << std::endl;
        if (Process::run(cloneArgs) != 0) {
            std::cerr << "Error: Git clone failed" << std::endl;
            return InstallResult::failed(InstallError::CloneFailed);
        }

        if (!req.ref.empty()) {
            std::cout << "Checking out \"" << req.ref << "\"..." << std::endl;
            if (Process::run({"git", "-C", dest.path().string(), "checkout", "-q", req.ref}) != 0) {
                std::cerr << "Error: Git checkout of \"" << req.ref << "\" failed" << std::endl;
                return InstallResult::failed(InstallError::CloneFailed);
            }
            if (recursive &&
                Process::run({"git", "-C", dest.path().string(),
                              "submodule", "update", "--init", "--recursive"}) != 0) {
                std::cerr << "Error: Git submodule update failed" << std::endl;
                return InstallResult::failed(InstallError::CloneFailed);
            }
        }

        DirectoryInstall moveParams = params;
        moveParams.movedir = true;
        moveParams.develop = false;
        return installFromDirectory(dest.path(), moveParams, ctx);
    }

} // namespace Quiver
