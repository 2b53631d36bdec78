/*******************************************************
 * lifecycle.cpp
 *
 * Runs the lifecycle scripts declared in a package
 * manifest (pre-install, post-install, pre-uninstall).
 *******************************************************/

#include "lifecycle.hpp"
#include "process.hpp"

#include <filesystem>
#include <iostream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace Quiver {

PackageLifecycle::PackageLifecycle(const PackageManifest& manifest)
    : manifest_(manifest)
{
}

bool PackageLifecycle::declares(const std::string& hook) const
{
    for (const auto& script : manifest_.scripts) {
        if (script.first == hook) {
            return true;
        }
    }
    return false;
}

HookStatus PackageLifecycle::run(const std::string& hook,
                                 const std::vector<std::string>& args,
                                 bool scriptOnly) const
{
    std::vector<std::string> commandArgs;

    for (const auto& script : manifest_.scripts) {
        if (script.first != hook) {
            continue;
        }
        if (script.second.empty()) {
            std::cerr << "     Warning: Empty command for hook '" << hook << "' in "
                      << manifest_.identifier() << ". Skipping." << std::endl;
            return HookStatus::NotDeclared;
        }
        // $0 is the hook name, then the positional arguments
        commandArgs = {"/bin/sh", "-c", script.second, hook};
        break;
    }

    if (commandArgs.empty() && !scriptOnly) {
        fs::path hookFile = manifest_.directory / "hooks" / hook;
        if (fs::is_regular_file(hookFile) && access(hookFile.c_str(), X_OK) == 0) {
            commandArgs = {hookFile.string()};
        }
    }

    if (commandArgs.empty()) {
        return HookStatus::NotDeclared;
    }
    commandArgs.insert(commandArgs.end(), args.begin(), args.end());

    std::cout << "  Running " << hook << " script for " << manifest_.identifier() << " ..." << std::endl;
    int exitCode = Process::run(commandArgs, manifest_.directory.string());
    if (exitCode != 0) {
        std::cerr << "     Hook '" << hook << "' of " << manifest_.identifier()
                  << " FAILED. Exit code: " << exitCode << std::endl;
        return HookStatus::Failed;
    }
    return HookStatus::Succeeded;
}

} // namespace Quiver
