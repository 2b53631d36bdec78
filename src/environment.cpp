#include "environment.hpp"
#include "errors.hpp"
#include "process.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <iostream>

namespace fs = std::filesystem;

namespace Quiver {

const char* locationName(InstallLocation location)
{
    switch (location) {
        case InstallLocation::Local:  return "local";
        case InstallLocation::Global: return "global";
        case InstallLocation::Root:   return "root";
    }
    return "unknown";
}

Environment Environment::fromProcess()
{
    Environment env;
    std::error_code ec;
    env.projectDir = fs::current_path(ec);
    if (ec) {
        env.projectDir = ".";
    }

    const char* home = std::getenv("HOME");
    env.homeDir = (home && *home) ? fs::path(home) : fs::path("/root");

    const char* venv = std::getenv("VIRTUAL_ENV");
    if (venv && *venv) {
        env.systemPrefix = venv;
    }
    return env;
}

const std::string& Environment::resolvePythonVersion()
{
    if (!pythonVersion.empty()) {
        return pythonVersion;
    }

    auto output = Process::capture({
        pythonExecutable, "-c",
        "import sys; print('%d.%d' % sys.version_info[:2])"});
    if (output) {
        std::string version = *output;
        trim(version);
        pythonVersion = version;
    }
    if (pythonVersion.empty()) {
        log_warning("Could not determine the version of " + pythonExecutable + ", assuming 3");
        pythonVersion = "3";
    }
    return pythonVersion;
}

Directories Environment::directories(InstallLocation location)
{
    Directories dirs;
    switch (location) {
        case InstallLocation::Local:
            dirs.packages  = projectDir / "quiver_modules";
            dirs.bin       = dirs.packages / ".bin";
            dirs.pipPrefix = dirs.packages / ".pip";
            break;
        case InstallLocation::Global:
            dirs.packages  = homeDir / ".local" / "lib" / "quiver" / "modules";
            dirs.bin       = homeDir / ".local" / "bin";
            dirs.pipPrefix = homeDir / ".local";
            break;
        case InstallLocation::Root:
            dirs.packages  = systemPrefix / "lib" / "quiver" / "modules";
            dirs.bin       = systemPrefix / "bin";
            dirs.pipPrefix = systemPrefix;
            break;
    }

    dirs.pipLib = dirs.pipPrefix / "lib" / ("python" + resolvePythonVersion()) / "site-packages";
    dirs.pipBin = dirs.pipPrefix / "bin";
    dirs.referenceDir = dirs.packages.parent_path();
    return dirs;
}

bool isVirtualEnv()
{
    const char* venv = std::getenv("VIRTUAL_ENV");
    return venv && *venv;
}

InstallLocation resolveLocation(bool global, bool root)
{
    if (global && root) {
        throw UsageError("-g,--global and --root can not be used together");
    }
    if (root) {
        return InstallLocation::Root;
    }
    if (global) {
        if (isVirtualEnv()) {
            std::cout << "Note: detected virtual environment, upgrading --global to --root" << std::endl;
            return InstallLocation::Root;
        }
        return InstallLocation::Global;
    }
    return InstallLocation::Local;
}

} // namespace Quiver
