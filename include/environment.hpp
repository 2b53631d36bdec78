#ifndef ENVIRONMENT_HPP
#define ENVIRONMENT_HPP

#include <filesystem>
#include <string>

namespace Quiver {

/**
 * @brief Where packages are installed: per project, per user or system-wide.
 */
enum class InstallLocation
{
    Local,
    Global,
    Root
};

const char* locationName(InstallLocation location);

/**
 * @brief The directory set belonging to one install location.
 */
struct Directories
{
    std::filesystem::path packages;
    std::filesystem::path bin;
    std::filesystem::path pipPrefix;
    std::filesystem::path pipLib;
    std::filesystem::path pipBin;
    std::filesystem::path referenceDir;
};

/**
 * @brief Host facts the installer needs to compute its directories.
 */
struct Environment
{
    std::filesystem::path projectDir;
    std::filesystem::path homeDir;
    std::filesystem::path systemPrefix = "/usr/local";
    std::string pythonExecutable = "python3";
    std::string runtimeExecutable = "quiver-run";

    /**
     * @brief "major.minor" of the interpreter. Probed on first use when empty.
     */
    std::string pythonVersion;

    /**
     * @brief Environment of the current process: working directory, $HOME,
     *        and $VIRTUAL_ENV as the system prefix when set.
     */
    static Environment fromProcess();

    /**
     * @brief The directory set for `location`.
     */
    Directories directories(InstallLocation location);

    /**
     * @brief "major.minor" of `pythonExecutable`, probed once.
     */
    const std::string& resolvePythonVersion();
};

/**
 * @brief True when a python virtual environment is active ($VIRTUAL_ENV set).
 */
bool isVirtualEnv();

/**
 * @brief Maps the --global and --root flags to an install location.
 *
 * --global inside a virtual environment is upgraded to Root with a note.
 *
 * @throws UsageError if both flags are set.
 */
InstallLocation resolveLocation(bool global, bool root);

} // namespace Quiver

#endif // ENVIRONMENT_HPP
