#ifndef PYTHON_BRIDGE_HPP
#define PYTHON_BRIDGE_HPP

#include "environment.hpp"
#include "manifest.hpp"
#include "script.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Quiver {

/**
 * @brief Name and version of an installed python distribution.
 */
struct DistInfo
{
    std::string name;
    std::string version;
};

struct PipOptions
{
    bool useTargetOption = false;
    bool ignoreInstalled = false;
    bool upgrade = false;
    bool verbose = false;
};

/**
 * @class PythonBridge
 * @brief Installs python dependencies with pip into the directories of an
 *        install location.
 */
class PythonBridge
{
public:
    PythonBridge(Directories dirs, InstallLocation location,
                 std::string python, PipOptions options);

    /**
     * @brief The pip command line (without "<python> -m pip install").
     */
    std::vector<std::string> pipArguments(const StringPairs& deps,
                                          const std::vector<std::string>& extraArgs) const;

    /**
     * @brief Runs pip for `deps` plus `extraArgs` and records the installed
     *        distribution of each dependency.
     * @return False if pip exits non-zero.
     */
    bool install(const StringPairs& deps, const std::vector<std::string>& extraArgs = {});

    /**
     * @brief Distributions recorded by install(), keyed by requested name.
     */
    const std::map<std::string, DistInfo>& installedLibs() const { return installedLibs_; }

    /**
     * @brief Looks up the .dist-info metadata of `name` in the pip library directory.
     */
    std::optional<DistInfo> findDistInfo(const std::string& name) const;

    /**
     * @brief Creates a wrapper in the bin directory for every program pip
     *        installed (local installs only).
     */
    void relinkScripts(ScriptMaker& script) const;

private:
    Directories dirs_;
    InstallLocation location_;
    std::string python_;
    PipOptions options_;
    std::map<std::string, DistInfo> installedLibs_;
};

} // namespace Quiver

#endif // PYTHON_BRIDGE_HPP
