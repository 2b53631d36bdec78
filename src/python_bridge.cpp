#include "python_bridge.hpp"
#include "process.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace Quiver {

namespace {

    // PEP 503 style: case-insensitive, runs of "-_." are equivalent
    std::string normalizeDistName(const std::string& name)
    {
        std::string result;
        bool lastSeparator = false;
        for (char c : name) {
            if (c == '-' || c == '_' || c == '.') {
                if (!lastSeparator) {
                    result += '-';
                }
                lastSeparator = true;
            } else {
                result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                lastSeparator = false;
            }
        }
        return result;
    }

    std::optional<DistInfo> readMetadata(const fs::path& metadataFile)
    {
        std::ifstream in(metadataFile);
        if (!in.is_open()) {
            return std::nullopt;
        }
        DistInfo info;
        std::string line;
        while (std::getline(in, line)) {
            if (line.empty() || line == "\r") {
                break; // end of headers
            }
            if (line.rfind("Name:", 0) == 0) {
                info.name = line.substr(5);
                trim(info.name);
            } else if (line.rfind("Version:", 0) == 0) {
                info.version = line.substr(8);
                trim(info.version);
            }
        }
        if (info.name.empty() || info.version.empty()) {
            return std::nullopt;
        }
        return info;
    }

} // end anonymous namespace

PythonBridge::PythonBridge(Directories dirs, InstallLocation location,
                           std::string python, PipOptions options)
    : dirs_(std::move(dirs)), location_(location),
      python_(std::move(python)), options_(options)
{
}

std::vector<std::string> PythonBridge::pipArguments(const StringPairs& deps,
                                                    const std::vector<std::string>& extraArgs) const
{
    std::vector<std::string> cmd;
    if (location_ == InstallLocation::Local || location_ == InstallLocation::Global) {
        if (options_.useTargetOption) {
            cmd = {"--target", dirs_.pipLib.string()};
        } else {
            cmd = {"--prefix", dirs_.pipPrefix.string()};
        }
    }

    cmd.insert(cmd.end(), extraArgs.begin(), extraArgs.end());
    for (const auto& dep : deps) {
        cmd.push_back(dep.first + dep.second);
    }
    if (options_.ignoreInstalled) {
        cmd.push_back("--ignore-installed");
    }
    if (options_.upgrade) {
        cmd.push_back("--upgrade");
    }
    if (options_.verbose) {
        cmd.push_back("--verbose");
    }
    return cmd;
}

bool PythonBridge::install(const StringPairs& deps, const std::vector<std::string>& extraArgs)
{
    if (deps.empty() && extraArgs.empty()) {
        return true;
    }

    std::vector<std::string> cmd = pipArguments(deps, extraArgs);
    std::cout << "  Installing Python dependencies via Pip: " << join(cmd, " ") << std::endl;

    ScopedEnvironment env;
    if (location_ != InstallLocation::Root) {
        env.prepend("PYTHONPATH", dirs_.pipLib.string());
    }

    std::vector<std::string> args = {python_, "-m", "pip", "install"};
    args.insert(args.end(), cmd.begin(), cmd.end());
    int res = Process::run(args);
    if (res != 0) {
        std::cerr << "Error: `pip install` failed with exit-code " << res << std::endl;
        return false;
    }

    for (const auto& dep : deps) {
        auto info = findDistInfo(dep.first);
        if (info) {
            installedLibs_[dep.first] = *info;
        } else {
            log_warning("Could not find the installed distribution of \"" + dep.first + "\"");
        }
    }
    return true;
}

std::optional<DistInfo> PythonBridge::findDistInfo(const std::string& name) const
{
    std::error_code ec;
    if (!fs::is_directory(dirs_.pipLib, ec)) {
        return std::nullopt;
    }

    std::string wanted = normalizeDistName(name);
    for (const auto& entry : fs::directory_iterator(dirs_.pipLib, ec)) {
        std::string dirName = entry.path().filename().string();
        const std::string suffix = ".dist-info";
        if (dirName.size() <= suffix.size() ||
            dirName.compare(dirName.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }
        // "<name>-<version>.dist-info"
        std::string stem = dirName.substr(0, dirName.size() - suffix.size());
        size_t dash = stem.find('-');
        if (normalizeDistName(stem.substr(0, dash)) != wanted) {
            continue;
        }
        auto info = readMetadata(entry.path() / "METADATA");
        if (info && normalizeDistName(info->name) == wanted) {
            return info;
        }
    }
    return std::nullopt;
}

void PythonBridge::relinkScripts(ScriptMaker& script) const
{
    if (location_ != InstallLocation::Local) {
        return;
    }
    std::error_code ec;
    if (!fs::is_directory(dirs_.pipBin, ec)) {
        return;
    }

    std::cout << "Relinking Pip-installed proxy scripts ..." << std::endl;
    std::vector<fs::path> programs;
    for (const auto& entry : fs::directory_iterator(dirs_.pipBin, ec)) {
        if (entry.is_regular_file(ec)) {
            programs.push_back(entry.path());
        }
    }
    std::sort(programs.begin(), programs.end());

    for (const auto& program : programs) {
        fs::path target = fs::absolute(program);
        std::cout << "  Creating " << program.filename().string()
                  << " from " << target.string() << " ..." << std::endl;
        try {
            script.makeWrapper(program.filename().string(), {target.string()});
        } catch (const std::exception& e) {
            log_error(std::string("Failed to relink ") + program.filename().string() + ": " + e.what());
        }
    }
}

} // namespace Quiver
