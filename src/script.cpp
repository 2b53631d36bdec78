#include "script.hpp"
#include "utils.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace Quiver {

std::string shellQuote(const std::string& value)
{
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

ScriptMaker::ScriptMaker(fs::path binDir, std::string runtime)
    : binDir_(std::move(binDir)), runtime_(std::move(runtime))
{
}

fs::path ScriptMaker::write(const std::string& name, const std::string& body)
{
    fs::create_directories(binDir_);
    fs::path scriptPath = binDir_ / name;

    std::ostringstream script;
    script << "#!/bin/sh\n";
    script << "# Generated by quiver, do not edit.\n";

    std::vector<std::string> quotedPath;
    for (const auto& p : path) {
        quotedPath.push_back(shellQuote(p));
    }
    if (!quotedPath.empty()) {
        script << "PATH=" << join(quotedPath, ":") << "${PATH:+:$PATH}\n";
        script << "export PATH\n";
    }

    std::vector<std::string> quotedPythonPath;
    for (const auto& p : pythonpath) {
        quotedPythonPath.push_back(shellQuote(p));
    }
    if (!quotedPythonPath.empty()) {
        script << "PYTHONPATH=" << join(quotedPythonPath, ":") << "${PYTHONPATH:+:$PYTHONPATH}\n";
        script << "export PYTHONPATH\n";
    }
    script << body;

    std::ofstream out(scriptPath, std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Unable to write script " + scriptPath.string());
    }
    out << script.str();
    out.close();
    if (!out) {
        throw std::runtime_error("Failed writing script " + scriptPath.string());
    }

    fs::permissions(scriptPath,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                    fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace);
    return scriptPath;
}

std::vector<fs::path> ScriptMaker::makeWrapper(const std::string& name,
                                               const std::vector<std::string>& command)
{
    std::vector<std::string> quoted;
    for (const auto& arg : command) {
        quoted.push_back(shellQuote(arg));
    }
    return {write(name, "exec " + join(quoted, " ") + " \"$@\"\n")};
}

std::vector<fs::path> ScriptMaker::makeEntryScript(const std::string& name,
                                                   const fs::path& targetFile,
                                                   const fs::path& referenceDir)
{
    std::string body =
        "QUIVER_REFERENCE_DIR=" + shellQuote(referenceDir.string()) + "\n"
        "export QUIVER_REFERENCE_DIR\n"
        "exec " + shellQuote(runtime_) + " " + shellQuote(targetFile.string()) + " \"$@\"\n";
    return {write(name, body)};
}

} // namespace Quiver
