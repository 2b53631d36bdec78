#ifndef SCRIPT_HPP
#define SCRIPT_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace Quiver {

/**
 * @class ScriptMaker
 * @brief Generates executable entry-point scripts in a bin directory.
 */
class ScriptMaker
{
public:
    ScriptMaker(std::filesystem::path binDir, std::string runtime);

    /** Directories prepended to PATH by every generated script. */
    std::vector<std::string> path;

    /** Directories prepended to PYTHONPATH by every generated script. */
    std::vector<std::string> pythonpath;

    /**
     * @brief Writes a script `name` that executes `command` with the
     *        script's arguments appended.
     * @return The files written.
     * @throws std::runtime_error if the script can't be written.
     */
    std::vector<std::filesystem::path> makeWrapper(const std::string& name,
                                                   const std::vector<std::string>& command);

    /**
     * @brief Writes a script `name` that runs `targetFile` with the module runtime,
     *        resolving modules relative to `referenceDir`.
     * @return The files written.
     */
    std::vector<std::filesystem::path> makeEntryScript(const std::string& name,
                                                       const std::filesystem::path& targetFile,
                                                       const std::filesystem::path& referenceDir);

    const std::filesystem::path& binDir() const { return binDir_; }

private:
    std::filesystem::path write(const std::string& name, const std::string& body);

    std::filesystem::path binDir_;
    std::string runtime_;
};

/**
 * @brief Quotes `value` for a POSIX shell.
 */
std::string shellQuote(const std::string& value);

} // namespace Quiver

#endif // SCRIPT_HPP
