#ifndef PROCESS_HPP
#define PROCESS_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Quiver {
namespace Process {

/**
 * @brief Runs a program found on PATH and waits for it.
 *
 * @param args       argv, args[0] being the program.
 * @param workingDir Directory to run in; the current one when empty.
 * @return The exit code, or -1 if the program could not be started or
 *         was terminated by a signal.
 */
int run(const std::vector<std::string>& args, const std::string& workingDir = "");

/**
 * @brief Runs a program and returns its standard output.
 * @return std::nullopt if the program could not be run or exited non-zero.
 */
std::optional<std::string> capture(const std::vector<std::string>& args,
                                   const std::string& workingDir = "");

} // namespace Process

/**
 * @class ScopedEnvironment
 * @brief Sets or prepends environment variables and restores the previous
 *        values when it goes out of scope.
 */
class ScopedEnvironment
{
public:
    ScopedEnvironment() = default;
    ~ScopedEnvironment();

    ScopedEnvironment(const ScopedEnvironment&) = delete;
    ScopedEnvironment& operator=(const ScopedEnvironment&) = delete;

    void set(const std::string& name, const std::string& value);

    /**
     * @brief Prepends `value` to a ':'-separated list such as PATH.
     */
    void prepend(const std::string& name, const std::string& value);

private:
    void remember(const std::string& name);

    std::vector<std::pair<std::string, std::optional<std::string>>> saved_;
};

} // namespace Quiver

#endif // PROCESS_HPP
