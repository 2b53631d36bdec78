#include "process.hpp"
#include "utils.hpp"

#include <iostream>
#include <string>
#include <system_error>

// Required Linux/Unix Headers
#include <sys/types.h> // pid_t
#include <sys/wait.h>  // waitpid
#include <unistd.h>    // fork, execvp, chdir, pipe, _exit
#include <errno.h>
#include <cstring>     // strerror
#include <cstdlib>     // setenv, unsetenv, getenv

namespace Quiver {
namespace Process {

    namespace {

        std::vector<char*> makeArgv(const std::vector<std::string>& args)
        {
            std::vector<char*> argv;
            for (const auto& arg : args) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr); // Null terminator
            return argv;
        }

        // Child side: change directory, redirect stdout if asked, exec.
        [[noreturn]] void execChild(const std::vector<std::string>& args,
                                    const std::string& workingDir,
                                    int stdoutFd)
        {
            if (!workingDir.empty() && chdir(workingDir.c_str()) != 0) {
                std::cerr << "Error: cannot enter " << workingDir << ": "
                          << strerror(errno) << std::endl;
                _exit(127);
            }
            if (stdoutFd >= 0) {
                dup2(stdoutFd, STDOUT_FILENO);
                close(stdoutFd);
            }

            std::vector<char*> argv = makeArgv(args);
            execvp(argv[0], argv.data());

            // If execvp returns, an error occurred
            std::cerr << "Error: failed to execute " << args[0] << ": "
                      << strerror(errno) << std::endl;
            _exit(127);
        }

        int waitForChild(pid_t pid, const std::string& program)
        {
            int status = 0;
            pid_t waited = -1;
            do {
                waited = waitpid(pid, &status, 0);
            } while (waited < 0 && errno == EINTR);

            if (waited < 0) {
                std::cerr << "Error: waitpid failed for " << program << ": "
                          << strerror(errno) << std::endl;
                return -1;
            }
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                std::cerr << program << " terminated by signal: " << WTERMSIG(status) << std::endl;
                return -1;
            }
            std::cerr << program << " finished with unknown status." << std::endl;
            return -1;
        }

    } // end anonymous namespace

    int run(const std::vector<std::string>& args, const std::string& workingDir)
    {
        if (args.empty() || args[0].empty()) {
            std::cerr << "Error: Invalid command or arguments for execution." << std::endl;
            return -1;
        }

        std::cout.flush();
        std::cerr.flush();

        pid_t pid = fork();
        if (pid < 0) {
            std::cerr << "Error: fork failed: " << strerror(errno) << std::endl;
            return -1;
        }
        if (pid == 0) {
            execChild(args, workingDir, -1);
        }
        return waitForChild(pid, args[0]);
    }

    std::optional<std::string> capture(const std::vector<std::string>& args,
                                       const std::string& workingDir)
    {
        if (args.empty() || args[0].empty()) {
            return std::nullopt;
        }

        int fds[2];
        if (pipe(fds) != 0) {
            std::cerr << "Error: pipe failed: " << strerror(errno) << std::endl;
            return std::nullopt;
        }

        std::cout.flush();
        std::cerr.flush();

        pid_t pid = fork();
        if (pid < 0) {
            std::cerr << "Error: fork failed: " << strerror(errno) << std::endl;
            close(fds[0]);
            close(fds[1]);
            return std::nullopt;
        }
        if (pid == 0) {
            close(fds[0]);
            execChild(args, workingDir, fds[1]);
        }

        close(fds[1]);
        std::string output;
        char buffer[4096];
        ssize_t n = 0;
        while ((n = read(fds[0], buffer, sizeof(buffer))) != 0) {
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }
            output.append(buffer, static_cast<size_t>(n));
        }
        close(fds[0]);

        if (waitForChild(pid, args[0]) != 0) {
            return std::nullopt;
        }
        return output;
    }

} // namespace Process

ScopedEnvironment::~ScopedEnvironment()
{
    // Restore in reverse order so repeated names end at their first value
    for (auto it = saved_.rbegin(); it != saved_.rend(); ++it) {
        if (it->second) {
            setenv(it->first.c_str(), it->second->c_str(), 1);
        } else {
            unsetenv(it->first.c_str());
        }
    }
}

void ScopedEnvironment::remember(const std::string& name)
{
    const char* current = std::getenv(name.c_str());
    if (current) {
        saved_.emplace_back(name, std::string(current));
    } else {
        saved_.emplace_back(name, std::nullopt);
    }
}

void ScopedEnvironment::set(const std::string& name, const std::string& value)
{
    remember(name);
    if (setenv(name.c_str(), value.c_str(), 1) != 0) {
        throw std::system_error(errno, std::system_category(), "setenv " + name);
    }
}

void ScopedEnvironment::prepend(const std::string& name, const std::string& value)
{
    const char* current = std::getenv(name.c_str());
    std::string combined = value;
    if (current && *current) {
        combined += ":";
        combined += current;
    }
    set(name, combined);
}

} // namespace Quiver
