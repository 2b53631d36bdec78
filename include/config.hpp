#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <vector>

namespace Quiver {

/**
 * @brief A named package registry endpoint.
 */
struct RegistryEntry
{
    std::string name;
    std::string url;
};

class Config
{
public:
    /**
     * @brief Registries in preference order; the first match wins.
     */
    std::vector<RegistryEntry> registries;

    /**
     * @brief Interpreter used to run pip and to probe the python version.
     */
    std::string python = "python3";

    /**
     * @brief Module runtime that generated entry scripts execute.
     */
    std::string runtime = "quiver-run";

    /**
     * @brief Passes --target instead of --prefix to pip for local/global installs.
     */
    bool pipUseTargetOption = false;

    /**
     * @brief Location of the configuration file ($QUIVER_CONFIG or
     *        /etc/quiver/config.yaml).
     */
    static std::string defaultPath();

    /**
     * @brief Loads configuration from a YAML file on disk.
     * @param path Path to the configuration file.
     * @return A fully populated Config instance (defaults if the file is absent).
     */
    static Config loadFromFile(const std::string& path);

    /**
     * @brief Saves the current configuration to a file.
     * @param path Path to the file where configuration should be saved.
     * @return False if the file could not be written.
     */
    bool saveToFile(const std::string& path) const;

    /**
     * @brief Prints the list of registries to standard output.
     */
    void print() const;

    /**
     * @brief Adds a new registry. Refuses duplicate names.
     */
    bool addRegistry(const std::string& name, const std::string& url);

    /**
     * @brief Removes the registry with the given name if it exists.
     */
    bool removeRegistry(const std::string& name);
};

} // namespace Quiver

#endif // CONFIG_HPP
