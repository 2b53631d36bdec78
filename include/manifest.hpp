#ifndef MANIFEST_HPP
#define MANIFEST_HPP

#include "requirement.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace Quiver {

// File name of the package manifest.
inline const char* const MANIFEST_FILE = "quiver.yaml";

// Name -> requirement, in declaration order.
using RequirementList = std::vector<std::pair<std::string, Requirement>>;

// Name -> value (pip specifier, script path, hook command), in declaration order.
using StringPairs = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Fields of a newly created manifest.
 */
struct StarterManifest
{
    std::string name;
    std::string version = "1.0.0";
    std::string description;
    std::vector<std::string> authors;
    std::string license = "MIT";
};

/**
 * @class PackageManifest
 * @brief The contents of a package's quiver.yaml.
 */
class PackageManifest
{
public:
    std::string name;
    std::string version;

    RequirementList dependencies;
    RequirementList devDependencies;

    StringPairs pythonDependencies;
    StringPairs devPythonDependencies;

    /** Entry-point name -> file relative to the package (or resolve_root). */
    StringPairs bin;

    /** Lifecycle hook name -> shell command. */
    StringPairs scripts;

    std::vector<std::string> includeFiles;
    std::vector<std::string> excludeFiles;

    std::string resolveRoot;
    std::vector<std::string> extensions;

    /** Directory the package lives in (the install directory once installed). */
    std::filesystem::path directory;

    /**
     * @brief Loads and validates a manifest.
     *
     * @param manifestPath Path to quiver.yaml.
     * @param directory    Directory to record; defaults to the manifest's parent.
     * @throws ManifestNotFound if the file does not exist.
     * @throws InvalidManifest on a YAML error or a missing/invalid field.
     */
    static PackageManifest load(const std::filesystem::path& manifestPath,
                                const std::filesystem::path& directory = {});

    /**
     * @brief "name@version"
     */
    std::string identifier() const;

    /**
     * @brief Raw YAML access to a top-level field.
     */
    YAML::Node get(const std::string& field) const;

    const YAML::Node& node() const { return root_; }

    /**
     * @brief Merges `field` with its "cfg(<context>)" variants for each
     *        active context. Later contexts override earlier entries.
     */
    YAML::Node evalFields(const std::vector<std::string>& contexts,
                          const std::string& field) const;

    /**
     * @brief The requirements of a dependency field under the given contexts.
     * @throws InvalidManifest if an entry does not parse.
     */
    RequirementList requirements(const std::string& field,
                                 const std::vector<std::string>& contexts = {}) const;

    /**
     * @brief Python dependencies of a field under the given contexts.
     */
    StringPairs pythonRequirements(const std::string& field,
                                   const std::vector<std::string>& contexts = {}) const;

    /**
     * @brief Writes `name: value` into `field` of the manifest at `manifestPath`,
     *        keeping the rest of the document.
     * @return False if the manifest could not be read or written.
     */
    static bool saveDependency(const std::filesystem::path& manifestPath,
                               const std::string& field,
                               const std::string& name,
                               const std::string& value);

    /**
     * @brief Appends `name` to the `extensions` list of the manifest at
     *        `manifestPath` unless it is already listed.
     */
    static bool saveExtension(const std::filesystem::path& manifestPath,
                              const std::string& name);

    /**
     * @brief Writes a starter manifest to `manifestPath`.
     * @return False if the file already exists, the name is invalid or the
     *         file could not be written.
     */
    static bool create(const std::filesystem::path& manifestPath,
                       const StarterManifest& fields);

private:
    YAML::Node root_;
};

} // namespace Quiver

#endif // MANIFEST_HPP
