#include "manifest.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <fstream>
#include <iostream>
#include <regex>
#include <stdexcept>

namespace fs = std::filesystem;

namespace Quiver {

namespace {

    StringPairs readStringMap(const YAML::Node& node, const std::string& field)
    {
        StringPairs result;
        if (!node) {
            return result;
        }
        if (!node.IsMap()) {
            throw InvalidManifest("'" + field + "' must be a mapping");
        }
        for (const auto& item : node) {
            std::string value = item.second.IsNull() ? "" : item.second.as<std::string>();
            result.emplace_back(item.first.as<std::string>(), value);
        }
        return result;
    }

    std::vector<std::string> readStringList(const YAML::Node& node, const std::string& field)
    {
        std::vector<std::string> result;
        if (!node) {
            return result;
        }
        if (node.IsScalar()) {
            result.push_back(node.as<std::string>());
            return result;
        }
        if (!node.IsSequence()) {
            throw InvalidManifest("'" + field + "' must be a list");
        }
        for (const auto& item : node) {
            result.push_back(item.as<std::string>());
        }
        return result;
    }

    // Maps merge key by key; anything else is replaced.
    void mergeInto(YAML::Node& target, const YAML::Node& source)
    {
        if (!source) {
            return;
        }
        if (target.IsMap() && source.IsMap()) {
            for (const auto& item : source) {
                target[item.first.as<std::string>()] = YAML::Clone(item.second);
            }
        } else if (target.IsSequence() && source.IsSequence()) {
            for (const auto& item : source) {
                target.push_back(YAML::Clone(item));
            }
        } else {
            target = YAML::Clone(source);
        }
    }

    bool isValidPackageName(const std::string& name)
    {
        static const std::regex nameRegex(R"((@[A-Za-z0-9_.\-]+/)?[A-Za-z0-9_.\-]+)");
        return std::regex_match(name, nameRegex);
    }

} // end anonymous namespace

PackageManifest PackageManifest::load(const fs::path& manifestPath, const fs::path& directory)
{
    if (!fs::is_regular_file(manifestPath)) {
        throw ManifestNotFound(manifestPath.string());
    }

    PackageManifest manifest;
    try {
        manifest.root_ = YAML::LoadFile(manifestPath.string());
    } catch (const YAML::Exception& e) {
        throw InvalidManifest(manifestPath.string() + ": " + e.what());
    }

    const YAML::Node& root = manifest.root_;
    if (!root.IsMap()) {
        throw InvalidManifest(manifestPath.string() + ": expected a mapping at the top level");
    }

    try {
        if (!root["name"] || !root["name"].IsScalar()) {
            throw InvalidManifest("missing 'name'");
        }
        if (!root["version"] || !root["version"].IsScalar()) {
            throw InvalidManifest("missing 'version'");
        }
        manifest.name = root["name"].as<std::string>();
        manifest.version = root["version"].as<std::string>();

        if (!isValidPackageName(manifest.name)) {
            throw InvalidManifest("invalid package name '" + manifest.name + "'");
        }

        manifest.dependencies = manifest.requirements("dependencies");
        manifest.devDependencies = manifest.requirements("dev_dependencies");
        manifest.pythonDependencies = manifest.pythonRequirements("python_dependencies");
        manifest.devPythonDependencies = manifest.pythonRequirements("dev_python_dependencies");
        manifest.bin = readStringMap(root["bin"], "bin");
        manifest.scripts = readStringMap(root["scripts"], "scripts");

        if (const YAML::Node dist = root["dist"]) {
            manifest.includeFiles = readStringList(dist["include_files"], "dist.include_files");
            manifest.excludeFiles = readStringList(dist["exclude_files"], "dist.exclude_files");
        }
        if (root["resolve_root"]) {
            manifest.resolveRoot = root["resolve_root"].as<std::string>();
        }
        manifest.extensions = readStringList(root["extensions"], "extensions");
    } catch (const InvalidManifest& e) {
        throw InvalidManifest(manifestPath.string() + ": " + e.what());
    } catch (const YAML::Exception& e) {
        throw InvalidManifest(manifestPath.string() + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw InvalidManifest(manifestPath.string() + ": " + e.what());
    }

    manifest.directory = directory.empty()
        ? fs::absolute(manifestPath).parent_path()
        : fs::absolute(directory);
    return manifest;
}

std::string PackageManifest::identifier() const
{
    return name + "@" + version;
}

YAML::Node PackageManifest::get(const std::string& field) const
{
    return root_[field];
}

YAML::Node PackageManifest::evalFields(const std::vector<std::string>& contexts,
                                       const std::string& field) const
{
    YAML::Node result;
    if (root_[field]) {
        result = YAML::Clone(root_[field]);
    }

    for (const auto& context : contexts) {
        std::string key = "cfg(" + context + ")";
        if (root_[key] && root_[key].IsMap()) {
            mergeInto(result, root_[key][field]);
        }
        mergeInto(result, root_[key + "." + field]);
    }
    return result;
}

RequirementList PackageManifest::requirements(const std::string& field,
                                              const std::vector<std::string>& contexts) const
{
    RequirementList result;
    YAML::Node node = evalFields(contexts, field);
    if (!node || node.IsNull()) {
        return result;
    }
    if (!node.IsMap()) {
        throw InvalidManifest("'" + field + "' must be a mapping");
    }
    for (const auto& item : node) {
        std::string depName = item.first.as<std::string>();
        try {
            result.emplace_back(depName, Requirement::fromManifestValue(depName, item.second));
        } catch (const std::invalid_argument& e) {
            throw InvalidManifest("'" + field + "." + depName + "': " + e.what());
        } catch (const YAML::Exception& e) {
            throw InvalidManifest("'" + field + "." + depName + "': " + e.what());
        }
    }
    return result;
}

StringPairs PackageManifest::pythonRequirements(const std::string& field,
                                                const std::vector<std::string>& contexts) const
{
    YAML::Node node = evalFields(contexts, field);
    if (node && node.IsNull()) {
        return {};
    }
    try {
        return readStringMap(node, field);
    } catch (const YAML::Exception& e) {
        throw InvalidManifest("'" + field + "': " + e.what());
    }
}

bool PackageManifest::saveDependency(const fs::path& manifestPath,
                                     const std::string& field,
                                     const std::string& name,
                                     const std::string& value)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(manifestPath.string());
    } catch (const YAML::Exception& e) {
        log_error("Unable to read " + manifestPath.string() + ": " + e.what());
        return false;
    }

    root[field][name] = value;

    YAML::Emitter out;
    out << root;

    std::ofstream file(manifestPath, std::ios::trunc);
    if (!file.is_open()) {
        log_error("Unable to open " + manifestPath.string() + " for writing.");
        return false;
    }
    file << out.c_str() << "\n";
    std::cout << "Saved " << field << " \"" << name << "\": \"" << value << "\"" << std::endl;
    return file.good();
}

bool PackageManifest::saveExtension(const fs::path& manifestPath, const std::string& name)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(manifestPath.string());
    } catch (const YAML::Exception& e) {
        log_error("Unable to read " + manifestPath.string() + ": " + e.what());
        return false;
    }

    YAML::Node extensions = root["extensions"];
    if (extensions.IsScalar()) {
        std::string single = extensions.as<std::string>();
        extensions = YAML::Node(YAML::NodeType::Sequence);
        extensions.push_back(single);
        root["extensions"] = extensions;
    }
    for (const auto& item : extensions) {
        if (item.as<std::string>() == name) {
            return true;
        }
    }
    extensions.push_back(name);

    YAML::Emitter out;
    out << root;

    std::ofstream file(manifestPath, std::ios::trunc);
    if (!file.is_open()) {
        log_error("Unable to open " + manifestPath.string() + " for writing.");
        return false;
    }
    file << out.c_str() << "\n";
    std::cout << "Saved extension \"" << name << "\"" << std::endl;
    return file.good();
}

/**
 * Writes a new manifest with the starter fields. Empty optional fields are
 * left out. Refuses to replace an existing file.
 */
bool PackageManifest::create(const fs::path& manifestPath, const StarterManifest& fields)
{
    std::error_code ec;
    if (fs::exists(manifestPath, ec)) {
        log_error("\"" + manifestPath.string() + "\" already exists");
        return false;
    }
    if (!isValidPackageName(fields.name)) {
        log_error("Invalid package name '" + fields.name + "'");
        return false;
    }
    if (fields.version.empty()) {
        log_error("A package version is required");
        return false;
    }

    YAML::Node root;
    root["name"] = fields.name;
    root["version"] = fields.version;
    if (!fields.description.empty()) {
        root["description"] = fields.description;
    }
    if (!fields.authors.empty()) {
        for (const auto& author : fields.authors) {
            root["authors"].push_back(author);
        }
    }
    if (!fields.license.empty()) {
        root["license"] = fields.license;
    }

    YAML::Emitter out;
    out << root;

    std::ofstream file(manifestPath);
    if (!file.is_open()) {
        log_error("Unable to open " + manifestPath.string() + " for writing.");
        return false;
    }
    file << out.c_str() << "\n";
    return file.good();
}

} // namespace Quiver
