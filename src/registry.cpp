#include "registry.hpp"
#include "utils.hpp"

#include <iostream>
#include <stdexcept>

namespace Quiver {

HttpRegistry::HttpRegistry(std::string name, std::string url)
    : name_(std::move(name)), url_(std::move(url))
{
    if (!url_.empty() && url_.back() != '/') {
        url_ += '/';
    }
}

const YAML::Node& HttpRegistry::index()
{
    if (!indexLoaded_) {
        std::string indexUrl = url_ + "index.yaml";
        std::string data = fetchUrl(indexUrl);
        try {
            index_ = YAML::Load(data);
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Failed to parse " + indexUrl + ": " + e.what());
        }
        if (!index_["packages"] || !index_["packages"].IsSequence()) {
            throw std::runtime_error("Invalid 'packages' in " + indexUrl);
        }
        indexLoaded_ = true;
        log_message("Loaded index of registry \"" + name_ + "\" (" +
                    std::to_string(index_["packages"].size()) + " packages)");
    }
    return index_;
}

std::optional<RegistryPackage> findInIndex(const YAML::Node& index,
                                           const std::string& name,
                                           const Selector& selector)
{
    std::optional<RegistryPackage> best;
    if (!index["packages"] || !index["packages"].IsSequence()) {
        return best;
    }

    for (const auto& node : index["packages"]) {
        if (!node["name"] || !node["version"] || !node["file_name"]) {
            // Skip invalid nodes
            continue;
        }
        if (node["name"].as<std::string>() != name) {
            continue;
        }
        std::string version = node["version"].as<std::string>();
        if (!selector(version)) {
            continue;
        }
        if (!best || compareVersionSemantics(version, best->version) > 0) {
            best = RegistryPackage{name, version, node["file_name"].as<std::string>()};
        }
    }
    return best;
}

std::optional<RegistryPackage> HttpRegistry::findPackage(const std::string& name,
                                                         const Selector& selector)
{
    return findInIndex(index(), name, selector);
}

void HttpRegistry::download(const std::string& name,
                            const std::string& version,
                            const std::string& outputPath)
{
    auto package = findPackage(name, Selector("==" + version));
    if (!package) {
        throw std::runtime_error(name + "@" + version + " is not available from " + url_);
    }
    std::cout << "  Downloading " << url_ << package->fileName << " ..." << std::endl;
    downloadToFile(url_ + package->fileName, outputPath);
}

std::vector<std::shared_ptr<Registry>> loadRegistries(const Config& config)
{
    std::vector<std::shared_ptr<Registry>> registries;
    for (const auto& entry : config.registries) {
        registries.push_back(std::make_shared<HttpRegistry>(entry.name, entry.url));
    }
    if (registries.empty()) {
        log_warning("No registries configured.");
    }
    return registries;
}

} // namespace Quiver
