#include "config.hpp"
#include <iostream>
#include <fstream>
#include <filesystem>
#include <vector>
#include <algorithm>
#include <cstdlib>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace Quiver {

    std::string Config::defaultPath() {
        const char* overridePath = std::getenv("QUIVER_CONFIG");
        if (overridePath && *overridePath) {
            return overridePath;
        }
        return "/etc/quiver/config.yaml";
    }

    Config Config::loadFromFile(const std::string& path) {
        Config config;

        if (!fs::exists(path)) {
            std::cerr << "Error: Configuration file not found: " << path << std::endl;
            return config;
        }

        YAML::Node root;
        try {
            root = YAML::LoadFile(path);
        } catch (const YAML::Exception& e) {
            std::cerr << "Error: Unable to parse configuration file " << path
                      << ": " << e.what() << std::endl;
            return config;
        }

        // Registries, in the order they should be queried
        if (root["registries"] && root["registries"].IsSequence()) {
            for (const auto& node : root["registries"]) {
                RegistryEntry entry;
                if (node.IsScalar()) {
                    entry.url = node.as<std::string>();
                    entry.name = entry.url;
                } else if (node.IsMap() && node["url"]) {
                    entry.url = node["url"].as<std::string>();
                    entry.name = node["name"] ? node["name"].as<std::string>() : entry.url;
                } else {
                    std::cerr << "Warning: Skipping malformed registry entry in "
                              << path << std::endl;
                    continue;
                }
                if (!entry.url.empty() && entry.url.back() != '/') {
                    entry.url += '/';
                }
                config.registries.push_back(entry);
            }
        }

        if (root["python"] && root["python"].IsScalar()) {
            config.python = root["python"].as<std::string>();
        }
        if (root["runtime"] && root["runtime"].IsScalar()) {
            config.runtime = root["runtime"].as<std::string>();
        }
        if (root["pip_use_target_option"] && root["pip_use_target_option"].IsScalar()) {
            config.pipUseTargetOption = root["pip_use_target_option"].as<bool>();
        }

        return config;
    }

    bool Config::saveToFile(const std::string& path) const {
        YAML::Emitter out;
        out << YAML::BeginMap;
        out << YAML::Key << "registries" << YAML::Value << YAML::BeginSeq;
        for (const auto& registry : registries) {
            out << YAML::BeginMap
                << YAML::Key << "name" << YAML::Value << registry.name
                << YAML::Key << "url" << YAML::Value << registry.url
                << YAML::EndMap;
        }
        out << YAML::EndSeq;
        out << YAML::Key << "python" << YAML::Value << python;
        out << YAML::Key << "runtime" << YAML::Value << runtime;
        out << YAML::Key << "pip_use_target_option" << YAML::Value << pipUseTargetOption;
        out << YAML::EndMap;

        fs::path parent = fs::path(path).parent_path();
        std::error_code ec;
        if (!parent.empty()) {
            fs::create_directories(parent, ec);
        }

        std::ofstream file(path, std::ios::trunc); // Truncate file to overwrite
        if (!file.is_open()) {
            std::cerr << "Error: Unable to open configuration file for writing: " << path << std::endl;
            return false;
        }

        // Adds a comment header
        file << "# Quiver configuration\n";
        file << "# Registries are queried top to bottom.\n\n";
        file << out.c_str() << "\n";
        return true;
    }

    void Config::print() const {
        std::cout << "Configured Registries:" << std::endl;
        for (const auto& registry : registries) {
            std::cout << "  - " << registry.name << " (" << registry.url << ")" << std::endl;
        }
    }

    bool Config::addRegistry(const std::string& name, const std::string& url) {
        // Ensures that the registry does not already exist
        auto it = std::find_if(registries.begin(), registries.end(),
                               [&](const RegistryEntry& e) { return e.name == name; });
        if (it != registries.end()) {
            std::cerr << "Error: Registry already exists: " << name << std::endl;
            return false;
        }

        std::string normalized = url;
        if (!normalized.empty() && normalized.back() != '/') {
            normalized += '/';
        }
        registries.push_back({name, normalized});
        std::cout << "Added registry: " << name << " (" << normalized << ")" << std::endl;
        return true;
    }

    bool Config::removeRegistry(const std::string& name) {
        auto it = std::find_if(registries.begin(), registries.end(),
                               [&](const RegistryEntry& e) { return e.name == name; });
        if (it != registries.end()) {
            registries.erase(it);
            std::cout << "Removed registry: " << name << std::endl;
            return true;
        }
        std::cerr << "Error: Registry not found: " << name << std::endl;
        return false;
    }
}
