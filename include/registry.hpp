#ifndef REGISTRY_HPP
#define REGISTRY_HPP

#include "config.hpp"
#include "version.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace Quiver {

/**
 * @brief A package release offered by a registry.
 */
struct RegistryPackage
{
    std::string name;
    std::string version;
    std::string fileName;
};

/**
 * @class Registry
 * @brief A source of released package archives.
 */
class Registry
{
public:
    virtual ~Registry() = default;

    virtual std::string name() const = 0;
    virtual std::string baseUrl() const = 0;

    /**
     * @brief The highest release of `name` matching `selector`.
     * @throws std::runtime_error on transport or index errors.
     */
    virtual std::optional<RegistryPackage> findPackage(const std::string& name,
                                                       const Selector& selector) = 0;

    /**
     * @brief Downloads the archive of `name@version` to `outputPath`.
     * @throws std::runtime_error on failure.
     */
    virtual void download(const std::string& name,
                          const std::string& version,
                          const std::string& outputPath) = 0;
};

/**
 * @class HttpRegistry
 * @brief Registry served over HTTP(S): `<url>/index.yaml` lists releases as
 *        {name, version, file_name}; archives live at `<url>/<file_name>`.
 */
class HttpRegistry : public Registry
{
public:
    HttpRegistry(std::string name, std::string url);

    std::string name() const override { return name_; }
    std::string baseUrl() const override { return url_; }

    std::optional<RegistryPackage> findPackage(const std::string& name,
                                               const Selector& selector) override;

    void download(const std::string& name,
                  const std::string& version,
                  const std::string& outputPath) override;

private:
    const YAML::Node& index();

    std::string name_;
    std::string url_;
    YAML::Node index_;
    bool indexLoaded_ = false;
};

/**
 * @brief Picks the highest release of `name` matching `selector` from a
 *        parsed index document.
 */
std::optional<RegistryPackage> findInIndex(const YAML::Node& index,
                                           const std::string& name,
                                           const Selector& selector);

/**
 * @brief One HttpRegistry per configured registry, in configuration order.
 */
std::vector<std::shared_ptr<Registry>> loadRegistries(const Config& config);

} // namespace Quiver

#endif // REGISTRY_HPP
