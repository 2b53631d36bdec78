#ifndef LIFECYCLE_HPP
#define LIFECYCLE_HPP

#include "manifest.hpp"

#include <string>
#include <vector>

namespace Quiver {

/**
 * @brief Outcome of running one lifecycle hook.
 */
enum class HookStatus
{
    NotDeclared,
    Succeeded,
    Failed
};

/**
 * @class PackageLifecycle
 * @brief Runs the scripts a manifest declares for lifecycle events such as
 *        pre-install, post-install and pre-uninstall.
 */
class PackageLifecycle
{
public:
    explicit PackageLifecycle(const PackageManifest& manifest);

    /**
     * @brief Runs the script declared for `hook`.
     *
     * The script runs as `/bin/sh -c <script>` inside the package directory
     * with `args` as positional parameters. Without `scriptOnly` a missing
     * script falls back to a `hooks/<hook>` executable in the package.
     */
    HookStatus run(const std::string& hook,
                   const std::vector<std::string>& args = {},
                   bool scriptOnly = true) const;

    bool declares(const std::string& hook) const;

private:
    const PackageManifest& manifest_;
};

} // namespace Quiver

#endif // LIFECYCLE_HPP
