#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Quiver {

/**
 * @brief Why an install, fetch or uninstall step gave up.
 */
enum class InstallError
{
    None,
    NotFound,
    PackageNotFound,
    NoManifest,
    InvalidManifest,
    IdentityMismatch,
    UninstallFailed,
    HookFailed,
    DependencyFailed,
    MoveFailed,
    CopyFailed,
    LedgerWriteFailed,
    ExtractFailed,
    CloneFailed,
    DownloadFailed,
    BridgeInstallFailed
};

/**
 * @brief Returns the identifier of an error kind, e.g. "CloneFailed".
 */
const char* errorName(InstallError error);

/**
 * @brief Raised when a package manifest exists but cannot be parsed or
 *        lacks a required field.
 */
class InvalidManifest : public std::runtime_error
{
public:
    explicit InvalidManifest(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when a manifest file does not exist.
 */
class ManifestNotFound : public std::runtime_error
{
public:
    explicit ManifestNotFound(const std::string& path)
        : std::runtime_error("No such manifest: " + path) {}
};

/**
 * @brief Raised for contradictory command-line flags.
 */
class UsageError : public std::runtime_error
{
public:
    explicit UsageError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace Quiver

#endif // ERRORS_HPP
