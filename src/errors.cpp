#include "errors.hpp"

namespace Quiver {

const char* errorName(InstallError error)
{
    switch (error) {
        case InstallError::None:                return "None";
        case InstallError::NotFound:            return "NotFound";
        case InstallError::PackageNotFound:     return "PackageNotFound";
        case InstallError::NoManifest:          return "NoManifest";
        case InstallError::InvalidManifest:     return "InvalidManifest";
        case InstallError::IdentityMismatch:    return "IdentityMismatch";
        case InstallError::UninstallFailed:     return "UninstallFailed";
        case InstallError::HookFailed:          return "HookFailed";
        case InstallError::DependencyFailed:    return "DependencyFailed";
        case InstallError::MoveFailed:          return "MoveFailed";
        case InstallError::CopyFailed:          return "CopyFailed";
        case InstallError::LedgerWriteFailed:   return "LedgerWriteFailed";
        case InstallError::ExtractFailed:       return "ExtractFailed";
        case InstallError::CloneFailed:         return "CloneFailed";
        case InstallError::DownloadFailed:      return "DownloadFailed";
        case InstallError::BridgeInstallFailed: return "BridgeInstallFailed";
    }
    return "Unknown";
}

} // namespace Quiver
