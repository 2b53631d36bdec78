#ifndef INSTALL_CONTEXT_HPP
#define INSTALL_CONTEXT_HPP

#include "manifest.hpp"

#include <cstddef>
#include <filesystem>
#include <vector>

namespace Quiver {

/**
 * @brief A package currently being installed and its target directory.
 */
struct InstallFrame
{
    PackageManifest manifest;
    std::filesystem::path directory;
};

/**
 * @class InstallContext
 * @brief The stack of packages currently being installed, innermost last.
 *        Internal dependencies are placed under the innermost frame.
 */
class InstallContext
{
public:
    bool empty() const { return frames_.empty(); }
    size_t size() const { return frames_.size(); }
    const InstallFrame& top() const { return frames_.back(); }

    bool contains(const std::filesystem::path& directory) const
    {
        for (const auto& frame : frames_) {
            if (frame.directory == directory) {
                return true;
            }
        }
        return false;
    }

private:
    friend class ScopedInstallFrame;
    std::vector<InstallFrame> frames_;
};

/**
 * @class ScopedInstallFrame
 * @brief Pushes a frame on construction and pops it on destruction.
 */
class ScopedInstallFrame
{
public:
    ScopedInstallFrame(InstallContext& ctx, const PackageManifest& manifest,
                       const std::filesystem::path& directory)
        : ctx_(ctx)
    {
        ctx_.frames_.push_back(InstallFrame{manifest, directory});
    }

    ~ScopedInstallFrame()
    {
        ctx_.frames_.pop_back();
    }

    ScopedInstallFrame(const ScopedInstallFrame&) = delete;
    ScopedInstallFrame& operator=(const ScopedInstallFrame&) = delete;

private:
    InstallContext& ctx_;
};

} // namespace Quiver

#endif // INSTALL_CONTEXT_HPP
