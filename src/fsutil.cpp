#include "fsutil.hpp"
#include "utils.hpp"

#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace Quiver {

TempPath::TempPath(fs::path path)
    : path_(std::move(path))
{
}

TempPath::~TempPath()
{
    if (!owned_ || path_.empty()) {
        return;
    }
    std::error_code ec;
    if (fs::exists(fs::symlink_status(path_, ec))) {
        fs::remove_all(path_, ec);
        if (ec) {
            std::cerr << "Warning: Failed to remove temporary path "
                      << path_.string() << ": " << ec.message() << std::endl;
        }
    }
}

fs::path TempPath::release()
{
    owned_ = false;
    return path_;
}

std::string generateTempFilename(const std::string& prefix, const std::string& baseDir)
{
    fs::path tempDir = baseDir;
    if (baseDir.empty()) {
        tempDir = fs::temp_directory_path(); // Use the system temp by default
    }

    if (!fs::exists(tempDir)) {
        fs::create_directories(tempDir);
    }

    // Create a random suffix
    static const char alphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    std::random_device rd;
    std::mt19937 mt(rd());
    std::uniform_int_distribution<size_t> dist(0, sizeof(alphabet) - 2);

    std::string filename = prefix;
    for (int i = 0; i < 8; ++i) {
        filename += alphabet[dist(mt)];
    }
    return (tempDir / filename).string();
}

TempPath makeTempDirectory(const std::string& prefix, const std::string& baseDir)
{
    for (int attempt = 0; attempt < 16; ++attempt) {
        fs::path candidate = generateTempFilename(prefix, baseDir);
        if (fs::create_directory(candidate)) {
            return TempPath(candidate);
        }
    }
    throw fs::filesystem_error("Could not create a temporary directory",
                               fs::path(baseDir),
                               std::make_error_code(std::errc::file_exists));
}

namespace {

    void makeWritable(const fs::path& path)
    {
        std::error_code ec;
        fs::permissions(path, fs::perms::owner_all, fs::perm_options::add, ec);
    }

} // end anonymous namespace

bool removeTree(const fs::path& path)
{
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(path, ec))) {
        return true;
    }

    try {
        fs::remove_all(path);
        return true;
    } catch (const fs::filesystem_error& e) {
        if (e.code() != std::errc::permission_denied &&
            e.code() != std::errc::operation_not_permitted) {
            std::cerr << "Error removing " << path.string() << ": " << e.what() << std::endl;
            return false;
        }

        // Repair permissions on the entry that failed and its parent, then retry once
        fs::path failed = e.path1().empty() ? path : e.path1();
        makeWritable(failed);
        makeWritable(failed.parent_path());
        if (fs::is_directory(fs::symlink_status(failed, ec))) {
            for (auto it = fs::recursive_directory_iterator(failed, ec);
                 !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
                if (it->is_directory(ec)) {
                    makeWritable(it->path());
                }
            }
        }
    }

    fs::remove_all(path, ec);
    if (ec) {
        std::cerr << "Error removing " << path.string() << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}

bool writeLedger(const fs::path& dir, const std::vector<fs::path>& paths)
{
    fs::path ledgerPath = dir / LEDGER_FILE;
    std::ofstream out(ledgerPath, std::ios::trunc);
    if (!out.is_open()) {
        std::cerr << "Error: Unable to open " << ledgerPath.string() << " for writing." << std::endl;
        return false;
    }
    for (const auto& p : paths) {
        out << p.string() << '\n';
    }
    out.flush();
    if (!out.good()) {
        std::cerr << "Error: Failed writing " << ledgerPath.string() << std::endl;
        return false;
    }
    return true;
}

std::optional<std::vector<fs::path>> readLedger(const fs::path& dir)
{
    fs::path ledgerPath = dir / LEDGER_FILE;
    std::ifstream in(ledgerPath);
    if (!in.is_open()) {
        return std::nullopt;
    }

    std::vector<fs::path> paths;
    std::string line;
    while (std::getline(in, line)) {
        // Only the line ending goes; paths may end in spaces
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.pop_back();
        }
        if (!line.empty()) {
            paths.emplace_back(line);
        }
    }
    return paths;
}

fs::path writeLink(const fs::path& dir, const fs::path& target)
{
    fs::path linkPath = dir / LINK_FILE;
    std::ofstream out(linkPath, std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Unable to write link marker " + linkPath.string());
    }
    out << fs::absolute(target).lexically_normal().string() << '\n';
    if (!out.good()) {
        throw std::runtime_error("Failed writing link marker " + linkPath.string());
    }
    return linkPath;
}

std::optional<fs::path> readLink(const fs::path& dir)
{
    std::ifstream in(dir / LINK_FILE);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::string target;
    std::getline(in, target);
    trim(target);
    if (target.empty()) {
        return std::nullopt;
    }
    return fs::path(target);
}

fs::path resolveLink(const fs::path& dir)
{
    auto target = readLink(dir);
    return target ? *target : dir;
}

} // namespace Quiver
