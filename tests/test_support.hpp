#ifndef QUIVER_TEST_SUPPORT_HPP
#define QUIVER_TEST_SUPPORT_HPP

#include "fsutil.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace QuiverTest {

namespace fs = std::filesystem;

// Scratch directory under the system temp dir, removed with the fixture
inline Quiver::TempPath makeScratch(const std::string& prefix)
{
    return Quiver::makeTempDirectory(prefix, fs::temp_directory_path().string());
}

inline void writeFile(const fs::path& path, const std::string& content)
{
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

inline std::string readFile(const fs::path& path)
{
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline bool haveTool(const std::string& tool)
{
    std::string cmd = "command -v " + tool + " >/dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

} // namespace QuiverTest

#endif // QUIVER_TEST_SUPPORT_HPP
