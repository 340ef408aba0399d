#pragma once

#include <string>
#include <filesystem>

namespace quantcore {
namespace utils {

class PathUtils {
public:
    // Directory holding the running executable; current directory if unknown
    static std::filesystem::path getExecutableDir();

    // Existing path under the working directory wins, otherwise the path
    // is taken relative to the executable directory.
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace quantcore
