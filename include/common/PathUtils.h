#pragma once

#include <string>
#include <filesystem>

namespace exitforge {
namespace utils {

class PathUtils {
public:
    // Directory containing the running executable
    static std::filesystem::path getExecutableDir();

    // Resolve a path relative to the executable directory
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

    // Absolute paths are returned untouched, relative ones go through resolveRelativePath
    static std::filesystem::path resolve(const std::string& path);

    static std::filesystem::path getConfigDir();
    static std::filesystem::path getLogsDir();
};

} // namespace utils
} // namespace exitforge
