#pragma once

#include <string>
#include <filesystem>

namespace factorsim {
namespace utils {

class PathUtils {
public:
    // Directory containing the running executable
    static std::filesystem::path getExecutableDir();

    // Relative paths resolve against the working directory first, then the executable directory
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

    static std::filesystem::path getLogsDir();
};

} // namespace utils
} // namespace factorsim
