#include "common/PathUtils.h"

#include <system_error>

namespace factorsim {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    const std::filesystem::path cwd_candidate = std::filesystem::current_path() / relative_path;
    std::error_code ec;
    if (std::filesystem::exists(cwd_candidate, ec)) {
        return cwd_candidate;
    }
    const std::filesystem::path exe_candidate = getExecutableDir() / relative_path;
    if (std::filesystem::exists(exe_candidate, ec)) {
        return exe_candidate;
    }
    return cwd_candidate;
}

std::filesystem::path PathUtils::getLogsDir() {
    return getExecutableDir() / "logs";
}

} // namespace utils
} // namespace factorsim
