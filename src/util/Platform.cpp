#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <cstdlib>
#include <sstream>
#include <unistd.h>

namespace reelcast::util {

std::filesystem::path Platform::get_config_directory() {
    auto xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return std::filesystem::path(xdg) / "reelcast";
    }
    auto home = std::getenv("HOME");
    if (home) {
        auto path = std::filesystem::path(home) / ".config" / "reelcast";
        Logger::debug("Platform: Config directory: " + path.string());
        return path;
    }
    Logger::warn("Platform: HOME env var not set, using fallback: .config/reelcast");
    return ".config/reelcast";
}

std::filesystem::path Platform::get_cache_directory() {
    auto xdg = std::getenv("XDG_CACHE_HOME");
    if (xdg && *xdg) {
        return std::filesystem::path(xdg) / "reelcast";
    }
    auto home = std::getenv("HOME");
    if (home) {
        auto path = std::filesystem::path(home) / ".cache" / "reelcast";
        Logger::debug("Platform: Cache directory: " + path.string());
        return path;
    }
    Logger::warn("Platform: HOME env var not set, using fallback: .cache/reelcast");
    return ".cache/reelcast";
}

std::optional<std::filesystem::path> Platform::find_executable(const std::string& name) {
    if (name.empty()) return std::nullopt;

    if (name.find('/') != std::string::npos) {
        if (::access(name.c_str(), X_OK) == 0 && !std::filesystem::is_directory(name)) {
            return std::filesystem::path(name);
        }
        return std::nullopt;
    }

    auto path_env = std::getenv("PATH");
    std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    std::istringstream dirs(search);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        auto candidate = std::filesystem::path(dir) / name;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) &&
            ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

}  // namespace reelcast::util
