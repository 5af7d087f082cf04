#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace reelcast::util {

class Platform {
public:
    static std::filesystem::path get_config_directory();
    static std::filesystem::path get_cache_directory();

    // Resolve a bare command name against $PATH; paths containing '/' are
    // checked directly. Empty optional when nothing executable is found.
    static std::optional<std::filesystem::path> find_executable(const std::string& name);
};

}  // namespace reelcast::util
