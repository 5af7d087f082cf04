#pragma once

#include <filesystem>
#include <string>

namespace reelcast::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    static void init();
    static void init(const std::filesystem::path& file, Level min_level = Level::Debug);
    static void set_level(Level level);
    static Level parse_level(const std::string& name, Level fallback = Level::Info);

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
};

}  // namespace reelcast::util
