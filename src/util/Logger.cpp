#include "util/Logger.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <ctime>
#include <mutex>
#include <format>

namespace reelcast::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Keep file open for performance
static std::filesystem::path log_path = "/tmp/reelcast_debug.log";
static std::atomic<int> min_level{static_cast<int>(Logger::Level::Debug)};

void Logger::init() {
    init(log_path);
}

void Logger::init(const std::filesystem::path& file, Level level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_path = file;
    min_level.store(static_cast<int>(level));
    log_file.open(log_path, std::ios::trunc);
}

void Logger::set_level(Level level) {
    min_level.store(static_cast<int>(level));
}

Logger::Level Logger::parse_level(const std::string& name, Level fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    return fallback;
}

void Logger::log(Level level, const std::string& message) {
    if (static_cast<int>(level) < min_level.load()) return;

    std::lock_guard<std::mutex> lock(log_mutex);
    if (!log_file.is_open()) {
        // Fallback: open if not initialized
        log_file.open(log_path, std::ios::app);
    }
    if (!log_file) return;

    auto now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);

    std::string_view level_str;
    switch (level) {
        case Level::Debug: level_str = "[DEBUG] "; break;
        case Level::Info:  level_str = "[INFO]  "; break;
        case Level::Warn:  level_str = "[WARN]  "; break;
        case Level::Error: level_str = "[ERROR] "; break;
    }

    log_file << std::put_time(&tm, "[%H:%M:%S] ");
    log_file << std::format("{}{}\n", level_str, message);
    log_file.flush();  // Ensure writes are visible immediately
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

}  // namespace reelcast::util
