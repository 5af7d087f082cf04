#include "ui/Formatting.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <sys/ioctl.h>
#include <unistd.h>

namespace reelcast::ui {

namespace {

// Length of the escape sequence starting at `i`, 0 if there is none
size_t escape_length(const std::string& s, size_t i) {
    if (s[i] != '\x1B' || i + 1 >= s.size()) return 0;

    size_t j = i + 2;
    if (s[i + 1] == '[') {
        while (j < s.size() && (s[j] < '@' || s[j] > '~')) j++;
        if (j < s.size()) j++;  // final byte
        return j - i;
    }
    if (s[i + 1] == ']') {
        while (j < s.size()) {
            if (s[j] == '\x07') return j + 1 - i;
            if (s[j] == '\x1B' && j + 1 < s.size() && s[j + 1] == '\\') return j + 2 - i;
            j++;
        }
        return j - i;
    }
    return 0;
}

size_t utf8_length(unsigned char c) {
    if ((c & 0x80) == 0) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;  // invalid lead byte
}

}  // namespace

int display_cols(const std::string& s) {
    int cols = 0;
    for (size_t i = 0; i < s.size(); ) {
        if (size_t esc = escape_length(s, i)) {
            i += esc;
            continue;
        }
        i += utf8_length(static_cast<unsigned char>(s[i]));
        cols++;
    }
    return cols;
}

std::string take_cols(const std::string& s, int width) {
    if (width <= 0) return "";

    std::string out;
    out.reserve(s.size());
    int seen = 0;
    size_t i = 0;
    while (i < s.size() && seen < width) {
        if (size_t esc = escape_length(s, i)) {
            out.append(s, i, esc);
            i += esc;
            continue;
        }
        size_t len = std::min(utf8_length(static_cast<unsigned char>(s[i])), s.size() - i);
        out.append(s, i, len);
        i += len;
        seen++;
    }
    return out;
}

std::string trunc_pad(const std::string& s, int width) {
    if (width <= 0) return "";

    int cols = display_cols(s);
    if (cols == width) return s;
    if (cols < width) return s + std::string(width - cols, ' ');
    if (width == 1) return take_cols(s, 1);
    return take_cols(s, width - 1) + "…";
}

std::string lr_align(int width, const std::string& left, const std::string& right) {
    int right_cols = display_cols(right);
    if (right_cols >= width) {
        return take_cols(right, width);
    }
    int left_room = width - right_cols - 1;
    if (left_room <= 0) {
        return std::string(width - right_cols, ' ') + right;
    }
    return trunc_pad(left, left_room) + " " + right;
}

std::string format_clock(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) seconds = 0.0;
    auto total = static_cast<long long>(seconds);
    long long hours = total / 3600;
    long long minutes = (total % 3600) / 60;
    long long secs = total % 60;
    if (hours > 0) {
        return std::format("{}:{:02}:{:02}", hours, minutes, secs);
    }
    return std::format("{:02}:{:02}", minutes, secs);
}

std::string format_bytes(uint64_t bytes) {
    static constexpr const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1000.0 && unit + 1 < std::size(units)) {
        value /= 1000.0;
        unit++;
    }
    if (unit == 0) {
        return std::format("{} B", bytes);
    }
    return std::format("{:.1f} {}", value, units[unit]);
}

std::string format_rate(uint64_t bytes_per_sec) {
    return format_bytes(bytes_per_sec) + "/s";
}

std::string progress_bar(double ratio, int width) {
    if (width < 3) return "";
    if (std::isnan(ratio)) ratio = 0.0;
    ratio = std::clamp(ratio, 0.0, 1.0);

    int inner = width - 2;
    int filled = static_cast<int>(std::lround(ratio * inner));
    return "[" + std::string(filled, '#') + std::string(inner - filled, '-') + "]";
}

int terminal_width(int fallback) {
    winsize ws{};
    if (::isatty(STDOUT_FILENO) && ::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        return ws.ws_col;
    }
    return fallback;
}

}  // namespace reelcast::ui
