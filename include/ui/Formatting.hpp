#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace reelcast::ui {

/**
 * Display width of a string: ANSI escape sequences take no space and each
 * UTF-8 character counts as one column.
 */
int display_cols(const std::string& s);

// First `width` display columns of `s`, escape sequences preserved
std::string take_cols(const std::string& s, int width);

// Exactly `width` columns: padded with spaces or cut with an ellipsis
std::string trunc_pad(const std::string& s, int width);

// Left and right text with the gap filled, e.g. "Playing      01:02 / 45:00"
std::string lr_align(int width, const std::string& left, const std::string& right);

// 75.5 -> "01:15", 3725 -> "1:02:05"
std::string format_clock(double seconds);

// Decimal units to match what the transfer reports: 1500000 -> "1.5 MB"
std::string format_bytes(uint64_t bytes);
std::string format_rate(uint64_t bytes_per_sec);

// [#####-----] style bar, `ratio` clamped to [0, 1]
std::string progress_bar(double ratio, int width);

// Columns of the controlling terminal, `fallback` when not a tty
int terminal_width(int fallback = 80);

}  // namespace reelcast::ui
