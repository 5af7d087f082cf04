#pragma once

#include "util/Result.hpp"
#include <filesystem>
#include <string>
#include <string_view>

namespace reelcast::subtitles {

// Cast devices only render WebVTT; SRT files are converted into a
// content-addressed cache before casting
class SubtitleStager {
public:
    explicit SubtitleStager(std::filesystem::path cache_dir);

    // .vtt comes back unchanged, .srt is converted (once per content hash)
    util::Result<std::filesystem::path> stage(const std::filesystem::path& path) const;

    const std::filesystem::path& cache_dir() const { return cache_dir_; }

    static std::string srt_to_webvtt(std::string_view srt);
    static bool is_subtitle_file(const std::filesystem::path& path);
    static std::string sha256_hex(std::string_view data);

private:
    std::filesystem::path cache_dir_;
};

}  // namespace reelcast::subtitles
