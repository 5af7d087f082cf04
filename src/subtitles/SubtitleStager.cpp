#include "subtitles/SubtitleStager.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <regex>
#include <sstream>
#include <openssl/sha.h>

namespace reelcast::subtitles {

using util::ErrorCode;

namespace {

std::string extension_of(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext;
}

}  // namespace

SubtitleStager::SubtitleStager(std::filesystem::path cache_dir) : cache_dir_(std::move(cache_dir)) {}

std::string SubtitleStager::srt_to_webvtt(std::string_view srt) {
    static const std::regex timestamp(R"((\d{1,2}:\d{2}:\d{2}),(\d{3}))");

    // UTF-8 BOM
    if (srt.size() >= 3 && srt.substr(0, 3) == "\xEF\xBB\xBF") {
        srt.remove_prefix(3);
    }

    std::string out = "WEBVTT\n\n";
    if (srt.substr(0, 6) == "WEBVTT") {
        out.clear();
    }

    size_t start = 0;
    while (start < srt.size()) {
        auto end = srt.find('\n', start);
        if (end == std::string_view::npos) end = srt.size();
        std::string line(srt.substr(start, end - start));
        if (!line.empty() && line.back() == '\r') line.pop_back();

        // Only cue timing lines carry timestamps; cue text keeps its commas
        if (line.find("-->") != std::string::npos) {
            line = std::regex_replace(line, timestamp, "$1.$2");
        }
        out += line;
        if (end < srt.size()) out += '\n';
        start = end + 1;
    }
    return out;
}

bool SubtitleStager::is_subtitle_file(const std::filesystem::path& path) {
    auto ext = extension_of(path);
    return ext == ".srt" || ext == ".vtt";
}

std::string SubtitleStager::sha256_hex(std::string_view data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

    std::ostringstream hex;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return hex.str();
}

util::Result<std::filesystem::path> SubtitleStager::stage(const std::filesystem::path& path) const {
    using R = util::Result<std::filesystem::path>;

    auto ext = extension_of(path);
    if (ext != ".srt" && ext != ".vtt") {
        return R::err(ErrorCode::InvalidArgument, "not a subtitle file: " + path.string());
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return R::err(ErrorCode::IoError, "subtitle file not found: " + path.string());
    }
    if (ext == ".vtt") {
        return path;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return R::err(ErrorCode::IoError, "cannot read " + path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    std::string content = buffer.str();

    auto staged = cache_dir_ / (sha256_hex(content) + ".vtt");
    if (std::filesystem::exists(staged, ec)) {
        util::Logger::debug("Subtitles: Cache hit " + staged.string());
        return staged;
    }

    std::filesystem::create_directories(cache_dir_, ec);
    if (ec) {
        return R::err(ErrorCode::IoError, "cannot create " + cache_dir_.string() + ": " + ec.message());
    }

    // Write beside the final name and rename so readers never see half a file
    auto temp = staged;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        out << srt_to_webvtt(content);
        if (!out) {
            return R::err(ErrorCode::IoError, "cannot write " + temp.string());
        }
    }
    std::filesystem::rename(temp, staged, ec);
    if (ec) {
        std::filesystem::remove(temp, ec);
        return R::err(ErrorCode::IoError, "cannot store " + staged.string());
    }

    util::Logger::info("Subtitles: Converted " + path.filename().string() + " -> " + staged.string());
    return staged;
}

}  // namespace reelcast::subtitles
