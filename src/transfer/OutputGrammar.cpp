#include "transfer/OutputGrammar.hpp"
#include "net/AddressResolver.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <regex>

namespace reelcast::transfer {

using model::TransferState;

namespace {

const std::regex& downloaded_re() {
    static const std::regex re(
        R"(downloaded:?\s*([0-9]+(?:\.[0-9]+)?)\s*([kmgt]?i?b)\b(?:\s*(?:/|of)\s*([0-9]+(?:\.[0-9]+)?)\s*([kmgt]?i?b)\b)?)",
        std::regex::icase);
    return re;
}

const std::regex& total_re() {
    static const std::regex re(
        R"((?:total size|total|size|length):\s*([0-9]+(?:\.[0-9]+)?)\s*([kmgt]?i?b)\b)",
        std::regex::icase);
    return re;
}

const std::regex& speed_re() {
    static const std::regex re(
        R"(speed:\s*([0-9]+(?:\.[0-9]+)?)\s*([kmgt]?i?b)/s)",
        std::regex::icase);
    return re;
}

const std::regex& peers_re() {
    static const std::regex re(
        R"((?:peers?:\s*([0-9]+))|(?:([0-9]+)\s+peers?\b)|(?:connect(?:ing|ed) to\b))",
        std::regex::icase);
    return re;
}

const std::regex& server_url_re() {
    static const std::regex re(
        R"((?:server|listening|running)[^\n]*?https?://[^\s/:]+:([0-9]{1,5}))",
        std::regex::icase);
    return re;
}

const std::regex& server_port_re() {
    static const std::regex re(
        R"(listening on port:?\s*([0-9]{1,5}))",
        std::regex::icase);
    return re;
}

const std::regex& no_peers_re() {
    static const std::regex re(
        R"(\b(?:no|zero) (?:peers|seeders|seeds)\b|\bcould not find any peers\b|\bno peers? (?:found|available)\b)",
        std::regex::icase);
    return re;
}

const std::regex& error_re() {
    static const std::regex re(R"(\berror\b)", std::regex::icase);
    return re;
}

std::optional<double> to_double(std::string_view text) {
    double value = 0.0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<uint32_t> to_u32(std::string_view text) {
    uint32_t value = 0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc()) return std::nullopt;
    return value;
}

std::string trim(std::string_view text) {
    auto start = text.find_first_not_of(" \t");
    if (start == std::string_view::npos) return {};
    auto end = text.find_last_not_of(" \t");
    return std::string(text.substr(start, end - start + 1));
}

bool is_hex(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

bool is_base32(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        c = static_cast<unsigned char>(std::toupper(c));
        return (c >= 'A' && c <= 'Z') || (c >= '2' && c <= '7');
    });
}

}  // namespace

std::string strip_ansi(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ) {
        if (s[i] == '\x1B' && i + 1 < s.size()) {
            // CSI: ESC [ params final-byte
            if (s[i + 1] == '[') {
                i += 2;
                while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
                if (i < s.size()) i++;
                continue;
            }
            // OSC: ESC ] ... BEL or ESC backslash
            if (s[i + 1] == ']') {
                i += 2;
                while (i < s.size()) {
                    if (s[i] == '\x07') { i++; break; }
                    if (s[i] == '\x1B' && i + 1 < s.size() && s[i + 1] == '\\') { i += 2; break; }
                    i++;
                }
                continue;
            }
            i += 2;  // two-byte escape
            continue;
        }
        if (s[i] == '\x1B') {
            i++;
            continue;
        }
        out.push_back(s[i]);
        i++;
    }
    return out;
}

std::optional<uint64_t> parse_size(std::string_view number, std::string_view unit) {
    auto value = to_double(number);
    if (!value || *value < 0.0 || !std::isfinite(*value)) return std::nullopt;

    std::string u(unit);
    std::transform(u.begin(), u.end(), u.begin(), [](unsigned char c) { return std::tolower(c); });
    u.erase(std::remove(u.begin(), u.end(), 'i'), u.end());

    double multiplier = 0.0;
    if (u == "b") multiplier = 1.0;
    else if (u == "kb") multiplier = 1e3;
    else if (u == "mb") multiplier = 1e6;
    else if (u == "gb") multiplier = 1e9;
    else if (u == "tb") multiplier = 1e12;
    else return std::nullopt;

    double bytes = *value * multiplier;
    if (bytes >= 1.8e19) return std::nullopt;
    return static_cast<uint64_t>(std::llround(bytes));
}

std::optional<TransferLineEvent> parse_transfer_line(std::string_view raw) {
    std::string line = strip_ansi(raw);
    if (line.empty()) return std::nullopt;

    TransferLineEvent event;
    bool matched = false;
    std::smatch m;

    if (std::regex_search(line, m, no_peers_re())) {
        event.error = trim(line);
        event.no_peers = true;
        return event;
    }
    if (std::regex_search(line, m, error_re())) {
        event.error = trim(line);
        return event;
    }

    if (std::regex_search(line, m, server_url_re()) || std::regex_search(line, m, server_port_re())) {
        auto port = to_u32(m[1].str());
        if (port && *port > 0 && *port <= 65535) {
            event.listening_port = static_cast<uint16_t>(*port);
            matched = true;
        }
    }

    if (std::regex_search(line, m, downloaded_re())) {
        if (auto bytes = parse_size(m[1].str(), m[2].str())) {
            event.downloaded_bytes = bytes;
            matched = true;
        }
        if (m[3].matched) {
            if (auto total = parse_size(m[3].str(), m[4].str())) {
                event.total_bytes = total;
            }
        }
    } else if (std::regex_search(line, m, total_re())) {
        if (auto total = parse_size(m[1].str(), m[2].str())) {
            event.total_bytes = total;
            matched = true;
        }
    }

    if (std::regex_search(line, m, speed_re())) {
        if (auto rate = parse_size(m[1].str(), m[2].str())) {
            event.rate_bytes_per_sec = rate;
            matched = true;
        }
    }

    if (std::regex_search(line, m, peers_re())) {
        event.connecting = true;
        matched = true;
        for (size_t group : {1u, 2u}) {
            if (m[group].matched) {
                event.peers = to_u32(m[group].str());
                break;
            }
        }
    }

    if (!matched) return std::nullopt;
    return event;
}

ApplyOutcome apply_event(model::TransferSession& session,
                         const TransferLineEvent& event,
                         const std::string& lan_address) {
    ApplyOutcome outcome;
    if (session.state.is_terminal()) return outcome;

    auto advance_to = [&](TransferState::Kind kind) {
        if (model::rank(session.state.kind) < model::rank(kind)) {
            session.state = TransferState::of(kind);
            outcome.state_changed = true;
        }
    };

    if (event.error) {
        session.state = event.no_peers ? TransferState::peerless(*event.error)
                                       : TransferState::error(*event.error);
        outcome.state_changed = true;
        return outcome;
    }

    if (event.connecting) {
        if (event.peers) session.peers = event.peers;
        if (session.state.kind == TransferState::Kind::Starting) {
            advance_to(TransferState::Kind::Connecting);
        }
    }

    if (event.total_bytes && *event.total_bytes > 0) {
        session.total_bytes = event.total_bytes;
    }

    if (event.downloaded_bytes) {
        if (*event.downloaded_bytes > session.bytes_transferred) {
            session.bytes_transferred = *event.downloaded_bytes;
            outcome.progress_changed = true;
        }
        if (session.total_bytes && *session.total_bytes > 0) {
            double ratio = static_cast<double>(session.bytes_transferred) /
                           static_cast<double>(*session.total_bytes);
            ratio = std::clamp(ratio, 0.0, 1.0);
            if (ratio > session.progress) {
                session.progress = ratio;
                outcome.progress_changed = true;
            }
        }
        advance_to(TransferState::Kind::Downloading);
    }

    if (event.rate_bytes_per_sec) {
        if (session.rate_bytes_per_sec != *event.rate_bytes_per_sec) {
            session.rate_bytes_per_sec = *event.rate_bytes_per_sec;
            outcome.progress_changed = true;
        }
    }

    if (event.listening_port) {
        auto url = stream_url_for(lan_address, *event.listening_port, session.file_index);
        if (session.stream_url != url) {
            session.stream_url = url;
            session.port = *event.listening_port;
            outcome.url_resolved = true;
        }
        advance_to(TransferState::Kind::Streaming);
    }

    return outcome;
}

ApplyOutcome apply_exit(model::TransferSession& session, int exit_status) {
    ApplyOutcome outcome;
    if (session.state.is_terminal()) return outcome;

    if (exit_status != 0) {
        session.state = TransferState::error("transfer process exited with status " +
                                             std::to_string(exit_status));
    } else {
        session.state = TransferState::of(TransferState::Kind::Stopped);
    }
    outcome.state_changed = true;
    return outcome;
}

std::string stream_url_for(const std::string& lan_address, uint16_t port,
                           std::optional<uint32_t> file_index) {
    return net::AddressResolver::format_url(lan_address, port, std::to_string(file_index.value_or(0)));
}

std::optional<std::string> extract_info_hash(std::string_view locator) {
    constexpr std::string_view prefix = "xt=urn:btih:";
    auto start = locator.find(prefix);
    if (start == std::string_view::npos) return std::nullopt;
    start += prefix.size();
    auto end = locator.find('&', start);
    return std::string(locator.substr(start, end == std::string_view::npos ? end : end - start));
}

util::EmptyResult validate_locator(std::string_view locator) {
    using util::ErrorCode;

    if (locator.empty()) {
        return util::make_error(ErrorCode::InvalidLocator, "locator is empty");
    }
    if (locator.substr(0, 8) != "magnet:?") {
        return util::make_error(ErrorCode::InvalidLocator, "locator must start with 'magnet:?'");
    }
    auto hash = extract_info_hash(locator);
    if (!hash) {
        return util::make_error(ErrorCode::InvalidLocator, "magnet link is missing the xt=urn:btih: infohash");
    }
    if (hash->size() == 32 && is_base32(*hash)) {
        return util::success();
    }
    if (hash->size() < 16 || hash->size() > 64) {
        return util::make_error(ErrorCode::InvalidLocator,
            "invalid infohash length " + std::to_string(hash->size()) + " (expected 16-64 hex characters)");
    }
    if (!is_hex(*hash)) {
        return util::make_error(ErrorCode::InvalidLocator, "infohash contains non-hexadecimal characters");
    }
    return util::success();
}

}  // namespace reelcast::transfer
