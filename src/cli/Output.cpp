#include "cli/Output.hpp"
#include <cmath>
#include <ostream>

namespace reelcast::cli {

using util::ErrorCode;

ExitCode exit_code_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidLocator:
        case ErrorCode::InvalidArgument:
            return ExitCode::InvalidArgs;
        case ErrorCode::LaunchNotFound:
        case ErrorCode::SpawnFailed:
            return ExitCode::NetworkError;
        case ErrorCode::DeviceUnreachable:
        case ErrorCode::NoTarget:
            return ExitCode::DeviceNotFound;
        case ErrorCode::NoPeers:
            return ExitCode::NoStreams;
        case ErrorCode::CastFailed:
            return ExitCode::CastFailed;
        case ErrorCode::Timeout:
            return ExitCode::Timeout;
        case ErrorCode::ParseError:
        case ErrorCode::TransferFailed:
        case ErrorCode::NoActiveSession:
        case ErrorCode::SessionNotFound:
        case ErrorCode::InvalidState:
        case ErrorCode::IoError:
            return ExitCode::Error;
    }
    return ExitCode::Error;
}

Json::Value to_json(const model::CastTarget& target) {
    Json::Value value;
    value["name"] = target.name;
    value["address"] = target.address;
    value["model"] = target.model ? Json::Value(*target.model) : Json::Value(Json::nullValue);
    return value;
}

Json::Value to_json(const std::vector<model::CastTarget>& targets) {
    Json::Value list(Json::arrayValue);
    for (const auto& target : targets) {
        list.append(to_json(target));
    }
    return list;
}

Json::Value to_json(const model::TransferSession& session) {
    Json::Value value;
    value["id"] = session.id;
    value["state"] = model::to_string(session.state);
    value["url"] = session.stream_url ? Json::Value(*session.stream_url) : Json::Value(Json::nullValue);
    value["port"] = session.port;
    value["progress"] = session.progress;
    value["rate_bytes_per_sec"] = Json::UInt64(session.rate_bytes_per_sec);
    value["bytes_transferred"] = Json::UInt64(session.bytes_transferred);
    value["total_bytes"] = session.total_bytes ? Json::Value(Json::UInt64(*session.total_bytes))
                                               : Json::Value(Json::nullValue);
    value["peers"] = session.peers ? Json::Value(*session.peers) : Json::Value(Json::nullValue);
    value["restarts"] = session.restarts;
    return value;
}

Json::Value to_json(const model::CastStatus& status) {
    Json::Value value;
    value["state"] = model::to_string(status.state);
    value["position"] = status.position_s;
    value["duration"] = status.duration_s ? Json::Value(*status.duration_s) : Json::Value(Json::nullValue);
    value["volume"] = static_cast<int>(std::lround(status.volume * 100.0));
    value["title"] = status.title ? Json::Value(*status.title) : Json::Value(Json::nullValue);
    return value;
}

Json::Value to_json(const playback::PlaybackStatus& status) {
    Json::Value value;
    value["state"] = model::to_string(status.state);
    value["detail"] = status.detail;
    if (status.warning) value["warning"] = *status.warning;
    if (status.error_code) value["code"] = std::string(util::error_code_name(*status.error_code));
    if (status.target) value["device"] = to_json(*status.target);
    if (status.transfer) value["transfer"] = to_json(*status.transfer);
    if (status.cast) value["cast"] = to_json(*status.cast);
    return value;
}

Output::Output(bool json, std::ostream& out, std::ostream& err)
    : json_(json), out_(out), err_(err) {}

std::string Output::compact(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

void Output::data(const Json::Value& value, const std::string& human) {
    end_status_line();
    if (json_) {
        Json::Value wrapped;
        wrapped["data"] = value;
        out_ << compact(wrapped) << '\n';
    } else if (!human.empty()) {
        out_ << human << '\n';
    }
    out_.flush();
}

int Output::error(const util::Error& error) {
    return this->error(exit_code_for(error.code), std::string(util::error_code_name(error.code)), error.message);
}

int Output::error(ExitCode code, const std::string& code_name, const std::string& message) {
    end_status_line();
    if (json_) {
        Json::Value value;
        value["error"] = message;
        value["code"] = code_name;
        value["exit_code"] = static_cast<int>(code);
        out_ << compact(value) << '\n';
        out_.flush();
    } else {
        err_ << "Error: " << message << '\n';
    }
    return static_cast<int>(code);
}

void Output::info(const std::string& message) {
    if (json_) return;
    end_status_line();
    err_ << message << '\n';
}

void Output::status_line(const std::string& line) {
    if (json_) return;
    err_ << '\r' << line << std::flush;
    status_line_open_ = true;
}

void Output::end_status_line() {
    if (status_line_open_) {
        err_ << '\n';
        status_line_open_ = false;
    }
}

}  // namespace reelcast::cli
