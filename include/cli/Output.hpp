#pragma once

#include "model/Session.hpp"
#include "playback/PlaybackOrchestrator.hpp"
#include "util/Result.hpp"
#include <iosfwd>
#include <string>
#include <vector>
#include <json/json.h>

namespace reelcast::cli {

enum class ExitCode : int {
    Success = 0,
    Error = 1,
    InvalidArgs = 2,
    NetworkError = 3,
    DeviceNotFound = 4,
    NoStreams = 5,
    CastFailed = 6,
    Timeout = 7,
};

ExitCode exit_code_for(util::ErrorCode code);

Json::Value to_json(const model::CastTarget& target);
Json::Value to_json(const std::vector<model::CastTarget>& targets);
Json::Value to_json(const model::TransferSession& session);
Json::Value to_json(const model::CastStatus& status);
Json::Value to_json(const playback::PlaybackStatus& status);

/**
 * Everything the commands print goes through here. In JSON mode each result
 * is one compact object on stdout ({"data": ...} or an error object) and
 * informational messages are dropped; in human mode messages go to stderr.
 */
class Output {
public:
    Output(bool json, std::ostream& out, std::ostream& err);

    bool json() const { return json_; }

    void data(const Json::Value& value, const std::string& human);
    int error(const util::Error& error);
    int error(ExitCode code, const std::string& code_name, const std::string& message);
    void info(const std::string& message);

    // Rewritable single status line (human mode only)
    void status_line(const std::string& line);
    void end_status_line();

    static std::string compact(const Json::Value& value);

private:
    bool json_;
    std::ostream& out_;
    std::ostream& err_;
    bool status_line_open_ = false;
};

}  // namespace reelcast::cli
