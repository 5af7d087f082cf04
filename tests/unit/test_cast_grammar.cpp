#include "../framework/SimpleTest.hpp"
#include "cast/CastGrammar.hpp"
#include <cmath>
#include <limits>
#include <random>

using namespace reelcast;
using namespace reelcast::cast;
using model::CastState;

TEST_CASE(test_device_line_name_first) {
    auto device = parse_device_line("Living Room TV - 192.168.1.50");
    ASSERT_TRUE(device.has_value());
    ASSERT_EQ(device->name, std::string("Living Room TV"));
    ASSERT_EQ(device->address, std::string("192.168.1.50"));
    ASSERT_FALSE(device->model.has_value());
}

TEST_CASE(test_device_line_address_first_with_model) {
    auto device = parse_device_line("192.168.1.36 - Kitchen - Google Inc. Chromecast");
    ASSERT_TRUE(device.has_value());
    ASSERT_EQ(device->name, std::string("Kitchen"));
    ASSERT_EQ(device->address, std::string("192.168.1.36"));
    ASSERT_EQ(*device->model, std::string("Google Inc. Chromecast"));
}

TEST_CASE(test_device_line_name_with_separator) {
    auto device = parse_device_line("Den - Upstairs - 10.0.0.7");
    ASSERT_TRUE(device.has_value());
    ASSERT_EQ(device->name, std::string("Den - Upstairs"));
}

TEST_CASE(test_device_line_rejects_banners_and_garbage) {
    ASSERT_FALSE(parse_device_line("Scanning Chromecasts...").has_value());
    ASSERT_FALSE(parse_device_line("No devices found").has_value());
    ASSERT_FALSE(parse_device_line("").has_value());
    ASSERT_FALSE(parse_device_line("just some words").has_value());
    ASSERT_FALSE(parse_device_line("Name - not-an-ip").has_value());
}

TEST_CASE(test_scan_output_two_devices) {
    auto devices = parse_scan_output(
        "Scanning Chromecasts...\n"
        "Living Room TV - 192.168.1.50\n"
        "192.168.1.51 - Bedroom - Google Inc. Chromecast Ultra\n");
    ASSERT_EQ(devices.size(), 2u);
    ASSERT_EQ(devices[0].name, std::string("Living Room TV"));
    ASSERT_EQ(devices[1].name, std::string("Bedroom"));
}

TEST_CASE(test_scan_output_no_devices) {
    ASSERT_TRUE(parse_scan_output("No devices found\n").empty());
    ASSERT_TRUE(parse_scan_output("").empty());
}

TEST_CASE(test_status_output_full) {
    auto update = parse_status_output(
        "Title: Big Buck Bunny\n"
        "State: PLAYING\n"
        "Duration: 596.5\n"
        "Current time: 42.0\n"
        "Volume: 80\n");
    ASSERT_TRUE(update.state->kind == CastState::Kind::Playing);
    ASSERT_NEAR(*update.duration_s, 596.5, 1e-9);
    ASSERT_NEAR(*update.position_s, 42.0, 1e-9);
    ASSERT_NEAR(*update.volume, 0.8, 1e-9);
    ASSERT_EQ(*update.title, std::string("Big Buck Bunny"));
}

TEST_CASE(test_status_output_clock_format) {
    auto update = parse_status_output("Current time: 1:02:03\nDuration: 02:00\n");
    ASSERT_NEAR(*update.position_s, 3723.0, 1e-9);
    ASSERT_NEAR(*update.duration_s, 120.0, 1e-9);
}

TEST_CASE(test_buffering_keeps_cached_position_and_duration) {
    model::CastStatus cached;
    cached.state = CastState::of(CastState::Kind::Playing);
    cached.position_s = 100.0;
    cached.duration_s = 600.0;
    cached.volume = 0.5;

    auto merged = merge_status(cached, parse_status_output("State: BUFFERING\n"));
    ASSERT_TRUE(merged.state.kind == CastState::Kind::Buffering);
    ASSERT_NEAR(merged.position_s, 100.0, 1e-9);
    ASSERT_NEAR(*merged.duration_s, 600.0, 1e-9);
    ASSERT_NEAR(merged.volume, 0.5, 1e-9);
}

TEST_CASE(test_unknown_state_word_keeps_cached_state) {
    model::CastStatus cached;
    cached.state = CastState::of(CastState::Kind::Paused);
    auto merged = merge_status(cached, parse_status_output("State: WHATEVER\n"));
    ASSERT_TRUE(merged.state.kind == CastState::Kind::Paused);
}

TEST_CASE(test_state_words_case_insensitive) {
    ASSERT_TRUE(*parse_state_word("playing") == CastState::Kind::Playing);
    ASSERT_TRUE(*parse_state_word("PAUSED") == CastState::Kind::Paused);
    ASSERT_TRUE(*parse_state_word("Idle") == CastState::Kind::Idle);
    ASSERT_FALSE(parse_state_word("dancing").has_value());
}

TEST_CASE(test_volume_clamp) {
    ASSERT_NEAR(clamp_volume(1.5), 1.0, 1e-12);
    ASSERT_NEAR(clamp_volume(-0.2), 0.0, 1e-12);
    ASSERT_NEAR(clamp_volume(0.42), 0.42, 1e-12);
    ASSERT_NEAR(clamp_volume(std::numeric_limits<double>::quiet_NaN()), 0.0, 1e-12);

    auto update = parse_status_output("Volume: 250\n");
    ASSERT_NEAR(*update.volume, 1.0, 1e-12);
}

TEST_CASE(test_seek_rules) {
    auto negative = clamp_seek(-1.0, 100.0);
    ASSERT_TRUE(negative.is_err());
    ASSERT_TRUE(negative.code() == util::ErrorCode::InvalidArgument);

    ASSERT_NEAR(clamp_seek(50.0, 100.0).value(), 50.0, 1e-12);
    ASSERT_NEAR(clamp_seek(500.0, 100.0).value(), 99.5, 1e-12);
    ASSERT_NEAR(clamp_seek(500.0, std::nullopt).value(), 500.0, 1e-12);
    ASSERT_NEAR(clamp_seek(5.0, 0.3).value(), 0.0, 1e-12);
    ASSERT_TRUE(clamp_seek(std::nan(""), 100.0).is_err());
}

TEST_CASE(test_unreachable_detection) {
    ASSERT_TRUE(looks_unreachable("Error: Specified device \"Den\" not found."));
    ASSERT_TRUE(looks_unreachable("socket connection refused"));
    ASSERT_FALSE(looks_unreachable("Error: invalid URL"));
}

TEST_CASE(test_random_status_never_throws) {
    std::mt19937 rng(99);
    const std::vector<std::string> keys = {"State", "Duration", "Current time", "Volume", "Title", "xx"};
    const std::vector<std::string> values = {"PLAYING", "-4", "nan", "1:2:3:4", "", "80", "1e400", "::", "12.5"};
    for (int i = 0; i < 2000; ++i) {
        std::string text;
        for (int l = 0; l < 4; ++l) {
            text += keys[rng() % keys.size()] + ": " + values[rng() % values.size()] + "\n";
        }
        auto merged = merge_status(model::CastStatus{}, parse_status_output(text));
        ASSERT_TRUE(merged.volume >= 0.0 && merged.volume <= 1.0);
        ASSERT_TRUE(merged.position_s >= 0.0);
        parse_scan_output(text);
    }
}

int main() {
    return reelcast::test::TestRunner::instance().run_all("cast grammar");
}
