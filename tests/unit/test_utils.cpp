#include "../framework/SimpleTest.hpp"
#include "../framework/Fixtures.hpp"
#include "backend/Config.hpp"
#include "cli/Arguments.hpp"
#include "cli/Output.hpp"
#include "events/EventBus.hpp"
#include "events/Scheduler.hpp"
#include "net/AddressResolver.hpp"
#include "subtitles/SubtitleStager.hpp"
#include "ui/Formatting.hpp"
#include "ui/StatusLine.hpp"
#include "util/Result.hpp"
#include "util/UnicodeUtils.hpp"
#include <sstream>
#include <thread>

using namespace reelcast;
using reelcast::test::TempDir;

// --- Result -----------------------------------------------------------------

TEST_CASE(test_result_value_and_error) {
    util::Result<int> good = 42;
    ASSERT_TRUE(good.is_ok());
    ASSERT_EQ(good.value(), 42);

    util::Result<int> bad = util::make_error(util::ErrorCode::Timeout, "too slow");
    ASSERT_TRUE(bad.is_err());
    ASSERT_TRUE(bad.code() == util::ErrorCode::Timeout);
    ASSERT_EQ(bad.error().message, std::string("too slow"));
    ASSERT_THROWS(bad.value());
    ASSERT_THROWS(good.error());
}

TEST_CASE(test_error_code_names) {
    ASSERT_EQ(util::error_code_name(util::ErrorCode::InvalidLocator), std::string_view("invalid_locator"));
    ASSERT_EQ(util::error_code_name(util::ErrorCode::DeviceUnreachable), std::string_view("device_unreachable"));
    ASSERT_EQ(util::error_code_name(util::ErrorCode::NoActiveSession), std::string_view("no_active_session"));
}

// --- Formatting -------------------------------------------------------------

TEST_CASE(test_format_clock) {
    ASSERT_EQ(ui::format_clock(0), std::string("00:00"));
    ASSERT_EQ(ui::format_clock(75.5), std::string("01:15"));
    ASSERT_EQ(ui::format_clock(3725), std::string("1:02:05"));
    ASSERT_EQ(ui::format_clock(-3), std::string("00:00"));
}

TEST_CASE(test_format_bytes_and_rate) {
    ASSERT_EQ(ui::format_bytes(999), std::string("999 B"));
    ASSERT_EQ(ui::format_bytes(1500000), std::string("1.5 MB"));
    ASSERT_EQ(ui::format_bytes(2000000000), std::string("2.0 GB"));
    ASSERT_EQ(ui::format_rate(5200000), std::string("5.2 MB/s"));
}

TEST_CASE(test_progress_bar) {
    ASSERT_EQ(ui::progress_bar(0.5, 12), std::string("[#####-----]"));
    ASSERT_EQ(ui::progress_bar(2.0, 6), std::string("[####]"));
    ASSERT_EQ(ui::progress_bar(-1.0, 6), std::string("[----]"));
    ASSERT_EQ(ui::progress_bar(0.5, 2), std::string(""));
}

TEST_CASE(test_display_width_and_truncation) {
    ASSERT_EQ(ui::display_cols("Salón"), 5);
    ASSERT_EQ(ui::display_cols("\x1B[1mbold\x1B[0m"), 4);
    ASSERT_EQ(ui::trunc_pad("abc", 5), std::string("abc  "));
    ASSERT_EQ(ui::trunc_pad("abcdefgh", 5), std::string("abcd…"));
    ASSERT_EQ(ui::display_cols(ui::lr_align(20, "Playing", "01:02 / 45:00")), 20);
}

TEST_CASE(test_transfer_status_line) {
    model::TransferSession session;
    session.state = model::TransferState::of(model::TransferState::Kind::Downloading);
    session.total_bytes = 1000000000;
    session.bytes_transferred = 420000000;
    session.progress = 0.42;
    session.rate_bytes_per_sec = 5200000;
    session.peers = 12;

    auto line = ui::transfer_line(session, 100);
    ASSERT_EQ(ui::display_cols(line), 100);
    ASSERT_TRUE(line.starts_with("Downloading"));
    ASSERT_TRUE(line.find(" 42%") != std::string::npos);
    ASSERT_TRUE(line.find("5.2 MB/s") != std::string::npos);
    ASSERT_TRUE(line.find("12 peers") != std::string::npos);
    ASSERT_EQ(ui::display_cols(ui::transfer_line(session, 20)), 20);
}

TEST_CASE(test_cast_status_text) {
    model::CastStatus status;
    status.state = model::CastState::of(model::CastState::Kind::Playing);
    status.position_s = 62;
    status.duration_s = 2700;
    status.volume = 0.8;
    ASSERT_EQ(ui::cast_status_text(status),
              std::string("State:    Playing\nPosition: 01:02 / 45:00\nVolume:   80%"));
}

// --- Unicode ----------------------------------------------------------------

TEST_CASE(test_device_names_match_across_case_and_accents) {
    ASSERT_TRUE(util::names_match("Salon TV", "Salón TV"));
    ASSERT_TRUE(util::names_match("living room", "Living Room"));
    ASSERT_FALSE(util::names_match("Kitchen", "Bedroom"));
}

// --- Config -----------------------------------------------------------------

TEST_CASE(test_config_save_and_load_round_trip) {
    TempDir dir("config");
    backend::Config cfg;
    cfg.transfer.webtorrent_path = "/opt/webtorrent/bin/webtorrent";
    cfg.transfer.port = 8888;
    cfg.transfer.extra_args = {"--blocklist", "/etc/blocklist"};
    cfg.cast.default_device = "Living Room TV";
    cfg.playback.on_transfer_loss = model::TransferLossPolicy::StopCast;
    cfg.subtitles.cache_dir = dir.path() / "subs";
    cfg.log.level = "debug";

    auto file = dir.path() / "nested" / "config.toml";
    ASSERT_TRUE(backend::ConfigLoader::save_config(cfg, file));

    auto loaded = backend::ConfigLoader::load_from_file(file);
    ASSERT_EQ(loaded.transfer.webtorrent_path, cfg.transfer.webtorrent_path);
    ASSERT_EQ(loaded.transfer.port, 8888);
    ASSERT_EQ(loaded.transfer.extra_args.size(), 2u);
    ASSERT_EQ(loaded.cast.default_device, std::string("Living Room TV"));
    ASSERT_TRUE(loaded.playback.on_transfer_loss == model::TransferLossPolicy::StopCast);
    ASSERT_EQ(loaded.subtitles.cache_dir, cfg.subtitles.cache_dir);
    ASSERT_EQ(loaded.log.level, std::string("debug"));
}

TEST_CASE(test_config_invalid_values_keep_defaults) {
    TempDir dir("config");
    auto file = dir.write("config.toml",
        "[transfer]\n"
        "port = 99999\n"
        "ready_timeout_ms = soon\n"
        "[cast]\n"
        "command_timeout_ms = 3000   # inline comment\n"
        "[playback]\n"
        "on_transfer_loss = \"explode\"\n");

    auto loaded = backend::ConfigLoader::load_from_file(file);
    backend::Config defaults;
    ASSERT_EQ(loaded.transfer.port, defaults.transfer.port);
    ASSERT_EQ(loaded.transfer.ready_timeout_ms, defaults.transfer.ready_timeout_ms);
    ASSERT_EQ(loaded.cast.command_timeout_ms, 3000);
    ASSERT_TRUE(loaded.playback.on_transfer_loss == model::TransferLossPolicy::Warn);
}

TEST_CASE(test_config_missing_override_uses_defaults) {
    TempDir dir("config");
    auto cfg = backend::ConfigLoader::load_config(dir.path() / "absent.toml");
    ASSERT_EQ(cfg.transfer.webtorrent_path, std::string("webtorrent"));
    ASSERT_EQ(cfg.cast.catt_path, std::string("catt"));
}

// --- Subtitles --------------------------------------------------------------

TEST_CASE(test_srt_to_webvtt_rewrites_only_timestamps) {
    std::string srt =
        "\xEF\xBB\xBF" "1\r\n"
        "00:00:01,500 --> 00:00:04,000\r\n"
        "Well, hello there, 00:00:01,500\r\n";
    std::string vtt = subtitles::SubtitleStager::srt_to_webvtt(srt);
    ASSERT_EQ(vtt,
        std::string("WEBVTT\n\n"
                    "1\n"
                    "00:00:01.500 --> 00:00:04.000\n"
                    "Well, hello there, 00:00:01,500\n"));
}

TEST_CASE(test_stage_converts_srt_once) {
    TempDir dir("subs");
    subtitles::SubtitleStager stager(dir.path() / "cache");
    auto srt = dir.write("movie.srt", "1\n00:00:01,000 --> 00:00:02,000\nHi\n");

    auto first = stager.stage(srt);
    ASSERT_TRUE(first.is_ok());
    ASSERT_EQ(first.value().extension(), std::filesystem::path(".vtt"));
    ASSERT_TRUE(test::read_file(first.value()).starts_with("WEBVTT"));

    auto second = stager.stage(srt);
    ASSERT_TRUE(second.is_ok());
    ASSERT_EQ(first.value(), second.value());
}

TEST_CASE(test_stage_rejects_missing_and_foreign_files) {
    TempDir dir("subs");
    subtitles::SubtitleStager stager(dir.path());

    auto vtt = dir.write("movie.vtt", "WEBVTT\n");
    ASSERT_EQ(stager.stage(vtt).value(), vtt);

    auto missing = stager.stage(dir.path() / "nope.srt");
    ASSERT_TRUE(missing.is_err());
    ASSERT_TRUE(missing.code() == util::ErrorCode::IoError);

    auto foreign = stager.stage(dir.write("movie.txt", "x"));
    ASSERT_TRUE(foreign.code() == util::ErrorCode::InvalidArgument);
}

TEST_CASE(test_sha256_hex) {
    ASSERT_EQ(subtitles::SubtitleStager::sha256_hex("abc"),
              std::string("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
}

// --- CLI --------------------------------------------------------------------

TEST_CASE(test_parse_play_command) {
    auto inv = cli::parse_arguments({"-d", "Den", "--json", "play", "magnet:?xt=urn:btih:abc",
                                     "--file-idx", "2", "--subtitle", "movie.srt"});
    ASSERT_TRUE(inv.is_ok());
    ASSERT_EQ(inv.value().command, std::string("play"));
    ASSERT_EQ(*inv.value().device, std::string("Den"));
    ASSERT_TRUE(inv.value().json);
    ASSERT_EQ(*inv.value().magnet, std::string("magnet:?xt=urn:btih:abc"));
    ASSERT_EQ(*inv.value().file_index, 2u);
    ASSERT_EQ(*inv.value().subtitle, std::string("movie.srt"));
}

TEST_CASE(test_parse_seek_positions) {
    using cli::SeekTarget;
    ASSERT_TRUE(cli::parse_seek_position("90.5") == (SeekTarget{90.5, false}));
    ASSERT_TRUE(cli::parse_seek_position("5:30") == (SeekTarget{330.0, false}));
    ASSERT_TRUE(cli::parse_seek_position("1:30:00") == (SeekTarget{5400.0, false}));
    ASSERT_TRUE(cli::parse_seek_position("+30") == (SeekTarget{30.0, true}));
    ASSERT_TRUE(cli::parse_seek_position("-10") == (SeekTarget{-10.0, true}));

    ASSERT_FALSE(cli::parse_seek_position("").has_value());
    ASSERT_FALSE(cli::parse_seek_position("soon").has_value());
    ASSERT_FALSE(cli::parse_seek_position("5:75").has_value());
    ASSERT_FALSE(cli::parse_seek_position("1:2:3:4").has_value());
    ASSERT_FALSE(cli::parse_seek_position(":30").has_value());
    ASSERT_FALSE(cli::parse_seek_position("+").has_value());
    ASSERT_FALSE(cli::parse_seek_position("+-5").has_value());
    ASSERT_FALSE(cli::parse_seek_position("inf").has_value());

    auto inv = cli::parse_arguments({"seek", "-10"});
    ASSERT_TRUE(inv.is_ok());
    ASSERT_TRUE(inv.value().seek == (SeekTarget{-10.0, true}));
    ASSERT_TRUE(cli::parse_arguments({"seek", "1:02:03"}).value().seek == (SeekTarget{3723.0, false}));
}

TEST_CASE(test_resolve_seek_against_position) {
    ASSERT_NEAR(cli::resolve_seek({30.0, true}, 100.0), 130.0, 1e-9);
    ASSERT_NEAR(cli::resolve_seek({-10.0, true}, 100.0), 90.0, 1e-9);
    ASSERT_NEAR(cli::resolve_seek({-10.0, true}, 4.0), 0.0, 1e-9);
    ASSERT_NEAR(cli::resolve_seek({75.0, false}, 100.0), 75.0, 1e-9);
}

TEST_CASE(test_parse_volume_levels) {
    using cli::VolumeTarget;
    ASSERT_TRUE(cli::parse_volume_level("40") == (VolumeTarget{40.0, false}));
    ASSERT_TRUE(cli::parse_volume_level("150") == (VolumeTarget{100.0, false}));
    ASSERT_TRUE(cli::parse_volume_level("+10") == (VolumeTarget{10.0, true}));
    ASSERT_TRUE(cli::parse_volume_level("-5") == (VolumeTarget{-5.0, true}));
    ASSERT_FALSE(cli::parse_volume_level("loud").has_value());
    ASSERT_FALSE(cli::parse_volume_level("nan").has_value());

    ASSERT_NEAR(cli::resolve_volume({10.0, true}, 0.5), 0.6, 1e-9);
    ASSERT_NEAR(cli::resolve_volume({-5.0, true}, 0.02), 0.0, 1e-9);
    ASSERT_NEAR(cli::resolve_volume({20.0, true}, 0.95), 1.0, 1e-9);
    ASSERT_NEAR(cli::resolve_volume({40.0, false}, 0.95), 0.4, 1e-9);

    ASSERT_TRUE(cli::parse_arguments({"volume", "+10"}).value().volume == (VolumeTarget{10.0, true}));
}

TEST_CASE(test_parse_stop_and_status_options) {
    auto stop = cli::parse_arguments({"stop", "--kill-stream"});
    ASSERT_TRUE(stop.is_ok());
    ASSERT_TRUE(stop.value().kill_stream);
    ASSERT_FALSE(cli::parse_arguments({"stop"}).value().kill_stream);

    auto watch = cli::parse_arguments({"status", "--watch", "-i", "5"});
    ASSERT_TRUE(watch.is_ok());
    ASSERT_TRUE(watch.value().watch);
    ASSERT_EQ(watch.value().interval_s, 5);
    ASSERT_FALSE(watch.value().file_index.has_value());
    ASSERT_EQ(cli::parse_arguments({"-w", "status", "--interval", "2"}).value().interval_s, 2);
    ASSERT_EQ(cli::parse_arguments({"status"}).value().interval_s, 1);

    // -i stays the file index everywhere else
    ASSERT_EQ(*cli::parse_arguments({"stream", "magnet:?xt=urn:btih:abc", "-i", "3"}).value().file_index, 3u);
    ASSERT_TRUE(cli::parse_arguments({"status", "-i", "0"}).is_err());
    ASSERT_TRUE(cli::parse_arguments({"play", "magnet:?xt=urn:btih:abc", "--interval", "2"}).is_err());
}

TEST_CASE(test_parse_rejects_bad_input) {
    ASSERT_TRUE(cli::parse_arguments({}).is_err());
    ASSERT_TRUE(cli::parse_arguments({"dance"}).is_err());
    ASSERT_TRUE(cli::parse_arguments({"play"}).is_err());
    ASSERT_TRUE(cli::parse_arguments({"status", "extra"}).is_err());
    ASSERT_TRUE(cli::parse_arguments({"seek", "soon"}).is_err());
    ASSERT_TRUE(cli::parse_arguments({"--frobnicate", "status"}).is_err());
    ASSERT_TRUE(cli::parse_arguments({"-d"}).code() == util::ErrorCode::InvalidArgument);
    ASSERT_EQ(cli::parse_arguments({"status", "--help"}).value().command, std::string("help"));
}

TEST_CASE(test_exit_codes) {
    using cli::ExitCode;
    using util::ErrorCode;
    ASSERT_TRUE(cli::exit_code_for(ErrorCode::InvalidLocator) == ExitCode::InvalidArgs);
    ASSERT_TRUE(cli::exit_code_for(ErrorCode::LaunchNotFound) == ExitCode::NetworkError);
    ASSERT_TRUE(cli::exit_code_for(ErrorCode::DeviceUnreachable) == ExitCode::DeviceNotFound);
    ASSERT_TRUE(cli::exit_code_for(ErrorCode::NoPeers) == ExitCode::NoStreams);
    ASSERT_TRUE(cli::exit_code_for(ErrorCode::CastFailed) == ExitCode::CastFailed);
    ASSERT_TRUE(cli::exit_code_for(ErrorCode::Timeout) == ExitCode::Timeout);
    ASSERT_TRUE(cli::exit_code_for(ErrorCode::TransferFailed) == ExitCode::Error);
}

TEST_CASE(test_json_output_shapes) {
    std::ostringstream out, err;
    cli::Output output(true, out, err);

    model::CastTarget target{"Den", "10.0.0.7", std::nullopt};
    output.data(cli::to_json(std::vector<model::CastTarget>{target}), "ignored");
    output.info("not shown in json mode");
    int code = output.error(util::make_error(util::ErrorCode::CastFailed, "device said no"));

    ASSERT_EQ(code, 6);
    ASSERT_EQ(out.str(),
        std::string("{\"data\":[{\"address\":\"10.0.0.7\",\"model\":null,\"name\":\"Den\"}]}\n"
                    "{\"code\":\"cast_failed\",\"error\":\"device said no\",\"exit_code\":6}\n"));
    ASSERT_TRUE(err.str().empty());
}

TEST_CASE(test_playback_error_json_names_the_failing_side) {
    playback::PlaybackStatus status;
    status.state = model::UnifiedState::Error;
    status.detail = "Ghost unreachable";
    status.error_code = util::ErrorCode::DeviceUnreachable;

    auto value = cli::to_json(status);
    ASSERT_EQ(value["state"].asString(), std::string("error"));
    ASSERT_EQ(value["code"].asString(), std::string("device_unreachable"));
    ASSERT_TRUE(cli::exit_code_for(*status.error_code) == cli::ExitCode::DeviceNotFound);
    ASSERT_TRUE(cli::exit_code_for(util::ErrorCode::NoPeers) == cli::ExitCode::NoStreams);

    status.state = model::UnifiedState::Playing;
    status.error_code.reset();
    ASSERT_FALSE(cli::to_json(status).isMember("code"));
}

TEST_CASE(test_human_output_goes_to_stderr) {
    std::ostringstream out, err;
    cli::Output output(false, out, err);
    output.info("Scanning...");
    output.error(util::make_error(util::ErrorCode::NoTarget, "no device selected"));
    ASSERT_TRUE(out.str().empty());
    ASSERT_EQ(err.str(), std::string("Scanning...\nError: no device selected\n"));
}

TEST_CASE(test_cast_status_volume_is_percent) {
    model::CastStatus status;
    status.volume = 0.42;
    ASSERT_EQ(cli::to_json(status)["volume"].asInt(), 42);
}

// --- Events -----------------------------------------------------------------

TEST_CASE(test_event_bus_subscribe_and_unsubscribe) {
    events::EventBus bus;
    int seen = 0;
    auto id = bus.subscribe(events::Event::Type::CastStateChanged,
                            [&](const events::Event& e) { if (e.data == "playing") seen++; });
    ASSERT_EQ(bus.subscriber_count(events::Event::Type::CastStateChanged), 1u);

    events::Event event{events::Event::Type::CastStateChanged, "", "playing"};
    bus.publish(event);
    bus.publish(events::Event{events::Event::Type::PlaybackWarning, "", "playing"});
    ASSERT_EQ(seen, 1);

    bus.unsubscribe(id);
    bus.publish(event);
    ASSERT_EQ(seen, 1);
    ASSERT_EQ(bus.subscriber_count(events::Event::Type::CastStateChanged), 0u);
}

TEST_CASE(test_event_handler_may_unsubscribe_itself) {
    events::EventBus bus;
    events::EventBus::SubscriptionId id = 0;
    int calls = 0;
    id = bus.subscribe(events::Event::Type::TransferProgress, [&](const events::Event&) {
        calls++;
        bus.unsubscribe(id);
    });
    bus.publish(events::Event{events::Event::Type::TransferProgress});
    bus.publish(events::Event{events::Event::Type::TransferProgress});
    ASSERT_EQ(calls, 1);
}

TEST_CASE(test_event_buses_are_independent) {
    events::EventBus first;
    events::EventBus second;
    int first_calls = 0;
    int second_calls = 0;
    first.subscribe(events::Event::Type::PlaybackStateChanged, [&](const events::Event&) { first_calls++; });
    second.subscribe(events::Event::Type::PlaybackStateChanged, [&](const events::Event&) { second_calls++; });

    first.publish(events::Event{events::Event::Type::PlaybackStateChanged, "ts-1", "playing"});
    ASSERT_EQ(first_calls, 1);
    ASSERT_EQ(second_calls, 0);
    ASSERT_EQ(second.subscriber_count(events::Event::Type::PlaybackStateChanged), 1u);
}

TEST_CASE(test_scheduler_runs_due_tasks) {
    events::Scheduler scheduler;
    int fast = 0, slow = 0;
    scheduler.schedule("fast", std::chrono::milliseconds(10), [&] { fast++; }, true);
    scheduler.schedule("slow", std::chrono::hours(1), [&] { slow++; });

    ASSERT_EQ(scheduler.process(), 1);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    scheduler.process();
    ASSERT_EQ(fast, 2);
    ASSERT_EQ(slow, 0);

    scheduler.unschedule("fast");
    ASSERT_FALSE(scheduler.is_scheduled("fast"));
    ASSERT_TRUE(scheduler.is_scheduled("slow"));
}

// --- Network ----------------------------------------------------------------

TEST_CASE(test_format_url) {
    ASSERT_EQ(net::AddressResolver::format_url("192.168.1.5", 8000, "0"), std::string("http://192.168.1.5:8000/0"));
    ASSERT_EQ(net::AddressResolver::format_url("fe80::1", 9000, "/2"), std::string("http://[fe80::1]:9000/2"));
}

TEST_CASE(test_claimed_ports_are_distinct_until_released) {
    net::AddressResolver resolver("127.0.0.1");
    ASSERT_EQ(resolver.lan_address(), std::string("127.0.0.1"));

    auto a = resolver.claim_port();
    auto b = resolver.claim_port();
    ASSERT_TRUE(a.is_ok() && b.is_ok());
    ASSERT_TRUE(a.value() != b.value());
    ASSERT_EQ(resolver.claimed_count(), 2u);

    // A claimed port is never handed out twice, even when asked for by number
    auto again = resolver.claim_port(a.value());
    ASSERT_TRUE(again.is_ok());
    ASSERT_TRUE(again.value() != a.value());

    resolver.release_port(a.value());
    ASSERT_FALSE(resolver.is_claimed(a.value()));
    ASSERT_EQ(resolver.claimed_count(), 2u);
}

int main() {
    return reelcast::test::TestRunner::instance().run_all("utilities");
}
