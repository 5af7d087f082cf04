#include "../framework/SimpleTest.hpp"
#include "../framework/FakeTools.hpp"
#include "cast/CastController.hpp"
#include "events/EventBus.hpp"

using namespace reelcast;
using model::CastState;
using reelcast::test::TempDir;

namespace {

backend::CastSettings settings_for(const std::filesystem::path& catt) {
    backend::CastSettings settings;
    settings.catt_path = catt.string();
    settings.discovery_timeout_ms = 3000;
    settings.command_timeout_ms = 3000;
    return settings;
}

const std::string kUrl = "http://192.168.1.100:8000/0";

}  // namespace

TEST_CASE(test_discover_lists_devices_in_both_formats) {
    TempDir dir("cast");
    cast::CastController controller(settings_for(test::fake_catt(dir)));

    auto found = controller.discover();
    ASSERT_TRUE(found.is_ok());
    ASSERT_EQ(found.value().size(), 2u);
    ASSERT_EQ(found.value()[0].name, std::string("Living Room TV"));
    ASSERT_EQ(*found.value()[0].model, std::string("Google Inc. Chromecast"));
    ASSERT_EQ(found.value()[1].address, std::string("192.168.1.51"));
    ASSERT_EQ(controller.devices().size(), 2u);
}

TEST_CASE(test_select_target_matches_discovered_names) {
    TempDir dir("cast");
    cast::CastController controller(settings_for(test::fake_catt(dir)));
    ASSERT_TRUE(controller.discover().is_ok());

    auto chosen = controller.select_target("living room tv");
    ASSERT_EQ(chosen.address, std::string("192.168.1.50"));
    ASSERT_EQ(controller.select_target("192.168.1.51").name, std::string("Kitchen"));

    auto unknown = controller.select_target("Attic");
    ASSERT_EQ(unknown.name, std::string("Attic"));
    ASSERT_TRUE(unknown.address.empty());
    ASSERT_EQ(controller.target()->name, std::string("Attic"));
}

TEST_CASE(test_commands_need_a_target) {
    TempDir dir("cast");
    cast::CastController controller(settings_for(test::fake_catt(dir)));
    ASSERT_FALSE(controller.target().has_value());
    ASSERT_TRUE(controller.cast(kUrl).code() == util::ErrorCode::NoTarget);
    ASSERT_TRUE(controller.status().code() == util::ErrorCode::NoTarget);
    ASSERT_TRUE(controller.pause().code() == util::ErrorCode::NoTarget);
}

TEST_CASE(test_default_device_is_the_initial_target) {
    TempDir dir("cast");
    auto settings = settings_for(test::fake_catt(dir));
    settings.default_device = "Kitchen";
    cast::CastController controller(settings);
    ASSERT_EQ(controller.target()->name, std::string("Kitchen"));
}

TEST_CASE(test_cast_then_status) {
    TempDir dir("cast");
    events::EventBus bus;
    cast::CastController controller(settings_for(test::fake_catt(dir)), &bus);
    std::vector<std::string> states;
    bus.subscribe(events::Event::Type::CastStateChanged, [&](const events::Event& e) { states.push_back(e.data); });

    controller.select_target("Living Room TV");
    ASSERT_TRUE(controller.cast(kUrl, std::string("Sintel"), std::string("/tmp/subs.vtt")).is_ok());
    ASSERT_TRUE(controller.last_status().state.kind == CastState::Kind::Connecting);
    ASSERT_TRUE(test::catt_log(dir).find("-d Living Room TV cast " + kUrl + " -s /tmp/subs.vtt") !=
                std::string::npos);

    auto status = controller.status();
    ASSERT_TRUE(status.is_ok());
    ASSERT_TRUE(status.value().state.kind == CastState::Kind::Playing);
    ASSERT_NEAR(*status.value().duration_s, 600.0, 1e-9);
    ASSERT_NEAR(status.value().position_s, 12.0, 1e-9);
    ASSERT_NEAR(status.value().volume, 0.5, 1e-9);
    ASSERT_EQ(*status.value().title, std::string("Sintel"));

    ASSERT_EQ(states.size(), 2u);
    ASSERT_EQ(states[0], std::string("connecting"));
    ASSERT_EQ(states[1], std::string("playing"));
}

TEST_CASE(test_pause_resume_stop) {
    TempDir dir("cast");
    cast::CastController controller(settings_for(test::fake_catt(dir)));
    controller.select_target("Kitchen");
    ASSERT_TRUE(controller.cast(kUrl).is_ok());

    ASSERT_TRUE(controller.pause().is_ok());
    ASSERT_TRUE(controller.last_status().state.kind == CastState::Kind::Paused);
    ASSERT_TRUE(controller.status().value().state.kind == CastState::Kind::Paused);

    ASSERT_TRUE(controller.play().is_ok());
    ASSERT_TRUE(controller.status().value().state.kind == CastState::Kind::Playing);

    ASSERT_TRUE(controller.stop().is_ok());
    ASSERT_TRUE(controller.status().value().state.kind == CastState::Kind::Idle);
}

TEST_CASE(test_seek_is_clamped_to_known_duration) {
    TempDir dir("cast");
    cast::CastController controller(settings_for(test::fake_catt(dir)));
    controller.select_target("Kitchen");
    ASSERT_TRUE(controller.cast(kUrl).is_ok());
    ASSERT_TRUE(controller.status().is_ok());

    ASSERT_TRUE(controller.seek(30).is_ok());
    ASSERT_TRUE(controller.seek(1000).is_ok());
    ASSERT_NEAR(controller.last_status().position_s, 599.5, 1e-9);

    auto before = test::catt_log(dir);
    ASSERT_TRUE(controller.seek(-1).code() == util::ErrorCode::InvalidArgument);
    ASSERT_EQ(test::catt_log(dir), before);

    auto log = test::catt_log(dir);
    ASSERT_TRUE(log.find("-d Kitchen seek 30\n") != std::string::npos);
    ASSERT_TRUE(log.find("-d Kitchen seek 599.5\n") != std::string::npos);
}

TEST_CASE(test_huge_seek_without_duration_is_sent_whole) {
    TempDir dir("cast");
    cast::CastController controller(settings_for(test::fake_catt(dir)));
    controller.select_target("Kitchen");

    ASSERT_TRUE(controller.seek(1e300).is_ok());
    ASSERT_TRUE(controller.seek(42.25).is_ok());

    auto log = test::catt_log(dir);
    const std::string prefix = "-d Kitchen seek ";
    auto start = log.find(prefix);
    ASSERT_TRUE(start != std::string::npos);
    start += prefix.size();
    auto digits = log.substr(start, log.find('\n', start) - start);
    ASSERT_EQ(digits.size(), 301u);
    ASSERT_TRUE(digits.find_first_not_of("0123456789") == std::string::npos);
    ASSERT_TRUE(log.find("-d Kitchen seek 42.2\n") != std::string::npos ||
                log.find("-d Kitchen seek 42.3\n") != std::string::npos);
}

TEST_CASE(test_volume_is_sent_as_percent) {
    TempDir dir("cast");
    cast::CastController controller(settings_for(test::fake_catt(dir)));
    controller.select_target("Kitchen");

    ASSERT_TRUE(controller.set_volume(0.426).is_ok());
    ASSERT_TRUE(controller.set_volume(7.0).is_ok());
    ASSERT_NEAR(controller.last_status().volume, 1.0, 1e-12);

    auto log = test::catt_log(dir);
    ASSERT_TRUE(log.find("-d Kitchen volume 43\n") != std::string::npos);
    ASSERT_TRUE(log.find("-d Kitchen volume 100\n") != std::string::npos);
}

TEST_CASE(test_unreachable_device) {
    TempDir dir("cast");
    cast::CastController controller(settings_for(test::fake_catt(dir)));
    controller.select_target("Ghost");

    auto status = controller.status();
    ASSERT_TRUE(status.code() == util::ErrorCode::DeviceUnreachable);
    ASSERT_TRUE(controller.last_status().state.kind == CastState::Kind::Error);

    ASSERT_TRUE(controller.cast(kUrl).code() == util::ErrorCode::DeviceUnreachable);
}

TEST_CASE(test_rejected_media_is_cast_failed) {
    TempDir dir("cast");
    cast::CastController controller(settings_for(test::fake_catt(dir)));
    controller.select_target("Kitchen");
    dir.write("reject-media", "");

    auto casted = controller.cast(kUrl);
    ASSERT_TRUE(casted.code() == util::ErrorCode::CastFailed);
    ASSERT_TRUE(casted.error().message.find("media could not be loaded") != std::string::npos);

    auto cached = controller.last_status();
    ASSERT_TRUE(cached.state.kind == CastState::Kind::Error);
    ASSERT_TRUE(cached.state.reason.find("Kitchen") != std::string::npos);

    // A later cast recovers
    std::filesystem::remove(dir.path() / "reject-media");
    ASSERT_TRUE(controller.cast(kUrl).is_ok());
    ASSERT_TRUE(controller.last_status().state.kind == CastState::Kind::Connecting);
}

TEST_CASE(test_status_timeout_keeps_cache) {
    TempDir dir("cast");
    auto settings = settings_for(dir.script("catt", "exec sleep 30"));
    settings.command_timeout_ms = 200;
    cast::CastController controller(settings);
    controller.select_target("Kitchen");

    auto status = controller.status();
    ASSERT_TRUE(status.code() == util::ErrorCode::Timeout);
    ASSERT_TRUE(controller.last_status().state.kind == CastState::Kind::Idle);
}

TEST_CASE(test_missing_tool) {
    TempDir dir("cast");
    cast::CastController controller(settings_for(dir.path() / "no-catt"));
    ASSERT_TRUE(controller.discover().code() == util::ErrorCode::LaunchNotFound);

    controller.select_target("Kitchen");
    ASSERT_TRUE(controller.status().code() == util::ErrorCode::LaunchNotFound);
    ASSERT_TRUE(controller.last_status().state.kind == CastState::Kind::Error);
}

int main() {
    return reelcast::test::TestRunner::instance().run_all("cast controller");
}
