#include "backend/Config.hpp"
#include "cli/Arguments.hpp"
#include "cli/Commands.hpp"
#include "cli/Output.hpp"
#include "util/Logger.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

// Global shutdown flag, polled by the long-running commands
static std::atomic<bool> g_shutdown{false};

// Only flips the flag: the command loop owns the teardown (killing the
// transfer, stopping the device)
static void signal_handler(int) {
    g_shutdown.store(true);
}

int main(int argc, char** argv) {
    using namespace reelcast;

    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = cli::parse_arguments(args);

    bool json = false;
    if (parsed.is_ok()) {
        json = parsed.value().json;
    } else {
        for (const auto& arg : args) {
            if (arg == "--json") json = true;
        }
    }
    cli::Output output(json, std::cout, std::cerr);

    if (parsed.is_err()) {
        if (!json) std::cerr << cli::usage() << '\n';
        return output.error(parsed.error());
    }

    try {
        const auto& inv = parsed.value();

        util::Logger::init();
        auto config = backend::ConfigLoader::load_config(inv.config_path);
        util::Logger::init(config.log.file, util::Logger::parse_level(config.log.level));
        util::Logger::info("reelcast starting: " + inv.command);

        std::signal(SIGINT, signal_handler);   // Ctrl+C
        std::signal(SIGTERM, signal_handler);  // kill command
        std::signal(SIGPIPE, SIG_IGN);         // a dead child's pipe must not kill us

        cli::CommandRunner runner(std::move(config), output, g_shutdown);
        int code = runner.run(inv);

        util::Logger::info("reelcast exiting with code " + std::to_string(code));
        return code;
    } catch (const std::exception& e) {
        util::Logger::error(std::string("Fatal error: ") + e.what());
        return output.error(cli::ExitCode::Error, "internal_error", e.what());
    }
}
