#include <iostream>
#include <string_view>
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "client/GameClient.hpp"

using namespace Wildspirit;

/**
 * Wildspirit - Main entry point
 *
 * Usage: wildspirit [assets-dir] < actions.txt
 */
int main(int argc, char** argv) {
    try {
        // Initialize logging
        spdlog::init_thread_pool(8192, 1);
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        auto logger = std::make_shared<spdlog::async_logger>("main", console_sink,
                                                             spdlog::thread_pool(),
                                                             spdlog::async_overflow_policy::block);
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::debug);
        spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

        spdlog::info("=== Wildspirit ===");
        spdlog::info("Initializing...");

        ClientOptions options;
        if (argc > 1) {
            options.assetsPath = std::string_view(argv[1]);
        }

        // Create and run the client
        GameClient client(options);
        client.init();
        client.run(std::cin);
        client.shutdown();

        spdlog::info("Application shutting down...");
        spdlog::shutdown();

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        spdlog::shutdown();
        return 1;
    }

    return 0;
}
