#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

#include <spdlog/spdlog.h>

#include "tailroute/configuration.hpp"
#include "tailroute/logging.hpp"
#include "tailroute/provider_runtime.hpp"

namespace {
std::atomic<bool> should_terminate{false};
std::atomic<bool> should_reload{false};

void handle_signal(int signal_number) {
    if (signal_number == SIGHUP) {
        should_reload.store(true);
        return;
    }
    should_terminate.store(true);
}
}  // namespace

int main() {
    using namespace tailroute;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    std::signal(SIGHUP, handle_signal);

    try {
        Configuration configuration = ConfigurationLoader::load();

        ProviderRuntime runtime{std::move(configuration)};
        runtime.initialize();
        runtime.run();

        while (!should_terminate.load()) {
            if (should_reload.exchange(false)) {
                runtime.request_rule_reload();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        runtime.shutdown();
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
