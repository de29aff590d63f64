#include "SessionApp.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {

std::atomic<bool> g_stopRequested{false};

void signalHandler(int)
{
    g_stopRequested = true;
}

} // namespace

int main(int argc, char* argv[])
{
    try {
        // config.json из аргумента, иначе ENV
        auto settings = argc > 1
            ? session::settings::SecuritySettings::fromJsonFile(argv[1])
            : session::settings::SecuritySettings::fromEnv();

        session::SessionApp app(settings);

        // Signal handlers для graceful shutdown
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::cout << "========================================" << std::endl;
        std::cout << "  Session Service v1.0.0 Starting" << std::endl;
        std::cout << "  Press Ctrl+C to stop" << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "[main] Config: " << app.settings().toJson().dump() << std::endl;

        app.start();

        while (!g_stopRequested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        std::cout << "\n[main] Shutdown requested" << std::endl;
        app.stop();
        std::cout << "[main] Final stats: " << app.statsJson().dump() << std::endl;
        std::cout << "[main] Session Service stopped" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
