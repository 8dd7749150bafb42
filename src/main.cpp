// src/main.cpp
// Terminal Health Service - Main Entry Point
//
// Usage: terminal_health_service [config.ini] [status.json]

#include "logging/logger.h"
#include "config/config_manager.h"
#include "core/health_monitor.h"
#include "core/monitor_settings.h"
#include "events/event_publisher.h"
#include "vendor_adapters/simulated/simulated_terminal.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace terminal_health;

namespace {
    std::atomic<bool> g_running(true);
}

// Signal handler for graceful shutdown
void SignalHandler(int signal) {
    (void)signal;
    g_running = false;
}

int main(int argc, char* argv[]) {
    auto& log = logging::Logger::getInstance();

    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    try {
        std::string configPath = argc > 1 ? argv[1] : "";
        config::ConfigManager::getInstance().initialize(configPath);
        auto& config = config::ConfigManager::getInstance();

        log.setMinLevel(logging::logLevelFromString(config.getString(config::KEY_LOG_LEVEL)));
        log.initialize(config.getString(config::KEY_LOG_FILE));
        log.info("Terminal Health Service starting...");

        core::MonitorSettings settings = core::MonitorSettings::fromConfig(config);

        auto clock = std::make_shared<SystemClock>();
        auto terminal = std::make_shared<vendor::simulated::SimulatedTerminal>(clock);
        terminal->setLayoutKind(settings.layout);
        terminal->setZeroTouchPreset(settings.preset);

        std::string statusFile = argc > 2 ? argv[2] : config.getString(config::KEY_SIMULATOR_STATUS_FILE);
        if (!statusFile.empty() && !terminal->reloadStatusFile(statusFile)) {
            log.info("No simulator status file at " + statusFile + " (terminal starts healthy)");
        }

        auto publisher = std::make_shared<events::EventPublisher>(clock);
        publisher->addSink(std::make_shared<events::LogEventSink>());

        core::HealthMonitor monitor(*terminal, *terminal, *terminal, settings, clock, publisher);
        if (!monitor.start()) {
            log.error("Failed to start health monitor");
            return 1;
        }

        log.info("Terminal Health Service started successfully");
        std::cout << "Terminal Health Service is running..." << std::endl;
        std::cout << "Press Ctrl+C to stop." << std::endl;

        // Main loop: pick up edits to the status file
        while (g_running && monitor.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            if (!statusFile.empty() && terminal->reloadStatusFile(statusFile)) {
                monitor.requestCheck("status_file_changed");
            }
        }

        std::cout << "\nShutting down..." << std::endl;
        monitor.stop();
        log.info("Final state: " + monitor.getStateSnapshot().dump());
        log.info("Terminal Health Service stopped");
        log.shutdown();

    } catch (const std::exception& e) {
        log.error("Exception in main: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
