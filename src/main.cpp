/**
 * @file main.cpp
 * @brief Main entry point for the heatsink controller daemon
 */

#include "config_parser.hpp"
#include "heatsink_builder.hpp"
#include "logger.hpp"
#include "thermal_controller.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

// sysexits.h values
constexpr int kExitUsage = 64;
constexpr int kExitNoInput = 66;
constexpr int kExitConfig = 78;

volatile std::sig_atomic_t g_shutdown_signal = 0;

/**
 * @brief Signal handler for graceful shutdown
 * @param signal Signal number (SIGINT, SIGTERM)
 *
 * Only records the signal; controllers are stopped from the main thread.
 */
void signalHandler(int signal) {
    g_shutdown_signal = signal;
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--config <path>] [--debug] [--help]\n";
    std::cout << "Configuration file: " << ConfigParser::kDefaultConfigPath << "\n";
    std::cout << "Environment variables: FAN_PATH, SENSOR_PATHS, SENSOR_HWMON_NAMES, MIN_TEMP, MAX_TEMP, etc.\n";
}

}  // namespace

/**
 * @brief Main entry point
 *
 * Parses configuration from the given file, the default file, or environment
 * variables, builds one thermal controller per heatsink and runs each on its
 * own thread until a signal arrives or every controller has failed.
 */
int main(int argc, char* argv[]) {
    std::string config_path;
    bool debug_flag = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--debug") {
            debug_flag = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            Logger::error("invalid argument: " + arg);
            printUsage(argv[0]);
            return kExitUsage;
        }
    }

    // Priority: --config > default config file > environment
    StatusOr<ControllerConfig> config = Status::NotFound("no configuration");
    if (!config_path.empty()) {
        config = ConfigParser::parseConfigFile(config_path);
    } else if (access(ConfigParser::kDefaultConfigPath, R_OK) == 0) {
        config = ConfigParser::parseConfigFile(ConfigParser::kDefaultConfigPath);
    } else {
        config = ConfigParser::parseEnvironment();
    }

    if (!config.ok()) {
        Logger::error("failed to load configuration: " + config.status().message());
        return config.status().code() == StatusCode::kNotFound ? kExitNoInput : kExitConfig;
    }
    Logger::setDebug(config->debug || debug_flag);

    HeatsinkBuilder builder;
    auto heatsinks = builder.build(*config);
    if (!heatsinks.ok()) {
        Logger::error("failed to instantiate heatsinks: " + heatsinks.status().message());
        return kExitConfig;
    }

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    std::atomic<size_t> running(heatsinks->size());
    std::vector<std::thread> threads;
    for (auto& heatsink : *heatsinks) {
        ThermalController* controller = heatsink.get();
        threads.emplace_back([controller, &running]() {
            Status status = controller->start();
            if (status.code() != StatusCode::kControllerStopped) {
                Logger::error("thermal control returned an error: " + controller->name() + ": " +
                              status.message());
            }
            running--;
        });
    }

    while (g_shutdown_signal == 0 && running.load() > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    bool interrupted = g_shutdown_signal != 0;
    if (interrupted) {
        Logger::info("received signal " + std::to_string(g_shutdown_signal) + ", shutting down...");
    }

    for (auto& heatsink : *heatsinks) {
        Status status = heatsink->stop();
        if (!status.ok() && status.code() != StatusCode::kControllerStopped) {
            Logger::error("failed to stop " + heatsink->name() + ": " + status.message());
        }
    }
    for (auto& thread : threads) {
        thread.join();
    }

    return interrupted ? 0 : 1;
}
