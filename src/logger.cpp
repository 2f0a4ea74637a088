/**
 * @file logger.cpp
 * @brief Implementation of the process-wide line logger
 */

#include "logger.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace {
std::mutex g_output_mutex;
std::atomic<bool> g_debug(false);
}  // namespace

namespace Logger {

void info(const std::string& message) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << message << std::endl;
}

void error(const std::string& message) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cerr << message << std::endl;
}

void debug(const std::string& message) {
    if (!g_debug.load()) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cerr << message << std::endl;
}

void setDebug(bool enabled) {
    g_debug.store(enabled);
}

bool debugEnabled() {
    return g_debug.load();
}

}  // namespace Logger
