#ifndef LOGGER_HPP
#define LOGGER_HPP

/**
 * @file logger.hpp
 * @brief Line logging to stdout/stderr, captured by journald under systemd
 *
 * Usage:
 *   Logger::info("started thermal control: heatsink/cpu-fan");
 *   Logger::debug("T:48.5°C ratio:0.12");   // only printed with DEBUG enabled
 *   Logger::error("failed to read temperature: ...");
 *
 * Each call writes one complete line; calls from several controller threads
 * are serialized.
 */

#include <string>

namespace Logger {
void info(const std::string& message);
void error(const std::string& message);
void debug(const std::string& message);

void setDebug(bool enabled);
bool debugEnabled();
}  // namespace Logger

#endif // LOGGER_HPP
