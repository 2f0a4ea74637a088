#ifndef CONFIG_PARSER_HPP
#define CONFIG_PARSER_HPP

/**
 * @file config_parser.hpp
 * @brief Configuration parsing for the heatsink controller daemon
 *
 * File format, one KEY = value per line, '#' and ';' start comments:
 *
 *   DEBUG = false
 *
 *   [heatsink cpu]
 *   FAN_PATH = /sys/class/hwmon/hwmon2/pwm1
 *   SENSOR_PATHS = /sys/class/thermal/thermal_zone0/temp
 *   SENSOR_HWMON_NAMES = cpu_thermal, rp1_adc
 *   MIN_TEMP = 45
 *   MAX_TEMP = 70
 *   FAN_RESPONSE = powpi
 *   TEMP_CHECK_PERIOD = 1s
 *   PWM_PERIOD = 50ms
 */

#include "duty_cycle.hpp"
#include "status.hpp"
#include <chrono>
#include <map>
#include <string>
#include <vector>

struct HeatsinkConfig {
    std::string name;                      // empty: "heatsink/<fan name>"

    std::string fan_name;                  // empty: fan device path
    std::string fan_path;                  // glob, must match exactly one file
    std::chrono::nanoseconds pwm_period{0};          // 0: driver default (50ms)
    std::string min_speed_value;           // empty: "0"
    std::string max_speed_value;           // empty: "255"
    FanResponse fan_response = FanResponse::POW_PI;

    std::vector<std::string> sensor_paths;         // globs
    std::vector<std::string> sensor_hwmon_names;   // resolved to .../hwmonN/temp1_input
    std::chrono::nanoseconds temp_check_period{0};   // 0: controller default (1s)
    double min_temp = 0.0;
    double max_temp = 0.0;
};

// Configuration structure with default values
struct ControllerConfig {
    std::vector<HeatsinkConfig> heatsinks;
    bool debug = false;
};

class ConfigParser {
public:
    static constexpr const char* kDefaultConfigPath =
        "/etc/heatsink-controller/heatsink-controller.conf";

    static StatusOr<ControllerConfig> parseConfigFile(const std::string& config_path);
    static StatusOr<ControllerConfig> parseConfigText(const std::string& text);
    static StatusOr<ControllerConfig> parseEnvironment();
    static ControllerConfig getDefaultConfig();

    // Go-style durations: "300ms", "1.5s", "1m30s", units ns, us, µs, ms, s, m, h
    static StatusOr<std::chrono::nanoseconds> parseDuration(const std::string& text);

    // Comma-separated list, entries trimmed, empty entries dropped
    static std::vector<std::string> splitList(const std::string& str);

    // Strips spaces, tabs and line endings from both ends
    static std::string trim(const std::string& str);

private:
    struct Section {
        std::string name;
        int line;
        std::map<std::string, std::string> values;
    };

    static StatusOr<std::vector<Section>> parseSections(const std::string& text);
    static StatusOr<HeatsinkConfig> parseHeatsink(const std::string& name,
                                                  const std::map<std::string, std::string>& kv_map);
    static StatusOr<double> parseNumber(const std::string& key, const std::string& value);
    static bool parseBool(const std::string& value);
};

#endif // CONFIG_PARSER_HPP
