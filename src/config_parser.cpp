/**
 * @file config_parser.cpp
 * @brief Implementation of configuration file and environment variable parsing
 */

#include "config_parser.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace {

const char* const kHeatsinkKeys[] = {
    "FAN_NAME", "FAN_PATH", "PWM_PERIOD", "MIN_SPEED_VALUE", "MAX_SPEED_VALUE",
    "FAN_RESPONSE", "SENSOR_PATHS", "SENSOR_HWMON_NAMES", "TEMP_CHECK_PERIOD",
    "MIN_TEMP", "MAX_TEMP"
};

struct DurationUnit {
    const char* name;
    double nanoseconds;
};

const DurationUnit kDurationUnits[] = {
    {"ns", 1.0},
    {"us", 1e3},
    {"\xC2\xB5s", 1e3},  // U+00B5 micro sign
    {"\xCE\xBCs", 1e3},  // U+03BC greek mu
    {"ms", 1e6},
    {"s", 1e9},
    {"m", 60e9},
    {"h", 3600e9},
};

}  // namespace

std::string ConfigParser::trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

std::vector<std::string> ConfigParser::splitList(const std::string& str) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

bool ConfigParser::parseBool(const std::string& value) {
    std::string val = value;
    std::transform(val.begin(), val.end(), val.begin(), ::tolower);
    return (val == "true" || val == "1" || val == "yes");
}

StatusOr<double> ConfigParser::parseNumber(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        double result = std::stod(value, &pos);
        if (pos != value.size() || !std::isfinite(result)) {
            return Status::InvalidArgument("invalid value for " + key + ": '" + value + "'");
        }
        return result;
    } catch (const std::exception&) {
        return Status::InvalidArgument("invalid value for " + key + ": '" + value + "'");
    }
}

StatusOr<std::chrono::nanoseconds> ConfigParser::parseDuration(const std::string& text) {
    std::string s = trim(text);
    const Status bad = Status::InvalidArgument("error parsing string as duration: '" + text + "'");

    if (s.empty()) {
        return bad;
    }

    bool negative = false;
    if (s[0] == '-' || s[0] == '+') {
        negative = (s[0] == '-');
        s = s.substr(1);
    }
    if (s == "0") {
        return std::chrono::nanoseconds(0);
    }
    if (s.empty()) {
        return bad;
    }

    double total = 0.0;
    size_t i = 0;
    while (i < s.size()) {
        size_t number_start = i;
        while (i < s.size() && (std::isdigit(static_cast<unsigned char>(s[i])) || s[i] == '.')) {
            i++;
        }
        std::string number = s.substr(number_start, i - number_start);
        if (number.empty() || number == ".") {
            return bad;
        }

        size_t unit_start = i;
        while (i < s.size() && !std::isdigit(static_cast<unsigned char>(s[i])) && s[i] != '.') {
            i++;
        }
        std::string unit = s.substr(unit_start, i - unit_start);

        const DurationUnit* match = nullptr;
        for (const auto& candidate : kDurationUnits) {
            if (unit == candidate.name) {
                match = &candidate;
                break;
            }
        }
        if (match == nullptr) {
            return bad;
        }

        try {
            size_t pos = 0;
            double value = std::stod(number, &pos);
            if (pos != number.size()) {
                return bad;
            }
            total += value * match->nanoseconds;
        } catch (const std::exception&) {
            return bad;
        }
    }

    if (!std::isfinite(total) || total > 9.2e18) {
        return bad;
    }
    auto ns = static_cast<long long>(std::llround(total));
    return std::chrono::nanoseconds(negative ? -ns : ns);
}

StatusOr<std::vector<ConfigParser::Section>> ConfigParser::parseSections(const std::string& text) {
    std::vector<Section> sections;
    sections.push_back(Section{"", 0, {}});

    std::istringstream input(text);
    std::string line;
    int line_number = 0;
    while (std::getline(input, line)) {
        line_number++;
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[') {
            if (line.back() != ']') {
                return Status::InvalidArgument("line " + std::to_string(line_number) +
                                               ": malformed section header: " + line);
            }
            std::string header = trim(line.substr(1, line.size() - 2));
            std::string kind = header.substr(0, header.find_first_of(" \t"));
            if (kind != "heatsink") {
                return Status::InvalidArgument("line " + std::to_string(line_number) +
                                               ": unknown section: [" + header + "]");
            }
            sections.push_back(Section{trim(header.substr(kind.size())), line_number, {}});
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        if (!key.empty() && !value.empty()) {
            sections.back().values[key] = value;
        }
    }

    return sections;
}

StatusOr<HeatsinkConfig> ConfigParser::parseHeatsink(const std::string& name,
                                                     const std::map<std::string, std::string>& kv_map) {
    HeatsinkConfig heatsink;
    heatsink.name = name;

    auto find = [&kv_map](const char* key) -> const std::string* {
        auto it = kv_map.find(key);
        return it == kv_map.end() ? nullptr : &it->second;
    };

    if (const std::string* val = find("FAN_NAME")) {
        heatsink.fan_name = *val;
    }
    if (const std::string* val = find("FAN_PATH")) {
        heatsink.fan_path = *val;
    }
    if (const std::string* val = find("PWM_PERIOD")) {
        auto period = parseDuration(*val);
        if (!period.ok()) {
            return period.status().wrapped("PWM_PERIOD");
        }
        heatsink.pwm_period = *period;
    }
    if (const std::string* val = find("MIN_SPEED_VALUE")) {
        heatsink.min_speed_value = *val;
    }
    if (const std::string* val = find("MAX_SPEED_VALUE")) {
        heatsink.max_speed_value = *val;
    }
    if (const std::string* val = find("FAN_RESPONSE")) {
        auto response = parseFanResponse(*val);
        if (!response.ok()) {
            return response.status();
        }
        heatsink.fan_response = *response;
    }
    if (const std::string* val = find("SENSOR_PATHS")) {
        heatsink.sensor_paths = splitList(*val);
    }
    if (const std::string* val = find("SENSOR_HWMON_NAMES")) {
        heatsink.sensor_hwmon_names = splitList(*val);
    }
    if (const std::string* val = find("TEMP_CHECK_PERIOD")) {
        auto period = parseDuration(*val);
        if (!period.ok()) {
            return period.status().wrapped("TEMP_CHECK_PERIOD");
        }
        heatsink.temp_check_period = *period;
    }
    if (const std::string* val = find("MIN_TEMP")) {
        auto temp = parseNumber("MIN_TEMP", *val);
        if (!temp.ok()) {
            return temp.status();
        }
        heatsink.min_temp = *temp;
    }
    if (const std::string* val = find("MAX_TEMP")) {
        auto temp = parseNumber("MAX_TEMP", *val);
        if (!temp.ok()) {
            return temp.status();
        }
        heatsink.max_temp = *temp;
    }

    if (heatsink.fan_path.empty()) {
        return Status::InvalidArgument("no FAN_PATH given");
    }
    if (heatsink.sensor_paths.empty() && heatsink.sensor_hwmon_names.empty()) {
        return Status::InvalidArgument("no SENSOR_PATHS or SENSOR_HWMON_NAMES given");
    }

    return heatsink;
}

StatusOr<ControllerConfig> ConfigParser::parseConfigText(const std::string& text) {
    ControllerConfig config = getDefaultConfig();

    auto sections = parseSections(text);
    if (!sections.ok()) {
        return sections.status();
    }

    const Section& globals = sections->front();
    auto debug = globals.values.find("DEBUG");
    if (debug != globals.values.end()) {
        config.debug = parseBool(debug->second);
    }

    for (size_t i = 1; i < sections->size(); i++) {
        const Section& section = (*sections)[i];
        auto heatsink = parseHeatsink(section.name, section.values);
        if (!heatsink.ok()) {
            std::string label = section.name.empty() ? "line " + std::to_string(section.line)
                                                     : "'" + section.name + "'";
            return heatsink.status().wrapped("heatsink " + label);
        }
        config.heatsinks.push_back(*heatsink);
    }

    if (config.heatsinks.empty()) {
        return Status::InvalidArgument("no heatsink config given");
    }
    return config;
}

StatusOr<ControllerConfig> ConfigParser::parseConfigFile(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        return Status::NotFound("failed to open config file: " + config_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    auto config = parseConfigText(buffer.str());
    if (!config.ok()) {
        return config.status().wrapped(config_path);
    }
    return config;
}

StatusOr<ControllerConfig> ConfigParser::parseEnvironment() {
    ControllerConfig config = getDefaultConfig();

    const char* env_val;

    if ((env_val = std::getenv("DEBUG")) != nullptr) {
        config.debug = parseBool(env_val);
    }

    std::map<std::string, std::string> kv_map;
    for (const char* key : kHeatsinkKeys) {
        if ((env_val = std::getenv(key)) != nullptr && env_val[0] != '\0') {
            kv_map[key] = trim(env_val);
        }
    }
    if (kv_map.find("FAN_PATH") == kv_map.end()) {
        return Status::InvalidArgument("no heatsink config given: FAN_PATH is not set");
    }

    std::string name = "default";
    if ((env_val = std::getenv("HEATSINK_NAME")) != nullptr && env_val[0] != '\0') {
        name = env_val;
    }

    auto heatsink = parseHeatsink(name, kv_map);
    if (!heatsink.ok()) {
        return heatsink.status().wrapped("environment");
    }
    config.heatsinks.push_back(*heatsink);
    return config;
}

ControllerConfig ConfigParser::getDefaultConfig() {
    ControllerConfig config;
    return config;
}
