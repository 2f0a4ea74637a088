/**
 * @file heatsink_builder.cpp
 * @brief Implementation of heatsink construction from configuration
 */

#include "heatsink_builder.hpp"
#include "logger.hpp"
#include "pwm_fan.hpp"
#include "thermal_sensor.hpp"
#include <filesystem>
#include <fstream>
#include <glob.h>

namespace fs = std::filesystem;

namespace {

std::string durationToString(std::chrono::nanoseconds d) {
    using namespace std::chrono;
    if (d.count() % 1000000 == 0) {
        return std::to_string(duration_cast<milliseconds>(d).count()) + "ms";
    }
    if (d.count() % 1000 == 0) {
        return std::to_string(duration_cast<microseconds>(d).count()) + "us";
    }
    return std::to_string(d.count()) + "ns";
}

}  // namespace

HeatsinkBuilder::HeatsinkBuilder(std::string hwmon_base_path)
    : hwmon_base_path_(std::move(hwmon_base_path))
{
}

StatusOr<std::vector<std::string>> HeatsinkBuilder::expandGlob(const std::string& pattern) {
    glob_t matches;
    int rc = ::glob(pattern.c_str(), 0, nullptr, &matches);
    if (rc == GLOB_NOMATCH) {
        globfree(&matches);
        return std::vector<std::string>();
    }
    if (rc != 0) {
        globfree(&matches);
        return Status::InvalidArgument("invalid glob '" + pattern + "'");
    }

    std::vector<std::string> result;
    for (size_t i = 0; i < matches.gl_pathc; i++) {
        result.push_back(fs::path(matches.gl_pathv[i]).lexically_normal().string());
    }
    globfree(&matches);
    return result;
}

std::string HeatsinkBuilder::findHwmonDeviceByName(const std::string& device_name) const {
    std::error_code ec;
    if (!fs::exists(hwmon_base_path_, ec)) {
        return "";
    }

    for (const auto& entry : fs::directory_iterator(hwmon_base_path_, ec)) {
        std::string entry_name = entry.path().filename().string();
        if (entry_name.find("hwmon") != 0) {
            continue;
        }

        fs::path name_file = entry.path() / "name";
        if (!fs::exists(name_file, ec)) {
            continue;
        }

        std::ifstream name_stream(name_file);
        std::string name;
        if (std::getline(name_stream, name) && ConfigParser::trim(name) == device_name) {
            fs::path temp_input = entry.path() / "temp1_input";
            if (fs::exists(temp_input, ec)) {
                return temp_input.string();
            }
        }
    }

    return "";
}

StatusOr<std::vector<std::string>> HeatsinkBuilder::resolveSensorPaths(const HeatsinkConfig& config) const {
    std::vector<std::string> paths;

    for (const auto& pattern : config.sensor_paths) {
        auto matches = expandGlob(pattern);
        if (!matches.ok()) {
            return matches.status();
        }
        paths.insert(paths.end(), matches->begin(), matches->end());
    }

    for (const auto& device_name : config.sensor_hwmon_names) {
        std::string path = findHwmonDeviceByName(device_name);
        if (path.empty()) {
            return Status::NotFound("no hwmon device named '" + device_name + "' under " +
                                    hwmon_base_path_);
        }
        paths.push_back(path);
    }

    if (paths.empty()) {
        std::string patterns;
        for (const auto& pattern : config.sensor_paths) {
            patterns += (patterns.empty() ? "" : ", ") + pattern;
        }
        return Status::NotFound("[" + patterns + "]: no file matches for the given glob(s)");
    }
    return paths;
}

StatusOr<std::string> HeatsinkBuilder::resolveFanPath(const HeatsinkConfig& config) const {
    auto matches = expandGlob(config.fan_path);
    if (!matches.ok()) {
        return matches.status();
    }
    if (matches->empty()) {
        return Status::NotFound("'" + config.fan_path + "': no file matches for the given glob");
    }
    if (matches->size() > 1) {
        return Status::InvalidArgument("'" + config.fan_path + "': too many matches for the given glob");
    }
    return matches->front();
}

StatusOr<std::unique_ptr<ThermalController>> HeatsinkBuilder::buildHeatsink(const HeatsinkConfig& config) const {
    auto sensor_paths = resolveSensorPaths(config);
    if (!sensor_paths.ok()) {
        return sensor_paths.status().wrapped("failed to create all sensors");
    }

    ThermalControllerConfig controller_config;
    for (const auto& path : *sensor_paths) {
        auto sensor = SysfsThermalSensor::open(path);
        if (!sensor.ok()) {
            return sensor.status().wrapped("failed to create all sensors");
        }
        Logger::info("created thermo sensor: " + path);
        controller_config.sensors.push_back(std::move(sensor.value()));
    }

    std::string fan_label = config.fan_name.empty() ? config.fan_path : config.fan_name;
    auto fan_path = resolveFanPath(config);
    if (!fan_path.ok()) {
        return fan_path.status().wrapped("failed to create fan '" + fan_label + "'");
    }

    PwmFanOptions fan_options;
    fan_options.name = config.fan_name;
    fan_options.min_speed_value = config.min_speed_value;
    fan_options.max_speed_value = config.max_speed_value;
    if (config.pwm_period.count() > 0) {
        fan_options.pwm_period = config.pwm_period;
    }

    auto fan = PwmFan::open(*fan_path, fan_options);
    if (!fan.ok()) {
        return fan.status().wrapped("failed to create fan '" + fan_label + "'");
    }
    Logger::info("created PWM fan: " + (*fan)->name() +
                 " (path=" + *fan_path +
                 ", pwm_period=" + durationToString((*fan)->pwmPeriod()) +
                 ", min_speed_value=" + (*fan)->minSpeedValue() +
                 ", max_speed_value=" + (*fan)->maxSpeedValue() + ")");

    controller_config.fan = std::move(fan.value());
    controller_config.name = config.name;
    controller_config.min_temperature = config.min_temp;
    controller_config.max_temperature = config.max_temp;
    controller_config.fan_response = config.fan_response;
    if (config.temp_check_period.count() > 0) {
        controller_config.check_period = config.temp_check_period;
    }

    auto controller = ThermalController::create(controller_config);
    if (!controller.ok()) {
        return controller.status().wrapped("failed to create heatsink");
    }
    Logger::info("created heatsink: " + (*controller)->name() +
                 " (temp_check_period=" + durationToString((*controller)->checkPeriod()) +
                 ", response=" + fanResponseToString(config.fan_response) + ")");
    return controller;
}

StatusOr<std::vector<std::unique_ptr<ThermalController>>> HeatsinkBuilder::build(
    const ControllerConfig& config) const {
    std::vector<std::unique_ptr<ThermalController>> heatsinks;

    for (const auto& heatsink_config : config.heatsinks) {
        auto heatsink = buildHeatsink(heatsink_config);
        if (!heatsink.ok()) {
            return heatsink.status().wrapped("heatsink '" + heatsink_config.name + "'");
        }
        heatsinks.push_back(std::move(heatsink.value()));
    }

    Logger::info("all heatsinks were created successfully: " + std::to_string(heatsinks.size()));
    return heatsinks;
}
