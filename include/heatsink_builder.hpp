#ifndef HEATSINK_BUILDER_HPP
#define HEATSINK_BUILDER_HPP

/**
 * @file heatsink_builder.hpp
 * @brief Creates fans, sensors and thermal controllers from configuration
 */

#include "config_parser.hpp"
#include "status.hpp"
#include "thermal_controller.hpp"
#include <memory>
#include <string>
#include <vector>

class HeatsinkBuilder {
public:
    explicit HeatsinkBuilder(std::string hwmon_base_path = "/sys/class/hwmon");

    StatusOr<std::vector<std::unique_ptr<ThermalController>>> build(const ControllerConfig& config) const;

    StatusOr<std::unique_ptr<ThermalController>> buildHeatsink(const HeatsinkConfig& config) const;

    // Sorted matches; a pattern without matches yields an empty list
    static StatusOr<std::vector<std::string>> expandGlob(const std::string& pattern);

    // temp1_input of the hwmon device whose 'name' attribute equals device_name
    std::string findHwmonDeviceByName(const std::string& device_name) const;

private:
    StatusOr<std::vector<std::string>> resolveSensorPaths(const HeatsinkConfig& config) const;
    StatusOr<std::string> resolveFanPath(const HeatsinkConfig& config) const;

    std::string hwmon_base_path_;
};

#endif // HEATSINK_BUILDER_HPP
