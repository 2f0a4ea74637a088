#ifndef THERMAL_SENSOR_HPP
#define THERMAL_SENSOR_HPP

/**
 * @file thermal_sensor.hpp
 * @brief Temperature sensor backed by a hwmon/thermal sysfs file
 */

#include "thermo_sensor.hpp"
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

/**
 * @brief Reads integer millidegree Celsius values such as
 *        /sys/class/hwmon/hwmon0/temp1_input
 *
 * The file stays open until close(). Safe for concurrent use.
 */
class SysfsThermalSensor : public ThermoSensor {
public:
    // An empty name defaults to the path
    static StatusOr<std::unique_ptr<SysfsThermalSensor>> open(const std::string& path,
                                                              const std::string& name = "");

    StatusOr<double> temperature() override;
    Status close() override;
    std::string name() const override;

private:
    SysfsThermalSensor(std::string path, std::string name);

    std::string path_;
    std::string name_;
    std::ifstream file_;
    std::mutex mutex_;
    bool closed_;
};

#endif // THERMAL_SENSOR_HPP
