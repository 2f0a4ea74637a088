#ifndef THERMO_SENSOR_HPP
#define THERMO_SENSOR_HPP

/**
 * @file thermo_sensor.hpp
 * @brief Interface of a device that provides temperature readings
 */

#include "status.hpp"
#include <string>

class ThermoSensor {
public:
    virtual ~ThermoSensor() = default;

    // Degrees Celsius. Returns kClosed once the sensor is closed
    virtual StatusOr<double> temperature() = 0;

    // Returns kClosed if the sensor was already closed
    virtual Status close() = 0;

    virtual std::string name() const = 0;
};

#endif // THERMO_SENSOR_HPP
