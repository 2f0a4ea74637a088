#ifndef FAN_DRIVER_HPP
#define FAN_DRIVER_HPP

/**
 * @file fan_driver.hpp
 * @brief Interface of a fan whose speed is commanded by a duty cycle ratio
 */

#include "status.hpp"
#include <string>

class FanDriver {
public:
    virtual ~FanDriver() = default;

    // Ratios outside [0, 1] are clamped. Returns kClosed once the driver is closed
    virtual Status setDutyCycle(double ratio) = 0;

    // Returns kClosed if the driver was already closed
    virtual Status close() = 0;

    virtual std::string name() const = 0;
};

#endif // FAN_DRIVER_HPP
