#ifndef DUTY_CYCLE_HPP
#define DUTY_CYCLE_HPP

/**
 * @file duty_cycle.hpp
 * @brief Fan response curves mapping a temperature to a duty cycle ratio
 */

#include "status.hpp"
#include <memory>
#include <string>

// Fan response curves
enum class FanResponse : int {
    POW_PI = 0,  // quiet on short spikes, ramps sharply near the maximum
    LINEAR = 1
};

class DutyCycleFunction {
public:
    virtual ~DutyCycleFunction() = default;

    // Ratio in [0, 1] for the given temperature in degrees Celsius
    virtual double ratio(double temperature) const = 0;
};

class LinearDutyCycle : public DutyCycleFunction {
public:
    LinearDutyCycle(double min_temp, double max_temp);

    double ratio(double temperature) const override;

private:
    double min_temp_;
    double max_temp_;
    double temp_range_;
};

class PowPiDutyCycle : public DutyCycleFunction {
public:
    PowPiDutyCycle(double min_temp, double max_temp);

    double ratio(double temperature) const override;

private:
    double min_temp_;
    double max_temp_;
    double temp_range_;
};

std::unique_ptr<DutyCycleFunction> makeDutyCycleFunction(FanResponse response,
                                                         double min_temp,
                                                         double max_temp);

// Accepts "linear" and "powpi", case-insensitive
StatusOr<FanResponse> parseFanResponse(const std::string& name);

std::string fanResponseToString(FanResponse response);

#endif // DUTY_CYCLE_HPP
