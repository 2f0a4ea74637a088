/**
 * @file duty_cycle.cpp
 * @brief Implementation of the linear and x^pi fan response curves
 */

#include "duty_cycle.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace {
constexpr double kPi = 3.14159265358979323846;
}  // namespace

LinearDutyCycle::LinearDutyCycle(double min_temp, double max_temp)
    : min_temp_(min_temp)
    , max_temp_(max_temp)
    , temp_range_(max_temp - min_temp)
{
}

double LinearDutyCycle::ratio(double temperature) const {
    if (temperature >= max_temp_) {
        return 1.0;
    }
    if (temperature <= min_temp_) {
        return 0.0;
    }
    return (temperature - min_temp_) / temp_range_;
}

PowPiDutyCycle::PowPiDutyCycle(double min_temp, double max_temp)
    : min_temp_(min_temp)
    , max_temp_(max_temp)
    , temp_range_(max_temp - min_temp)
{
}

double PowPiDutyCycle::ratio(double temperature) const {
    if (temperature >= max_temp_) {
        return 1.0;
    }
    if (temperature <= min_temp_) {
        return 0.0;
    }
    double fraction = (temperature - min_temp_) / temp_range_;
    return std::pow(fraction, kPi);
}

std::unique_ptr<DutyCycleFunction> makeDutyCycleFunction(FanResponse response,
                                                         double min_temp,
                                                         double max_temp) {
    switch (response) {
        case FanResponse::LINEAR:
            return std::make_unique<LinearDutyCycle>(min_temp, max_temp);
        case FanResponse::POW_PI:
        default:
            return std::make_unique<PowPiDutyCycle>(min_temp, max_temp);
    }
}

StatusOr<FanResponse> parseFanResponse(const std::string& name) {
    std::string val = name;
    std::transform(val.begin(), val.end(), val.begin(), ::tolower);

    if (val == "linear") {
        return FanResponse::LINEAR;
    }
    if (val == "powpi") {
        return FanResponse::POW_PI;
    }
    return Status::InvalidArgument("unknown fan response type: '" + name + "'");
}

std::string fanResponseToString(FanResponse response) {
    switch (response) {
        case FanResponse::LINEAR:
            return "linear";
        case FanResponse::POW_PI:
            return "powpi";
        default:
            return "unknown";
    }
}
