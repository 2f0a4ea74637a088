/**
 * @file thermal_controller.cpp
 * @brief Implementation of the heatsink thermal control loop
 */

#include "thermal_controller.hpp"
#include "logger.hpp"
#include <iomanip>
#include <limits>
#include <set>
#include <sstream>

StatusOr<std::unique_ptr<ThermalController>> ThermalController::create(
    const ThermalControllerConfig& config) {
    Status status = validate(config);
    if (!status.ok()) {
        return status.wrapped("invalid configuration");
    }
    return std::unique_ptr<ThermalController>(new ThermalController(config));
}

ThermalController::ThermalController(const ThermalControllerConfig& config)
    : name_(config.name.empty() ? "heatsink/" + config.fan->name() : config.name)
    , fan_(config.fan)
    , sensors_(config.sensors)
    , duty_cycle_(config.response_curve)
    , response_name_(config.response_curve ? "custom" : fanResponseToString(config.fan_response))
    , min_temperature_(config.min_temperature)
    , max_temperature_(config.max_temperature)
    , check_period_(config.check_period.count() > 0 ? config.check_period : kDefaultCheckPeriod)
    , stopped_(false)
{
    if (!duty_cycle_) {
        duty_cycle_ = makeDutyCycleFunction(config.fan_response, min_temperature_, max_temperature_);
    }
}

ThermalController::~ThermalController() {
    Status status = stop();
    if (!status.ok() && status.code() != StatusCode::kControllerStopped) {
        Logger::error("failed to release resources of " + name_ + ": " + status.message());
    }
}

Status ThermalController::validate(const ThermalControllerConfig& config) {
    if (!config.fan) {
        return Status::InvalidArgument("no fan given");
    }
    if (config.sensors.empty()) {
        return Status::InvalidArgument("no thermal sensors given");
    }

    std::set<const ThermoSensor*> seen;
    for (const auto& sensor : config.sensors) {
        if (!sensor) {
            return Status::InvalidArgument("a given sensor cannot be null");
        }
        if (!seen.insert(sensor.get()).second) {
            return Status::InvalidArgument("sensor '" + sensor->name() + "' given more than once");
        }
    }

    // Also rejects NaN bounds
    if (!(config.min_temperature < config.max_temperature)) {
        return Status::InvalidArgument("maximum temperature must be greater than the minimum");
    }
    return Status::OK();
}

Status ThermalController::start() {
    if (isStopped()) {
        return Status::ControllerStopped();
    }

    Logger::info("started thermal control: " + name_ +
                 " (fan=" + fan_->name() +
                 ", sensors=" + std::to_string(sensors_.size()) +
                 ", min=" + formatTemperature(min_temperature_) + "°C" +
                 ", max=" + formatTemperature(max_temperature_) + "°C" +
                 ", response=" + response_name_ + ")");

    Status result = runLoop();

    // Only reported when this call tore the resources down
    Status stop_status = stop();
    if (stop_status.code() == StatusCode::kControllerStopped) {
        return result;
    }
    if (!stop_status.ok()) {
        Logger::error("failed to properly stop thermal control after encountering an error: " +
                      name_ + ": " + stop_status.message());
    }
    Logger::info("stopped thermal control: " + name_);

    return result;
}

Status ThermalController::stop() {
    std::lock_guard<std::mutex> close_lock(close_mutex_);
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        if (stopped_) {
            return Status::ControllerStopped();
        }
        stopped_ = true;
    }
    stop_cv_.notify_all();

    std::lock_guard<std::mutex> cycle(cycle_mutex_);

    std::vector<Status> errs;
    Status status = fan_->close();
    if (!status.ok()) {
        errs.push_back(status.wrapped("error closing fan"));
    }
    for (const auto& sensor : sensors_) {
        status = sensor->close();
        if (!status.ok()) {
            errs.push_back(status.wrapped("error closing sensor"));
        }
    }
    return Status::Aggregate(errs);
}

bool ThermalController::isStopped() const {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    return stopped_;
}

Status ThermalController::runLoop() {
    for (;;) {
        {
            std::unique_lock<std::mutex> lock(stop_mutex_);
            stop_cv_.wait_for(lock, check_period_, [this]() { return stopped_; });
            if (stopped_) {
                return Status::ControllerStopped();
            }
        }

        std::lock_guard<std::mutex> cycle(cycle_mutex_);
        if (isStopped()) {
            return Status::ControllerStopped();
        }
        Status status = controlCycle();
        if (!status.ok()) {
            return status;
        }
    }
}

Status ThermalController::controlCycle() {
    auto temp = maxTemperature();
    if (!temp.ok()) {
        return temp.status().wrapped("determining max core temperature");
    }

    double ratio = duty_cycle_->ratio(*temp);
    if (Logger::debugEnabled()) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3) << ratio;
        Logger::debug(name_ + " T:" + formatTemperature(*temp) + "°C ratio:" + oss.str());
    }

    Status status = fan_->setDutyCycle(ratio);
    if (!status.ok()) {
        return status.wrapped("setting fan's duty cycle");
    }
    return Status::OK();
}

StatusOr<double> ThermalController::maxTemperature() {
    double max_temp = -std::numeric_limits<double>::infinity();
    std::vector<Status> errs;

    for (const auto& sensor : sensors_) {
        auto temp = sensor->temperature();
        if (!temp.ok()) {
            errs.push_back(temp.status().wrapped("thermo sensor '" + sensor->name() + "'"));
            continue;
        }
        if (*temp > max_temp) {
            max_temp = *temp;
        }
    }

    if (errs.size() == sensors_.size()) {
        return Status::Aggregate(errs);
    }
    for (const auto& err : errs) {
        Logger::error("failed to read temperature: " + name_ + ": " + err.message());
    }

    return max_temp;
}

std::string ThermalController::formatTemperature(double temp) const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << temp;
    std::string result = oss.str();
    // Drop trailing zeros and a bare decimal point
    size_t dot_pos = result.find('.');
    if (dot_pos != std::string::npos) {
        while (result.size() > dot_pos + 1 && result.back() == '0') {
            result.pop_back();
        }
        if (result.size() == dot_pos + 1) {
            result.pop_back();
        }
    }
    return result;
}
