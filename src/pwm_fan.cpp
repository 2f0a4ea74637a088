/**
 * @file pwm_fan.cpp
 * @brief Implementation of the software PWM fan driver
 */

#include "pwm_fan.hpp"
#include "logger.hpp"
#include <cmath>

StatusOr<std::unique_ptr<PwmFan>> PwmFan::open(const std::string& path,
                                               const PwmFanOptions& options) {
    auto device = SysfsDeviceFile::open(path);
    if (!device.ok()) {
        return device.status();
    }
    return std::make_unique<PwmFan>(std::move(device.value()), path, options);
}

PwmFan::PwmFan(std::unique_ptr<WritableDevice> device, const std::string& default_name,
               const PwmFanOptions& options)
    : name_(options.name.empty() ? default_name : options.name)
    , device_(std::move(device))
    , min_speed_value_(options.min_speed_value.empty() ? "0" : options.min_speed_value)
    , max_speed_value_(options.max_speed_value.empty() ? "255" : options.max_speed_value)
    , pwm_period_(options.pwm_period.count() > 0 ? options.pwm_period
                                                 : std::chrono::nanoseconds(kDefaultPwmPeriod))
    , closed_(false)
    , retire_requested_(false)
    , close_requested_(false)
{
    // So the first setDutyCycle() has a thread to retire
    startNopPwm();
}

PwmFan::~PwmFan() {
    if (closed_.load()) {
        return;
    }
    Status status = close();
    if (!status.ok() && status.code() != StatusCode::kClosed) {
        Logger::error("failed to close fan '" + name_ + "': " + status.message());
    }
}

Status PwmFan::setDutyCycle(double ratio) {
    std::lock_guard<std::mutex> busy(busy_mutex_);

    if (closed_.load()) {
        return Status::Closed("fan driver is closed");
    }
    retireCurrentPwm();

    PulseSplit split = calcDurations(ratio);
    Status status = generateSinglePulse(split);
    if (!status.ok() || split.flat) {
        startNopPwm();
    }
    if (!status.ok()) {
        return status.wrapped("generating initial pulse");
    }
    if (split.flat) {
        return Status::OK();
    }

    startPwm(split);
    return Status::OK();
}

Status PwmFan::close() {
    std::lock_guard<std::mutex> close_lock(close_mutex_);
    if (closed_.load()) {
        return Status::Closed("fan driver is closed");
    }
    closed_.store(true);

    {
        std::lock_guard<std::mutex> lock(signal_mutex_);
        close_requested_ = true;
    }
    signal_cv_.notify_all();

    std::lock_guard<std::mutex> busy(busy_mutex_);
    if (pwm_thread_.joinable()) {
        pwm_thread_.join();
    }

    // Leave the fan spinning at full speed
    Status max_status = setSpeedMax();
    Status close_status = device_->close();

    std::vector<Status> errs;
    if (!max_status.ok()) {
        errs.push_back(max_status.wrapped("failed to set fan speed to max while closing driver"));
    }
    if (!close_status.ok()) {
        errs.push_back(close_status.wrapped("failed to close device file while closing driver"));
    }
    return Status::Aggregate(errs);
}

std::string PwmFan::name() const {
    return name_;
}

PwmFan::PulseSplit PwmFan::calcDurations(double ratio) const {
    if (ratio > 1.0) {
        ratio = 1.0;
    } else if (!(ratio >= 0.0)) {
        ratio = 0.0;
    }

    PulseSplit split;
    split.up = std::chrono::nanoseconds(
        std::llround(ratio * static_cast<double>(pwm_period_.count())));
    split.down = pwm_period_ - split.up;
    split.flat = (split.up == pwm_period_) || (split.down == pwm_period_);
    return split;
}

Status PwmFan::generateSinglePulse(const PulseSplit& split) {
    // Every pulse starts at minimum
    Status status = setSpeedMin();
    if (!status.ok()) {
        return status.wrapped("failed to set min speed");
    }
    if (split.down == pwm_period_) {
        return Status::OK();
    }
    std::this_thread::sleep_for(split.down);

    status = setSpeedMax();
    if (!status.ok()) {
        return status.wrapped("failed to set max speed");
    }
    if (split.up == pwm_period_) {
        return Status::OK();
    }
    std::this_thread::sleep_for(split.up);

    return Status::OK();
}

void PwmFan::startNopPwm() {
    pwm_thread_ = std::thread([this]() {
        std::unique_lock<std::mutex> lock(signal_mutex_);
        signal_cv_.wait(lock, [this]() { return retire_requested_ || close_requested_; });
    });
}

void PwmFan::startPwm(const PulseSplit& split) {
    pwm_thread_ = std::thread([this, split]() {
        for (;;) {
            // Only logged, the next setDutyCycle() reports a persistent fault
            Status status = setSpeedMin();
            if (!status.ok()) {
                Logger::debug("fan '" + name_ + "': failed to set min speed: " + status.message());
            }
            std::this_thread::sleep_for(split.down);

            status = setSpeedMax();
            if (!status.ok()) {
                Logger::debug("fan '" + name_ + "': failed to set max speed: " + status.message());
            }
            std::this_thread::sleep_for(split.up);

            if (shouldStop()) {
                return;
            }
        }
    });
}

void PwmFan::retireCurrentPwm() {
    {
        std::lock_guard<std::mutex> lock(signal_mutex_);
        retire_requested_ = true;
    }
    signal_cv_.notify_all();

    if (pwm_thread_.joinable()) {
        pwm_thread_.join();
    }

    std::lock_guard<std::mutex> lock(signal_mutex_);
    retire_requested_ = false;
}

bool PwmFan::shouldStop() {
    std::lock_guard<std::mutex> lock(signal_mutex_);
    return retire_requested_ || close_requested_;
}

Status PwmFan::setSpeedMin() {
    return writeSpeed(min_speed_value_);
}

Status PwmFan::setSpeedMax() {
    return writeSpeed(max_speed_value_);
}

Status PwmFan::writeSpeed(const std::string& value) {
    Status status = device_->seekToStart();
    if (!status.ok()) {
        return status;
    }
    status = device_->truncate();
    if (!status.ok()) {
        return status;
    }
    return device_->write(value);
}
