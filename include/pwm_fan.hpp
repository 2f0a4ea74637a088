#ifndef PWM_FAN_HPP
#define PWM_FAN_HPP

/**
 * @file pwm_fan.hpp
 * @brief Two-speed fan driven by software PWM
 */

#include "device_file.hpp"
#include "fan_driver.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// Options for PwmFan, empty or non-positive values fall back to the defaults
struct PwmFanOptions {
    std::string name;                                // default: device path
    std::string min_speed_value = "0";               // written for minimum speed
    std::string max_speed_value = "255";             // written for maximum speed
    std::chrono::nanoseconds pwm_period = std::chrono::milliseconds(50);
};

/**
 * @brief Fan whose controller only accepts a minimum and a maximum speed
 *
 * Intermediate speeds are produced by toggling the device between the two
 * values on a background thread: for a ratio r and period P the device is
 * held at minimum for P - round(r * P) and at maximum for round(r * P).
 * The fan has exclusive write access to the device until close(). Closing
 * leaves the fan at maximum speed.
 *
 * Safe for concurrent use; setDutyCycle() and close() are serialized.
 */
class PwmFan : public FanDriver {
public:
    static constexpr std::chrono::milliseconds kDefaultPwmPeriod{50};

    // Opens a PWM attribute such as /sys/class/hwmon/hwmon2/pwm1
    static StatusOr<std::unique_ptr<PwmFan>> open(const std::string& path,
                                                  const PwmFanOptions& options = PwmFanOptions());

    PwmFan(std::unique_ptr<WritableDevice> device, const std::string& default_name,
           const PwmFanOptions& options = PwmFanOptions());
    ~PwmFan() override;

    PwmFan(const PwmFan&) = delete;
    PwmFan& operator=(const PwmFan&) = delete;

    Status setDutyCycle(double ratio) override;
    Status close() override;
    std::string name() const override;

    std::chrono::nanoseconds pwmPeriod() const { return pwm_period_; }
    const std::string& minSpeedValue() const { return min_speed_value_; }
    const std::string& maxSpeedValue() const { return max_speed_value_; }

private:
    struct PulseSplit {
        std::chrono::nanoseconds down;
        std::chrono::nanoseconds up;
        bool flat;
    };

    PulseSplit calcDurations(double ratio) const;
    Status generateSinglePulse(const PulseSplit& split);

    void startNopPwm();
    void startPwm(const PulseSplit& split);
    void retireCurrentPwm();
    bool shouldStop();

    Status setSpeedMin();
    Status setSpeedMax();
    Status writeSpeed(const std::string& value);

    std::string name_;
    std::unique_ptr<WritableDevice> device_;
    std::string min_speed_value_;
    std::string max_speed_value_;
    std::chrono::nanoseconds pwm_period_;

    // Serializes setDutyCycle() and the teardown part of close()
    std::mutex busy_mutex_;
    std::mutex close_mutex_;
    std::atomic<bool> closed_;

    // Retire and close signals observed by the oscillation thread
    std::mutex signal_mutex_;
    std::condition_variable signal_cv_;
    bool retire_requested_;
    bool close_requested_;

    std::thread pwm_thread_;
};

#endif // PWM_FAN_HPP
