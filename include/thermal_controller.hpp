#ifndef THERMAL_CONTROLLER_HPP
#define THERMAL_CONTROLLER_HPP

/**
 * @file thermal_controller.hpp
 * @brief Closed-loop temperature control of one heatsink fan
 */

#include "duty_cycle.hpp"
#include "fan_driver.hpp"
#include "status.hpp"
#include "thermo_sensor.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct ThermalControllerConfig {
    std::shared_ptr<FanDriver> fan;
    std::vector<std::shared_ptr<ThermoSensor>> sensors;

    // Below min the fan spins at minimum speed, above max at maximum speed
    double min_temperature = 0.0;
    double max_temperature = 0.0;

    std::string name;                                    // default: "heatsink/<fan name>"
    FanResponse fan_response = FanResponse::POW_PI;
    std::shared_ptr<DutyCycleFunction> response_curve;   // replaces fan_response when set
    std::chrono::nanoseconds check_period = std::chrono::seconds(1);  // non-positive: 1 second
};

/**
 * @brief Polls the sensors, maps the hottest reading to a duty cycle and
 *        commands the fan, until an error or stop()
 *
 * The controller owns the fan and the sensors: stopping it closes all of
 * them exactly once.
 */
class ThermalController {
public:
    static constexpr std::chrono::nanoseconds kDefaultCheckPeriod = std::chrono::seconds(1);

    static StatusOr<std::unique_ptr<ThermalController>> create(const ThermalControllerConfig& config);

    ~ThermalController();

    ThermalController(const ThermalController&) = delete;
    ThermalController& operator=(const ThermalController&) = delete;

    /**
     * @brief Run the control loop on the calling thread
     *
     * Always returns an error: kControllerStopped after stop(), otherwise the
     * sensor or fan failure that ended the loop. The controller is stopped
     * when this returns.
     */
    Status start();

    /**
     * @brief Stop the loop and close the fan and every sensor
     *
     * Waits for an in-flight control cycle. Only the first call has side
     * effects, later calls return kControllerStopped.
     */
    Status stop();

    bool isStopped() const;
    const std::string& name() const { return name_; }
    std::chrono::nanoseconds checkPeriod() const { return check_period_; }

private:
    explicit ThermalController(const ThermalControllerConfig& config);

    static Status validate(const ThermalControllerConfig& config);

    Status runLoop();
    Status controlCycle();
    StatusOr<double> maxTemperature();
    std::string formatTemperature(double temp) const;

    std::string name_;
    std::shared_ptr<FanDriver> fan_;
    std::vector<std::shared_ptr<ThermoSensor>> sensors_;
    std::shared_ptr<DutyCycleFunction> duty_cycle_;
    std::string response_name_;
    double min_temperature_;
    double max_temperature_;
    std::chrono::nanoseconds check_period_;

    mutable std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    bool stopped_;

    // Held for a whole stop() so teardown runs once
    std::mutex close_mutex_;
    // Held for one sample-decide-act cycle
    std::mutex cycle_mutex_;
};

#endif // THERMAL_CONTROLLER_HPP
