/**
 * @file thermal_sensor.cpp
 * @brief Implementation of the sysfs temperature sensor
 */

#include "thermal_sensor.hpp"
#include <filesystem>

namespace fs = std::filesystem;

StatusOr<std::unique_ptr<SysfsThermalSensor>> SysfsThermalSensor::open(const std::string& path,
                                                                       const std::string& name) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Status::NotFound("temperature sensor path does not exist: " + path);
    }

    std::unique_ptr<SysfsThermalSensor> sensor(
        new SysfsThermalSensor(path, name.empty() ? path : name));
    sensor->file_.open(path);
    if (!sensor->file_.is_open()) {
        return Status::IoError("failed to open temperature sensor: " + path);
    }
    return sensor;
}

SysfsThermalSensor::SysfsThermalSensor(std::string path, std::string name)
    : path_(std::move(path))
    , name_(std::move(name))
    , closed_(false)
{
}

StatusOr<double> SysfsThermalSensor::temperature() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (closed_) {
        return Status::Closed("thermal sensor is closed");
    }

    // sysfs attributes must be re-read from offset 0 to get a fresh value
    file_.clear();
    file_.seekg(0, std::ios::beg);
    if (!file_) {
        return Status::IoError("failed to seek temperature sensor: " + path_);
    }

    long temp_millicelsius = 0;
    if (!(file_ >> temp_millicelsius)) {
        file_.clear();
        return Status::IoError("invalid temperature value from " + path_);
    }

    return static_cast<double>(temp_millicelsius) / 1000.0;
}

Status SysfsThermalSensor::close() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (closed_) {
        return Status::Closed("thermal sensor is closed");
    }
    closed_ = true;

    file_.clear();
    file_.close();
    if (file_.fail()) {
        return Status::IoError("failed to close device file while closing sensor: " + path_);
    }
    return Status::OK();
}

std::string SysfsThermalSensor::name() const {
    return name_;
}
