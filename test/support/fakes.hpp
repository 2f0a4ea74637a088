#ifndef TEST_FAKES_HPP
#define TEST_FAKES_HPP

// Test doubles for devices, sensors, fans and response curves

#include "device_file.hpp"
#include "duty_cycle.hpp"
#include "fan_driver.hpp"
#include "status.hpp"
#include "thermo_sensor.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

// Shared between a FakeDevice owned by a fan and the test inspecting it
struct FakeDeviceState {
    std::mutex mutex;
    std::vector<std::string> writes;
    int seeks = 0;
    int truncates = 0;
    int closes = 0;
    std::deque<Status> on_seek;
    std::deque<Status> on_truncate;
    std::deque<Status> on_write;
    std::deque<Status> on_close;

    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return writes;
    }

    int closeCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return closes;
    }
};

class FakeDevice : public WritableDevice {
public:
    explicit FakeDevice(std::shared_ptr<FakeDeviceState> state) : state_(std::move(state)) {}

    Status seekToStart() override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->seeks++;
        return next(state_->on_seek);
    }

    Status truncate() override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->truncates++;
        return next(state_->on_truncate);
    }

    Status write(const std::string& data) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        Status status = next(state_->on_write);
        if (status.ok()) {
            state_->writes.push_back(data);
        }
        return status;
    }

    Status close() override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->closes++;
        return next(state_->on_close);
    }

private:
    static Status next(std::deque<Status>& queue) {
        if (queue.empty()) {
            return Status::OK();
        }
        Status status = queue.front();
        queue.pop_front();
        return status;
    }

    std::shared_ptr<FakeDeviceState> state_;
};

class FakeSensor : public ThermoSensor {
public:
    FakeSensor(std::string name, double temp) : name_(std::move(name)), temp_(temp) {}

    StatusOr<double> temperature() override {
        std::lock_guard<std::mutex> lock(mutex_);
        reads_++;
        if (closes_ > 0) {
            return Status::Closed("thermal sensor is closed");
        }
        if (!read_error_.ok()) {
            return read_error_;
        }
        return temp_;
    }

    Status close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        closes_++;
        if (closes_ > 1) {
            return Status::Closed("thermal sensor is closed");
        }
        return close_error_;
    }

    std::string name() const override { return name_; }

    void failReads(const Status& status) {
        std::lock_guard<std::mutex> lock(mutex_);
        read_error_ = status;
    }

    void failClose(const Status& status) {
        std::lock_guard<std::mutex> lock(mutex_);
        close_error_ = status;
    }

    int closeCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        return closes_;
    }

    int readCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        return reads_;
    }

private:
    std::string name_;
    double temp_;
    std::mutex mutex_;
    Status read_error_;
    Status close_error_;
    int reads_ = 0;
    int closes_ = 0;
};

class FakeFan : public FanDriver {
public:
    explicit FakeFan(std::string name) : name_(std::move(name)) {}

    Status setDutyCycle(double ratio) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closes_ > 0) {
            return Status::Closed("fan driver is closed");
        }
        ratios_.push_back(ratio);
        cv_.notify_all();
        return set_error_;
    }

    Status close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        closes_++;
        cv_.notify_all();
        if (closes_ > 1) {
            return Status::Closed("fan driver is closed");
        }
        return close_error_;
    }

    std::string name() const override { return name_; }

    void failSet(const Status& status) {
        std::lock_guard<std::mutex> lock(mutex_);
        set_error_ = status;
    }

    void failClose(const Status& status) {
        std::lock_guard<std::mutex> lock(mutex_);
        close_error_ = status;
    }

    // Waits until at least count ratios were recorded
    bool waitForRatios(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this, count]() { return ratios_.size() >= count; });
    }

    std::vector<double> ratios() {
        std::lock_guard<std::mutex> lock(mutex_);
        return ratios_;
    }

    int closeCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        return closes_;
    }

private:
    std::string name_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<double> ratios_;
    Status set_error_;
    Status close_error_;
    int closes_ = 0;
};

// Looks up exact temperatures, 0 for anything else
class MappedDutyCycle : public DutyCycleFunction {
public:
    explicit MappedDutyCycle(std::map<double, double> mapping) : mapping_(std::move(mapping)) {}

    double ratio(double temperature) const override {
        auto it = mapping_.find(temperature);
        return it == mapping_.end() ? 0.0 : it->second;
    }

private:
    std::map<double, double> mapping_;
};

// Scratch file under /tmp, removed on destruction
class TempFile {
public:
    explicit TempFile(const std::string& content = "") {
        char path[] = "/tmp/heatsink-test-XXXXXX";
        int fd = mkstemp(path);
        if (fd >= 0) {
            ::close(fd);
        }
        path_ = path;
        write(content);
    }

    ~TempFile() { std::remove(path_.c_str()); }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    // Rewrites in place so open readers see the new content
    void write(const std::string& content) {
        std::ofstream out(path_, std::ios::trunc);
        out << content;
    }

    std::string read() const {
        std::ifstream in(path_);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Scratch directory under /tmp, removed recursively on destruction
class TempDir {
public:
    TempDir() {
        char path[] = "/tmp/heatsink-test-dir-XXXXXX";
        char* created = mkdtemp(path);
        path_ = created ? created : path;
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& relative, const std::string& content) const {
        std::filesystem::path full = std::filesystem::path(path_) / relative;
        std::filesystem::create_directories(full.parent_path());
        std::ofstream out(full);
        out << content;
        return full.string();
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

#endif // TEST_FAKES_HPP
