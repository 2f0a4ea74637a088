#ifndef DEVICE_FILE_HPP
#define DEVICE_FILE_HPP

/**
 * @file device_file.hpp
 * @brief Write-only device handles used to command a fan
 */

#include "status.hpp"
#include <memory>
#include <string>

class WritableDevice {
public:
    virtual ~WritableDevice() = default;

    virtual Status seekToStart() = 0;
    virtual Status truncate() = 0;
    virtual Status write(const std::string& data) = 0;
    virtual Status close() = 0;
};

/**
 * @brief A sysfs attribute such as /sys/class/hwmon/hwmon2/pwm1
 *
 * The descriptor stays open until close() or destruction.
 */
class SysfsDeviceFile : public WritableDevice {
public:
    static StatusOr<std::unique_ptr<SysfsDeviceFile>> open(const std::string& path);

    ~SysfsDeviceFile() override;

    SysfsDeviceFile(const SysfsDeviceFile&) = delete;
    SysfsDeviceFile& operator=(const SysfsDeviceFile&) = delete;

    Status seekToStart() override;
    Status truncate() override;
    Status write(const std::string& data) override;
    Status close() override;

private:
    SysfsDeviceFile(std::string path, int fd);

    Status errnoStatus(const std::string& operation, int err) const;

    std::string path_;
    int fd_;
};

#endif // DEVICE_FILE_HPP
