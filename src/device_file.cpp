/**
 * @file device_file.cpp
 * @brief Implementation of the sysfs write-only device file
 */

#include "device_file.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

StatusOr<std::unique_ptr<SysfsDeviceFile>> SysfsDeviceFile::open(const std::string& path) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        std::string msg = "open " + path + ": " + std::strerror(err);
        if (err == ENOENT) {
            return Status::NotFound(msg);
        }
        return Status::IoError(msg);
    }
    return std::unique_ptr<SysfsDeviceFile>(new SysfsDeviceFile(path, fd));
}

SysfsDeviceFile::SysfsDeviceFile(std::string path, int fd)
    : path_(std::move(path))
    , fd_(fd)
{
}

SysfsDeviceFile::~SysfsDeviceFile() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

Status SysfsDeviceFile::seekToStart() {
    if (fd_ < 0) {
        return Status::Closed("seek " + path_ + ": file already closed");
    }
    if (::lseek(fd_, 0, SEEK_SET) < 0) {
        return errnoStatus("seek", errno);
    }
    return Status::OK();
}

Status SysfsDeviceFile::truncate() {
    if (fd_ < 0) {
        return Status::Closed("truncate " + path_ + ": file already closed");
    }
    if (::ftruncate(fd_, 0) < 0) {
        return errnoStatus("truncate", errno);
    }
    return Status::OK();
}

Status SysfsDeviceFile::write(const std::string& data) {
    if (fd_ < 0) {
        return Status::Closed("write " + path_ + ": file already closed");
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return errnoStatus("write", errno);
        }
        if (n == 0) {
            return Status::IoError("write " + path_ + ": short write");
        }
        written += static_cast<size_t>(n);
    }
    return Status::OK();
}

Status SysfsDeviceFile::close() {
    if (fd_ < 0) {
        return Status::Closed("close " + path_ + ": file already closed");
    }
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) < 0) {
        return errnoStatus("close", errno);
    }
    return Status::OK();
}

Status SysfsDeviceFile::errnoStatus(const std::string& operation, int err) const {
    return Status::IoError(operation + " " + path_ + ": " + std::strerror(err));
}
