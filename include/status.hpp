#ifndef STATUS_HPP
#define STATUS_HPP

/**
 * @file status.hpp
 * @brief Status and StatusOr error values shared by fans, sensors and controllers
 */

#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class StatusCode : int {
    kOk = 0,
    kClosed = 1,
    kControllerStopped = 2,
    kInvalidArgument = 3,
    kNotFound = 4,
    kIoError = 5,
    kAggregated = 6,
    kInternalError = 7
};

class Status {
public:
    Status() : code_(StatusCode::kOk) {}

    Status(StatusCode code, std::string message)
        : code_(code)
        , message_(std::move(message))
    {
    }

    static Status OK() { return Status(); }

    static Status Closed(const std::string& message) {
        return Status(StatusCode::kClosed, message);
    }

    static Status ControllerStopped() {
        return Status(StatusCode::kControllerStopped, "thermal controller is stopped");
    }

    static Status InvalidArgument(const std::string& message) {
        return Status(StatusCode::kInvalidArgument, message);
    }

    static Status NotFound(const std::string& message) {
        return Status(StatusCode::kNotFound, message);
    }

    static Status IoError(const std::string& message) {
        return Status(StatusCode::kIoError, message);
    }

    /**
     * @brief Collect several failures into one status
     *
     * OK entries are dropped. An empty list yields OK. A single entry is
     * rendered verbatim, more entries one per line prefixed with "- ".
     */
    static Status Aggregate(const std::vector<Status>& entries);

    bool ok() const { return code_ == StatusCode::kOk; }
    StatusCode code() const { return code_; }
    const std::string& message() const { return message_; }

    // Underlying failures of an aggregated status, in the order collected
    const std::vector<Status>& entries() const { return entries_; }

    // Same code and entries, message prefixed with "context: "
    Status wrapped(const std::string& context) const;

    std::string toString() const;

private:
    StatusCode code_;
    std::string message_;
    std::vector<Status> entries_;
};

template <typename T>
class StatusOr {
public:
    StatusOr(const T& value)  // NOLINT
        : value_(value)
    {
    }

    StatusOr(T&& value)  // NOLINT
        : value_(std::move(value))
    {
    }

    StatusOr(const Status& status)  // NOLINT
        : status_(status)
    {
        // A StatusOr without a value must carry an error
        if (status_.ok()) {
            status_ = Status(StatusCode::kInternalError,
                             "StatusOr constructed with OK status but no value");
        }
    }

    bool ok() const { return status_.ok() && value_.has_value(); }

    const Status& status() const { return status_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    const T& operator*() const { return value(); }
    T& operator*() { return value(); }

    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }

private:
    Status status_;
    std::optional<T> value_;
};

std::string statusCodeToString(StatusCode code);

#endif // STATUS_HPP
