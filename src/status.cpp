/**
 * @file status.cpp
 * @brief Implementation of Status aggregation and rendering
 */

#include "status.hpp"

Status Status::Aggregate(const std::vector<Status>& entries) {
    Status result(StatusCode::kAggregated, "");
    for (const auto& entry : entries) {
        if (!entry.ok()) {
            result.entries_.push_back(entry);
        }
    }

    if (result.entries_.empty()) {
        return Status::OK();
    }

    if (result.entries_.size() == 1) {
        result.message_ = result.entries_.front().message();
        return result;
    }

    for (const auto& entry : result.entries_) {
        result.message_ += "\n- " + entry.message();
    }
    return result;
}

Status Status::wrapped(const std::string& context) const {
    if (ok()) {
        return *this;
    }
    Status result = *this;
    if (code_ == StatusCode::kAggregated && entries_.size() > 1) {
        // Entries already start on their own line
        result.message_ = context + ":" + message_;
    } else {
        result.message_ = context + ": " + message_;
    }
    return result;
}

std::string Status::toString() const {
    if (ok()) {
        return "OK";
    }
    return statusCodeToString(code_) + ": " + message_;
}

std::string statusCodeToString(StatusCode code) {
    switch (code) {
        case StatusCode::kOk:
            return "OK";
        case StatusCode::kClosed:
            return "CLOSED";
        case StatusCode::kControllerStopped:
            return "CONTROLLER_STOPPED";
        case StatusCode::kInvalidArgument:
            return "INVALID_ARGUMENT";
        case StatusCode::kNotFound:
            return "NOT_FOUND";
        case StatusCode::kIoError:
            return "IO_ERROR";
        case StatusCode::kAggregated:
            return "AGGREGATED";
        case StatusCode::kInternalError:
            return "INTERNAL";
        default:
            return "UNKNOWN";
    }
}
