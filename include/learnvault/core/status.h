#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace learnvault {

enum class StatusCode {
    ok = 0,
    invalid_argument,
    not_found,
    timeout,
    unavailable,
    cancelled,
    internal_error,
};

constexpr std::string_view ToString(StatusCode code) {
    switch (code) {
        case StatusCode::ok: return "ok";
        case StatusCode::invalid_argument: return "invalid_argument";
        case StatusCode::not_found: return "not_found";
        case StatusCode::timeout: return "timeout";
        case StatusCode::unavailable: return "unavailable";
        case StatusCode::cancelled: return "cancelled";
        case StatusCode::internal_error: return "internal_error";
    }
    return "unknown";
}

class Status {
public:
    Status() : code_(StatusCode::ok) {}
    Status(StatusCode code, std::string message) : code_(code), message_(std::move(message)) {}

    static Status Ok() { return Status(); }

    bool ok() const { return code_ == StatusCode::ok; }
    StatusCode code() const { return code_; }
    const std::string& message() const { return message_; }

    // "timeout: primary read exceeded 100ms"
    std::string ToString() const {
        std::string out(learnvault::ToString(code_));
        if (!message_.empty()) {
            out.append(": ");
            out.append(message_);
        }
        return out;
    }

private:
    StatusCode code_;
    std::string message_;
};

template <class T>
class Result {
public:
    Result(T value) : status_(Status::Ok()), value_(std::move(value)) {}
    Result(Status status) : status_(std::move(status)) {}

    bool ok() const { return status_.ok(); }
    const Status& status() const { return status_; }

    const T& value() const& { return *value_; }
    T& value() & { return *value_; }
    T&& value() && { return std::move(*value_); }

private:
    Status status_;
    std::optional<T> value_;
};

} // namespace learnvault
