#pragma once

#include <optional>
#include <string>

namespace autoheal {

/**
 * @brief Error categories for the remediation core
 */
enum class ErrorCategory {
    NONE,
    SIGNAL_ERROR,        // Metrics provider unreachable / malformed
    ACTION_ERROR,        // Lifecycle provider failed or timed out
    PERSISTENCE_ERROR,   // State store write/read failed
    CONFIG_ERROR,
    NOT_FOUND,
    INTERNAL_ERROR       // Programming error, fatal to one incident only
};

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/**
 * @brief Result for operations without a payload
 */
struct Status {
    bool success = true;
    ErrorCategory category = ErrorCategory::NONE;
    std::string message;

    static Status ok() { return {}; }
    static Status error(ErrorCategory c, std::string msg) {
        return Status{false, c, std::move(msg)};
    }

    bool is_ok() const { return success; }
    bool is_error() const { return !success; }
};

[[nodiscard]] constexpr const char* error_category_to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NONE:              return "none";
        case ErrorCategory::SIGNAL_ERROR:      return "signal_error";
        case ErrorCategory::ACTION_ERROR:      return "action_error";
        case ErrorCategory::PERSISTENCE_ERROR: return "persistence_error";
        case ErrorCategory::CONFIG_ERROR:      return "config_error";
        case ErrorCategory::NOT_FOUND:         return "not_found";
        case ErrorCategory::INTERNAL_ERROR:    return "internal_error";
        default: return "unknown";
    }
}

} // namespace autoheal
