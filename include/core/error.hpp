#pragma once

#include <optional>
#include <string>
#include <utility>

namespace gabi {

/**
 * @brief Error categories for the audit path
 */
enum class ErrorCategory {
    NONE,
    CREATE_REQUEST_ERROR,
    SEND_REQUEST_ERROR,
    RESPONSE_DECODE_ERROR,
    COLLECTOR_REJECTED_ERROR,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                     return "none";
        case ErrorCategory::CREATE_REQUEST_ERROR:     return "create_request";
        case ErrorCategory::SEND_REQUEST_ERROR:       return "send_request";
        case ErrorCategory::RESPONSE_DECODE_ERROR:    return "response_decode";
        case ErrorCategory::COLLECTOR_REJECTED_ERROR: return "collector_rejected";
        case ErrorCategory::CONFIG_ERROR:             return "config";
        case ErrorCategory::INTERNAL_ERROR:           return "internal";
        default:                                      return "unknown";
    }
}

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
 * @brief Outcome of an operation with no value
 *
 * An error carries a headline (what failed) and the wrapped cause (why).
 * message() renders both as "<headline>: <cause>".
 */
class Status {
public:
    static Status ok() { return Status{}; }

    static Status error(ErrorCategory category, std::string headline, std::string cause = {}) {
        Status s;
        s.category_ = category;
        s.headline_ = std::move(headline);
        s.cause_ = std::move(cause);
        return s;
    }

    bool is_ok() const { return category_ == ErrorCategory::NONE; }
    bool is_error() const { return !is_ok(); }

    ErrorCategory category() const { return category_; }
    const std::string& headline() const { return headline_; }
    const std::string& cause() const { return cause_; }

    [[nodiscard]] std::string message() const {
        if (cause_.empty()) return headline_;
        return headline_ + ": " + cause_;
    }

private:
    ErrorCategory category_ = ErrorCategory::NONE;
    std::string headline_;
    std::string cause_;
};

} // namespace gabi
