#pragma once

#include <optional>
#include <string>

namespace piiguard {

/**
 * @brief Error categories for fallible piiguard operations
 *
 * sanitize() itself is total and never reports errors; these cover the
 * surrounding helpers (JSON parsing, depth validation, configuration).
 */
enum class ErrorCategory {
    NONE,
    PARSE_ERROR,
    DEPTH_LIMIT_ERROR,
    CIRCULAR_REFERENCE_ERROR,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "NONE";
        case ErrorCategory::PARSE_ERROR: return "PARSE_ERROR";
        case ErrorCategory::DEPTH_LIMIT_ERROR: return "DEPTH_LIMIT_ERROR";
        case ErrorCategory::CIRCULAR_REFERENCE_ERROR: return "CIRCULAR_REFERENCE_ERROR";
        case ErrorCategory::CONFIG_ERROR: return "CONFIG_ERROR";
        case ErrorCategory::INTERNAL_ERROR: return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
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

} // namespace piiguard
