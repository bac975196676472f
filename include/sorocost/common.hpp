#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error type, Result aliases, ISO-8601 time formatting
 */

#include <chrono>
#include <expected>
#include <string>
#include <utility>

namespace sorocost {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

/// Error codes shared across modules
constexpr const char* kConfigurationError = "ConfigurationError";
constexpr const char* kInvalidInputError = "InvalidInputError";
constexpr const char* kIOError = "IOError";
constexpr const char* kParseError = "ParseError";

}  // namespace sorocost

namespace sorocost::common {

/**
 * Format a time point as an ISO-8601 UTC string with second precision
 * @param tp Time point
 * @return "YYYY-MM-DDTHH:MM:SSZ"
 */
[[nodiscard]] std::string format_utc(std::chrono::system_clock::time_point tp);

}  // namespace sorocost::common
