#pragma once

#include <cmath>
#include <stdexcept>
#include <string>

namespace earthzones {

/**
 * Structured error reporting with context and recovery suggestions
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // Numeric / geometric input
    INVALID_NUMERIC_INPUT = 200,
    EMPTY_POINT_SET = 201,
    INVALID_GEOMETRY = 202,

    // Collaborators
    GEOCODE_FAILED = 300,
    FILE_NOT_FOUND = 301,

    CONFIG_ERROR = 400,

    INTERNAL_ERROR = 500
};

class EarthZonesException : public std::runtime_error {
public:
    explicit EarthZonesException(ErrorCode code, const std::string& message,
                                 const std::string& context = "",
                                 const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "EarthZones error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public EarthZonesException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : EarthZonesException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// NaN, infinity, or text that is not a longitude
class InvalidNumericInputError : public EarthZonesException {
public:
    explicit InvalidNumericInputError(const std::string& message,
                                      const std::string& context = "",
                                      const std::string& suggestion = "")
        : EarthZonesException(ErrorCode::INVALID_NUMERIC_INPUT, message, context, suggestion) {}
};

class GeometryError : public EarthZonesException {
public:
    explicit GeometryError(const std::string& message,
                           const std::string& context = "",
                           const std::string& suggestion = "")
        : EarthZonesException(ErrorCode::INVALID_GEOMETRY, message, context, suggestion) {}
};

class GeocodeError : public EarthZonesException {
public:
    explicit GeocodeError(const std::string& message,
                          const std::string& context = "",
                          const std::string& suggestion = "")
        : EarthZonesException(ErrorCode::GEOCODE_FAILED, message, context, suggestion) {}
};

class ConfigError : public EarthZonesException {
public:
    explicit ConfigError(const std::string& message,
                         const std::string& context = "",
                         const std::string& suggestion = "")
        : EarthZonesException(ErrorCode::CONFIG_ERROR, message, context, suggestion) {}
};

class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (!condition) {
            throw EarthZonesException(code, message, context, suggestion);
        }
    }

    static void check_finite(double value, const std::string& context) {
        if (!std::isfinite(value)) {
            throw InvalidNumericInputError("Longitude must be a finite number, got " + std::to_string(value),
                                           context);
        }
    }
};

#define EARTHZONES_CHECK(condition, code, message) \
    earthzones::ErrorHandler::check_condition(condition, code, message, __func__)

#define EARTHZONES_CHECK_ARGUMENT(condition, message) \
    do { if (!(condition)) throw earthzones::InvalidArgumentError(message, __func__); } while (0)

#define EARTHZONES_CHECK_FINITE(value) \
    earthzones::ErrorHandler::check_finite(value, __func__)

#define EARTHZONES_THROW(code, message) \
    throw earthzones::EarthZonesException(code, message, __func__)

} // namespace earthzones
