#pragma once

#include "phasecloud/core/types.hpp"
#include <stdexcept>
#include <string>

/**
 * @file exception.h
 * @brief Exception hierarchy for phasecloud
 */

namespace phasecloud {
namespace core {

/**
 * @brief Base exception class for all phasecloud failures
 *
 * Carries a result code, the bare message and the throw-site context.
 * what() returns the formatted combination of the three.
 */
class Exception : public std::runtime_error {
public:
    /**
     * @brief Construct exception with result code and message
     * @param code Result code indicating error type
     * @param message Detailed error description
     * @param context Additional context information
     */
    Exception(ResultCode code,
              const std::string& message,
              const std::string& context = "")
        : std::runtime_error(formatMessage(code, message, context))
        , result_code_(code)
        , message_(message)
        , context_(context) {}

    ResultCode getResultCode() const noexcept { return result_code_; }

    const std::string& getMessage() const noexcept { return message_; }

    const std::string& getContext() const noexcept { return context_; }

private:
    ResultCode result_code_;
    std::string message_;
    std::string context_;

    static std::string formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context);
};

/**
 * @brief Malformed command-line or configuration value
 */
class ConfigException : public Exception {
public:
    ConfigException(const std::string& message,
                    const std::string& context = "")
        : Exception(ResultCode::ERROR_INVALID_PARAMETER, message, context) {}
};

/**
 * @brief Missing or unreadable input array
 */
class InputException : public Exception {
public:
    InputException(ResultCode code,
                   const std::string& message,
                   const std::string& context = "")
        : Exception(code, message, context) {}
};

/**
 * @brief Phase and quality fields differ in shape
 */
class ShapeMismatchException : public InputException {
public:
    ShapeMismatchException(const std::string& message,
                           const std::string& context = "")
        : InputException(ResultCode::ERROR_SHAPE_MISMATCH, message, context) {}
};

/**
 * @brief Too few points to determine the five surface coefficients
 */
class InsufficientDataException : public Exception {
public:
    InsufficientDataException(const std::string& message,
                              const std::string& context = "")
        : Exception(ResultCode::ERROR_INSUFFICIENT_DATA, message, context) {}
};

/**
 * @brief Numerical failure of the least-squares solve
 */
class FitDivergenceException : public Exception {
public:
    FitDivergenceException(const std::string& message,
                           const std::string& context = "")
        : Exception(ResultCode::ERROR_FIT_DIVERGENCE, message, context) {}
};

/**
 * @brief Output could not be produced
 */
class RenderException : public Exception {
public:
    RenderException(ResultCode code,
                    const std::string& message,
                    const std::string& context = "")
        : Exception(code, message, context) {}
};

/**
 * @brief Convert result code to string representation
 */
std::string resultCodeToString(ResultCode code);

/**
 * @brief Process exit status reported for a result code
 *
 * SUCCESS maps to 0, every failure to a distinct non-zero value.
 */
int exitCodeFor(ResultCode code);

/**
 * @brief Macros for throwing exceptions with automatic context
 */
#define PHASECLOUD_THROW(ExceptionType, message) \
    throw ExceptionType(message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define PHASECLOUD_THROW_CODE(ExceptionType, code, message) \
    throw ExceptionType(code, message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

} // namespace core
} // namespace phasecloud
