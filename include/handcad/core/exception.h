#pragma once

#include "types.hpp"
#include <stdexcept>
#include <string>

/**
 * @file exception.h
 * @brief Exception handling system for HandCAD
 */

namespace handcad {
namespace core {

/**
 * @brief Base exception class for all HandCAD exceptions
 *
 * Carries a result code and the context (usually file:line) where the
 * failure was raised.
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
 * @brief A landmark set that cannot be indexed safely
 *
 * Wrong point count, hand index outside {0, 1}, duplicated hand index or
 * non-finite coordinates. This is the only gesture-core failure that is
 * reported back to the acquisition side.
 */
class InvalidLandmarksException : public Exception {
public:
    InvalidLandmarksException(const std::string& message,
                              const std::string& context = "")
        : Exception(ResultCode::ERROR_INVALID_LANDMARKS, message, context) {}
};

/**
 * @brief Configuration values that fail validation
 */
class ConfigurationException : public Exception {
public:
    ConfigurationException(const std::string& message,
                           const std::string& context = "")
        : Exception(ResultCode::ERROR_CONFIG_INVALID, message, context) {}
};

/**
 * @brief Pipeline lifecycle errors (thread start, missing source)
 */
class PipelineException : public Exception {
public:
    PipelineException(ResultCode code,
                      const std::string& message,
                      const std::string& context = "")
        : Exception(code, message, context) {}
};

/**
 * @brief Convert result code to string representation
 */
std::string resultCodeToString(ResultCode code);

/**
 * @brief Macro for throwing exceptions with automatic context
 */
#define HANDCAD_THROW(ExceptionType, message) \
    throw ExceptionType(message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define HANDCAD_THROW_CODE(ExceptionType, code, message) \
    throw ExceptionType(code, message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

} // namespace core
} // namespace handcad
