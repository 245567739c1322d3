/**
 * @file errors.hpp
 * @brief Typed engine errors raised before a container exists
 * 
 * Failures that happen before any container is created (unknown language,
 * workspace staging, bad configuration) are thrown as exceptions derived
 * from EngineError. Failures after container creation never throw; they are
 * reported inside ExecutionResult::error_message.
 * 
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace runcage {
namespace core {

/**
 * @enum ErrorCode
 * @brief Error taxonomy of the execution engine
 */
enum class ErrorCode {
    UNSUPPORTED_LANGUAGE,  ///< Language id not in the registry
    WORKSPACE,             ///< Staging source files on local disk failed
    IMAGE_UNAVAILABLE,     ///< Image missing locally and pull failed
    CONTAINER_CREATE,      ///< Runtime rejected container creation
    CONTAINER_START,       ///< Runtime rejected container start
    TIMEOUT,               ///< Execution exceeded its deadline
    BACKEND,               ///< Any other runtime / transport failure
    CONFIGURATION          ///< Invalid engine configuration
};

/**
 * @brief Taxonomy name used as the prefix of error messages
 * @param code Error code
 * @return Name such as "UnsupportedLanguage" or "ImageUnavailable"
 */
const char* ErrorCodeName(ErrorCode code);

/**
 * @class EngineError
 * @brief Base class of all exceptions thrown by the engine
 */
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/// Requested language is not registered
class UnsupportedLanguageError : public EngineError {
public:
    explicit UnsupportedLanguageError(const std::string& message)
        : EngineError(ErrorCode::UNSUPPORTED_LANGUAGE, message) {}
};

/// Source or auxiliary files could not be staged
class WorkspaceError : public EngineError {
public:
    explicit WorkspaceError(const std::string& message)
        : EngineError(ErrorCode::WORKSPACE, message) {}
};

/// Configuration file or values are invalid
class ConfigError : public EngineError {
public:
    explicit ConfigError(const std::string& message)
        : EngineError(ErrorCode::CONFIGURATION, message) {}
};

} // namespace core
} // namespace runcage
