#pragma once

/**
 * @file result.hpp
 * @brief Error taxonomy and Result type shared by every hatch component
 *
 * Fallible operations return Result<T>. Check isOk() before value(), or
 * isErr() before error(). Nothing in the library throws across its API.
 *
 * @example
 * ```cpp
 * auto selection = hatch::resolve_selected_tasks(manifest, choices);
 * if (selection.isErr()) {
 *     return hatch::exit_code_for(selection.error());
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>

namespace hatch {

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error codes for hatch operations
 */
enum class ErrorCode {
    CONFIGURATION_ERROR,  ///< Bad manifest, config or task reference. Nothing mutated.
    PRIVILEGE_ERROR,      ///< Insufficient rights or session lock held. Nothing mutated.
    DEPLOYMENT_ERROR,     ///< File copy / IO failure while deploying the payload.
    INTEGRATION_ERROR,    ///< System store write failure. Applied operations stay journaled.
    NOT_INSTALLED,        ///< Uninstall target has neither record nor journal.
    IO_ERROR,             ///< Any other filesystem failure.
};

inline const char* error_code_to_string(ErrorCode c) {
    switch (c) {
        case ErrorCode::CONFIGURATION_ERROR: return "ConfigurationError";
        case ErrorCode::PRIVILEGE_ERROR: return "PrivilegeError";
        case ErrorCode::DEPLOYMENT_ERROR: return "DeploymentError";
        case ErrorCode::INTEGRATION_ERROR: return "IntegrationError";
        case ErrorCode::NOT_INSTALLED: return "NotInstalled";
        case ErrorCode::IO_ERROR: return "IOError";
        default: return "Error";
    }
}

/**
 * @brief Error type with code, message and the path involved (if any)
 */
class Error {
public:
    Error(ErrorCode code, std::string message, std::string path = "")
        : code_(code), message_(std::move(message)), path_(std::move(path)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& path() const { return path_; }

    std::string toString() const {
        std::string out = std::string(error_code_to_string(code_)) + ": " + message_;
        if (!path_.empty()) {
            out += " (" + path_ + ")";
        }
        return out;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string path_;
};

// ============================================================================
// Process Exit Codes
// ============================================================================

constexpr int EXIT_OK = 0;
constexpr int EXIT_GENERIC = 1;
constexpr int EXIT_CONFIGURATION = 2;
constexpr int EXIT_PRIVILEGE = 3;
constexpr int EXIT_DEPLOYMENT = 4;
constexpr int EXIT_INTEGRATION = 5;

inline int exit_code_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::CONFIGURATION_ERROR: return EXIT_CONFIGURATION;
        case ErrorCode::PRIVILEGE_ERROR: return EXIT_PRIVILEGE;
        case ErrorCode::DEPLOYMENT_ERROR: return EXIT_DEPLOYMENT;
        case ErrorCode::INTEGRATION_ERROR: return EXIT_INTEGRATION;
        default: return EXIT_GENERIC;
    }
}

inline int exit_code_for(const Error& error) {
    return exit_code_for(error.code());
}

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
    }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace hatch
