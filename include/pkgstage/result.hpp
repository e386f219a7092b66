#pragma once

/**
 * @file result.hpp
 * @brief Error and Result types shared by every pipeline stage
 *
 * Stages never throw across module boundaries. Each fallible operation
 * returns a Result<T>; the pipeline stops at the first Error and turns it
 * into the process exit status with exit_code_for().
 *
 * @example
 * ```cpp
 * auto plan = pkgstage::classify(deps, host, artifacts);
 * if (plan.isErr()) {
 *     spdlog::error("{}", plan.error().toString());
 *     return pkgstage::exit_code_for(plan.error());
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>

namespace pkgstage {

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error codes for pkgstage operations
 */
enum class ErrorCode {
    // System / IO
    FILE_NOT_FOUND,
    IO_ERROR,
    PATH_ESCAPES_ROOT,

    // Recipe
    CONFIGURATION_ERROR,

    // Pipeline stages (fatal)
    BUILD_FAILURE,
    CLASSIFICATION_CONFLICT,
    INSTALL_FAILURE,
    DUPLICATE_INSTALL,
    ASSET_MISSING,
    TIMEOUT,

    // A warning upgraded to an error by policy
    WARNING_AS_ERROR,
};

inline const char* error_code_to_string(ErrorCode c) {
    switch (c) {
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::PATH_ESCAPES_ROOT: return "PATH_ESCAPES_ROOT";
        case ErrorCode::CONFIGURATION_ERROR: return "CONFIGURATION_ERROR";
        case ErrorCode::BUILD_FAILURE: return "BUILD_FAILURE";
        case ErrorCode::CLASSIFICATION_CONFLICT: return "CLASSIFICATION_CONFLICT";
        case ErrorCode::INSTALL_FAILURE: return "INSTALL_FAILURE";
        case ErrorCode::DUPLICATE_INSTALL: return "DUPLICATE_INSTALL";
        case ErrorCode::ASSET_MISSING: return "ASSET_MISSING";
        case ErrorCode::TIMEOUT: return "TIMEOUT";
        case ErrorCode::WARNING_AS_ERROR: return "WARNING_AS_ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Error type with code, message and the stage/subject that caused it
 *
 * `status` carries the exit status of an external tool when one failed, so
 * that it can be propagated unchanged.
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    Error& withStage(std::string stage) {
        stage_ = std::move(stage);
        return *this;
    }

    Error& withSubject(std::string subject) {
        subject_ = std::move(subject);
        return *this;
    }

    Error& withStatus(int status) {
        status_ = status;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& stage() const { return stage_; }
    const std::string& subject() const { return subject_; }
    std::optional<int> status() const { return status_; }

    // "<stage>: <subject>: <message>" with empty parts omitted
    std::string toString() const {
        std::string out;
        if (!stage_.empty()) out += stage_ + ": ";
        if (!subject_.empty()) out += subject_ + ": ";
        out += message_;
        return out;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string stage_;
    std::string subject_;
    std::optional<int> status_;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
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

// ============================================================================
// Exit Status Mapping
// ============================================================================

constexpr int EXIT_CONFIGURATION = 2;
constexpr int EXIT_CONFLICT = 3;
constexpr int EXIT_DUPLICATE = 4;
constexpr int EXIT_IO = 5;
constexpr int EXIT_TIMEOUT = 124;

// A non-zero external tool status is returned unchanged; everything else
// maps to a fixed code per error kind.
inline int exit_code_for(const Error& error) {
    if (auto status = error.status(); status && *status != 0) {
        return *status;
    }
    switch (error.code()) {
        case ErrorCode::CONFIGURATION_ERROR:
        case ErrorCode::WARNING_AS_ERROR:
            return EXIT_CONFIGURATION;
        case ErrorCode::CLASSIFICATION_CONFLICT:
            return EXIT_CONFLICT;
        case ErrorCode::DUPLICATE_INSTALL:
            return EXIT_DUPLICATE;
        case ErrorCode::TIMEOUT:
            return EXIT_TIMEOUT;
        case ErrorCode::BUILD_FAILURE:
        case ErrorCode::INSTALL_FAILURE:
            return 1;
        case ErrorCode::FILE_NOT_FOUND:
        case ErrorCode::IO_ERROR:
        case ErrorCode::PATH_ESCAPES_ROOT:
        case ErrorCode::ASSET_MISSING:
            return EXIT_IO;
    }
    return 1;
}

} // namespace pkgstage
