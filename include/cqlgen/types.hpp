// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Common Types                                                       ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace cqlgen {

// ==============================================================================
// Error Handling
// ==============================================================================

/// Error codes, grouped by the layer that raises them
enum class ErrorCode : std::uint32_t {
    Success = 0,

    // Construction
    InvalidIdentifier = 100,
    InvalidDataType = 101,
    InvalidOptionValue = 102,
    EmptyColumnList = 103,
    EmptyChangeList = 104,
    MissingPartitionKey = 105,
    DuplicateColumn = 106,
    MissingName = 107,

    // Generation
    IllegalOption = 200,
    IllegalSpecification = 201,
    UnsupportedSpecification = 202,

    // Configuration
    ConfigParseError = 300,
    ConfigInvalid = 301,
    FileNotFound = 302,

    InvalidArgument = 900,
    InternalError = 999,
};

/// Convert error code to string
[[nodiscard]] constexpr const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidIdentifier: return "Invalid identifier";
        case ErrorCode::InvalidDataType: return "Invalid data type";
        case ErrorCode::InvalidOptionValue: return "Invalid option value";
        case ErrorCode::EmptyColumnList: return "Empty column list";
        case ErrorCode::EmptyChangeList: return "Empty change list";
        case ErrorCode::MissingPartitionKey: return "Missing partition key";
        case ErrorCode::DuplicateColumn: return "Duplicate column";
        case ErrorCode::MissingName: return "Missing name";
        case ErrorCode::IllegalOption: return "Illegal option";
        case ErrorCode::IllegalSpecification: return "Illegal specification";
        case ErrorCode::UnsupportedSpecification: return "Unsupported specification";
        case ErrorCode::ConfigParseError: return "Config parse error";
        case ErrorCode::ConfigInvalid: return "Invalid config";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

/// Error with context
class Error {
public:
    Error() noexcept : code_(ErrorCode::Success) {}

    explicit Error(ErrorCode code) noexcept : code_(code) {}

    Error(ErrorCode code, std::string message) noexcept
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] bool ok() const noexcept { return code_ == ErrorCode::Success; }
    [[nodiscard]] explicit operator bool() const noexcept { return !ok(); }

    [[nodiscard]] std::string to_string() const {
        if (message_.empty()) {
            return std::string(error_code_to_string(code_));
        }
        return std::string(error_code_to_string(code_)) + ": " + message_;
    }

private:
    ErrorCode code_;
    std::string message_;
};

// ==============================================================================
// Exceptions (construction-time failures)
// ==============================================================================

/// Raised while building a specification; the caller must fix its input.
class SpecificationError : public std::runtime_error {
public:
    SpecificationError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] Error error() const { return Error(code_, what()); }

private:
    ErrorCode code_;
};

/// Raised when a name matches neither the quoted nor the unquoted grammar
class InvalidIdentifierError : public SpecificationError {
public:
    explicit InvalidIdentifierError(const std::string& message)
        : SpecificationError(ErrorCode::InvalidIdentifier, message) {}
};

// ==============================================================================
// Result<T>
// ==============================================================================

/// Tag type for constructing error result
struct ErrorTag {};
inline constexpr ErrorTag error_tag{};

/// Result type for operations that can fail
template<typename T>
class Result {
public:
    using value_type = T;
    using error_type = Error;

    // Success constructors
    Result(const T& value) : storage_(value), has_value_(true) {}
    Result(T&& value) : storage_(std::move(value)), has_value_(true) {}

    // Error constructors
    Result(ErrorTag, const Error& err) : storage_(err), has_value_(false) {}
    Result(ErrorTag, Error&& err) : storage_(std::move(err)), has_value_(false) {}
    Result(ErrorTag, ErrorCode code) : storage_(Error(code)), has_value_(false) {}
    Result(ErrorTag, ErrorCode code, std::string msg)
        : storage_(Error(code, std::move(msg))), has_value_(false) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] T& value() & {
        if (!has_value_) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value_) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value_) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] const Error& error() const& {
        if (has_value_) throw std::runtime_error("Result has value, not error");
        return std::get<Error>(storage_);
    }

    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }
    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T&& operator*() && { return std::move(value()); }

    template<typename U>
    [[nodiscard]] T value_or(U&& default_value) const& {
        return has_value_ ? value() : static_cast<T>(std::forward<U>(default_value));
    }

private:
    std::variant<T, Error> storage_;
    bool has_value_;
};

// ==============================================================================
// Result<void> specialization (Status)
// ==============================================================================

template<>
class Result<void> {
public:
    using value_type = void;
    using error_type = Error;

    Result() : error_(), has_value_(true) {}

    Result(ErrorTag, const Error& err) : error_(err), has_value_(false) {}
    Result(ErrorTag, Error&& err) : error_(std::move(err)), has_value_(false) {}
    Result(ErrorTag, ErrorCode code) : error_(code), has_value_(false) {}
    Result(ErrorTag, ErrorCode code, std::string msg)
        : error_(code, std::move(msg)), has_value_(false) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] const Error& error() const& {
        if (has_value_) throw std::runtime_error("Result has value, not error");
        return error_;
    }

private:
    Error error_;
    bool has_value_;
};

/// Status is an alias for Result<void>
using Status = Result<void>;

// ==============================================================================
// Factory functions
// ==============================================================================

template<typename T>
[[nodiscard]] Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

[[nodiscard]] inline Status Ok() {
    return Status();
}

template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code) {
    return Result<T>(error_tag, code);
}

template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(error_tag, code, std::move(message));
}

template<typename T>
[[nodiscard]] Result<T> Err(const Error& error) {
    return Result<T>(error_tag, error);
}

[[nodiscard]] inline Status Err(ErrorCode code, std::string message) {
    return Status(error_tag, code, std::move(message));
}

[[nodiscard]] inline Status Err(const Error& error) {
    return Status(error_tag, error);
}

} // namespace cqlgen
