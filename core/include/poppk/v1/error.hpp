#pragma once

// =============================================================================
// poppk - Error taxonomy and Result type
// =============================================================================

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace poppk::v1 {

/// Error categories surfaced to the caller
enum class ErrorKind {
    Io,
    ParseJson,
    ParseYaml,
    ParseCsv,
    ParseControlStream,
    InvalidModel,
    InvalidDosing,
    Simulation,
    Validation,
    Random
};

[[nodiscard]] inline constexpr const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Io: return "IO error";
        case ErrorKind::ParseJson: return "JSON parsing error";
        case ErrorKind::ParseYaml: return "YAML parsing error";
        case ErrorKind::ParseCsv: return "CSV error";
        case ErrorKind::ParseControlStream: return "Control stream error";
        case ErrorKind::InvalidModel: return "Invalid model configuration";
        case ErrorKind::InvalidDosing: return "Invalid dosing configuration";
        case ErrorKind::Simulation: return "Simulation error";
        case ErrorKind::Validation: return "Parameter validation error";
        case ErrorKind::Random: return "Random number generation error";
        default: return "Unknown error";
    }
}

/// Error information
struct Error {
    ErrorKind kind = ErrorKind::Validation;
    std::string message;

    [[nodiscard]] std::string to_string() const {
        return std::string(v1::to_string(kind)) + ": " + message;
    }
};

/// Result type for operations that can fail (portable alternative to std::expected)
template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
    [[nodiscard]] explicit operator bool() const { return has_value(); }

    [[nodiscard]] T& value() { return std::get<T>(data_); }
    [[nodiscard]] const T& value() const { return std::get<T>(data_); }

    [[nodiscard]] T& operator*() { return value(); }
    [[nodiscard]] const T& operator*() const { return value(); }

    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] Error& error() { return std::get<Error>(data_); }
    [[nodiscard]] const Error& error() const { return std::get<Error>(data_); }

    static Result success(T v) { return Result(std::move(v)); }

    static Result failure(ErrorKind kind, std::string message) {
        return Result(Error{kind, std::move(message)});
    }

private:
    std::variant<T, Error> data_;
};

/// Optional error for operations without a value (validation passes)
using Status = std::optional<Error>;

[[nodiscard]] inline Status make_error(ErrorKind kind, std::string message) {
    return Error{kind, std::move(message)};
}

}  // namespace poppk::v1
