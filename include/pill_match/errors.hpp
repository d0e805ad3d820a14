#pragma once

/// @file errors.hpp
/// @brief Exceptions raised at the pill_match API boundary

#include <exception>
#include <string>
#include <utility>

namespace pill_match {

/// @brief Category of a PillMatchError
enum class ErrorCode {
    None = 0,
    /// Caller passed signals or candidates that break the input contract
    InvalidInput,
    /// MatchConfig holds an out-of-range value
    InvalidConfig
};

/// @brief Returns a stable lowercase name for an error code
[[nodiscard]] std::string to_string(ErrorCode code);

/// @brief Root of every exception thrown by pill_match
class PillMatchError : public std::exception {
public:
    explicit PillMatchError(std::string message, ErrorCode code = ErrorCode::None)
        : message_(std::move(message)), code_(code) {}

    [[nodiscard]] const char* what() const noexcept override { return message_.c_str(); }
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    std::string message_;
    ErrorCode code_;
};

/// @brief An error tied to one named field
///
/// The message reads "invalid <subject> for '<field>': <details>", or
/// "invalid <subject>: <details>" when no field is named.
class FieldError : public PillMatchError {
public:
    [[nodiscard]] const std::string& field() const noexcept { return field_; }
    [[nodiscard]] const std::string& details() const noexcept { return details_; }

protected:
    FieldError(const char* subject, ErrorCode code, std::string field, std::string details)
        : PillMatchError(describe(subject, field, details), code),
          field_(std::move(field)),
          details_(std::move(details)) {}

private:
    static std::string describe(const char* subject, const std::string& field, const std::string& details) {
        std::string message = std::string("invalid ") + subject;
        if (!field.empty()) {
            message += " for '" + field + "'";
        }
        return message + ": " + details;
    }

    std::string field_;
    std::string details_;
};

/// @brief Signals or candidates violate the input contract
///
/// @p field names the offending element, e.g. "candidates[2].id".
class ValidationError : public FieldError {
public:
    ValidationError(std::string field, std::string details)
        : FieldError("input", ErrorCode::InvalidInput, std::move(field), std::move(details)) {}
};

/// @brief A MatchConfig field is out of range
class ConfigError : public FieldError {
public:
    ConfigError(std::string field, std::string details)
        : FieldError("configuration", ErrorCode::InvalidConfig, std::move(field), std::move(details)) {}
};

}  // namespace pill_match
