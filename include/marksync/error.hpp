/// @file error.hpp
/// @brief Error types for the marksync library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace marksync {

/// Categories of errors that can occur in the engine.
enum class ErrorKind : std::uint8_t {
    not_found,          ///< A document identifier is unknown to the replica.
    unknown_field,      ///< A mutation targets a field outside the schema (kept as opaque metadata).
    causality_gap,      ///< A sync delta ended with unsatisfied operation dependencies.
    storage_failure,    ///< The storage collaborator reported an I/O error.
    fatal_mismatch,     ///< Two documents with different identifiers were merged.
    encoding_error,     ///< An error occurred during binary encoding.
    decoding_error,     ///< An error occurred during binary decoding.
    sync_error,         ///< The sync protocol was violated or replicas diverged.
    transport_failure,  ///< The transport timed out or was closed mid-session.
    invalid_config,     ///< A configuration value is out of range or malformed.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::not_found:         return "not_found";
        case ErrorKind::unknown_field:     return "unknown_field";
        case ErrorKind::causality_gap:     return "causality_gap";
        case ErrorKind::storage_failure:   return "storage_failure";
        case ErrorKind::fatal_mismatch:    return "fatal_mismatch";
        case ErrorKind::encoding_error:    return "encoding_error";
        case ErrorKind::decoding_error:    return "decoding_error";
        case ErrorKind::sync_error:        return "sync_error";
        case ErrorKind::transport_failure: return "transport_failure";
        case ErrorKind::invalid_config:    return "invalid_config";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    /// Whether a caller may recover by retrying a whole sync session.
    auto retryable() const -> bool {
        return kind == ErrorKind::causality_gap ||
               kind == ErrorKind::transport_failure ||
               kind == ErrorKind::storage_failure;
    }

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception carrying an Error, thrown for conditions that must propagate
/// beyond the immediate caller (storage failures, invalid configuration).
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{std::string{to_string_view(error.kind)} + ": " + error.message},
          error_{std::move(error)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    auto error() const -> const Error& { return error_; }
    auto kind() const -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

/// Thrown when documents with different identifiers are merged.
///
/// This is a programming error. The library never catches it.
class FatalMismatch : public std::logic_error {
public:
    explicit FatalMismatch(const std::string& what) : std::logic_error{what} {}
};

}  // namespace marksync
