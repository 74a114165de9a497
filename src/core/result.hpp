#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lexis {

enum class ErrorKind {
    Generic,
    ResourceNotFound,
    ArchiveEntryNotFound,
    ArchiveConstructFailed,
    NotFound,
    UnknownFormat,
    ParserMissing,
    DecodeError,
    UnknownEncoding,
    UnsupportedOperation,
    UnsupportedProtocol,
    AlreadyExists,
    IoError,
    InconsistentState,
    InvalidArgument,
};

const char* error_kind_name(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::Generic;
    std::string message;

    /// Only filled for ResourceNotFound.
    std::string resource;
    std::vector<std::string> searched;
    std::string package;

    Error() = default;
    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    bool is(ErrorKind k) const { return kind == k; }
};

/// Simple Result type: holds either a value of type T or an Error.
/// For void results, use Result<void>.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error err) : data_(std::move(err)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }

    const Error& error() const { return std::get<Error>(data_); }

private:
    std::variant<T, Error> data_;
};

/// Specialization for void results.
template <>
class Result<void> {
public:
    Result() : err_(std::nullopt) {}
    Result(Error err) : err_(std::move(err)) {}

    bool ok() const { return !err_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return err_.value(); }

private:
    std::optional<Error> err_;
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Generic: return "Error";
    case ErrorKind::ResourceNotFound: return "ResourceNotFound";
    case ErrorKind::ArchiveEntryNotFound: return "ArchiveEntryNotFound";
    case ErrorKind::ArchiveConstructFailed: return "ArchiveConstructFailed";
    case ErrorKind::NotFound: return "NotFound";
    case ErrorKind::UnknownFormat: return "UnknownFormat";
    case ErrorKind::ParserMissing: return "ParserMissing";
    case ErrorKind::DecodeError: return "DecodeError";
    case ErrorKind::UnknownEncoding: return "UnknownEncoding";
    case ErrorKind::UnsupportedOperation: return "UnsupportedOperation";
    case ErrorKind::UnsupportedProtocol: return "UnsupportedProtocol";
    case ErrorKind::AlreadyExists: return "AlreadyExists";
    case ErrorKind::IoError: return "IoError";
    case ErrorKind::InconsistentState: return "InconsistentState";
    case ErrorKind::InvalidArgument: return "InvalidArgument";
    }
    return "Error";
}

} // namespace lexis
