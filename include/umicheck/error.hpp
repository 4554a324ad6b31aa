#pragma once

#include <stdexcept>
#include <string>

namespace umicheck {

enum class ErrorKind {
    InvalidArgument,
    Io,
    Format,
    UmiLengthMismatch,
    Unsupported
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidArgument:   return "invalid argument";
        case ErrorKind::Io:                return "I/O error";
        case ErrorKind::Format:            return "format error";
        case ErrorKind::UmiLengthMismatch: return "UMI length mismatch";
        case ErrorKind::Unsupported:       return "unsupported";
    }
    return "error";
}

// Fatal error for the current run. The message names the failing path or
// record; kind() lets callers and tests tell the categories apart.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace umicheck
