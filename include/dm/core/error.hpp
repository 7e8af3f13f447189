#pragma once

#include <string>
#include <utility>

namespace dm {

/**
 * @brief Failure categories shared by every drivemirror component
 *
 * NotFound  - a requested remote path or album does not exist
 * Io        - a local filesystem operation failed
 * Transfer  - the remote stream failed or misbehaved mid-download
 * Auth      - the remote session could not be established
 * InvalidArgument - bad command line usage
 * Parse     - a remote catalogue could not be decoded
 */
enum class ErrorKind {
    NotFound,
    Io,
    Transfer,
    Auth,
    InvalidArgument,
    Parse
};

struct Error {
    ErrorKind kind = ErrorKind::Io;
    std::string message;
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "not found";
        case ErrorKind::Io: return "io";
        case ErrorKind::Transfer: return "transfer";
        case ErrorKind::Auth: return "auth";
        case ErrorKind::InvalidArgument: return "invalid argument";
        case ErrorKind::Parse: return "parse";
    }
    return "unknown";
}

inline Error not_found_error(std::string message) {
    return Error{ErrorKind::NotFound, std::move(message)};
}

inline Error io_error(std::string message) {
    return Error{ErrorKind::Io, std::move(message)};
}

inline Error transfer_error(std::string message) {
    return Error{ErrorKind::Transfer, std::move(message)};
}

inline Error invalid_argument_error(std::string message) {
    return Error{ErrorKind::InvalidArgument, std::move(message)};
}

inline Error parse_error(std::string message) {
    return Error{ErrorKind::Parse, std::move(message)};
}

} // namespace dm
