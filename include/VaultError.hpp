#pragma once
#include <stdexcept>
#include <string>

// Failure categories surfaced by the core. The CLI maps each to an exit code.
enum class ErrorCode {
    ProviderUnavailable,   // no token present
    ProviderError,         // token refused, timed out or answered garbage
    NotFound,
    AuthenticationFailed,  // tag mismatch; never any plaintext
    PersistenceError,      // store unreadable/unwritable
    InvalidInput,
    AlreadyEnrolled,
    ExternalCommand        // a downstream tool (bw, $SHELL) failed
};

class VaultError : public std::runtime_error {
public:
    VaultError(ErrorCode code, const std::string& what)
    : std::runtime_error(what), m_code(code) {}

    ErrorCode code() const noexcept { return m_code; }

private:
    ErrorCode m_code;
};

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::ProviderUnavailable:  return "token unavailable";
        case ErrorCode::ProviderError:        return "token error";
        case ErrorCode::NotFound:             return "not found";
        case ErrorCode::AuthenticationFailed: return "authentication failed";
        case ErrorCode::PersistenceError:     return "store error";
        case ErrorCode::InvalidInput:         return "invalid input";
        case ErrorCode::AlreadyEnrolled:      return "already enrolled";
        case ErrorCode::ExternalCommand:      return "external command failed";
    }
    return "error";
}

inline int exitCodeFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidInput:         return 1;
        case ErrorCode::ProviderUnavailable:  return 2;
        case ErrorCode::ProviderError:        return 3;
        case ErrorCode::NotFound:             return 4;
        case ErrorCode::AuthenticationFailed: return 5;
        case ErrorCode::PersistenceError:     return 6;
        case ErrorCode::AlreadyEnrolled:      return 7;
        case ErrorCode::ExternalCommand:      return 8;
    }
    return 99;
}
