#include "errors.hpp"
#include <fmt/format.h>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                 return "None";
        case ErrorKind::InvalidTask:          return "InvalidTask";
        case ErrorKind::ResourceUnavailable:  return "ResourceUnavailable";
        case ErrorKind::ConnectionError:      return "ConnectionError";
        case ErrorKind::AuthorizationError:   return "AuthorizationError";
        case ErrorKind::VerificationMismatch: return "VerificationMismatch";
        case ErrorKind::RemoteStateVanished:  return "RemoteStateVanished";
        case ErrorKind::Unexpected:           return "Unexpected";
    }
    return "Unexpected";
}

ErrorKind parse_error_kind(const std::string& name) {
    static const ErrorKind all[] = {
        ErrorKind::None, ErrorKind::InvalidTask, ErrorKind::ResourceUnavailable,
        ErrorKind::ConnectionError, ErrorKind::AuthorizationError,
        ErrorKind::VerificationMismatch, ErrorKind::RemoteStateVanished,
        ErrorKind::Unexpected,
    };
    if (name.empty()) return ErrorKind::None;
    for (auto k : all) {
        if (name == error_kind_name(k)) return k;
    }
    return ErrorKind::Unexpected;
}

bool is_retriable(ErrorKind kind) {
    return kind == ErrorKind::ConnectionError
        || kind == ErrorKind::VerificationMismatch;
}

std::string JobError::describe() const {
    if (empty()) return "";
    return fmt::format("{}: {}", error_kind_name(kind), message);
}
