#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                    return "None";
        case ErrorKind::NotFound:                return "NotFound";
        case ErrorKind::CorruptState:            return "CorruptState";
        case ErrorKind::AlreadyExists:           return "AlreadyExists";
        case ErrorKind::NotResumable:            return "NotResumable";
        case ErrorKind::ShapeMismatch:           return "ShapeMismatch";
        case ErrorKind::LockTimeout:             return "LockTimeout";
        case ErrorKind::IoError:                 return "IoError";
        case ErrorKind::RecoverableChunkFailure: return "RecoverableChunkFailure";
        case ErrorKind::FatalJobFailure:         return "FatalJobFailure";
        case ErrorKind::RateLimited:             return "RateLimited";
        case ErrorKind::ConnectionLost:          return "ConnectionLost";
        case ErrorKind::ServerFault:             return "ServerFault";
        case ErrorKind::AuthFailure:             return "AuthFailure";
        case ErrorKind::InvalidConfig:           return "InvalidConfig";
        case ErrorKind::Internal:                return "Internal";
    }
    return "Unknown";
}

bool is_recoverable(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::RecoverableChunkFailure:
        case ErrorKind::RateLimited:
        case ErrorKind::ConnectionLost:
        case ErrorKind::ServerFault:
            return true;
        default:
            return false;
    }
}
