#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "none";
        case ErrorKind::Generic:           return "error";
        case ErrorKind::GitOperation:      return "git";
        case ErrorKind::EffectCritical:    return "effect-critical";
        case ErrorKind::EffectRecoverable: return "effect-recoverable";
        case ErrorKind::EffectWarning:     return "effect-warning";
        case ErrorKind::Timeout:           return "timeout";
        case ErrorKind::LockAcquisition:   return "lock";
        case ErrorKind::Config:            return "config";
        case ErrorKind::Io:                return "io";
        case ErrorKind::NotFound:          return "not-found";
        case ErrorKind::AlreadyExists:     return "already-exists";
        case ErrorKind::InvalidArgument:   return "invalid-argument";
    }
    return "error";
}

const char* phase_name(LifecyclePhase phase) {
    switch (phase) {
        case LifecyclePhase::PreAdd:     return "pre_add";
        case LifecyclePhase::PostAdd:    return "post_add";
        case LifecyclePhase::PreRemove:  return "pre_remove";
        case LifecyclePhase::PostRemove: return "post_remove";
    }
    return "unknown";
}

const char* mapping_type_name(MappingType type) {
    return type == MappingType::Copy ? "copy" : "symlink";
}

const char* error_handling_name(ErrorHandling handling) {
    return handling == ErrorHandling::Continue ? "continue" : "abort";
}
