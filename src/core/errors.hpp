#pragma once

// Error taxonomy carried by Result<T>::kind.
enum class ErrorKind {
    None,
    Generic,
    GitOperation,        // worktree primitive failed; nothing after it runs
    EffectCritical,      // effect failed with continue_on_error=false
    EffectRecoverable,   // effect fell back to another strategy and succeeded
    EffectWarning,       // effect failed but the phase continued
    Timeout,             // hook exceeded its time limit
    LockAcquisition,     // repository lock held by another invocation
    Config,
    Io,
    NotFound,
    AlreadyExists,
    InvalidArgument,
};

const char* error_kind_name(ErrorKind kind);

