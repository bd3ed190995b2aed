#pragma once

#include <stdexcept>
#include <string>

namespace photo_restore {

class PhotoRestoreError : public std::runtime_error {
public:
    explicit PhotoRestoreError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public PhotoRestoreError {
public:
    explicit ConfigError(const std::string& message)
        : PhotoRestoreError("Config error: " + message) {}
};

class ValidationError : public PhotoRestoreError {
public:
    explicit ValidationError(const std::string& message)
        : PhotoRestoreError("Validation error: " + message) {}
};

// Terminal failure kinds of a single run. None of them is retried internally.
enum class ErrorKind {
    IOError,
    InputNotFound,
    LaunchScriptMissing,
    SpawnError,
    WorkerExitedNonZero,
    NoOutputProduced,
    TaskFailed
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::IOError: return "IOError";
        case ErrorKind::InputNotFound: return "InputNotFound";
        case ErrorKind::LaunchScriptMissing: return "LaunchScriptMissing";
        case ErrorKind::SpawnError: return "SpawnError";
        case ErrorKind::WorkerExitedNonZero: return "WorkerExitedNonZero";
        case ErrorKind::NoOutputProduced: return "NoOutputProduced";
        case ErrorKind::TaskFailed: return "TaskFailed";
    }
    return "Unknown";
}

class RunError : public PhotoRestoreError {
public:
    RunError(ErrorKind kind, const std::string& message)
        : PhotoRestoreError(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class IOError : public RunError {
public:
    explicit IOError(const std::string& message)
        : RunError(ErrorKind::IOError, message) {}
};

class InputNotFound : public RunError {
public:
    explicit InputNotFound(const std::string& message)
        : RunError(ErrorKind::InputNotFound, message) {}
};

class LaunchScriptMissing : public RunError {
public:
    explicit LaunchScriptMissing(const std::string& message)
        : RunError(ErrorKind::LaunchScriptMissing, message) {}
};

class SpawnError : public RunError {
public:
    explicit SpawnError(const std::string& message)
        : RunError(ErrorKind::SpawnError, message) {}
};

class WorkerExitedNonZero : public RunError {
public:
    explicit WorkerExitedNonZero(const std::string& message)
        : RunError(ErrorKind::WorkerExitedNonZero, message) {}
};

class NoOutputProduced : public RunError {
public:
    explicit NoOutputProduced(const std::string& message)
        : RunError(ErrorKind::NoOutputProduced, message) {}
};

class TaskFailed : public RunError {
public:
    explicit TaskFailed(const std::string& message)
        : RunError(ErrorKind::TaskFailed, "Task failed: " + message) {}
};

} // namespace photo_restore
