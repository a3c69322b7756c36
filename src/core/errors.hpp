#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    AUTH,
    TIMEOUT,
    TOOL_UNAVAILABLE,
    VALIDATION,
    PROCESS,
    CANCELLED,
    PERMISSION_DENIED,
    NOT_SUPPORTED,
    UNAVAILABLE,
    NOT_FOUND,
};

const char* to_string(ErrorKind kind);

// Base for every failure surfaced by the session / sync layer.
class RemoteError : public std::runtime_error {
public:
    RemoteError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class AuthError : public RemoteError {
public:
    explicit AuthError(const std::string& msg) : RemoteError(ErrorKind::AUTH, msg) {}
};

class TimeoutError : public RemoteError {
public:
    explicit TimeoutError(const std::string& msg) : RemoteError(ErrorKind::TIMEOUT, msg) {}
};

class ToolUnavailableError : public RemoteError {
public:
    explicit ToolUnavailableError(const std::string& msg)
        : RemoteError(ErrorKind::TOOL_UNAVAILABLE, msg) {}
};

class ValidationError : public RemoteError {
public:
    explicit ValidationError(const std::string& msg) : RemoteError(ErrorKind::VALIDATION, msg) {}
};

// Non-zero exit of an external tool. Keeps exit code and stderr for diagnosis.
class ProcessError : public RemoteError {
public:
    ProcessError(const std::string& msg, int exit_code, std::string stderr_data)
        : RemoteError(ErrorKind::PROCESS, msg),
          exit_code_(exit_code), stderr_data_(std::move(stderr_data)) {}

    int exit_code() const { return exit_code_; }
    const std::string& stderr_data() const { return stderr_data_; }

private:
    int exit_code_;
    std::string stderr_data_;
};

class CancelledError : public RemoteError {
public:
    explicit CancelledError(const std::string& msg) : RemoteError(ErrorKind::CANCELLED, msg) {}
};

class PermissionDeniedError : public RemoteError {
public:
    explicit PermissionDeniedError(const std::string& msg)
        : RemoteError(ErrorKind::PERMISSION_DENIED, msg) {}
};

class NotSupportedError : public RemoteError {
public:
    explicit NotSupportedError(const std::string& msg)
        : RemoteError(ErrorKind::NOT_SUPPORTED, msg) {}
};

class UnavailableError : public RemoteError {
public:
    explicit UnavailableError(const std::string& msg)
        : RemoteError(ErrorKind::UNAVAILABLE, msg) {}
};

class NotFoundError : public RemoteError {
public:
    explicit NotFoundError(const std::string& msg) : RemoteError(ErrorKind::NOT_FOUND, msg) {}
};
