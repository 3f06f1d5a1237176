#pragma once

#include "common/backup_status.hpp"
#include <chrono>
#include <exception>
#include <stdexcept>
#include <string>

// Raised by ThreadUtils::runWithTimeout when a bounded operation did not
// return in time. The worker running it is abandoned, not killed.
class TimeoutFailure : public std::runtime_error {
public:
    TimeoutFailure(const std::string& operation, std::chrono::milliseconds bound);

    const std::string& operation() const { return operation_; }
    std::chrono::milliseconds bound() const { return bound_; }

private:
    std::string operation_;
    std::chrono::milliseconds bound_;
};

enum class IOErrorKind {
    Unresponsive,
    PermissionDenied,
    NoSpace,
    Network,
    Other
};

// Raised by the file layer. remote() is true when the failing path is on the
// off-site destination.
class IOFailure : public std::runtime_error {
public:
    IOFailure(const std::string& path, IOErrorKind kind, bool remote, const std::string& cause);

    static IOFailure fromErrno(const std::string& path, int err, bool remote, const std::string& what);
    static IOFailure fromTimeout(const std::string& path, const TimeoutFailure& timeout);

    const std::string& path() const { return path_; }
    IOErrorKind kind() const { return kind_; }
    bool remote() const { return remote_; }
    const std::string& cause() const { return cause_; }

private:
    std::string path_;
    IOErrorKind kind_;
    bool remote_;
    std::string cause_;
};

// Raised at cooperative poll points once cancellation was requested.
class CancelledError : public std::runtime_error {
public:
    explicit CancelledError(const std::string& where = "Backup cancelled by user.");
};

IOErrorKind kindFromErrno(int err);
std::string ioErrorKindToString(IOErrorKind kind);

// Maps a failure raised during a run onto the outcome taxonomy.
StatusCode classifyFailure(const std::exception& error);
