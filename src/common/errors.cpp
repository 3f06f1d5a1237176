#include "common/errors.hpp"
#include <cerrno>
#include <cstring>

TimeoutFailure::TimeoutFailure(const std::string& operation, std::chrono::milliseconds bound)
    : std::runtime_error("Operation '" + operation + "' timed out after " +
                         std::to_string(bound.count()) + "ms")
    , operation_(operation)
    , bound_(bound) {
}

IOFailure::IOFailure(const std::string& path, IOErrorKind kind, bool remote, const std::string& cause)
    : std::runtime_error((remote ? "Remote destination " : "File ") + path + ": " + cause)
    , path_(path)
    , kind_(kind)
    , remote_(remote)
    , cause_(cause) {
}

IOFailure IOFailure::fromErrno(const std::string& path, int err, bool remote, const std::string& what) {
    return IOFailure(path, kindFromErrno(err), remote, what + ": " + std::strerror(err));
}

IOFailure IOFailure::fromTimeout(const std::string& path, const TimeoutFailure& timeout) {
    return IOFailure(path, IOErrorKind::Unresponsive, true,
                     std::string("not responding: ") + timeout.what());
}

CancelledError::CancelledError(const std::string& where)
    : std::runtime_error(where) {
}

IOErrorKind kindFromErrno(int err) {
    switch (err) {
        case EACCES:
        case EPERM:
        case EROFS:
            return IOErrorKind::PermissionDenied;
        case ENOSPC:
        case EDQUOT:
        case EFBIG:
            return IOErrorKind::NoSpace;
        case ENETDOWN:
        case ENETUNREACH:
        case ENETRESET:
        case EHOSTUNREACH:
        case EHOSTDOWN:
        case ECONNABORTED:
        case ECONNRESET:
        case ECONNREFUSED:
        case ETIMEDOUT:
            return IOErrorKind::Network;
        // A FUSE mount whose daemon died answers with these
        case ENOTCONN:
        case ESTALE:
            return IOErrorKind::Unresponsive;
        default:
            return IOErrorKind::Other;
    }
}

std::string ioErrorKindToString(IOErrorKind kind) {
    switch (kind) {
        case IOErrorKind::Unresponsive:     return "unresponsive";
        case IOErrorKind::PermissionDenied: return "permission denied";
        case IOErrorKind::NoSpace:          return "no space";
        case IOErrorKind::Network:          return "network";
        case IOErrorKind::Other:            return "other";
    }
    return "other";
}

StatusCode classifyFailure(const std::exception& error) {
    if (dynamic_cast<const CancelledError*>(&error)) {
        return StatusCode::Stopped;
    }

    if (auto io = dynamic_cast<const IOFailure*>(&error)) {
        // Remote problems take precedence over the generic kinds
        if (io->remote()) {
            return io->kind() == IOErrorKind::Unresponsive ? StatusCode::RemoteNotMounted
                                                           : StatusCode::RemoteWriteFailed;
        }
        switch (io->kind()) {
            case IOErrorKind::PermissionDenied: return StatusCode::PermissionDenied;
            case IOErrorKind::NoSpace:          return StatusCode::DiskFull;
            case IOErrorKind::Network:
            case IOErrorKind::Unresponsive:     return StatusCode::NetworkError;
            case IOErrorKind::Other:            return StatusCode::GeneralError;
        }
    }

    if (dynamic_cast<const TimeoutFailure*>(&error)) {
        return StatusCode::NetworkError;
    }

    return StatusCode::GeneralError;
}
