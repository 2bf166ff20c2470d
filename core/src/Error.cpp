#include "sshutils/Error.hpp"
#include <cerrno>
#include <cstring>

namespace sshutils {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::Auth: return "Auth";
        case ErrorKind::ConnectFailed: return "ConnectFailed";
        case ErrorKind::ChannelOpen: return "ChannelOpen";
        case ErrorKind::ConnectionLost: return "ConnectionLost";
        case ErrorKind::ChannelLost: return "ChannelLost";
        case ErrorKind::Io: return "Io";
        case ErrorKind::LocalIo: return "LocalIo";
        case ErrorKind::Protocol: return "Protocol";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::AlreadyExists: return "AlreadyExists";
        case ErrorKind::IsADirectory: return "IsADirectory";
        case ErrorKind::NotADirectory: return "NotADirectory";
        case ErrorKind::NotEmpty: return "NotEmpty";
        case ErrorKind::PermissionDenied: return "PermissionDenied";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::Decode: return "Decode";
        case ErrorKind::ProcessFailed: return "ProcessFailed";
        case ErrorKind::Unknown: return "Unknown";
    }
    return "Unknown";
}

bool isTransient(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConnectionLost:
        case ErrorKind::ChannelLost:
        case ErrorKind::Io:
        case ErrorKind::Protocol:
            return true;
        default:
            return false;
    }
}

std::string Error::describe() const {
    if (message.empty()) return errorKindName(kind);
    return std::string(errorKindName(kind)) + ": " + message;
}

void setFromErrno(Error& err, int errnum, const std::string& what) {
    ErrorKind kind = ErrorKind::LocalIo;
    switch (errnum) {
        case ENOENT: kind = ErrorKind::NotFound; break;
        case EEXIST: kind = ErrorKind::AlreadyExists; break;
        case EISDIR: kind = ErrorKind::IsADirectory; break;
        case ENOTDIR: kind = ErrorKind::NotADirectory; break;
        case ENOTEMPTY: kind = ErrorKind::NotEmpty; break;
        case EACCES:
        case EPERM: kind = ErrorKind::PermissionDenied; break;
        case EINVAL:
        case ENAMETOOLONG:
        case ELOOP: kind = ErrorKind::InvalidArgument; break;
        default: break;
    }
    err.set(kind, what + ": " + std::strerror(errnum));
}

} // namespace sshutils
