// Error taxonomy shared by the transport, the session and the filesystem layers.
// Every fallible call returns bool and fills an Error out-parameter.
#pragma once
#include <string>

namespace sshutils {

enum class ErrorKind {
    None,
    Auth,             // credentials rejected
    ConnectFailed,    // transport could not be established (after the auth cap)
    ChannelOpen,      // SFTP subsystem could not be opened
    ConnectionLost,   // transport dropped or never (re)established
    ChannelLost,      // stale or closed SFTP channel
    Io,               // generic read/write failure on the remote side
    LocalIo,          // local disk, pipe or process failure; a reconnect cannot cure it
    Protocol,         // malformed or unexpected SFTP/SSH message
    NotFound,
    AlreadyExists,
    IsADirectory,
    NotADirectory,
    NotEmpty,
    PermissionDenied,
    InvalidArgument,
    Decode,           // text could not be decoded with the requested encoding
    ProcessFailed,    // command exited non-zero with check enabled
    Unknown
};

const char* errorKindName(ErrorKind kind);

// Faults that a reconnect may cure.
bool isTransient(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    void set(ErrorKind k, std::string msg) {
        kind = k;
        message = std::move(msg);
    }
    void clear() {
        kind = ErrorKind::None;
        message.clear();
    }
    explicit operator bool() const { return kind != ErrorKind::None; }

    // "<Kind>: message"
    std::string describe() const;
};

// Fill err from a local errno value; "what" names the failed call and path.
// Values without a domain kind become LocalIo, never a transport kind.
void setFromErrno(Error& err, int errnum, const std::string& what);

} // namespace sshutils
