// Basic types shared by the transport, the session and the filesystem layers.
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <functional>
#include <utility>

namespace sshutils {

// known_hosts validation policy for the server host key.
enum class KnownHostsPolicy {
    Strict,     // Requires exact match with known_hosts.
    AcceptNew,  // TOFU: accept and save new hosts; reject key changes.
    Off         // No verification (not recommended).
};

// Entry kind decoded from POSIX mode bits (SFTP uses the same values).
enum class FileKind {
    File,
    Directory,
    Symlink,
    Socket,
    Fifo,
    BlockDevice,
    CharDevice,
    Other
};

FileKind kindFromMode(std::uint32_t mode);
const char* fileKindName(FileKind kind);

struct FileInfo {
    std::string   name;       // base name
    std::uint64_t size  = 0;  // bytes (if applicable)
    std::uint64_t mtime = 0;  // epoch (seconds)
    std::uint32_t mode  = 0;  // POSIX bits (permissions/type)
    std::uint32_t uid   = 0;
    std::uint32_t gid   = 0;

    FileKind kind() const { return kindFromMode(mode); }
    bool isDir() const { return kind() == FileKind::Directory; }
    bool isLink() const { return kind() == FileKind::Symlink; }
};

// Progress of a single copy: bytes done so far, total bytes (0 if unknown).
using ProgressCB = std::function<void(std::uint64_t /*done*/, std::uint64_t /*total*/)>;

// Callback to answer keyboard-interactive prompts.
// Must return true and fill "responses" with one entry per prompt if input was provided.
// If it returns false, the backend answers with username/password by prompt text.
using KbdIntPromptsCB = std::function<bool(const std::string& name,
                                           const std::string& instruction,
                                           const std::vector<std::string>& prompts,
                                           std::vector<std::string>& responses)>;

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    // Password and private key are mutually exclusive.
    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    // SSH security
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::AcceptNew;

    // Host key confirmation (TOFU) when known_hosts lacks an entry.
    // Return true to accept and save, false to reject. Unset means accept.
    std::function<bool(const std::string& host,
                       std::uint16_t port,
                       const std::string& algorithm,
                       const std::string& fingerprint)> hostkey_confirm_cb;

    KbdIntPromptsCB keyboard_interactive_cb;
};

struct OpenFlags {
    bool read = true;
    bool write = false;
    bool append = false;
    bool create = false;
    bool truncate = false;
    bool exclusive = false;
};

struct ExecRequest {
    std::string command;
    std::vector<std::pair<std::string, std::string>> env;
    std::string input; // written to stdin, then EOF
};

struct ExecResult {
    std::string stdout_data;
    std::string stderr_data;
    int exit_status = 0;
};

} // namespace sshutils
