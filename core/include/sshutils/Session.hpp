// One transport to one host plus a lazily opened SFTP channel.
// Tracks readiness and exposes the raw primitive operations; retries live in RetryGuard.
#pragma once
#include "SftpClient.hpp"
#include <memory>
#include <mutex>

namespace sshutils {

enum class SessionState {
    Disconnected,
    Connecting,
    Connected,       // transport authenticated, no SFTP channel
    ChannelOpening,
    Ready            // SFTP channel open
};

const char* sessionStateName(SessionState s);

class Session {
public:
    Session(std::unique_ptr<SftpClient> client,
            SessionOptions opt,
            int authAttempts = 3,
            bool threadSafe = false);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Authenticates, retrying auth/connect failures up to the attempt cap.
    bool connect(Error& err);
    // Opens the SFTP channel once and caches it.
    bool ensureChannel(Error& err);
    // Idempotent.
    void close();
    // close + connect, and reopen the channel if one had been opened before.
    bool reconnect(Error& err);

    SessionState state() const { return state_; }
    bool isReady() const { return state_ == SessionState::Ready; }
    bool isConnected() const { return state_ == SessionState::Connected || state_ == SessionState::Ready; }
    bool channelWanted() const { return channelWanted_; }
    bool threadSafe() const { return threadSafe_; }
    const SessionOptions& options() const { return opt_; }
    const std::string& host() const { return opt_.host; }
    void setAuthAttempts(int n) { authAttempts_ = n > 0 ? n : 1; }
    int authAttempts() const { return authAttempts_; }

    // Locked in thread-safe mode, deferred (not owning) otherwise.
    std::unique_lock<std::recursive_mutex> lock();

    // Raw primitives. Each requires a Ready session (exec only a connected one);
    // a transient failure moves the session back to Disconnected.
    bool stat(const std::string& path, FileInfo& info, Error& err);
    bool lstat(const std::string& path, FileInfo& info, Error& err);
    bool list(const std::string& path, std::vector<FileInfo>& out, Error& err);
    bool realpath(const std::string& path, std::string& out, Error& err);
    bool get(const std::string& remote, const std::string& local, Error& err, ProgressCB progress = {});
    bool put(const std::string& local, const std::string& remote, Error& err, ProgressCB progress = {});
    std::unique_ptr<FileHandle> open(const std::string& path, const OpenFlags& flags,
                                     std::uint32_t mode, Error& err);
    bool mkdir(const std::string& path, unsigned int mode, Error& err);
    bool removeFile(const std::string& path, Error& err);
    bool removeDir(const std::string& path, Error& err);
    bool rename(const std::string& from, const std::string& to, bool overwrite, Error& err);
    bool chmod(const std::string& path, std::uint32_t mode, Error& err);
    bool symlink(const std::string& target, const std::string& link_path, Error& err);
    bool exec(const ExecRequest& req, ExecResult& out, Error& err);

private:
    std::unique_ptr<SftpClient> client_;
    SessionOptions opt_;
    int authAttempts_;
    bool threadSafe_;
    SessionState state_ = SessionState::Disconnected;
    bool channelWanted_ = false;
    std::recursive_mutex mtx_;

    template <class F>
    bool primitive(const char* what, bool needsChannel, F&& fn, Error& err);
    void noteFailure(const char* what, const Error& err);
};

} // namespace sshutils
