#include "sshutils/Session.hpp"
#include "sshutils/Log.hpp"

namespace sshutils {

const char* sessionStateName(SessionState s) {
    switch (s) {
        case SessionState::Disconnected: return "Disconnected";
        case SessionState::Connecting: return "Connecting";
        case SessionState::Connected: return "Connected";
        case SessionState::ChannelOpening: return "ChannelOpening";
        case SessionState::Ready: return "Ready";
    }
    return "Unknown";
}

Session::Session(std::unique_ptr<SftpClient> client, SessionOptions opt, int authAttempts, bool threadSafe)
    : client_(std::move(client)),
      opt_(std::move(opt)),
      authAttempts_(authAttempts > 0 ? authAttempts : 1),
      threadSafe_(threadSafe) {}

Session::~Session() {
    close();
}

std::unique_lock<std::recursive_mutex> Session::lock() {
    if (threadSafe_) return std::unique_lock<std::recursive_mutex>(mtx_);
    return std::unique_lock<std::recursive_mutex>(mtx_, std::defer_lock);
}

bool Session::connect(Error& err) {
    auto lk = lock();
    if (opt_.password && opt_.private_key_path) {
        err.set(ErrorKind::InvalidArgument, "password and private key are mutually exclusive");
        return false;
    }
    if (isConnected()) return true;

    Error last;
    for (int attempt = 1; attempt <= authAttempts_; ++attempt) {
        state_ = SessionState::Connecting;
        last.clear();
        if (client_->connect(opt_, last)) {
            state_ = SessionState::Connected;
            LOGI("session.connect host=%s user=%s attempt=%d outcome=ok",
                 opt_.host.c_str(), opt_.username.c_str(), attempt);
            return true;
        }
        client_->disconnect();
        state_ = SessionState::Disconnected;
        LOGW("session.connect host=%s attempt=%d/%d kind=%s msg=\"%s\"", opt_.host.c_str(), attempt,
             authAttempts_, errorKindName(last.kind), last.message.c_str());
        if (last.kind != ErrorKind::Auth && last.kind != ErrorKind::ConnectFailed) {
            err = last;
            return false;
        }
    }
    err.set(ErrorKind::ConnectFailed, "could not connect to " + opt_.host + " after " +
                                          std::to_string(authAttempts_) + " attempts: " + last.message);
    return false;
}

bool Session::ensureChannel(Error& err) {
    auto lk = lock();
    if (state_ == SessionState::Ready && client_->hasChannel()) return true;
    if (!isConnected()) {
        err.set(ErrorKind::ConnectionLost, "session to " + opt_.host + " is not connected");
        return false;
    }
    state_ = SessionState::ChannelOpening;
    Error e;
    if (!client_->openChannel(e)) {
        if (e.kind == ErrorKind::ConnectionLost) {
            client_->disconnect();
            state_ = SessionState::Disconnected;
            err = e;
        } else {
            state_ = SessionState::Connected;
            err.set(ErrorKind::ChannelOpen, "SFTP channel to " + opt_.host + ": " + e.message);
        }
        return false;
    }
    channelWanted_ = true;
    state_ = SessionState::Ready;
    LOGD("session.channel host=%s outcome=open", opt_.host.c_str());
    return true;
}

void Session::close() {
    auto lk = lock();
    if (state_ == SessionState::Disconnected && !client_->isConnected()) return;
    client_->disconnect();
    state_ = SessionState::Disconnected;
    LOGD("session.close host=%s", opt_.host.c_str());
}

bool Session::reconnect(Error& err) {
    auto lk = lock();
    close();
    if (!connect(err)) return false;
    if (channelWanted_ && !ensureChannel(err)) return false;
    return true;
}

void Session::noteFailure(const char* what, const Error& err) {
    if (!isTransient(err.kind)) return;
    LOGD("session.fault host=%s op=%s kind=%s", opt_.host.c_str(), what, errorKindName(err.kind));
    client_->disconnect();
    state_ = SessionState::Disconnected;
}

template <class F>
bool Session::primitive(const char* what, bool needsChannel, F&& fn, Error& err) {
    auto lk = lock();
    if (needsChannel) {
        if (!ensureChannel(err)) return false;
    } else if (!isConnected()) {
        err.set(ErrorKind::ConnectionLost, "session to " + opt_.host + " is not connected");
        return false;
    }
    if (fn(*client_)) return true;
    noteFailure(what, err);
    return false;
}

bool Session::stat(const std::string& path, FileInfo& info, Error& err) {
    return primitive("stat", true, [&](SftpClient& c) { return c.stat(path, info, err); }, err);
}

bool Session::lstat(const std::string& path, FileInfo& info, Error& err) {
    return primitive("lstat", true, [&](SftpClient& c) { return c.lstat(path, info, err); }, err);
}

bool Session::list(const std::string& path, std::vector<FileInfo>& out, Error& err) {
    return primitive("list", true, [&](SftpClient& c) { return c.list(path, out, err); }, err);
}

bool Session::realpath(const std::string& path, std::string& out, Error& err) {
    return primitive("realpath", true, [&](SftpClient& c) { return c.realpath(path, out, err); }, err);
}

bool Session::get(const std::string& remote, const std::string& local, Error& err, ProgressCB progress) {
    return primitive("get", true, [&](SftpClient& c) { return c.get(remote, local, err, progress); }, err);
}

bool Session::put(const std::string& local, const std::string& remote, Error& err, ProgressCB progress) {
    return primitive("put", true, [&](SftpClient& c) { return c.put(local, remote, err, progress); }, err);
}

std::unique_ptr<FileHandle> Session::open(const std::string& path, const OpenFlags& flags,
                                          std::uint32_t mode, Error& err) {
    std::unique_ptr<FileHandle> h;
    primitive("open", true, [&](SftpClient& c) {
        h = c.open(path, flags, mode, err);
        return h != nullptr;
    }, err);
    return h;
}

bool Session::mkdir(const std::string& path, unsigned int mode, Error& err) {
    return primitive("mkdir", true, [&](SftpClient& c) { return c.mkdir(path, err, mode); }, err);
}

bool Session::removeFile(const std::string& path, Error& err) {
    return primitive("removeFile", true, [&](SftpClient& c) { return c.removeFile(path, err); }, err);
}

bool Session::removeDir(const std::string& path, Error& err) {
    return primitive("removeDir", true, [&](SftpClient& c) { return c.removeDir(path, err); }, err);
}

bool Session::rename(const std::string& from, const std::string& to, bool overwrite, Error& err) {
    return primitive("rename", true, [&](SftpClient& c) { return c.rename(from, to, err, overwrite); }, err);
}

bool Session::chmod(const std::string& path, std::uint32_t mode, Error& err) {
    return primitive("chmod", true, [&](SftpClient& c) { return c.chmod(path, mode, err); }, err);
}

bool Session::symlink(const std::string& target, const std::string& link_path, Error& err) {
    return primitive("symlink", true, [&](SftpClient& c) { return c.symlink(target, link_path, err); }, err);
}

bool Session::exec(const ExecRequest& req, ExecResult& out, Error& err) {
    return primitive("exec", false, [&](SftpClient& c) { return c.exec(req, out, err); }, err);
}

} // namespace sshutils
