// Mock implementation: a map of absolute path -> node plays the remote filesystem.
#include "sshutils/MockSftpClient.hpp"
#include "sshutils/PathUtil.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <sys/stat.h>

namespace sshutils {

class MockFileHandle : public FileHandle {
public:
    MockFileHandle(MockSftpClient* owner, std::string path, bool writable)
        : owner_(owner), path_(std::move(path)), writable_(writable) {}

    bool read(char* buf, std::size_t n, std::size_t& got, Error& err) override {
        got = 0;
        auto it = owner_->nodes_.find(path_);
        if (closed_ || it == owner_->nodes_.end()) {
            err.set(ErrorKind::ChannelLost, "stale handle for " + path_);
            return false;
        }
        const std::string& data = it->second.content;
        if (pos_ >= data.size()) return true;
        got = std::min(n, data.size() - pos_);
        std::copy(data.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data.begin() + static_cast<std::ptrdiff_t>(pos_ + got), buf);
        pos_ += got;
        return true;
    }

    bool write(const char* buf, std::size_t n, Error& err) override {
        auto it = owner_->nodes_.find(path_);
        if (closed_ || it == owner_->nodes_.end()) {
            err.set(ErrorKind::ChannelLost, "stale handle for " + path_);
            return false;
        }
        if (!writable_) {
            err.set(ErrorKind::PermissionDenied, path_ + " not opened for writing");
            return false;
        }
        it->second.content.append(buf, n);
        return true;
    }

    bool close(Error&) override {
        closed_ = true;
        return true;
    }

private:
    MockSftpClient* owner_;
    std::string path_;
    bool writable_;
    bool closed_ = false;
    std::size_t pos_ = 0;
};

MockSftpClient::MockSftpClient() {
    nodes_["/"] = Node{S_IFDIR | 0755, {}, {}};
}

std::string MockSftpClient::absolute(const std::string& path) const {
    if (path.empty()) return home_;
    return normalizePath(isAbsolutePath(path) ? path : joinPath(home_, path));
}

void MockSftpClient::makeParents(const std::string& path) {
    std::string cur = "/";
    const auto parts = splitPath(parentPath(path));
    for (const auto& p : parts) {
        cur = joinPath(cur, p);
        if (!nodes_.count(cur)) nodes_[cur] = Node{S_IFDIR | 0755, {}, {}};
    }
}

void MockSftpClient::addDir(const std::string& path, std::uint32_t perms) {
    const std::string p = absolute(path);
    makeParents(p);
    nodes_[p] = Node{S_IFDIR | perms, {}, {}};
}

void MockSftpClient::addFile(const std::string& path, const std::string& content, std::uint32_t perms) {
    const std::string p = absolute(path);
    makeParents(p);
    nodes_[p] = Node{S_IFREG | perms, content, {}};
}

void MockSftpClient::addSymlink(const std::string& link_path, const std::string& target) {
    const std::string p = absolute(link_path);
    makeParents(p);
    nodes_[p] = Node{S_IFLNK | 0777, {}, target};
}

void MockSftpClient::addSpecial(const std::string& path, std::uint32_t typeBits) {
    const std::string p = absolute(path);
    makeParents(p);
    nodes_[p] = Node{(typeBits & S_IFMT) | 0644, {}, {}};
}

bool MockSftpClient::hasPath(const std::string& path) const {
    return nodes_.count(absolute(path)) > 0;
}

std::optional<std::string> MockSftpClient::fileContent(const std::string& path) const {
    auto it = nodes_.find(absolute(path));
    if (it == nodes_.end() || !S_ISREG(it->second.mode)) return std::nullopt;
    return it->second.content;
}

void MockSftpClient::injectFault(const std::string& op, ErrorKind kind, int times, const std::string& path) {
    faults_.push_back(Fault{op, path.empty() ? std::string() : absolute(path), kind, times});
}

void MockSftpClient::failConnect(ErrorKind kind, int times) {
    for (int i = 0; i < times; ++i) connectFaults_.push_back(kind);
}

void MockSftpClient::failChannel(int times) {
    channelFaults_ += times;
}

void MockSftpClient::dropConnection() {
    connected_ = false;
    channel_ = false;
}

int MockSftpClient::calls(const std::string& op) const {
    auto it = calls_.find(op);
    return it == calls_.end() ? 0 : it->second;
}

bool MockSftpClient::enter(const std::string& op, const std::string& path, bool needsChannel, Error& err) {
    ++calls_[op];
    if (!connected_) {
        err.set(ErrorKind::ConnectionLost, op + ": not connected");
        return false;
    }
    if (needsChannel && !channel_) {
        err.set(ErrorKind::ChannelLost, op + ": SFTP channel not open");
        return false;
    }
    for (auto it = faults_.begin(); it != faults_.end(); ++it) {
        if (it->op != op || (!it->path.empty() && it->path != path)) continue;
        err.set(it->kind, op + " " + path + ": injected fault");
        if (--it->times <= 0) faults_.erase(it);
        if (err.kind == ErrorKind::ConnectionLost) dropConnection();
        if (err.kind == ErrorKind::ChannelLost) channel_ = false;
        return false;
    }
    return true;
}

bool MockSftpClient::resolveParent(const std::string& path, std::string& out, Error& err) const {
    const std::string parent = parentPath(path);
    if (path == "/" || parent == "/") {
        out = path;
        return true;
    }
    std::string real;
    if (!resolve(parent, real, err)) return false;
    out = joinPath(real, baseName(path));
    return true;
}

bool MockSftpClient::resolve(const std::string& path, std::string& out, Error& err) const {
    std::string cur = path;
    for (int hops = 0; hops < 8; ++hops) {
        std::string phys;
        if (!resolveParent(cur, phys, err)) return false;
        auto it = nodes_.find(phys);
        if (it == nodes_.end()) {
            err.set(ErrorKind::NotFound, "no such file: " + path);
            return false;
        }
        if (!S_ISLNK(it->second.mode)) {
            out = phys;
            return true;
        }
        const std::string& t = it->second.target;
        cur = normalizePath(isAbsolutePath(t) ? t : joinPath(parentPath(phys), t));
    }
    err.set(ErrorKind::InvalidArgument, "too many levels of symbolic links: " + path);
    return false;
}

bool MockSftpClient::requireParentDir(const std::string& path, Error& err) const {
    std::string parent;
    if (!resolve(parentPath(path), parent, err)) {
        err.set(ErrorKind::NotFound, "parent directory missing for " + path);
        return false;
    }
    if (!S_ISDIR(nodes_.at(parent).mode)) {
        err.set(ErrorKind::NotADirectory, "parent of " + path + " is not a directory");
        return false;
    }
    return true;
}

FileInfo MockSftpClient::infoFor(const std::string& path, const Node& n) const {
    FileInfo fi;
    fi.name = baseName(path);
    fi.mode = n.mode;
    fi.size = S_ISLNK(n.mode) ? n.target.size() : n.content.size();
    return fi;
}

bool MockSftpClient::connect(const SessionOptions& opt, Error& err) {
    ++connects_;
    if (connected_) {
        err.set(ErrorKind::InvalidArgument, "already connected");
        return false;
    }
    if (opt.host.empty() || opt.username.empty()) {
        err.set(ErrorKind::InvalidArgument, "host and user are required");
        return false;
    }
    if (!connectFaults_.empty()) {
        const ErrorKind kind = connectFaults_.front();
        connectFaults_.erase(connectFaults_.begin());
        err.set(kind, "connect " + opt.host + ": injected fault");
        return false;
    }
    connected_ = true;
    lastOpt_ = opt;
    return true;
}

void MockSftpClient::disconnect() {
    connected_ = false;
    channel_ = false;
}

bool MockSftpClient::openChannel(Error& err) {
    ++channelOpens_;
    if (!connected_) {
        err.set(ErrorKind::ConnectionLost, "not connected");
        return false;
    }
    if (channelFaults_ > 0) {
        --channelFaults_;
        err.set(ErrorKind::ChannelOpen, "SFTP subsystem refused");
        return false;
    }
    channel_ = true;
    return true;
}

bool MockSftpClient::list(const std::string& remote_path,
                          std::vector<FileInfo>& out,
                          Error& err) {
    const std::string path = absolute(remote_path);
    if (!enter("list", path, true, err)) return false;
    std::string dir;
    if (!resolve(path, dir, err)) return false;
    if (!S_ISDIR(nodes_.at(dir).mode)) {
        err.set(ErrorKind::NotADirectory, "not a directory: " + path);
        return false;
    }
    out.clear();
    for (const auto& kv : nodes_) {
        if (kv.first == dir || parentPath(kv.first) != dir) continue;
        out.push_back(infoFor(kv.first, kv.second));
    }
    return true;
}

bool MockSftpClient::stat(const std::string& remote_path, FileInfo& info, Error& err) {
    const std::string path = absolute(remote_path);
    if (!enter("stat", path, true, err)) return false;
    std::string real;
    if (!resolve(path, real, err)) return false;
    info = infoFor(path, nodes_.at(real));
    return true;
}

bool MockSftpClient::lstat(const std::string& remote_path, FileInfo& info, Error& err) {
    const std::string path = absolute(remote_path);
    if (!enter("lstat", path, true, err)) return false;
    std::string phys;
    if (!resolveParent(path, phys, err)) return false;
    auto it = nodes_.find(phys);
    if (it == nodes_.end()) {
        err.set(ErrorKind::NotFound, "no such file: " + path);
        return false;
    }
    info = infoFor(path, it->second);
    return true;
}

bool MockSftpClient::realpath(const std::string& remote_path, std::string& out, Error& err) {
    const std::string path = absolute(remote_path);
    if (!enter("realpath", path, true, err)) return false;
    if (!resolve(path, out, err)) {
        // Like OpenSSH, a missing leaf still resolves lexically.
        err.clear();
        out = path;
    }
    return true;
}

bool MockSftpClient::get(const std::string& remote,
                         const std::string& local,
                         Error& err,
                         ProgressCB progress) {
    const std::string path = absolute(remote);
    if (!enter("get", path, true, err)) return false;
    std::string real;
    if (!resolve(path, real, err)) return false;
    const Node& n = nodes_.at(real);
    if (S_ISDIR(n.mode)) {
        err.set(ErrorKind::IsADirectory, "cannot download directory " + path);
        return false;
    }
    FILE* lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        setFromErrno(err, errno, "open " + local + " for writing");
        return false;
    }
    const std::uint64_t total = n.content.size();
    std::uint64_t done = 0;
    while (done < total) {
        const std::size_t len = static_cast<std::size_t>(std::min<std::uint64_t>(chunk_, total - done));
        if (std::fwrite(n.content.data() + done, 1, len, lf) != len) {
            setFromErrno(err, errno, "write " + local);
            std::fclose(lf);
            return false;
        }
        done += len;
        if (progress) progress(done, total);
    }
    if (std::fclose(lf) != 0) {
        setFromErrno(err, errno, "close " + local);
        return false;
    }
    return true;
}

bool MockSftpClient::put(const std::string& local,
                         const std::string& remote,
                         Error& err,
                         ProgressCB progress) {
    const std::string path = absolute(remote);
    if (!enter("put", path, true, err)) return false;
    if (!requireParentDir(path, err)) return false;
    auto it = nodes_.find(path);
    if (it != nodes_.end() && S_ISDIR(it->second.mode)) {
        err.set(ErrorKind::IsADirectory, "cannot overwrite directory " + path);
        return false;
    }
    FILE* lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        setFromErrno(err, errno, "open " + local + " for reading");
        return false;
    }
    std::string data;
    std::vector<char> buf(chunk_);
    std::fseek(lf, 0, SEEK_END);
    const long fsz = std::ftell(lf);
    std::fseek(lf, 0, SEEK_SET);
    const std::uint64_t total = fsz > 0 ? static_cast<std::uint64_t>(fsz) : 0;
    for (;;) {
        size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n == 0) break;
        data.append(buf.data(), n);
        if (progress) progress(data.size(), total);
    }
    const bool readFailed = std::ferror(lf) != 0;
    std::fclose(lf);
    if (readFailed) {
        err.set(ErrorKind::LocalIo, "read " + local + " failed");
        return false;
    }
    nodes_[path] = Node{S_IFREG | 0644, std::move(data), {}};
    return true;
}

std::unique_ptr<FileHandle> MockSftpClient::open(const std::string& remote_path,
                                                 const OpenFlags& flags,
                                                 std::uint32_t mode,
                                                 Error& err) {
    const std::string path = absolute(remote_path);
    if (!enter("open", path, true, err)) return nullptr;
    std::string real;
    const bool exists = resolve(path, real, err);
    err.clear();
    if (!exists) {
        if (!flags.create) {
            err.set(ErrorKind::NotFound, "no such file: " + path);
            return nullptr;
        }
        if (!requireParentDir(path, err)) return nullptr;
        nodes_[path] = Node{S_IFREG | (mode & 07777), {}, {}};
        real = path;
    } else {
        if (flags.exclusive) {
            err.set(ErrorKind::AlreadyExists, "file exists: " + path);
            return nullptr;
        }
        Node& n = nodes_.at(real);
        if (S_ISDIR(n.mode)) {
            err.set(ErrorKind::IsADirectory, "is a directory: " + path);
            return nullptr;
        }
        if (flags.truncate) n.content.clear();
    }
    return std::make_unique<MockFileHandle>(this, real, flags.write || flags.append);
}

bool MockSftpClient::mkdir(const std::string& remote_dir, Error& err, unsigned int mode) {
    const std::string path = absolute(remote_dir);
    if (!enter("mkdir", path, true, err)) return false;
    if (nodes_.count(path)) {
        err.set(ErrorKind::AlreadyExists, "file exists: " + path);
        return false;
    }
    if (!requireParentDir(path, err)) return false;
    nodes_[path] = Node{S_IFDIR | (mode & 07777), {}, {}};
    return true;
}

bool MockSftpClient::removeFile(const std::string& remote_path, Error& err) {
    const std::string path = absolute(remote_path);
    if (!enter("removeFile", path, true, err)) return false;
    auto it = nodes_.find(path);
    if (it == nodes_.end()) {
        err.set(ErrorKind::NotFound, "no such file: " + path);
        return false;
    }
    if (S_ISDIR(it->second.mode)) {
        err.set(ErrorKind::IsADirectory, "is a directory: " + path);
        return false;
    }
    nodes_.erase(it);
    return true;
}

bool MockSftpClient::removeDir(const std::string& remote_dir, Error& err) {
    const std::string path = absolute(remote_dir);
    if (!enter("removeDir", path, true, err)) return false;
    auto it = nodes_.find(path);
    if (it == nodes_.end()) {
        err.set(ErrorKind::NotFound, "no such directory: " + path);
        return false;
    }
    if (!S_ISDIR(it->second.mode)) {
        err.set(ErrorKind::NotADirectory, "not a directory: " + path);
        return false;
    }
    for (const auto& kv : nodes_) {
        if (kv.first != path && parentPath(kv.first) == path) {
            err.set(ErrorKind::NotEmpty, "directory not empty: " + path);
            return false;
        }
    }
    nodes_.erase(it);
    return true;
}

bool MockSftpClient::rename(const std::string& from, const std::string& to, Error& err, bool overwrite) {
    const std::string src = absolute(from);
    const std::string dst = absolute(to);
    if (!enter("rename", src, true, err)) return false;
    if (!nodes_.count(src)) {
        err.set(ErrorKind::NotFound, "no such file: " + src);
        return false;
    }
    if (nodes_.count(dst) && !overwrite) {
        err.set(ErrorKind::AlreadyExists, "file exists: " + dst);
        return false;
    }
    if (!requireParentDir(dst, err)) return false;
    // Move the node and everything below it.
    std::map<std::string, Node> moved;
    for (auto it = nodes_.begin(); it != nodes_.end();) {
        const std::string& p = it->first;
        if (p == src || (p.size() > src.size() && p.compare(0, src.size(), src) == 0 && p[src.size()] == '/')) {
            moved[dst + p.substr(src.size())] = it->second;
            it = nodes_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto& kv : moved) nodes_[kv.first] = std::move(kv.second);
    return true;
}

bool MockSftpClient::chmod(const std::string& remote_path, std::uint32_t mode, Error& err) {
    const std::string path = absolute(remote_path);
    if (!enter("chmod", path, true, err)) return false;
    std::string real;
    if (!resolve(path, real, err)) return false;
    Node& n = nodes_.at(real);
    n.mode = (n.mode & S_IFMT) | (mode & 07777);
    return true;
}

bool MockSftpClient::symlink(const std::string& target, const std::string& link_path, Error& err) {
    const std::string path = absolute(link_path);
    if (!enter("symlink", path, true, err)) return false;
    if (nodes_.count(path)) {
        err.set(ErrorKind::AlreadyExists, "file exists: " + path);
        return false;
    }
    if (!requireParentDir(path, err)) return false;
    nodes_[path] = Node{S_IFLNK | 0777, {}, target};
    return true;
}

bool MockSftpClient::exec(const ExecRequest& req, ExecResult& out, Error& err) {
    if (!enter("exec", {}, false, err)) return false;
    execLog_.push_back(req);
    out = ExecResult{};
    if (execHandler_) return execHandler_(req, out, err);
    return true;
}

} // namespace sshutils
