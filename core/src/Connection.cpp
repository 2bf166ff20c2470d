#include "sshutils/Connection.hpp"
#include "sshutils/Libssh2SftpClient.hpp"
#include "sshutils/Log.hpp"
#include <cstdlib>

namespace sshutils {

namespace {

const char* kRemoteTag = "SSHConnection";
const char* kLocalTag = "LocalConnection";

std::string boolText(bool b) { return b ? "True" : "False"; }

bool parseBool(const std::string& s, bool& out) {
    if (s == "True" || s == "true" || s == "1") {
        out = true;
        return true;
    }
    if (s == "False" || s == "false" || s == "0") {
        out = false;
        return true;
    }
    return false;
}

bool parsePort(const std::string& s, int& out) {
    if (s.empty() || s.size() > 5) return false;
    int v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    if (v < 1 || v > 65535) return false;
    out = v;
    return true;
}

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(' ');
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(' ');
    return s.substr(b, e - b + 1);
}

} // namespace

std::string ConnectionDescriptor::toString() const {
    std::string s = "<";
    s += local ? kLocalTag : kRemoteTag;
    s += ":" + serverName + ">(";
    s += "user_name:" + username;
    s += " | rsa_key:" + (keyFile ? *keyFile : std::string("None"));
    s += " | address:" + address;
    s += " | port:" + std::to_string(port);
    s += " | thread_safe:" + boolText(threadSafe);
    s += ")";
    return s;
}

bool ConnectionDescriptor::fromString(const std::string& s, ConnectionDescriptor& out, Error& err) {
    auto bad = [&](const std::string& why) {
        err.set(ErrorKind::InvalidArgument, "malformed connection descriptor (" + why + "): " + s);
        return false;
    };
    if (s.size() < 4 || s.front() != '<' || s.back() != ')') return bad("framing");
    const auto close = s.find(">(");
    const auto colon = s.find(':');
    if (close == std::string::npos || colon == std::string::npos || colon > close) return bad("header");

    std::map<std::string, std::string> m;
    const std::string tag = s.substr(1, colon - 1);
    if (tag == kLocalTag) m["local"] = "True";
    else if (tag != kRemoteTag) return bad("unknown tag '" + tag + "'");
    m["server_name"] = s.substr(colon + 1, close - colon - 1);

    const std::string body = s.substr(close + 2, s.size() - close - 3);
    std::size_t pos = 0;
    while (pos <= body.size()) {
        auto bar = body.find('|', pos);
        if (bar == std::string::npos) bar = body.size();
        const std::string field = trim(body.substr(pos, bar - pos));
        pos = bar + 1;
        if (field.empty()) continue;
        const auto sep = field.find(':');
        if (sep == std::string::npos) return bad("field '" + field + "'");
        m[field.substr(0, sep)] = field.substr(sep + 1);
    }
    return fromMap(m, out, err);
}

std::map<std::string, std::string> ConnectionDescriptor::toMap() const {
    std::map<std::string, std::string> m;
    m["server_name"] = serverName;
    m["user_name"] = username;
    m["rsa_key"] = keyFile ? *keyFile : "None";
    m["address"] = address;
    m["port"] = std::to_string(port);
    m["thread_safe"] = boolText(threadSafe);
    m["local"] = boolText(local);
    return m;
}

bool ConnectionDescriptor::fromMap(const std::map<std::string, std::string>& m, ConnectionDescriptor& out,
                                   Error& err) {
    auto get = [&](const char* key) -> const std::string* {
        auto it = m.find(key);
        return it == m.end() ? nullptr : &it->second;
    };
    ConnectionDescriptor d;
    if (const auto* v = get("local")) {
        if (!parseBool(*v, d.local)) {
            err.set(ErrorKind::InvalidArgument, "local must be True or False, not '" + *v + "'");
            return false;
        }
    }
    const auto* name = get("server_name");
    const auto* addr = get("address");
    if (!name || name->empty()) {
        err.set(ErrorKind::InvalidArgument, "connection descriptor lacks server_name");
        return false;
    }
    if (!d.local && (!addr || addr->empty())) {
        err.set(ErrorKind::InvalidArgument, "connection descriptor for " + *name + " lacks address");
        return false;
    }
    d.serverName = *name;
    if (addr) d.address = *addr;
    if (const auto* v = get("user_name")) d.username = *v;
    if (const auto* v = get("rsa_key")) {
        if (!v->empty() && *v != "None") d.keyFile = *v;
    }
    if (const auto* v = get("port")) {
        if (!parsePort(*v, d.port)) {
            err.set(ErrorKind::InvalidArgument, "invalid port '" + *v + "'");
            return false;
        }
    }
    if (const auto* v = get("thread_safe")) {
        if (!parseBool(*v, d.threadSafe)) {
            err.set(ErrorKind::InvalidArgument, "thread_safe must be True or False, not '" + *v + "'");
            return false;
        }
    }
    out = std::move(d);
    return true;
}

SessionOptions ConnectionDescriptor::toSessionOptions() const {
    SessionOptions opt;
    opt.host = address;
    opt.port = static_cast<std::uint16_t>(port);
    opt.username = username;
    opt.private_key_path = keyFile;
    return opt;
}

bool ConnectionDescriptor::operator==(const ConnectionDescriptor& o) const {
    return serverName == o.serverName && address == o.address && username == o.username &&
           keyFile == o.keyFile && port == o.port && threadSafe == o.threadSafe && local == o.local;
}

std::unique_ptr<Connection> Connection::openRemote(const ConnectionDescriptor& desc, const RetryPolicy& policy,
                                                   const ClientFactory& factory, Error& err,
                                                   RetryGuard::Sleeper sleeper) {
    return openRemote(desc, desc.toSessionOptions(), policy, factory, err, std::move(sleeper));
}

std::unique_ptr<Connection> Connection::openRemote(const ConnectionDescriptor& desc, const SessionOptions& opt,
                                                   const RetryPolicy& policy, const ClientFactory& factory,
                                                   Error& err, RetryGuard::Sleeper sleeper) {
    if (desc.local) {
        err.set(ErrorKind::InvalidArgument, desc.serverName + " is a local connection");
        return nullptr;
    }
    std::unique_ptr<SftpClient> client = factory ? factory() : std::make_unique<Libssh2SftpClient>();
    if (!client) {
        err.set(ErrorKind::InvalidArgument, "client factory returned nothing for " + desc.serverName);
        return nullptr;
    }

    std::unique_ptr<Connection> c(new Connection());
    c->desc_ = desc;
    c->policy_ = policy;
    c->session_ = std::make_unique<Session>(std::move(client), opt, policy.authAttempts, desc.threadSafe);
    if (!c->session_->connect(err)) {
        LOGE("connection.open name=%s host=%s kind=%s", desc.serverName.c_str(), opt.host.c_str(),
             errorKindName(err.kind));
        return nullptr;
    }
    c->guard_ = std::make_unique<RetryGuard>(std::move(sleeper));
    c->remote_ = std::make_unique<RemoteFileSystem>(*c->session_, *c->guard_, policy);
    c->remoteRaw_ = std::make_unique<RemoteFileSystem>(c->remote_->unguarded());
    c->runner_ = std::make_unique<RemoteProcessRunner>(*c->session_, *c->guard_, policy);
    LOGI("connection.open name=%s host=%s port=%d user=%s", desc.serverName.c_str(), opt.host.c_str(),
         static_cast<int>(opt.port), opt.username.c_str());
    return c;
}

std::unique_ptr<Connection> Connection::openLocal(const std::string& name) {
    std::unique_ptr<Connection> c(new Connection());
    c->desc_.serverName = name;
    c->desc_.address = "localhost";
    c->desc_.local = true;
    if (const char* u = std::getenv("USER")) c->desc_.username = u;
    c->runner_ = std::make_unique<LocalProcessRunner>();
    return c;
}

Connection::~Connection() { close(); }

FileSystem& Connection::fs() {
    if (remote_) return *remote_;
    return local_;
}

bool Connection::downloadTree(const std::string& remoteRoot, const std::string& localRoot,
                              const TransferOptions& opts, TransferPlan& applied, Error& err) {
    return transferTree(remoteRoot, localRoot, TransferDirection::Download, opts, applied, err);
}

bool Connection::uploadTree(const std::string& localRoot, const std::string& remoteRoot,
                            const TransferOptions& opts, TransferPlan& applied, Error& err) {
    return transferTree(localRoot, remoteRoot, TransferDirection::Upload, opts, applied, err);
}

bool Connection::transferTree(const std::string& sourceRoot, const std::string& destRoot, TransferDirection dir,
                              const TransferOptions& opts, TransferPlan& applied, Error& err) {
    if (!remote_) {
        TreeTransferEngine engine(local_, local_);
        return engine.transfer(sourceRoot, destRoot, dir, opts, applied, err);
    }
    TreeTransferEngine engine(*remoteRaw_, local_);
    const char* what = dir == TransferDirection::Download ? "downloadTree" : "uploadTree";
    // Only a dropped transport restarts the tree; a failed copy is final.
    return guard_->run(*session_, policy_.excluding({ErrorKind::Io}), what, [&](Error& e) {
        return engine.transfer(sourceRoot, destRoot, dir, opts, applied, e);
    }, err);
}

bool Connection::copyFile(const std::string& src, const std::string& dst, TransferDirection dir,
                          ProgressCB progress, Error& err) {
    FileSystem& far = fs();
    return dir == TransferDirection::Download ? far.download(src, dst, std::move(progress), err)
                                              : far.upload(src, dst, std::move(progress), err);
}

bool Connection::run(const std::vector<std::string>& args, const RunOptions& opts, CompletedProcess& out,
                     Error& err) {
    return runner_->run(args, opts, out, err);
}

void Connection::close() {
    if (session_) session_->close();
}

RetryStats Connection::guardStats() const {
    return guard_ ? guard_->stats() : RetryStats{};
}

} // namespace sshutils
