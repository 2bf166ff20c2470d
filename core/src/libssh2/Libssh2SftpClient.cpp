// libssh2 backend: manages TCP socket, SSH session, SFTP channel and exec channels.
// Includes keepalive and known_hosts validation.
#include "sshutils/Libssh2SftpClient.hpp"
#include "sshutils/Log.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>
#include <chrono>
#include <thread>
#include <cstdlib>
#include <cstdio>
#include <mutex>
#include <sstream>

// POSIX sockets
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

namespace sshutils {

namespace {

constexpr std::size_t kChunk = 64 * 1024;

// Context for keyboard-interactive: respond with username/password based on the prompt
struct KbdIntCtx {
    const char* user;
    const char* pass;
    const KbdIntPromptsCB* cb;
};

char* dupResponse(const std::string& s, unsigned int& len) {
    len = 0;
    if (s.empty()) return nullptr;
    char* buf = static_cast<char*>(std::malloc(s.size() + 1));
    if (!buf) return nullptr;
    std::memcpy(buf, s.data(), s.size());
    buf[s.size()] = '\0';
    len = static_cast<unsigned int>(s.size());
    return buf;
}

bool promptAsksForUser(const char* prompt) {
    std::string p(prompt ? prompt : "");
    for (auto& c : p) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return p.find("user") != std::string::npos || p.find("name") != std::string::npos;
}

void kbintCallback(const char* name, int name_len,
                   const char* instruction, int instruction_len,
                   int num_prompts,
                   const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                   LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                   void** abstract) {
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);

    std::vector<std::string> texts;
    for (int i = 0; i < num_prompts; ++i) {
        const char* pt = (prompts && prompts[i].text) ? reinterpret_cast<const char*>(prompts[i].text) : "";
        texts.emplace_back(pt);
    }

    if (ctx->cb && *(ctx->cb) && num_prompts > 0) {
        std::vector<std::string> answers;
        std::string nm = (name && name_len > 0) ? std::string(name, static_cast<size_t>(name_len)) : std::string();
        std::string ins = (instruction && instruction_len > 0) ? std::string(instruction, static_cast<size_t>(instruction_len)) : std::string();
        if ((*(ctx->cb))(nm, ins, texts, answers) && static_cast<int>(answers.size()) >= num_prompts) {
            for (int i = 0; i < num_prompts; ++i)
                responses[i].text = dupResponse(answers[static_cast<size_t>(i)], responses[i].length);
            return;
        }
    }
    // Fallback: prompts mentioning "user" or "name" get the username, the rest the password.
    for (int i = 0; i < num_prompts; ++i) {
        const char* ans = promptAsksForUser(texts[static_cast<size_t>(i)].c_str()) ? ctx->user : ctx->pass;
        responses[i].text = dupResponse(ans ? ans : "", responses[i].length);
    }
}

ErrorKind kindFromSftpStatus(unsigned long status) {
    switch (status) {
        case LIBSSH2_FX_NO_SUCH_FILE:
        case LIBSSH2_FX_NO_SUCH_PATH:
            return ErrorKind::NotFound;
        case LIBSSH2_FX_PERMISSION_DENIED:
        case LIBSSH2_FX_WRITE_PROTECT:
            return ErrorKind::PermissionDenied;
        case LIBSSH2_FX_FILE_ALREADY_EXISTS:
            return ErrorKind::AlreadyExists;
        case LIBSSH2_FX_DIR_NOT_EMPTY:
            return ErrorKind::NotEmpty;
        case LIBSSH2_FX_NOT_A_DIRECTORY:
            return ErrorKind::NotADirectory;
        case LIBSSH2_FX_NO_CONNECTION:
        case LIBSSH2_FX_CONNECTION_LOST:
            return ErrorKind::ConnectionLost;
        case LIBSSH2_FX_BAD_MESSAGE:
            return ErrorKind::Protocol;
        case LIBSSH2_FX_OP_UNSUPPORTED:
        case LIBSSH2_FX_INVALID_FILENAME:
            return ErrorKind::InvalidArgument;
        default:
            return ErrorKind::Io;
    }
}

ErrorKind kindFromSessionErrno(int e) {
    switch (e) {
        case LIBSSH2_ERROR_SOCKET_NONE:
        case LIBSSH2_ERROR_SOCKET_SEND:
        case LIBSSH2_ERROR_SOCKET_RECV:
        case LIBSSH2_ERROR_SOCKET_DISCONNECT:
        case LIBSSH2_ERROR_SOCKET_TIMEOUT:
        case LIBSSH2_ERROR_TIMEOUT:
            return ErrorKind::ConnectionLost;
        case LIBSSH2_ERROR_CHANNEL_CLOSED:
        case LIBSSH2_ERROR_CHANNEL_EOF_SENT:
        case LIBSSH2_ERROR_CHANNEL_FAILURE:
        case LIBSSH2_ERROR_CHANNEL_UNKNOWN:
            return ErrorKind::ChannelLost;
        case LIBSSH2_ERROR_PROTO:
        case LIBSSH2_ERROR_KEX_FAILURE:
        case LIBSSH2_ERROR_DECRYPT:
            return ErrorKind::Protocol;
        case LIBSSH2_ERROR_AUTHENTICATION_FAILED:
        case LIBSSH2_ERROR_PUBLICKEY_UNVERIFIED:
        case LIBSSH2_ERROR_FILE:
            return ErrorKind::Auth;
        default:
            return ErrorKind::Io;
    }
}

std::string lastSessionMessage(LIBSSH2_SESSION* s) {
    if (!s) return {};
    char* msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(s, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<size_t>(len)) : std::string();
}

void fillInfo(const LIBSSH2_SFTP_ATTRIBUTES& a, FileInfo& fi) {
    if (a.flags & LIBSSH2_SFTP_ATTR_SIZE) fi.size = a.filesize;
    if (a.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) fi.mtime = a.mtime;
    if (a.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) fi.mode = static_cast<std::uint32_t>(a.permissions);
    if (a.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
        fi.uid = static_cast<std::uint32_t>(a.uid);
        fi.gid = static_cast<std::uint32_t>(a.gid);
    }
}

std::string hostKeyFingerprint(LIBSSH2_SESSION* session) {
#ifdef LIBSSH2_HOSTKEY_HASH_SHA256
    const int type = LIBSSH2_HOSTKEY_HASH_SHA256;
    const int len = 32;
    const char* label = "SHA256:";
#else
    const int type = LIBSSH2_HOSTKEY_HASH_SHA1;
    const int len = 20;
    const char* label = "SHA1:";
#endif
    const unsigned char* h = reinterpret_cast<const unsigned char*>(libssh2_hostkey_hash(session, type));
    if (!h) return {};
    std::ostringstream oss;
    oss << label;
    for (int i = 0; i < len; ++i) {
        if (i) oss << ':';
        char b[4];
        std::snprintf(b, sizeof(b), "%02X", static_cast<unsigned>(h[i]));
        oss << b;
    }
    return oss.str();
}

// Maps the session host key type to the knownhost mask bits and a display name.
int knownHostAlgorithm(int keytype, std::string& name) {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: name = "RSA"; return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        case LIBSSH2_HOSTKEY_TYPE_DSS: name = "DSA"; return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: name = "ECDSA-256"; return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: name = "ECDSA-384"; return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: name = "ECDSA-521"; return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519: name = "ED25519"; return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
        default: name = "UNKNOWN"; return 0;
    }
}

// Try up to three ssh-agent identities.
bool agentAuth(LIBSSH2_SESSION* session, const std::string& user) {
    bool authed = false;
    LIBSSH2_AGENT* agent = libssh2_agent_init(session);
    if (agent && libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey* identity = nullptr;
        struct libssh2_agent_publickey* prev = nullptr;
        int tries = 0;
        while (tries < 3 && libssh2_agent_get_identity(agent, &identity, prev) == 0) {
            prev = identity;
            ++tries;
            int rc;
            while ((rc = libssh2_agent_userauth(agent, user.c_str(), identity)) == LIBSSH2_ERROR_EAGAIN)
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            if (rc == 0) {
                authed = true;
                break;
            }
        }
    }
    if (agent) {
        libssh2_agent_disconnect(agent);
        libssh2_agent_free(agent);
    }
    return authed;
}

class Libssh2FileHandle : public FileHandle {
public:
    explicit Libssh2FileHandle(LIBSSH2_SFTP_HANDLE* h) : h_(h) {}
    ~Libssh2FileHandle() override {
        if (h_) libssh2_sftp_close(h_);
    }

    bool read(char* buf, std::size_t n, std::size_t& got, Error& err) override {
        got = 0;
        if (!h_) {
            err.set(ErrorKind::ChannelLost, "read on closed remote file");
            return false;
        }
        ssize_t rc = libssh2_sftp_read(h_, buf, n);
        if (rc < 0) {
            err.set(ErrorKind::Io, "remote read failed (rc=" + std::to_string(rc) + ")");
            return false;
        }
        got = static_cast<std::size_t>(rc);
        return true;
    }

    bool write(const char* buf, std::size_t n, Error& err) override {
        if (!h_) {
            err.set(ErrorKind::ChannelLost, "write on closed remote file");
            return false;
        }
        while (n > 0) {
            ssize_t w = libssh2_sftp_write(h_, buf, n);
            if (w < 0) {
                err.set(ErrorKind::Io, "remote write failed (rc=" + std::to_string(w) + ")");
                return false;
            }
            buf += w;
            n -= static_cast<std::size_t>(w);
        }
        return true;
    }

    bool close(Error& err) override {
        if (!h_) return true;
        int rc = libssh2_sftp_close(h_);
        h_ = nullptr;
        if (rc != 0) {
            err.set(ErrorKind::Io, "remote close failed");
            return false;
        }
        return true;
    }

private:
    LIBSSH2_SFTP_HANDLE* h_;
};

} // namespace

Libssh2SftpClient::Libssh2SftpClient() {
    // Global libssh2 initialization (once per process)
    static std::once_flag once;
    std::call_once(once, [] {
        if (libssh2_init(0) != 0) LOGE("libssh2_init failed");
    });
}

Libssh2SftpClient::~Libssh2SftpClient() {
    disconnect();
}

bool Libssh2SftpClient::tcpConnect(const std::string& host, uint16_t port, Error& err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const std::string portStr = std::to_string(port);
    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &res);
    if (gai != 0) {
        err.set(ErrorKind::ConnectFailed, std::string("getaddrinfo(") + host + "): " + gai_strerror(gai));
        return false;
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        // Timeouts are left to libssh2_session_set_timeout; only keepalive here.
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    err.set(ErrorKind::ConnectFailed, "could not connect to " + host + ":" + portStr);
    return false;
}

bool Libssh2SftpClient::verifyHostKey(const SessionOptions& opt, Error& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off) return true;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err.set(ErrorKind::ConnectFailed, "could not initialize known_hosts");
        return false;
    }
    struct Guard {
        LIBSSH2_KNOWNHOSTS* nh;
        ~Guard() { libssh2_knownhost_free(nh); }
    } guard{nh};

    std::string khPath;
    if (opt.known_hosts_path) {
        khPath = *opt.known_hosts_path;
    } else if (const char* home = std::getenv("HOME")) {
        khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = !khPath.empty() &&
                    libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        err.set(ErrorKind::Auth, "known_hosts missing or unreadable (strict policy): " + khPath);
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        err.set(ErrorKind::Protocol, "could not obtain host key");
        return false;
    }

    std::string algName;
    const int alg = knownHostAlgorithm(keytype, algName);
    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port, hostkey, keylen,
                                         LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port, hostkey, keylen,
                                         LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg, &host);
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) return true;

    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        err.set(ErrorKind::Auth, "host key for " + opt.host + " does not match known_hosts");
        return false;
    }
    if (opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        err.set(ErrorKind::Auth, "host " + opt.host + " not present in known_hosts");
        return false;
    }

    // TOFU
    const std::string fp = hostKeyFingerprint(session_);
    if (opt.hostkey_confirm_cb && !opt.hostkey_confirm_cb(opt.host, opt.port, algName, fp)) {
        err.set(ErrorKind::Auth, "unknown host key " + fp + " rejected");
        return false;
    }
    if (khPath.empty()) {
        err.set(ErrorKind::InvalidArgument, "known_hosts path not defined");
        return false;
    }
    int addrc = libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr, hostkey, keylen, nullptr, 0,
                                       LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg, nullptr);
    if (addrc != 0 || libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
        err.set(ErrorKind::Io, "could not record host in " + khPath);
        return false;
    }
    LOGI("known_hosts: added %s (%s %s)", opt.host.c_str(), algName.c_str(), fp.c_str());
    return true;
}

// Authentication order: explicit key file; password then keyboard-interactive;
// finally ssh-agent when the server offers publickey.
bool Libssh2SftpClient::authenticate(const SessionOptions& opt, Error& err) {
    const std::string& user = opt.username;

    if (opt.private_key_path) {
        const char* passphrase = opt.private_key_passphrase ? opt.private_key_passphrase->c_str() : nullptr;
        int rc;
        while ((rc = libssh2_userauth_publickey_fromfile(session_, user.c_str(), nullptr,
                                                         opt.private_key_path->c_str(),
                                                         passphrase)) == LIBSSH2_ERROR_EAGAIN)
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        if (rc != 0) {
            err.set(ErrorKind::Auth, "public key authentication failed with " + *opt.private_key_path +
                                         ": " + lastSessionMessage(session_));
            return false;
        }
        return true;
    }

    std::string authlist;
    auto methods = [&]() -> const std::string& {
        if (authlist.empty()) {
            char* m = libssh2_userauth_list(session_, user.c_str(), static_cast<unsigned>(user.size()));
            authlist = m ? std::string(m) : std::string();
        }
        return authlist;
    };

    if (opt.password) {
        int rc;
        while ((rc = libssh2_userauth_password(session_, user.c_str(), opt.password->c_str())) == LIBSSH2_ERROR_EAGAIN)
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        if (rc == 0) return true;

        // The server hung up: everything else would cascade-fail.
        if (rc == LIBSSH2_ERROR_SOCKET_DISCONNECT || rc == LIBSSH2_ERROR_SOCKET_SEND ||
            rc == LIBSSH2_ERROR_SOCKET_RECV) {
            err.set(ErrorKind::ConnectFailed, "server closed the connection after password attempt");
            return false;
        }
        if (methods().find("keyboard-interactive") != std::string::npos) {
            KbdIntCtx ctx{user.c_str(), opt.password->c_str(), &opt.keyboard_interactive_cb};
            void** abs = libssh2_session_abstract(session_);
            if (abs) *abs = &ctx;
            while ((rc = libssh2_userauth_keyboard_interactive(session_, user.c_str(), kbintCallback)) == LIBSSH2_ERROR_EAGAIN)
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            if (abs) *abs = nullptr;
            if (rc == 0) return true;
        }
    }

    if (methods().find("publickey") != std::string::npos && agentAuth(session_, user)) return true;

    err.set(ErrorKind::Auth, "authentication failed for " + user + "@" + opt.host +
                                 (authlist.empty() ? std::string() : " (methods: " + authlist + ")") +
                                 (opt.password ? std::string() : " (no password, key file or agent identity)"));
    return false;
}

bool Libssh2SftpClient::connect(const SessionOptions& opt, Error& err) {
    if (connected_) {
        err.set(ErrorKind::InvalidArgument, "already connected");
        return false;
    }
    if (!tcpConnect(opt.host, opt.port, err)) return false;

    session_ = libssh2_session_init();
    if (!session_) {
        err.set(ErrorKind::ConnectFailed, "libssh2_session_init failed");
        disconnect();
        return false;
    }
    if (libssh2_session_handshake(session_, sock_) != 0) {
        err.set(ErrorKind::ConnectFailed, "SSH handshake failed: " + lastSessionMessage(session_));
        disconnect();
        return false;
    }
    // Blocking mode and a bounded timeout so auth never spins on EAGAIN.
    libssh2_session_set_blocking(session_, 1);
#ifdef LIBSSH2_SESSION_TIMEOUT
    libssh2_session_set_timeout(session_, 20000);
#endif
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err) || !authenticate(opt, err)) {
        disconnect();
        return false;
    }
    connected_ = true;
    LOGD("libssh2: authenticated %s@%s:%u", opt.username.c_str(), opt.host.c_str(), static_cast<unsigned>(opt.port));
    return true;
}

bool Libssh2SftpClient::openChannel(Error& err) {
    if (!connected_) {
        err.set(ErrorKind::ConnectionLost, "not connected");
        return false;
    }
    if (sftp_) return true;
    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err.set(ErrorKind::ChannelOpen, "could not start SFTP subsystem: " + lastSessionMessage(session_));
        return false;
    }
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

bool Libssh2SftpClient::requireChannel(Error& err) const {
    if (!connected_) {
        err.set(ErrorKind::ConnectionLost, "not connected");
        return false;
    }
    if (!sftp_) {
        err.set(ErrorKind::ChannelLost, "SFTP channel not open");
        return false;
    }
    return true;
}

void Libssh2SftpClient::fail(Error& err, const std::string& what) {
    const int e = session_ ? libssh2_session_last_errno(session_) : LIBSSH2_ERROR_SOCKET_DISCONNECT;
    ErrorKind kind = kindFromSessionErrno(e);
    std::string detail;
    if (e == LIBSSH2_ERROR_SFTP_PROTOCOL && sftp_) {
        const unsigned long status = libssh2_sftp_last_error(sftp_);
        kind = kindFromSftpStatus(status);
        detail = "sftp status " + std::to_string(status);
    } else {
        detail = lastSessionMessage(session_);
    }
    err.set(kind, what + (detail.empty() ? std::string() : " (" + detail + ")"));
}

bool Libssh2SftpClient::list(const std::string& remote_path,
                             std::vector<FileInfo>& out,
                             Error& err) {
    if (!requireChannel(err)) return false;

    const std::string path = remote_path.empty() ? "/" : remote_path;
    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        fail(err, "opendir " + path);
        return false;
    }

    out.clear();
    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    for (;;) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename), longentry, sizeof(longentry), &attrs);
        if (rc == 0) break; // end of directory
        if (rc < 0) {
            fail(err, "readdir " + path);
            libssh2_sftp_closedir(dir);
            return false;
        }
        FileInfo fi{};
        fi.name.assign(filename, static_cast<size_t>(rc));
        if (fi.name == "." || fi.name == "..") continue;
        fillInfo(attrs, fi);
        out.push_back(std::move(fi));
    }
    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2SftpClient::statImpl(const std::string& remote_path, int statType, FileInfo& info, Error& err) {
    if (!requireChannel(err)) return false;
    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
                             statType, &st) != 0) {
        fail(err, "stat " + remote_path);
        // Some servers answer a missing path with a generic failure.
        if (err.kind == ErrorKind::Io && libssh2_sftp_last_error(sftp_) == LIBSSH2_FX_FAILURE)
            err.kind = ErrorKind::NotFound;
        return false;
    }
    info = FileInfo{};
    auto slash = remote_path.find_last_of('/');
    info.name = slash == std::string::npos ? remote_path : remote_path.substr(slash + 1);
    fillInfo(st, info);
    return true;
}

bool Libssh2SftpClient::stat(const std::string& remote_path, FileInfo& info, Error& err) {
    return statImpl(remote_path, LIBSSH2_SFTP_STAT, info, err);
}

bool Libssh2SftpClient::lstat(const std::string& remote_path, FileInfo& info, Error& err) {
    return statImpl(remote_path, LIBSSH2_SFTP_LSTAT, info, err);
}

bool Libssh2SftpClient::realpath(const std::string& remote_path, std::string& out, Error& err) {
    if (!requireChannel(err)) return false;
    char buf[4096];
    int rc = libssh2_sftp_realpath(sftp_, remote_path.c_str(), buf, sizeof(buf));
    if (rc < 0) {
        fail(err, "realpath " + remote_path);
        return false;
    }
    out.assign(buf, static_cast<size_t>(rc));
    return true;
}

// Download a remote file to local, reporting progress per chunk.
bool Libssh2SftpClient::get(const std::string& remote,
                            const std::string& local,
                            Error& err,
                            ProgressCB progress) {
    FileInfo st;
    if (!stat(remote, st, err)) return false;
    if (st.isDir()) {
        err.set(ErrorKind::IsADirectory, "cannot download directory " + remote);
        return false;
    }
    const std::uint64_t total = st.size;

    LIBSSH2_SFTP_HANDLE* rh = libssh2_sftp_open_ex(sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
                                                   LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        fail(err, "open " + remote + " for reading");
        return false;
    }
    FILE* lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        setFromErrno(err, errno, "open " + local + " for writing");
        libssh2_sftp_close(rh);
        return false;
    }

    std::vector<char> buf(kChunk);
    std::uint64_t done = 0;
    bool ok = true;
    for (;;) {
        ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n == 0) break; // EOF
        if (n < 0) {
            fail(err, "read " + remote);
            ok = false;
            break;
        }
        if (std::fwrite(buf.data(), 1, static_cast<size_t>(n), lf) != static_cast<size_t>(n)) {
            setFromErrno(err, errno, "write " + local);
            ok = false;
            break;
        }
        done += static_cast<std::uint64_t>(n);
        if (progress) progress(done, total);
    }
    if (std::fclose(lf) != 0 && ok) {
        setFromErrno(err, errno, "close " + local);
        ok = false;
    }
    libssh2_sftp_close(rh);
    return ok;
}

// Upload a local file to remote (create/truncate), reporting progress per chunk.
bool Libssh2SftpClient::put(const std::string& local,
                            const std::string& remote,
                            Error& err,
                            ProgressCB progress) {
    if (!requireChannel(err)) return false;

    FILE* lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        setFromErrno(err, errno, "open " + local + " for reading");
        return false;
    }
    std::fseek(lf, 0, SEEK_END);
    long fsz = std::ftell(lf);
    std::fseek(lf, 0, SEEK_SET);
    const std::uint64_t total = fsz > 0 ? static_cast<std::uint64_t>(fsz) : 0;

    LIBSSH2_SFTP_HANDLE* wh = libssh2_sftp_open_ex(sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
                                                   LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                                   0644, LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        std::fclose(lf);
        fail(err, "open " + remote + " for writing");
        return false;
    }

    std::vector<char> buf(kChunk);
    std::uint64_t done = 0;
    bool ok = true;
    while (ok) {
        size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n == 0) {
            if (std::ferror(lf)) {
                setFromErrno(err, errno, "read " + local);
                ok = false;
            }
            break; // EOF
        }
        const char* p = buf.data();
        size_t remain = n;
        while (remain > 0) {
            ssize_t w = libssh2_sftp_write(wh, p, remain);
            if (w < 0) {
                fail(err, "write " + remote);
                ok = false;
                break;
            }
            remain -= static_cast<size_t>(w);
            p += w;
            done += static_cast<std::uint64_t>(w);
        }
        if (ok && progress) progress(done, total);
    }
    libssh2_sftp_close(wh);
    std::fclose(lf);
    return ok;
}

std::unique_ptr<FileHandle> Libssh2SftpClient::open(const std::string& remote_path,
                                                    const OpenFlags& flags,
                                                    std::uint32_t mode,
                                                    Error& err) {
    if (!requireChannel(err)) return nullptr;
    unsigned long fx = 0;
    if (flags.read) fx |= LIBSSH2_FXF_READ;
    if (flags.write || flags.append) fx |= LIBSSH2_FXF_WRITE;
    if (flags.append) fx |= LIBSSH2_FXF_APPEND;
    if (flags.create) fx |= LIBSSH2_FXF_CREAT;
    if (flags.truncate) fx |= LIBSSH2_FXF_TRUNC;
    if (flags.exclusive) fx |= LIBSSH2_FXF_EXCL;

    LIBSSH2_SFTP_HANDLE* h = libssh2_sftp_open_ex(sftp_, remote_path.c_str(),
                                                  static_cast<unsigned>(remote_path.size()),
                                                  fx, static_cast<long>(mode), LIBSSH2_SFTP_OPENFILE);
    if (!h) {
        fail(err, "open " + remote_path);
        return nullptr;
    }
    if (flags.append) {
        // Not every server honours FXF_APPEND; position at the end explicitly.
        LIBSSH2_SFTP_ATTRIBUTES st{};
        if (libssh2_sftp_fstat_ex(h, &st, 0) == 0 && (st.flags & LIBSSH2_SFTP_ATTR_SIZE))
            libssh2_sftp_seek64(h, st.filesize);
    }
    return std::make_unique<Libssh2FileHandle>(h);
}

bool Libssh2SftpClient::mkdir(const std::string& remote_dir, Error& err, unsigned int mode) {
    if (!requireChannel(err)) return false;
    if (libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), static_cast<long>(mode)) != 0) {
        fail(err, "mkdir " + remote_dir);
        // Servers commonly report an existing directory as a generic failure.
        if (err.kind == ErrorKind::Io) {
            LIBSSH2_SFTP_ATTRIBUTES st{};
            if (libssh2_sftp_stat_ex(sftp_, remote_dir.c_str(), static_cast<unsigned>(remote_dir.size()),
                                     LIBSSH2_SFTP_STAT, &st) == 0)
                err.kind = ErrorKind::AlreadyExists;
        }
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeFile(const std::string& remote_path, Error& err) {
    if (!requireChannel(err)) return false;
    if (libssh2_sftp_unlink(sftp_, remote_path.c_str()) != 0) {
        fail(err, "unlink " + remote_path);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeDir(const std::string& remote_dir, Error& err) {
    if (!requireChannel(err)) return false;
    if (libssh2_sftp_rmdir(sftp_, remote_dir.c_str()) != 0) {
        fail(err, "rmdir " + remote_dir);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::rename(const std::string& from, const std::string& to, Error& err, bool overwrite) {
    if (!requireChannel(err)) return false;
    long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    if (overwrite) flags |= LIBSSH2_SFTP_RENAME_OVERWRITE;
    if (libssh2_sftp_rename_ex(sftp_, from.c_str(), static_cast<unsigned>(from.size()),
                               to.c_str(), static_cast<unsigned>(to.size()), flags) != 0) {
        fail(err, "rename " + from + " -> " + to);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::chmod(const std::string& remote_path, std::uint32_t mode, Error& err) {
    if (!requireChannel(err)) return false;
    LIBSSH2_SFTP_ATTRIBUTES a{};
    a.flags = LIBSSH2_SFTP_ATTR_PERMISSIONS;
    a.permissions = mode;
    if (libssh2_sftp_stat_ex(sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
                             LIBSSH2_SFTP_SETSTAT, &a) != 0) {
        fail(err, "chmod " + remote_path);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::symlink(const std::string& target, const std::string& link_path, Error& err) {
    if (!requireChannel(err)) return false;
    if (libssh2_sftp_symlink(sftp_, target.c_str(), const_cast<char*>(link_path.c_str())) != 0) {
        fail(err, "symlink " + link_path + " -> " + target);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::waitSocket() const {
    struct pollfd pfd{};
    pfd.fd = sock_;
    const int dir = libssh2_session_block_directions(session_);
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) pfd.events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) pfd.events |= POLLOUT;
    return ::poll(&pfd, 1, 20000) > 0;
}

bool Libssh2SftpClient::exec(const ExecRequest& req, ExecResult& out, Error& err) {
    if (!connected_) {
        err.set(ErrorKind::ConnectionLost, "not connected");
        return false;
    }
    out = ExecResult{};
    LIBSSH2_CHANNEL* ch = libssh2_channel_open_session(session_);
    if (!ch) {
        fail(err, "open exec channel");
        return false;
    }
    for (const auto& kv : req.env) {
        if (libssh2_channel_setenv_ex(ch, kv.first.c_str(), static_cast<unsigned>(kv.first.size()),
                                      kv.second.c_str(), static_cast<unsigned>(kv.second.size())) != 0)
            LOGW("exec: server refused environment variable %s", kv.first.c_str());
    }
    if (libssh2_channel_exec(ch, req.command.c_str()) != 0) {
        fail(err, "exec '" + req.command + "'");
        libssh2_channel_free(ch);
        return false;
    }
    if (!req.input.empty()) {
        const char* p = req.input.data();
        size_t remain = req.input.size();
        while (remain > 0) {
            ssize_t w = libssh2_channel_write(ch, p, remain);
            if (w < 0) {
                fail(err, "write stdin of '" + req.command + "'");
                libssh2_channel_free(ch);
                return false;
            }
            p += w;
            remain -= static_cast<size_t>(w);
        }
    }
    libssh2_channel_send_eof(ch);

    // Drain stdout and stderr together so neither window stalls the other.
    libssh2_session_set_blocking(session_, 0);
    char buf[16 * 1024];
    bool ok = true;
    for (;;) {
        ssize_t n1 = libssh2_channel_read(ch, buf, sizeof(buf));
        if (n1 > 0) out.stdout_data.append(buf, static_cast<size_t>(n1));
        ssize_t n2 = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
        if (n2 > 0) out.stderr_data.append(buf, static_cast<size_t>(n2));
        if ((n1 < 0 && n1 != LIBSSH2_ERROR_EAGAIN) || (n2 < 0 && n2 != LIBSSH2_ERROR_EAGAIN)) {
            fail(err, "read output of '" + req.command + "'");
            ok = false;
            break;
        }
        if (n1 > 0 || n2 > 0) continue;
        if (libssh2_channel_eof(ch)) break;
        if (!waitSocket()) {
            err.set(ErrorKind::ConnectionLost, "timed out waiting for '" + req.command + "'");
            ok = false;
            break;
        }
    }
    libssh2_session_set_blocking(session_, 1);

    if (ok) {
        libssh2_channel_close(ch);
        libssh2_channel_wait_closed(ch);
        out.exit_status = libssh2_channel_get_exit_status(ch);
    }
    libssh2_channel_free(ch);
    return ok;
}

} // namespace sshutils
