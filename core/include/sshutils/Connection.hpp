// A connection to one host (or the local machine): session, retry guard,
// filesystem, process runner and tree transfer behind one object.
#pragma once
#include "FileSystem.hpp"
#include "FileTree.hpp"
#include "LocalFileSystem.hpp"
#include "PathProxy.hpp"
#include "ProcessRunner.hpp"
#include "RemoteFileSystem.hpp"
#include "RetryGuard.hpp"
#include "Session.hpp"
#include "TreeTransfer.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace sshutils {

// Flat, persistable form of a connection.
struct ConnectionDescriptor {
    std::string serverName;
    std::string address;
    std::string username;
    std::optional<std::string> keyFile;
    int port = 22;
    bool threadSafe = false;
    bool local = false;

    // <SSHConnection:NAME>(user_name:U | rsa_key:K | address:A | port:P | thread_safe:B)
    // Local connections use the LocalConnection tag.
    std::string toString() const;
    static bool fromString(const std::string& s, ConnectionDescriptor& out, Error& err);

    std::map<std::string, std::string> toMap() const;
    static bool fromMap(const std::map<std::string, std::string>& m, ConnectionDescriptor& out, Error& err);

    SessionOptions toSessionOptions() const;

    bool operator==(const ConnectionDescriptor& o) const;
    bool operator!=(const ConnectionDescriptor& o) const { return !(*this == o); }
};

using ClientFactory = std::function<std::unique_ptr<SftpClient>()>;

class Connection {
public:
    // Connects (authentication bounded by policy.authAttempts); the SFTP channel opens on first use.
    // An empty factory selects the libssh2 client.
    static std::unique_ptr<Connection> openRemote(const ConnectionDescriptor& desc, const RetryPolicy& policy,
                                                  const ClientFactory& factory, Error& err,
                                                  RetryGuard::Sleeper sleeper = {});
    // Same, with explicit session options (password, host key policy, callbacks).
    static std::unique_ptr<Connection> openRemote(const ConnectionDescriptor& desc, const SessionOptions& opt,
                                                  const RetryPolicy& policy, const ClientFactory& factory,
                                                  Error& err, RetryGuard::Sleeper sleeper = {});
    static std::unique_ptr<Connection> openLocal(const std::string& name = "local");

    ~Connection();
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    bool isRemote() const { return session_ != nullptr; }
    const std::string& name() const { return desc_.serverName; }
    const ConnectionDescriptor& descriptor() const { return desc_; }

    // Guarded per call for a remote connection.
    FileSystem& fs();
    LocalFileSystem& localFs() { return local_; }
    ProcessRunner& runner() { return *runner_; }
    FileTree tree() { return FileTree(fs()); }
    PathProxy path(const std::string& p) { return PathProxy(fs(), p); }

    // Whole-tree copies. The guard wraps the entire transfer and restarts it from
    // the beginning after a repaired transport or channel fault; Io is not retried.
    bool downloadTree(const std::string& remoteRoot, const std::string& localRoot,
                      const TransferOptions& opts, TransferPlan& applied, Error& err);
    bool uploadTree(const std::string& localRoot, const std::string& remoteRoot,
                    const TransferOptions& opts, TransferPlan& applied, Error& err);
    bool transferTree(const std::string& sourceRoot, const std::string& destRoot, TransferDirection dir,
                      const TransferOptions& opts, TransferPlan& applied, Error& err);

    // Single file in either direction.
    bool copyFile(const std::string& src, const std::string& dst, TransferDirection dir,
                  ProgressCB progress, Error& err);

    bool run(const std::vector<std::string>& args, const RunOptions& opts, CompletedProcess& out, Error& err);

    // Idempotent.
    void close();

    Session* session() { return session_.get(); }
    const RetryPolicy& policy() const { return policy_; }
    RetryStats guardStats() const;

private:
    Connection() = default;

    ConnectionDescriptor desc_;
    RetryPolicy policy_;
    std::unique_ptr<Session> session_;
    std::unique_ptr<RetryGuard> guard_;
    std::unique_ptr<RemoteFileSystem> remote_;
    std::unique_ptr<RemoteFileSystem> remoteRaw_;
    LocalFileSystem local_;
    std::unique_ptr<ProcessRunner> runner_;
};

} // namespace sshutils
