// Simulated SSH/SFTP transport for tests: an in-memory remote filesystem with
// scripted exec results and injectable faults.
#pragma once
#include "SftpClient.hpp"
#include <map>
#include <optional>

namespace sshutils {

class MockSftpClient : public SftpClient {
public:
    using ExecHandler = std::function<bool(const ExecRequest&, ExecResult&, Error&)>;

    MockSftpClient();

    // Remote tree seeding. Parents are created as needed.
    void addDir(const std::string& path, std::uint32_t perms = 0755);
    void addFile(const std::string& path, const std::string& content, std::uint32_t perms = 0644);
    void addSymlink(const std::string& link_path, const std::string& target);
    // Any other node type (socket, fifo, device), given by its S_IF* bits.
    void addSpecial(const std::string& path, std::uint32_t typeBits);
    void setHome(const std::string& home) { home_ = home; }

    bool hasPath(const std::string& path) const;
    std::optional<std::string> fileContent(const std::string& path) const;

    // The next "times" calls of op (optionally only on path) fail with kind.
    // ConnectionLost also drops the transport, ChannelLost the SFTP channel.
    void injectFault(const std::string& op, ErrorKind kind, int times = 1, const std::string& path = {});
    void failConnect(ErrorKind kind, int times = 1);
    void failChannel(int times = 1);
    void dropConnection();

    int calls(const std::string& op) const;
    int connectCount() const { return connects_; }
    int channelOpenCount() const { return channelOpens_; }
    const SessionOptions& lastOptions() const { return lastOpt_; }

    void setExecHandler(ExecHandler h) { execHandler_ = std::move(h); }
    const std::vector<ExecRequest>& execLog() const { return execLog_; }

    // Bytes per chunk for get/put progress.
    void setChunkSize(std::size_t n) { chunk_ = n ? n : 1; }

    bool connect(const SessionOptions& opt, Error& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    bool openChannel(Error& err) override;
    bool hasChannel() const override { return channel_; }

    bool list(const std::string& remote_path,
              std::vector<FileInfo>& out,
              Error& err) override;

    bool stat(const std::string& remote_path, FileInfo& info, Error& err) override;
    bool lstat(const std::string& remote_path, FileInfo& info, Error& err) override;
    bool realpath(const std::string& remote_path, std::string& out, Error& err) override;

    bool get(const std::string& remote,
             const std::string& local,
             Error& err,
             ProgressCB progress) override;

    bool put(const std::string& local,
             const std::string& remote,
             Error& err,
             ProgressCB progress) override;

    std::unique_ptr<FileHandle> open(const std::string& remote_path,
                                     const OpenFlags& flags,
                                     std::uint32_t mode,
                                     Error& err) override;

    bool mkdir(const std::string& remote_dir,
               Error& err,
               unsigned int mode = 0755) override;

    bool removeFile(const std::string& remote_path, Error& err) override;

    bool removeDir(const std::string& remote_dir, Error& err) override;

    bool rename(const std::string& from,
                const std::string& to,
                Error& err,
                bool overwrite = false) override;

    bool chmod(const std::string& remote_path, std::uint32_t mode, Error& err) override;

    bool symlink(const std::string& target, const std::string& link_path, Error& err) override;

    bool exec(const ExecRequest& req, ExecResult& out, Error& err) override;

private:
    struct Node {
        std::uint32_t mode = 0;
        std::string content;
        std::string target; // symlinks only
    };
    struct Fault {
        std::string op;
        std::string path;
        ErrorKind kind;
        int times;
    };

    friend class MockFileHandle;

    bool connected_ = false;
    bool channel_ = false;
    SessionOptions lastOpt_{};
    std::string home_ = "/";
    std::size_t chunk_ = 64 * 1024;

    std::map<std::string, Node> nodes_;
    std::vector<Fault> faults_;
    std::vector<ErrorKind> connectFaults_;
    int channelFaults_ = 0;
    std::map<std::string, int> calls_;
    int connects_ = 0;
    int channelOpens_ = 0;
    ExecHandler execHandler_;
    std::vector<ExecRequest> execLog_;

    std::string absolute(const std::string& path) const;
    // Counts the call, checks transport/channel and pending faults.
    bool enter(const std::string& op, const std::string& path, bool needsChannel, Error& err);
    // Follows symlinks (max 8 hops); out is the final node path.
    bool resolve(const std::string& path, std::string& out, Error& err) const;
    // Follows symlinks in every component but the last.
    bool resolveParent(const std::string& path, std::string& out, Error& err) const;
    bool requireParentDir(const std::string& path, Error& err) const;
    FileInfo infoFor(const std::string& path, const Node& n) const;
    void makeParents(const std::string& path);
};

} // namespace sshutils
