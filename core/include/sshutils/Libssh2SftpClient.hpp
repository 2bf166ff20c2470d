// SftpClient implementation using libssh2 for SSH/SFTP.
// Encapsulates the SSH session, SFTP channel, and TCP socket.
#pragma once
#include "SftpClient.hpp"
#include <string>
#include <vector>

// Forward declarations of libssh2 internal types (with leading underscore)
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace sshutils {

class Libssh2SftpClient : public SftpClient {
public:
    Libssh2SftpClient();
    ~Libssh2SftpClient() override;

    bool connect(const SessionOptions& opt, Error& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    bool openChannel(Error& err) override;
    bool hasChannel() const override { return sftp_ != nullptr; }

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
    bool connected_ = false;
    int  sock_ = -1;
    _LIBSSH2_SESSION* session_ = nullptr; // <- uses internal libssh2 types
    _LIBSSH2_SFTP*    sftp_    = nullptr; // <- same

    // TCP connection + SSH handshake and authentication.
    bool tcpConnect(const std::string& host, uint16_t port, Error& err);
    bool verifyHostKey(const SessionOptions& opt, Error& err);
    bool authenticate(const SessionOptions& opt, Error& err);

    bool requireChannel(Error& err) const;
    bool statImpl(const std::string& remote_path, int statType, FileInfo& info, Error& err);
    // Translate the last libssh2/SFTP failure into err; "what" names the call.
    void fail(Error& err, const std::string& what);
    bool waitSocket() const;
};

} // namespace sshutils
