// Abstract interface for SSH/SFTP transport primitives. Concrete implementations
// (libssh2, in-memory mock) follow this API so Session stays backend agnostic.
#pragma once
#include "Error.hpp"
#include "SftpTypes.hpp"
#include <memory>

namespace sshutils {

// Open file on either side of the connection.
class FileHandle {
public:
    virtual ~FileHandle() = default;

    // Reads up to n bytes; got == 0 means EOF.
    virtual bool read(char* buf, std::size_t n, std::size_t& got, Error& err) = 0;
    virtual bool write(const char* buf, std::size_t n, Error& err) = 0;
    virtual bool close(Error& err) = 0;

    bool readAll(std::string& out, Error& err);
    bool writeAll(const std::string& data, Error& err) { return write(data.data(), data.size(), err); }
};

class SftpClient {
public:
    virtual ~SftpClient() = default;

    // Transport: TCP, handshake, host key check and authentication.
    virtual bool connect(const SessionOptions& opt, Error& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // SFTP subsystem on top of an authenticated transport.
    virtual bool openChannel(Error& err) = 0;
    virtual bool hasChannel() const = 0;

    // Directory listing without "." and ".."; entries carry lstat-style mode bits.
    virtual bool list(const std::string& remote_path,
                      std::vector<FileInfo>& out,
                      Error& err) = 0;

    // Metadata following symlinks (stat) or not (lstat). Missing path is NotFound.
    virtual bool stat(const std::string& remote_path, FileInfo& info, Error& err) = 0;
    virtual bool lstat(const std::string& remote_path, FileInfo& info, Error& err) = 0;

    virtual bool realpath(const std::string& remote_path, std::string& out, Error& err) = 0;

    // Download a remote file to local
    virtual bool get(const std::string& remote,
                     const std::string& local,
                     Error& err,
                     ProgressCB progress = {}) = 0;

    // Upload a local file to remote (create/truncate)
    virtual bool put(const std::string& local,
                     const std::string& remote,
                     Error& err,
                     ProgressCB progress = {}) = 0;

    virtual std::unique_ptr<FileHandle> open(const std::string& remote_path,
                                             const OpenFlags& flags,
                                             std::uint32_t mode,
                                             Error& err) = 0;

    virtual bool mkdir(const std::string& remote_dir,
                       Error& err,
                       unsigned int mode = 0755) = 0;

    virtual bool removeFile(const std::string& remote_path, Error& err) = 0;

    virtual bool removeDir(const std::string& remote_dir, Error& err) = 0;

    virtual bool rename(const std::string& from,
                        const std::string& to,
                        Error& err,
                        bool overwrite = false) = 0;

    // Change permissions (POSIX mode, e.g. 0644)
    virtual bool chmod(const std::string& remote_path, std::uint32_t mode, Error& err) = 0;

    // Create link_path pointing at target
    virtual bool symlink(const std::string& target, const std::string& link_path, Error& err) = 0;

    // Run a command on the transport (needs no SFTP channel).
    virtual bool exec(const ExecRequest& req, ExecResult& out, Error& err) = 0;
};

} // namespace sshutils
