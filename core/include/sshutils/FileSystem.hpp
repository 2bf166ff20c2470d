// Filesystem capability interface, implemented once for the local machine and
// once for a remote host behind a Session.
#pragma once
#include "SftpClient.hpp"
#include "TextFile.hpp"
#include <memory>
#include <string>
#include <vector>

namespace sshutils {

class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual bool isRemote() const = 0;
    // "local" or the remote host name.
    virtual std::string name() const = 0;

    virtual bool stat(const std::string& path, FileInfo& info, Error& err) = 0;
    virtual bool lstat(const std::string& path, FileInfo& info, Error& err) = 0;
    virtual bool list(const std::string& path, std::vector<FileInfo>& out, Error& err) = 0;
    virtual bool realpath(const std::string& path, std::string& out, Error& err) = 0;

    virtual bool mkdir(const std::string& path, unsigned int mode, Error& err) = 0;
    virtual bool removeFile(const std::string& path, Error& err) = 0;
    virtual bool removeDir(const std::string& path, Error& err) = 0;
    virtual bool rename(const std::string& from, const std::string& to, bool overwrite, Error& err) = 0;
    virtual bool chmod(const std::string& path, std::uint32_t mode, Error& err) = 0;
    virtual bool symlink(const std::string& target, const std::string& link_path, Error& err) = 0;

    virtual std::unique_ptr<FileHandle> open(const std::string& path, const OpenFlags& flags,
                                             std::uint32_t mode, Error& err) = 0;

    // Copy a file of this filesystem to a local path, and the reverse.
    virtual bool download(const std::string& src, const std::string& localDst,
                          ProgressCB progress, Error& err) = 0;
    virtual bool upload(const std::string& localSrc, const std::string& dst,
                        ProgressCB progress, Error& err) = 0;

    // Check existence (err stays empty if "does not exist").
    bool exists(const std::string& path, bool& isDir, Error& err);
    // Kind of the entry; a missing path is a NotFound error.
    bool kindOf(const std::string& path, bool followLinks, FileKind& kind, Error& err);
    bool isDir(const std::string& path);
    bool isFile(const std::string& path);
    // mkdir -p; an existing final directory is an error unless existOk.
    bool makedirs(const std::string& path, unsigned int mode, bool existOk, Error& err);
    // Open with a parsed mode; reading something that is not a regular file is NotFound.
    std::unique_ptr<TextFile> openFile(const std::string& path, const OpenSpec& spec, Error& err);
    // Absolute path of the working (home) directory.
    bool cwd(std::string& out, Error& err) { return realpath(".", out, err); }
};

} // namespace sshutils
