// FileSystem on the local machine (POSIX calls).
#pragma once
#include "FileSystem.hpp"

namespace sshutils {

class LocalFileSystem : public FileSystem {
public:
    LocalFileSystem() = default;

    bool isRemote() const override { return false; }
    std::string name() const override { return "local"; }

    bool stat(const std::string& path, FileInfo& info, Error& err) override;
    bool lstat(const std::string& path, FileInfo& info, Error& err) override;
    bool list(const std::string& path, std::vector<FileInfo>& out, Error& err) override;
    bool realpath(const std::string& path, std::string& out, Error& err) override;

    bool mkdir(const std::string& path, unsigned int mode, Error& err) override;
    bool removeFile(const std::string& path, Error& err) override;
    bool removeDir(const std::string& path, Error& err) override;
    bool rename(const std::string& from, const std::string& to, bool overwrite, Error& err) override;
    bool chmod(const std::string& path, std::uint32_t mode, Error& err) override;
    bool symlink(const std::string& target, const std::string& link_path, Error& err) override;

    std::unique_ptr<FileHandle> open(const std::string& path, const OpenFlags& flags,
                                     std::uint32_t mode, Error& err) override;

    // Both directions are a chunked local copy reporting progress per chunk.
    bool download(const std::string& src, const std::string& localDst,
                  ProgressCB progress, Error& err) override;
    bool upload(const std::string& localSrc, const std::string& dst,
                ProgressCB progress, Error& err) override;

    bool copy(const std::string& src, const std::string& dst, ProgressCB progress, Error& err);
};

} // namespace sshutils
