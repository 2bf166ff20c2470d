// FileSystem on a remote host: every operation runs a Session primitive
// through RetryGuard with the filesystem's retry policy.
#pragma once
#include "FileSystem.hpp"
#include "RetryGuard.hpp"
#include "Session.hpp"

namespace sshutils {

class RemoteFileSystem : public FileSystem {
public:
    RemoteFileSystem(Session& session, RetryGuard& guard, RetryPolicy policy, bool guarded = true);

    // Same session without the guard; for code that is itself wrapped in one guarded call.
    RemoteFileSystem unguarded() const { return RemoteFileSystem(session_, guard_, policy_, false); }

    bool isGuarded() const { return guarded_; }
    const RetryPolicy& policy() const { return policy_; }
    void setPolicy(RetryPolicy p) { policy_ = std::move(p); }
    Session& session() { return session_; }
    RetryGuard& guard() { return guard_; }

    bool isRemote() const override { return true; }
    std::string name() const override { return session_.host(); }

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

    bool download(const std::string& src, const std::string& localDst,
                  ProgressCB progress, Error& err) override;
    bool upload(const std::string& localSrc, const std::string& dst,
                ProgressCB progress, Error& err) override;

private:
    Session& session_;
    RetryGuard& guard_;
    RetryPolicy policy_;
    bool guarded_;

    template <class F>
    bool call(const char* what, F&& fn, Error& err) {
        if (!guarded_) return fn(err);
        return guard_.run(session_, policy_, what, fn, err);
    }
};

} // namespace sshutils
