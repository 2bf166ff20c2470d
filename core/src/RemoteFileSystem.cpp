#include "sshutils/RemoteFileSystem.hpp"

namespace sshutils {

RemoteFileSystem::RemoteFileSystem(Session& session, RetryGuard& guard, RetryPolicy policy, bool guarded)
    : session_(session), guard_(guard), policy_(std::move(policy)), guarded_(guarded) {}

bool RemoteFileSystem::stat(const std::string& path, FileInfo& info, Error& err) {
    return call("stat", [&](Error& e) { return session_.stat(path, info, e); }, err);
}

bool RemoteFileSystem::lstat(const std::string& path, FileInfo& info, Error& err) {
    return call("lstat", [&](Error& e) { return session_.lstat(path, info, e); }, err);
}

bool RemoteFileSystem::list(const std::string& path, std::vector<FileInfo>& out, Error& err) {
    return call("listdir", [&](Error& e) { return session_.list(path, out, e); }, err);
}

bool RemoteFileSystem::realpath(const std::string& path, std::string& out, Error& err) {
    return call("realpath", [&](Error& e) { return session_.realpath(path, out, e); }, err);
}

bool RemoteFileSystem::mkdir(const std::string& path, unsigned int mode, Error& err) {
    return call("mkdir", [&](Error& e) { return session_.mkdir(path, mode, e); }, err);
}

bool RemoteFileSystem::removeFile(const std::string& path, Error& err) {
    return call("unlink", [&](Error& e) { return session_.removeFile(path, e); }, err);
}

bool RemoteFileSystem::removeDir(const std::string& path, Error& err) {
    return call("rmdir", [&](Error& e) { return session_.removeDir(path, e); }, err);
}

bool RemoteFileSystem::rename(const std::string& from, const std::string& to, bool overwrite, Error& err) {
    return call("rename", [&](Error& e) { return session_.rename(from, to, overwrite, e); }, err);
}

bool RemoteFileSystem::chmod(const std::string& path, std::uint32_t mode, Error& err) {
    return call("chmod", [&](Error& e) { return session_.chmod(path, mode, e); }, err);
}

bool RemoteFileSystem::symlink(const std::string& target, const std::string& link_path, Error& err) {
    return call("symlink", [&](Error& e) { return session_.symlink(target, link_path, e); }, err);
}

std::unique_ptr<FileHandle> RemoteFileSystem::open(const std::string& path, const OpenFlags& flags,
                                                   std::uint32_t mode, Error& err) {
    std::unique_ptr<FileHandle> h;
    call("open", [&](Error& e) {
        h = session_.open(path, flags, mode, e);
        return h != nullptr;
    }, err);
    return h;
}

bool RemoteFileSystem::download(const std::string& src, const std::string& localDst,
                                ProgressCB progress, Error& err) {
    return call("get", [&](Error& e) { return session_.get(src, localDst, e, progress); }, err);
}

bool RemoteFileSystem::upload(const std::string& localSrc, const std::string& dst,
                              ProgressCB progress, Error& err) {
    return call("put", [&](Error& e) { return session_.put(localSrc, dst, e, progress); }, err);
}

} // namespace sshutils
