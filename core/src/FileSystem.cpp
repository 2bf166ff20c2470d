#include "sshutils/FileSystem.hpp"
#include "sshutils/PathUtil.hpp"

namespace sshutils {

bool FileSystem::exists(const std::string& path, bool& isDir, Error& err) {
    isDir = false;
    FileInfo info;
    Error e;
    if (stat(path, info, e)) {
        isDir = info.isDir();
        return true;
    }
    if (e.kind == ErrorKind::NotFound) {
        // A dangling symlink still exists as an entry.
        Error le;
        if (lstat(path, info, le)) return true;
        return false;
    }
    err = e;
    return false;
}

bool FileSystem::kindOf(const std::string& path, bool followLinks, FileKind& kind, Error& err) {
    FileInfo info;
    if (!(followLinks ? stat(path, info, err) : lstat(path, info, err))) return false;
    kind = info.kind();
    return true;
}

bool FileSystem::isDir(const std::string& path) {
    FileInfo info;
    Error e;
    return stat(path, info, e) && info.isDir();
}

bool FileSystem::isFile(const std::string& path) {
    FileInfo info;
    Error e;
    return stat(path, info, e) && info.kind() == FileKind::File;
}

bool FileSystem::makedirs(const std::string& path, unsigned int mode, bool existOk, Error& err) {
    FileInfo info;
    Error e;
    if (stat(path, info, e)) {
        if (!info.isDir()) {
            err.set(ErrorKind::NotADirectory, "not a directory: " + path);
            return false;
        }
        if (existOk) return true;
        err.set(ErrorKind::AlreadyExists, "directory exists: " + path);
        return false;
    }
    if (e.kind != ErrorKind::NotFound) {
        err = e;
        return false;
    }
    const std::string parent = parentPath(path);
    if (parent != path && parent != "." && !makedirs(parent, mode, true, err)) return false;
    e.clear();
    if (!mkdir(path, mode, e)) {
        // Lost a race with another creator.
        if (e.kind == ErrorKind::AlreadyExists && isDir(path)) return true;
        err = e;
        return false;
    }
    return true;
}

std::unique_ptr<TextFile> FileSystem::openFile(const std::string& path, const OpenSpec& spec, Error& err) {
    FileInfo info;
    Error e;
    const bool present = stat(path, info, e);
    if (!present && e.kind != ErrorKind::NotFound) {
        err = e;
        return nullptr;
    }
    if (present && info.isDir()) {
        err.set(ErrorKind::IsADirectory, "is a directory: " + path);
        return nullptr;
    }
    if (spec.flags.read && !spec.flags.create && (!present || info.kind() != FileKind::File)) {
        err.set(ErrorKind::NotFound, "not a file: " + path);
        return nullptr;
    }
    auto raw = open(path, spec.flags, 0644, err);
    if (!raw) return nullptr;
    return std::make_unique<TextFile>(std::move(raw), spec, path);
}

} // namespace sshutils
