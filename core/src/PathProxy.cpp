#include "sshutils/PathProxy.hpp"
#include "sshutils/FileTree.hpp"
#include "sshutils/Log.hpp"
#include "sshutils/PathUtil.hpp"
#include <cstdlib>

namespace sshutils {

PathProxy::PathProxy(FileSystem& fs, std::string path)
    : fs_(&fs), path_(path.empty() ? std::string(".") : std::move(path)) {}

bool PathProxy::home(FileSystem& fs, PathProxy& out, Error& err) {
    if (!fs.isRemote()) {
        const char* h = std::getenv("HOME");
        if (h && *h) {
            out = PathProxy(fs, h);
            return true;
        }
    }
    // An SFTP server resolves "." to the login directory.
    std::string p;
    if (!fs.realpath(".", p, err)) return false;
    out = PathProxy(fs, p);
    return true;
}

bool PathProxy::cwd(FileSystem& fs, PathProxy& out, Error& err) {
    std::string p;
    if (!fs.cwd(p, err)) return false;
    out = PathProxy(fs, p);
    return true;
}

bool PathProxy::isAbsolute() const { return isAbsolutePath(path_); }

PathProxy PathProxy::operator/(const std::string& name) const {
    return PathProxy(*fs_, joinPath(path_, name));
}

PathProxy PathProxy::parent() const { return PathProxy(*fs_, parentPath(path_)); }

std::string PathProxy::name() const { return baseName(path_); }

std::string PathProxy::suffix() const {
    const std::string n = name();
    const auto dot = n.find_last_of('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == n.size()) return {};
    return n.substr(dot);
}

std::string PathProxy::stem() const {
    const std::string n = name();
    const std::string s = suffix();
    return n.substr(0, n.size() - s.size());
}

PathProxy PathProxy::withName(const std::string& name) const {
    return PathProxy(*fs_, joinPath(parentPath(path_), name));
}

PathProxy PathProxy::withSuffix(const std::string& suffix) const {
    return withName(stem() + suffix);
}

std::vector<std::string> PathProxy::parts() const { return splitPath(path_); }

bool PathProxy::resolve(PathProxy& out, Error& err) const {
    std::string p;
    if (!fs_->realpath(path_, p, err)) return false;
    out = PathProxy(*fs_, p);
    return true;
}

bool PathProxy::expanduser(PathProxy& out, Error& err) const {
    if (path_.empty() || path_.front() != '~') {
        out = *this;
        return true;
    }
    PathProxy h(*fs_, "/");
    if (!home(*fs_, h, err)) return false;
    out = PathProxy(*fs_, expandUser(path_, h.str()));
    return true;
}

bool PathProxy::iterdir(std::vector<PathProxy>& out, Error& err) const {
    out.clear();
    std::vector<FileInfo> entries;
    if (!fs_->list(path_, entries, err)) return false;
    for (const auto& e : entries) out.emplace_back(*fs_, joinPath(path_, e.name));
    return true;
}

bool PathProxy::glob(const std::string& pattern, std::vector<PathProxy>& out, Error& err) const {
    out.clear();
    std::vector<std::string> found;
    FileTree tree(*fs_);
    if (!tree.glob(path_, pattern, found, err)) return false;
    for (auto& p : found) out.emplace_back(*fs_, std::move(p));
    return true;
}

bool PathProxy::rglob(const std::string& pattern, std::vector<PathProxy>& out, Error& err) const {
    return glob("**/" + pattern, out, err);
}

bool PathProxy::hasKind(FileKind kind, bool followLinks) const {
    FileKind k = FileKind::Other;
    Error e;
    return fs_->kindOf(path_, followLinks, k, e) && k == kind;
}

bool PathProxy::isDir() const { return hasKind(FileKind::Directory, true); }
bool PathProxy::isFile() const { return hasKind(FileKind::File, true); }
bool PathProxy::isSymlink() const { return hasKind(FileKind::Symlink, false); }
bool PathProxy::isSocket() const { return hasKind(FileKind::Socket, true); }
bool PathProxy::isFifo() const { return hasKind(FileKind::Fifo, true); }
bool PathProxy::isBlockDevice() const { return hasKind(FileKind::BlockDevice, true); }
bool PathProxy::isCharDevice() const { return hasKind(FileKind::CharDevice, true); }

bool PathProxy::exists() const {
    return isDir() || isFile() || isSymlink() || isSocket() || isFifo() || isBlockDevice() ||
           isCharDevice();
}

bool PathProxy::stat(FileInfo& info, Error& err) const { return fs_->stat(path_, info, err); }
bool PathProxy::lstat(FileInfo& info, Error& err) const { return fs_->lstat(path_, info, err); }
bool PathProxy::chmod(std::uint32_t mode, Error& err) const { return fs_->chmod(path_, mode, err); }

bool PathProxy::mkdir(unsigned int mode, bool parents, bool existOk, Error& err) const {
    if (parents) return fs_->makedirs(path_, mode, existOk, err);
    Error e;
    if (fs_->mkdir(path_, mode, e)) return true;
    if (e.kind == ErrorKind::AlreadyExists && existOk && isDir()) return true;
    err = e;
    return false;
}

bool PathProxy::touch(std::uint32_t mode, bool existOk, Error& err) const {
    if (exists()) {
        if (existOk) return true;
        err.set(ErrorKind::AlreadyExists, "file exists: " + path_);
        return false;
    }
    OpenFlags flags{false, true, false, true, false, false};
    auto h = fs_->open(path_, flags, mode, err);
    if (!h) return false;
    return h->close(err);
}

bool PathProxy::unlink(bool missingOk, Error& err) const {
    FileInfo info;
    Error e;
    if (!fs_->lstat(path_, info, e)) {
        if (e.kind == ErrorKind::NotFound && missingOk) return true;
        err = e;
        return false;
    }
    if (info.isDir()) {
        err.set(ErrorKind::IsADirectory, "is a directory: " + path_);
        return false;
    }
    return fs_->removeFile(path_, err);
}

bool PathProxy::rmdir(Error& err) {
    FileTree tree(*fs_);
    if (!tree.rmtree(path_, false, err)) return false;
    LOGD("path.rmdir fs=%s path=%s", fs_->name().c_str(), path_.c_str());
    path_ = parentPath(path_);
    return true;
}

bool PathProxy::rename(const std::string& target, PathProxy& out, Error& err) const {
    if (!fs_->rename(path_, target, false, err)) return false;
    out = PathProxy(*fs_, target);
    return true;
}

bool PathProxy::replace(const std::string& target, PathProxy& out, Error& err) const {
    if (!fs_->rename(path_, target, true, err)) return false;
    out = PathProxy(*fs_, target);
    return true;
}

bool PathProxy::symlinkTo(const std::string& target, Error& err) const {
    return fs_->symlink(target, path_, err);
}

bool PathProxy::samefile(const PathProxy& other, bool& same, Error& err) const {
    same = false;
    if (fs_ != other.fs_) return true;
    std::string a, b;
    if (!fs_->realpath(path_, a, err) || !fs_->realpath(other.path_, b, err)) return false;
    same = a == b;
    return true;
}

std::unique_ptr<TextFile> PathProxy::open(const std::string& mode, const std::string& encoding,
                                          DecodeErrors errors, Error& err) const {
    OpenSpec spec;
    spec.encoding = encoding;
    spec.errors = errors;
    if (!OpenSpec::parse(mode, spec, err)) return nullptr;
    return fs_->openFile(path_, spec, err);
}

bool PathProxy::readAll(const std::string& mode, std::string& out, Error& err,
                        const std::string& encoding, DecodeErrors errors) const {
    auto f = open(mode, encoding, errors, err);
    if (!f) return false;
    if (!f->read(out, err)) return false;
    return f->close(err);
}

bool PathProxy::writeAll(const std::string& mode, const std::string& data, Error& err,
                         const std::string& encoding) const {
    auto f = open(mode, encoding, DecodeErrors::Strict, err);
    if (!f) return false;
    if (!f->write(data, err)) return false;
    return f->close(err);
}

bool PathProxy::readText(std::string& out, Error& err, const std::string& encoding,
                         DecodeErrors errors) const {
    return readAll("r", out, err, encoding, errors);
}

bool PathProxy::writeText(const std::string& data, Error& err, const std::string& encoding) const {
    return writeAll("w", data, err, encoding);
}

bool PathProxy::readBytes(std::string& out, Error& err) const {
    return readAll("rb", out, err, "utf-8", DecodeErrors::Strict);
}

bool PathProxy::writeBytes(const std::string& data, Error& err) const {
    return writeAll("wb", data, err, "utf-8");
}

} // namespace sshutils
