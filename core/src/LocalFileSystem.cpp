#include "sshutils/LocalFileSystem.hpp"
#include "sshutils/PathUtil.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <vector>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace sshutils {

namespace {

constexpr std::size_t kChunk = 64 * 1024;

void fillInfo(const std::string& path, const struct stat& st, FileInfo& info) {
    info = FileInfo{};
    info.name = baseName(path);
    info.size = static_cast<std::uint64_t>(st.st_size);
    info.mtime = static_cast<std::uint64_t>(st.st_mtime);
    info.mode = static_cast<std::uint32_t>(st.st_mode);
    info.uid = static_cast<std::uint32_t>(st.st_uid);
    info.gid = static_cast<std::uint32_t>(st.st_gid);
}

class LocalFileHandle : public FileHandle {
public:
    LocalFileHandle(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}
    ~LocalFileHandle() override {
        if (fd_ >= 0) ::close(fd_);
    }

    bool read(char* buf, std::size_t n, std::size_t& got, Error& err) override {
        got = 0;
        for (;;) {
            ssize_t r = ::read(fd_, buf, n);
            if (r >= 0) {
                got = static_cast<std::size_t>(r);
                return true;
            }
            if (errno == EINTR) continue;
            setFromErrno(err, errno, "read " + path_);
            return false;
        }
    }

    bool write(const char* buf, std::size_t n, Error& err) override {
        while (n > 0) {
            ssize_t w = ::write(fd_, buf, n);
            if (w < 0) {
                if (errno == EINTR) continue;
                setFromErrno(err, errno, "write " + path_);
                return false;
            }
            buf += w;
            n -= static_cast<std::size_t>(w);
        }
        return true;
    }

    bool close(Error& err) override {
        if (fd_ < 0) return true;
        int rc = ::close(fd_);
        fd_ = -1;
        if (rc != 0) {
            setFromErrno(err, errno, "close " + path_);
            return false;
        }
        return true;
    }

private:
    int fd_;
    std::string path_;
};

} // namespace

bool LocalFileSystem::stat(const std::string& path, FileInfo& info, Error& err) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        setFromErrno(err, errno, "stat " + path);
        return false;
    }
    fillInfo(path, st, info);
    return true;
}

bool LocalFileSystem::lstat(const std::string& path, FileInfo& info, Error& err) {
    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0) {
        setFromErrno(err, errno, "lstat " + path);
        return false;
    }
    fillInfo(path, st, info);
    return true;
}

bool LocalFileSystem::list(const std::string& path, std::vector<FileInfo>& out, Error& err) {
    DIR* dir = ::opendir(path.c_str());
    if (!dir) {
        setFromErrno(err, errno, "opendir " + path);
        return false;
    }
    out.clear();
    errno = 0;
    while (struct dirent* de = ::readdir(dir)) {
        const std::string name = de->d_name;
        if (name == "." || name == "..") continue;
        FileInfo fi;
        Error e;
        if (!lstat(joinPath(path, name), fi, e)) {
            // Entry vanished between readdir and lstat.
            if (e.kind == ErrorKind::NotFound) continue;
            err = e;
            ::closedir(dir);
            return false;
        }
        out.push_back(std::move(fi));
        errno = 0;
    }
    const int rerr = errno;
    ::closedir(dir);
    if (rerr != 0) {
        setFromErrno(err, rerr, "readdir " + path);
        return false;
    }
    return true;
}

bool LocalFileSystem::realpath(const std::string& path, std::string& out, Error& err) {
    char buf[PATH_MAX];
    if (!::realpath(path.c_str(), buf)) {
        setFromErrno(err, errno, "realpath " + path);
        return false;
    }
    out = buf;
    return true;
}

bool LocalFileSystem::mkdir(const std::string& path, unsigned int mode, Error& err) {
    if (::mkdir(path.c_str(), static_cast<mode_t>(mode)) != 0) {
        setFromErrno(err, errno, "mkdir " + path);
        return false;
    }
    return true;
}

bool LocalFileSystem::removeFile(const std::string& path, Error& err) {
    if (::unlink(path.c_str()) != 0) {
        setFromErrno(err, errno, "unlink " + path);
        return false;
    }
    return true;
}

bool LocalFileSystem::removeDir(const std::string& path, Error& err) {
    if (::rmdir(path.c_str()) != 0) {
        setFromErrno(err, errno, "rmdir " + path);
        return false;
    }
    return true;
}

bool LocalFileSystem::rename(const std::string& from, const std::string& to, bool overwrite, Error& err) {
    if (!overwrite) {
        struct stat st{};
        if (::lstat(to.c_str(), &st) == 0) {
            err.set(ErrorKind::AlreadyExists, "file exists: " + to);
            return false;
        }
    }
    if (::rename(from.c_str(), to.c_str()) != 0) {
        setFromErrno(err, errno, "rename " + from + " -> " + to);
        return false;
    }
    return true;
}

bool LocalFileSystem::chmod(const std::string& path, std::uint32_t mode, Error& err) {
    if (::chmod(path.c_str(), static_cast<mode_t>(mode)) != 0) {
        setFromErrno(err, errno, "chmod " + path);
        return false;
    }
    return true;
}

bool LocalFileSystem::symlink(const std::string& target, const std::string& link_path, Error& err) {
    if (::symlink(target.c_str(), link_path.c_str()) != 0) {
        setFromErrno(err, errno, "symlink " + link_path + " -> " + target);
        return false;
    }
    return true;
}

std::unique_ptr<FileHandle> LocalFileSystem::open(const std::string& path, const OpenFlags& flags,
                                                  std::uint32_t mode, Error& err) {
    int oflags = 0;
    const bool writing = flags.write || flags.append;
    if (flags.read && writing) oflags = O_RDWR;
    else if (writing) oflags = O_WRONLY;
    else oflags = O_RDONLY;
    if (flags.append) oflags |= O_APPEND;
    if (flags.create) oflags |= O_CREAT;
    if (flags.truncate) oflags |= O_TRUNC;
    if (flags.exclusive) oflags |= O_EXCL;
    oflags |= O_CLOEXEC;

    int fd = ::open(path.c_str(), oflags, static_cast<mode_t>(mode));
    if (fd < 0) {
        setFromErrno(err, errno, "open " + path);
        return nullptr;
    }
    return std::make_unique<LocalFileHandle>(fd, path);
}

bool LocalFileSystem::copy(const std::string& src, const std::string& dst, ProgressCB progress, Error& err) {
    FileInfo info;
    if (!stat(src, info, err)) return false;
    if (info.isDir()) {
        err.set(ErrorKind::IsADirectory, "cannot copy directory " + src);
        return false;
    }
    auto in = open(src, OpenFlags{}, 0, err);
    if (!in) return false;
    auto out = open(dst, OpenFlags{false, true, false, true, true, false}, info.mode & 07777, err);
    if (!out) return false;

    std::vector<char> buf(kChunk);
    std::uint64_t done = 0;
    for (;;) {
        std::size_t got = 0;
        if (!in->read(buf.data(), buf.size(), got, err)) return false;
        if (got == 0) break;
        if (!out->write(buf.data(), got, err)) return false;
        done += got;
        if (progress) progress(done, info.size);
    }
    return out->close(err) && in->close(err);
}

bool LocalFileSystem::download(const std::string& src, const std::string& localDst,
                               ProgressCB progress, Error& err) {
    return copy(src, localDst, std::move(progress), err);
}

bool LocalFileSystem::upload(const std::string& localSrc, const std::string& dst,
                             ProgressCB progress, Error& err) {
    return copy(localSrc, dst, std::move(progress), err);
}

} // namespace sshutils
