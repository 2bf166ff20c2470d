#include "sshutils/SftpClient.hpp"
#include <sys/stat.h>
#include <vector>

namespace sshutils {

FileKind kindFromMode(std::uint32_t mode) {
    switch (mode & S_IFMT) {
        case S_IFREG: return FileKind::File;
        case S_IFDIR: return FileKind::Directory;
        case S_IFLNK: return FileKind::Symlink;
        case S_IFSOCK: return FileKind::Socket;
        case S_IFIFO: return FileKind::Fifo;
        case S_IFBLK: return FileKind::BlockDevice;
        case S_IFCHR: return FileKind::CharDevice;
        default: return FileKind::Other;
    }
}

const char* fileKindName(FileKind kind) {
    switch (kind) {
        case FileKind::File: return "file";
        case FileKind::Directory: return "dir";
        case FileKind::Symlink: return "link";
        case FileKind::Socket: return "socket";
        case FileKind::Fifo: return "fifo";
        case FileKind::BlockDevice: return "block";
        case FileKind::CharDevice: return "char";
        default: return "other";
    }
}

bool FileHandle::readAll(std::string& out, Error& err) {
    out.clear();
    std::vector<char> buf(64 * 1024);
    for (;;) {
        std::size_t got = 0;
        if (!read(buf.data(), buf.size(), got, err)) return false;
        if (got == 0) break;
        out.append(buf.data(), got);
    }
    return true;
}

} // namespace sshutils
