// Path value bound to one FileSystem. Everything that yields another path
// (join, parent, resolve, iterdir, glob) yields a PathProxy on the same filesystem.
#pragma once
#include "FileSystem.hpp"
#include "TextFile.hpp"
#include <memory>
#include <string>
#include <vector>

namespace sshutils {

class PathProxy {
public:
    PathProxy(FileSystem& fs, std::string path);

    // Home directory of the filesystem ($HOME locally, the login directory remotely).
    static bool home(FileSystem& fs, PathProxy& out, Error& err);
    static bool cwd(FileSystem& fs, PathProxy& out, Error& err);

    const std::string& str() const { return path_; }
    FileSystem& fs() const { return *fs_; }
    bool isAbsolute() const;

    PathProxy operator/(const std::string& name) const;
    PathProxy parent() const;
    std::string name() const;
    // ".gz" for "a.tar.gz"; empty for dot-files and names without a dot.
    std::string suffix() const;
    std::string stem() const;
    PathProxy withName(const std::string& name) const;
    PathProxy withSuffix(const std::string& suffix) const;
    std::vector<std::string> parts() const;

    bool resolve(PathProxy& out, Error& err) const;
    bool expanduser(PathProxy& out, Error& err) const;

    bool iterdir(std::vector<PathProxy>& out, Error& err) const;
    bool glob(const std::string& pattern, std::vector<PathProxy>& out, Error& err) const;
    // glob with "**/" prepended.
    bool rglob(const std::string& pattern, std::vector<PathProxy>& out, Error& err) const;

    // Kind checks; any failure, including a missing path, reads as false.
    bool isDir() const;
    bool isFile() const;
    bool isSymlink() const;
    bool isSocket() const;
    bool isFifo() const;
    bool isBlockDevice() const;
    bool isCharDevice() const;
    bool exists() const;

    bool stat(FileInfo& info, Error& err) const;
    bool lstat(FileInfo& info, Error& err) const;
    bool chmod(std::uint32_t mode, Error& err) const;

    bool mkdir(unsigned int mode, bool parents, bool existOk, Error& err) const;
    // Creates an empty file if missing; an existing file is an error unless existOk.
    bool touch(std::uint32_t mode, bool existOk, Error& err) const;
    // Removes a file or link. A directory is IsADirectory, a missing path NotFound unless missingOk.
    bool unlink(bool missingOk, Error& err) const;
    // Removes the whole tree, then this path points at its parent.
    bool rmdir(Error& err);

    // Fails with AlreadyExists if target exists; replace overwrites it.
    bool rename(const std::string& target, PathProxy& out, Error& err) const;
    bool replace(const std::string& target, PathProxy& out, Error& err) const;
    bool symlinkTo(const std::string& target, Error& err) const;
    bool samefile(const PathProxy& other, bool& same, Error& err) const;

    std::unique_ptr<TextFile> open(const std::string& mode, const std::string& encoding,
                                   DecodeErrors errors, Error& err) const;
    bool readText(std::string& out, Error& err, const std::string& encoding = "utf-8",
                  DecodeErrors errors = DecodeErrors::Strict) const;
    bool writeText(const std::string& data, Error& err, const std::string& encoding = "utf-8") const;
    bool readBytes(std::string& out, Error& err) const;
    bool writeBytes(const std::string& data, Error& err) const;

    bool operator==(const PathProxy& o) const { return fs_ == o.fs_ && path_ == o.path_; }
    bool operator!=(const PathProxy& o) const { return !(*this == o); }

private:
    FileSystem* fs_;
    std::string path_;

    bool hasKind(FileKind kind, bool followLinks) const;
    bool readAll(const std::string& mode, std::string& out, Error& err, const std::string& encoding,
                 DecodeErrors errors) const;
    bool writeAll(const std::string& mode, const std::string& data, Error& err,
                  const std::string& encoding) const;
};

} // namespace sshutils
