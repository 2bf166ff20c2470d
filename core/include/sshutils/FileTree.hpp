// Tree operations built only on FileSystem list/stat primitives: walk, glob, rmtree.
#pragma once
#include "FileSystem.hpp"
#include "GlobPattern.hpp"
#include <set>
#include <string>
#include <vector>

namespace sshutils {

// One directory of a walk; files and fileInfo are parallel.
struct WalkStep {
    std::string root;
    std::vector<std::string> dirs;
    std::vector<std::string> files;
    std::vector<FileInfo> fileInfo;
    std::size_t depth = 0;   // 0 for the top directory
};

// Lazy single-pass depth-first walk. Each directory is listed exactly once.
// In top-down mode the caller may remove names from step().dirs to prune descent.
// When following symlinks, a link to a directory already listed is reported as a file.
class TreeWalker {
public:
    TreeWalker(FileSystem& fs, std::string top, bool followSymlinks = false, bool topDown = true);

    // Advances to the next directory. Returns false at the end (err empty) or on error.
    bool next(Error& err);
    WalkStep& step() { return current_; }
    std::size_t listings() const { return listings_; }

private:
    struct Pending {
        std::string path;
        std::size_t depth;
    };
    struct Frame {
        WalkStep step;
        std::size_t nextChild = 0;
    };

    FileSystem& fs_;
    std::string top_;
    bool follow_;
    bool topDown_;
    bool started_ = false;
    bool done_ = false;
    std::size_t listings_ = 0;
    WalkStep current_;
    std::vector<Pending> pending_;   // top-down
    std::vector<Frame> frames_;      // bottom-up
    std::set<std::string> visited_;  // real paths of listed directories, when following links

    bool listDir(const std::string& path, std::size_t depth, WalkStep& out, Error& err);
    bool nextTopDown(Error& err);
    bool nextBottomUp(Error& err);
};

class FileTree {
public:
    explicit FileTree(FileSystem& fs) : fs_(fs) {}

    FileSystem& fs() { return fs_; }

    TreeWalker walk(const std::string& top, bool followSymlinks = false, bool topDown = true) {
        return TreeWalker(fs_, top, followSymlinks, topDown);
    }

    // Paths below base matching pattern, in walk order. A missing start directory yields nothing.
    bool glob(const std::string& base, const std::string& pattern,
              std::vector<std::string>& out, Error& err);

    // Removes a directory tree. With ignoreErrors, failures are logged and skipped.
    bool rmtree(const std::string& path, bool ignoreErrors, Error& err);

private:
    FileSystem& fs_;
};

} // namespace sshutils
