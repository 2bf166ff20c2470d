#include "sshutils/FileTree.hpp"
#include "sshutils/Log.hpp"
#include "sshutils/PathUtil.hpp"
#include <algorithm>

namespace sshutils {

TreeWalker::TreeWalker(FileSystem& fs, std::string top, bool followSymlinks, bool topDown)
    : fs_(fs), top_(std::move(top)), follow_(followSymlinks), topDown_(topDown) {}

bool TreeWalker::listDir(const std::string& path, std::size_t depth, WalkStep& out, Error& err) {
    std::vector<FileInfo> entries;
    ++listings_;
    if (!fs_.list(path, entries, err)) return false;
    std::sort(entries.begin(), entries.end(),
              [](const FileInfo& a, const FileInfo& b) { return a.name < b.name; });

    if (follow_) {
        std::string real;
        if (!fs_.realpath(path, real, err)) return false;
        visited_.insert(real);
    }

    out = WalkStep{};
    out.root = path;
    out.depth = depth;
    for (auto& e : entries) {
        bool isDir = e.isDir();
        if (!isDir && follow_ && e.isLink()) {
            const std::string linkPath = joinPath(path, e.name);
            FileInfo target;
            Error se;
            if (fs_.stat(linkPath, target, se)) {
                target.name = e.name;
                isDir = target.isDir();
                if (!isDir) {
                    e = target;
                } else {
                    // A link to a directory already listed is a leaf, so cycles end.
                    std::string real;
                    if (!fs_.realpath(linkPath, real, err)) return false;
                    if (visited_.count(real)) isDir = false;
                }
            } else if (se.kind != ErrorKind::NotFound) {
                err = se;
                return false;
            }
            // Broken link: stays a file leaf.
        }
        if (isDir) {
            out.dirs.push_back(e.name);
        } else {
            out.files.push_back(e.name);
            out.fileInfo.push_back(e);
        }
    }
    return true;
}

bool TreeWalker::next(Error& err) {
    if (done_) return false;
    bool ok = topDown_ ? nextTopDown(err) : nextBottomUp(err);
    if (!ok) done_ = true;
    return ok;
}

bool TreeWalker::nextTopDown(Error& err) {
    if (!started_) {
        started_ = true;
        pending_.push_back(Pending{top_, 0});
    } else {
        // Descend into what the caller left in dirs; first name is visited first.
        for (auto it = current_.dirs.rbegin(); it != current_.dirs.rend(); ++it)
            pending_.push_back(Pending{joinPath(current_.root, *it), current_.depth + 1});
    }
    if (pending_.empty()) return false;
    Pending p = pending_.back();
    pending_.pop_back();
    return listDir(p.path, p.depth, current_, err);
}

bool TreeWalker::nextBottomUp(Error& err) {
    if (!started_) {
        started_ = true;
        Frame f;
        if (!listDir(top_, 0, f.step, err)) return false;
        frames_.push_back(std::move(f));
    }
    while (!frames_.empty()) {
        Frame& top = frames_.back();
        if (top.nextChild < top.step.dirs.size()) {
            const std::string child = joinPath(top.step.root, top.step.dirs[top.nextChild++]);
            Frame f;
            if (!listDir(child, top.step.depth + 1, f.step, err)) return false;
            frames_.push_back(std::move(f));
            continue;
        }
        current_ = std::move(top.step);
        frames_.pop_back();
        return true;
    }
    return false;
}

bool FileTree::glob(const std::string& base, const std::string& pattern,
                    std::vector<std::string>& out, Error& err) {
    out.clear();
    const GlobPattern gp = GlobPattern::parse(pattern);
    const std::string start = gp.startDir(base);

    FileInfo info;
    Error se;
    if (!fs_.stat(start, info, se)) {
        if (se.kind == ErrorKind::NotFound) return true;
        err = se;
        return false;
    }
    if (!info.isDir()) return true;

    LOGD("glob start=%s pattern=%s tokens=%d recursive=%d", start.c_str(), pattern.c_str(),
         gp.wildcardTokens(), gp.recursive() ? 1 : 0);

    TreeWalker walker(fs_, start);
    while (walker.next(err)) {
        WalkStep& step = walker.step();
        const auto rel = splitPath(relativePath(step.root, start));
        auto matchName = [&](const std::string& name) {
            auto parts = rel;
            parts.push_back(name);
            if (gp.matches(parts)) out.push_back(joinPath(step.root, name));
        };
        for (const auto& d : step.dirs) matchName(d);
        for (const auto& f : step.files) matchName(f);

        if (!gp.recursive()) {
            std::vector<std::string> keep;
            for (const auto& d : step.dirs) {
                auto parts = rel;
                parts.push_back(d);
                if (gp.mayContainMatches(parts)) keep.push_back(d);
            }
            step.dirs.swap(keep);
        }
    }
    return !err;
}

bool FileTree::rmtree(const std::string& path, bool ignoreErrors, Error& err) {
    FileInfo info;
    if (!fs_.lstat(path, info, err)) {
        if (!ignoreErrors) return false;
        err.clear();
        return true;
    }
    if (info.isLink()) {
        err.set(ErrorKind::InvalidArgument, "cannot call rmtree on a symbolic link: " + path);
        return false;
    }
    if (!info.isDir()) {
        err.set(ErrorKind::NotADirectory, "not a directory: " + path);
        return false;
    }

    auto failed = [&](const Error& e) {
        if (!ignoreErrors) {
            err = e;
            return true;
        }
        LOGW("rmtree: skipping %s", e.message.c_str());
        return false;
    };

    TreeWalker walker(fs_, path, false, false);
    Error werr;
    while (walker.next(werr)) {
        const WalkStep& step = walker.step();
        for (const auto& f : step.files) {
            Error e;
            if (!fs_.removeFile(joinPath(step.root, f), e) && failed(e)) return false;
        }
        Error e;
        if (!fs_.removeDir(step.root, e) && failed(e)) return false;
    }
    if (werr && failed(werr)) return false;
    err.clear();
    return true;
}

} // namespace sshutils
