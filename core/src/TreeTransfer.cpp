#include "sshutils/TreeTransfer.hpp"
#include "sshutils/FileTree.hpp"
#include "sshutils/GlobPattern.hpp"
#include "sshutils/Log.hpp"
#include "sshutils/PathUtil.hpp"
#include <set>

namespace sshutils {

bool parseTransferDirection(const std::string& s, TransferDirection& out, Error& err) {
    if (s == "get" || s == "download") {
        out = TransferDirection::Download;
        return true;
    }
    if (s == "put" || s == "upload") {
        out = TransferDirection::Upload;
        return true;
    }
    err.set(ErrorKind::InvalidArgument, "direction must be 'get' or 'put', not '" + s + "'");
    return false;
}

const char* transferDirectionName(TransferDirection d) {
    return d == TransferDirection::Download ? "get" : "put";
}

bool TreeTransferEngine::plan(const std::string& sourceRoot, const std::string& destRoot,
                              TransferDirection dir, const TransferOptions& opts,
                              TransferPlan& out, Error& err) {
    out = TransferPlan{};
    FileSystem& src = source(dir);

    FileInfo info;
    Error se;
    if (!src.stat(sourceRoot, info, se) || !info.isDir()) {
        if (se && se.kind != ErrorKind::NotFound) {
            err = se;
            return false;
        }
        err.set(ErrorKind::NotFound, "source directory " + sourceRoot + " does not exist on " + src.name());
        return false;
    }

    const FileFilter filter(opts.include, opts.exclude);
    std::set<std::string> seen;
    TreeWalker walker(src, sourceRoot, opts.followSymlinks);
    while (walker.next(err)) {
        const WalkStep& step = walker.step();
        const std::string rel = relativePath(step.root, sourceRoot);
        const std::string destDir = rel.empty() ? destRoot : joinPath(destRoot, rel);
        if (seen.insert(destDir).second) out.directories.push_back(destDir);

        for (size_t i = 0; i < step.files.size(); ++i) {
            const std::string& name = step.files[i];
            if (!filter.accepts(name)) continue;
            // Links the walk did not follow (broken, or back into the tree) are not copied.
            if (opts.followSymlinks && step.fileInfo[i].isLink()) continue;
            TransferItem item;
            item.source = joinPath(step.root, name);
            item.destination = joinPath(destDir, name);
            item.size = step.fileInfo[i].size;
            out.totalBytes += item.size;
            out.files.push_back(std::move(item));
        }
    }
    if (err) return false;
    LOGD("transfer.plan dir=%s src=%s files=%zu dirs=%zu bytes=%llu", transferDirectionName(dir),
         sourceRoot.c_str(), out.files.size(), out.directories.size(),
         static_cast<unsigned long long>(out.totalBytes));
    return true;
}

bool TreeTransferEngine::transfer(const std::string& sourceRoot, const std::string& destRoot,
                                  TransferDirection dir, const TransferOptions& opts,
                                  TransferPlan& applied, Error& err) {
    if (!plan(sourceRoot, destRoot, dir, opts, applied, err)) return false;

    FileSystem& dst = destination(dir);
    for (const auto& d : applied.directories) {
        if (!dst.makedirs(d, 0755, true, err)) {
            err.message = "could not create " + d + ": " + err.message;
            return false;
        }
    }

    const std::uint64_t total = applied.totalBytes;
    std::uint64_t base = 0;
    for (const auto& item : applied.files) {
        ProgressCB chunk;
        if (opts.progress) {
            chunk = [&](std::uint64_t done, std::uint64_t) { opts.progress(base + done, total); };
        }
        const bool ok = dir == TransferDirection::Download
                            ? remote_.download(item.source, item.destination, chunk, err)
                            : remote_.upload(item.source, item.destination, chunk, err);
        if (!ok) {
            LOGE("transfer.copy dir=%s src=%s dst=%s kind=%s", transferDirectionName(dir),
                 item.source.c_str(), item.destination.c_str(), errorKindName(err.kind));
            err.message = "failed to copy " + item.source + " -> " + item.destination + ": " + err.message;
            return false;
        }
        base += item.size;
        if (opts.progress) opts.progress(base, total);
    }

    if (opts.removeSourceAfter) {
        FileTree tree(source(dir));
        if (!tree.rmtree(sourceRoot, false, err)) return false;
    }
    LOGI("transfer.done dir=%s src=%s dst=%s files=%zu bytes=%llu", transferDirectionName(dir),
         sourceRoot.c_str(), destRoot.c_str(), applied.files.size(),
         static_cast<unsigned long long>(total));
    return true;
}

} // namespace sshutils
