// Whole-directory copy between a (possibly remote) filesystem and the local one.
// Enumerate and plan first, create every destination directory, then copy file by file.
#pragma once
#include "FileSystem.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sshutils {

enum class TransferDirection {
    Download,   // source filesystem -> local
    Upload      // local -> destination filesystem
};

// Accepts "get"/"download" and "put"/"upload".
bool parseTransferDirection(const std::string& s, TransferDirection& out, Error& err);
const char* transferDirectionName(TransferDirection d);

struct TransferItem {
    std::string source;
    std::string destination;
    std::uint64_t size = 0;
};

struct TransferPlan {
    std::vector<TransferItem> files;          // walk order
    std::vector<std::string> directories;     // destination dirs, root first, no duplicates
    std::uint64_t totalBytes = 0;
};

struct TransferOptions {
    std::vector<std::string> include;   // file name patterns; empty keeps everything
    std::vector<std::string> exclude;   // wins over include
    bool removeSourceAfter = false;
    bool followSymlinks = false;
    // Cumulative bytes copied and plan total.
    ProgressCB progress;
};

class TreeTransferEngine {
public:
    // remote is the far side (may itself be local for a local connection).
    TreeTransferEngine(FileSystem& remote, FileSystem& local) : remote_(remote), local_(local) {}

    // Phase 1 only. Fails with NotFound if sourceRoot is not a directory.
    bool plan(const std::string& sourceRoot, const std::string& destRoot, TransferDirection dir,
              const TransferOptions& opts, TransferPlan& out, Error& err);

    // Plan, create directories, copy, then optionally remove the source tree.
    // The first failed copy aborts the transfer and nothing is removed.
    bool transfer(const std::string& sourceRoot, const std::string& destRoot, TransferDirection dir,
                  const TransferOptions& opts, TransferPlan& applied, Error& err);

private:
    FileSystem& remote_;
    FileSystem& local_;

    FileSystem& source(TransferDirection d) { return d == TransferDirection::Download ? remote_ : local_; }
    FileSystem& destination(TransferDirection d) { return d == TransferDirection::Download ? local_ : remote_; }
};

} // namespace sshutils
