#include "Commands.hpp"

using namespace sshutils;

namespace {

std::string str(const QString& s) { return s.toStdString(); }

std::vector<std::string> strList(const QStringList& l) {
    std::vector<std::string> v;
    v.reserve(static_cast<size_t>(l.size()));
    for (const auto& s : l) v.push_back(s.toStdString());
    return v;
}

QString kindLetter(const FileInfo& info) {
    switch (info.kind()) {
        case FileKind::Directory: return "d";
        case FileKind::Symlink: return "l";
        case FileKind::Socket: return "s";
        case FileKind::Fifo: return "p";
        case FileKind::BlockDevice: return "b";
        case FileKind::CharDevice: return "c";
        default: return "-";
    }
}

} // namespace

bool parseKnownHostsPolicy(const QString& s, KnownHostsPolicy& out) {
    const QString v = s.trimmed().toLower();
    if (v == "strict") out = KnownHostsPolicy::Strict;
    else if (v == "accept-new" || v == "acceptnew") out = KnownHostsPolicy::AcceptNew;
    else if (v == "off" || v == "no") out = KnownHostsPolicy::Off;
    else return false;
    return true;
}

Commands::Commands(CliConfig cfg, const HostRegistry& hosts, QTextStream& out, QTextStream& err)
    : cfg_(std::move(cfg)), hosts_(hosts), out_(out), err_(err) {}

QString Commands::usage() {
    return QStringLiteral(
        "commands:\n"
        "  hosts                          list hosts from the ssh config\n"
        "  ls HOST PATH                   list a directory\n"
        "  glob HOST BASE PATTERN         match paths below BASE\n"
        "  download HOST REMOTE LOCAL     copy a file or directory tree to this machine\n"
        "  upload HOST LOCAL REMOTE       copy a file or directory tree to HOST\n"
        "  run HOST CMD...                run a command\n"
        "  rm HOST PATH                   remove a file, or a directory recursively\n"
        "  multi-run HOST,HOST... CMD...  run a command on several hosts at once\n"
        "HOST 'local' is this machine.");
}

int Commands::fail(const Error& e) {
    err_ << "error: " << QString::fromStdString(e.describe()) << Qt::endl;
    return e.kind == ErrorKind::InvalidArgument ? 2 : 1;
}

std::unique_ptr<Connection> Commands::open(const QString& host, Error& err) {
    if (host == "local") return Connection::openLocal();
    ConnectionDescriptor desc;
    if (!hosts_.lookup(str(host), desc, err)) return nullptr;
    SessionOptions opt = desc.toSessionOptions();
    opt.known_hosts_policy = cfg_.knownHosts;
    return Connection::openRemote(desc, opt, cfg_.policy, ClientFactory{}, err);
}

int Commands::exec(const QStringList& args) {
    if (args.isEmpty()) {
        err_ << usage() << Qt::endl;
        return 2;
    }
    const QString cmd = args.front();
    const int n = args.size() - 1;
    auto arity = [&](int want) {
        if (n == want) return true;
        err_ << "error: '" << cmd << "' takes " << want << " argument(s)\n" << usage() << Qt::endl;
        return false;
    };

    if (cmd == "hosts") return arity(0) ? cmdHosts() : 2;
    if (cmd == "ls") return arity(2) ? cmdLs(args[1], args[2]) : 2;
    if (cmd == "glob") return arity(3) ? cmdGlob(args[1], args[2], args[3]) : 2;
    if (cmd == "download")
        return arity(3) ? cmdTransfer(args[1], args[2], args[3], TransferDirection::Download) : 2;
    if (cmd == "upload")
        return arity(3) ? cmdTransfer(args[1], args[2], args[3], TransferDirection::Upload) : 2;
    if (cmd == "rm") return arity(2) ? cmdRm(args[1], args[2]) : 2;
    if (cmd == "run" || cmd == "multi-run") {
        if (n < 2) {
            err_ << "error: '" << cmd << "' needs a host and a command\n" << usage() << Qt::endl;
            return 2;
        }
        const QStringList rest = args.mid(2);
        return cmd == "run" ? cmdRun(args[1], rest) : cmdMultiRun(args[1], rest);
    }
    err_ << "error: unknown command '" << cmd << "'\n" << usage() << Qt::endl;
    return 2;
}

int Commands::cmdHosts() {
    for (const auto& name : hosts_.availableHosts()) {
        ConnectionDescriptor d;
        Error e;
        if (!hosts_.lookup(name, d, e)) continue;
        out_ << QString::fromStdString(d.toString()) << '\n';
    }
    out_.flush();
    return 0;
}

int Commands::cmdLs(const QString& host, const QString& path) {
    Error e;
    auto c = open(host, e);
    if (!c) return fail(e);
    std::vector<PathProxy> entries;
    if (!c->path(str(path)).iterdir(entries, e)) return fail(e);
    for (const auto& p : entries) {
        FileInfo info;
        Error se;
        if (!p.lstat(info, se)) continue;
        out_ << kindLetter(info) << ' ' << qSetFieldWidth(12) << static_cast<qulonglong>(info.size)
             << qSetFieldWidth(0) << ' ' << QString::fromStdString(p.name()) << '\n';
    }
    out_.flush();
    return 0;
}

int Commands::cmdGlob(const QString& host, const QString& base, const QString& pattern) {
    Error e;
    auto c = open(host, e);
    if (!c) return fail(e);
    std::vector<PathProxy> found;
    if (!c->path(str(base)).glob(str(pattern), found, e)) return fail(e);
    for (const auto& p : found) out_ << QString::fromStdString(p.str()) << '\n';
    out_.flush();
    return 0;
}

int Commands::cmdTransfer(const QString& host, const QString& src, const QString& dst, TransferDirection dir) {
    Error e;
    auto c = open(host, e);
    if (!c) return fail(e);

    ProgressCB progress;
    if (cfg_.showProgress) {
        progress = [this](std::uint64_t done, std::uint64_t total) {
            const int pct = total ? static_cast<int>(done * 100 / total) : 100;
            err_ << "\r" << qSetFieldWidth(3) << pct << qSetFieldWidth(0) << "%" << Qt::flush;
        };
    }

    FileSystem& source = dir == TransferDirection::Download ? c->fs() : c->localFs();
    bool srcIsDir = false;
    if (!source.exists(str(src), srcIsDir, e)) {
        if (!e) e.set(ErrorKind::NotFound, str(src) + " does not exist on " + source.name());
        return fail(e);
    }

    bool ok;
    if (srcIsDir) {
        TransferOptions opts = cfg_.transfer;
        opts.progress = progress;
        TransferPlan plan;
        ok = c->transferTree(str(src), str(dst), dir, opts, plan, e);
        if (ok) {
            if (cfg_.showProgress) err_ << '\n';
            out_ << static_cast<qulonglong>(plan.files.size()) << " files, "
                 << static_cast<qulonglong>(plan.totalBytes) << " bytes" << Qt::endl;
        }
    } else {
        ok = c->copyFile(str(src), str(dst), dir, progress, e);
        if (ok && cfg_.showProgress) err_ << '\n';
        if (ok && cfg_.transfer.removeSourceAfter) ok = PathProxy(source, str(src)).unlink(false, e);
    }
    err_.flush();
    return ok ? 0 : fail(e);
}

int Commands::cmdRun(const QString& host, const QStringList& cmd) {
    Error e;
    auto c = open(host, e);
    if (!c) return fail(e);
    CompletedProcess res;
    if (!c->run(strList(cmd), cfg_.run, res, e)) return fail(e);
    if (!res.stdoutText.empty()) out_ << QString::fromStdString(res.stdoutText) << '\n';
    if (!res.stderrText.empty()) err_ << QString::fromStdString(res.stderrText) << '\n';
    out_.flush();
    err_.flush();
    return res.returncode;
}

int Commands::cmdRm(const QString& host, const QString& path) {
    Error e;
    auto c = open(host, e);
    if (!c) return fail(e);
    PathProxy p = c->path(str(path));
    const bool ok = p.isDir() && !p.isSymlink() ? p.rmdir(e) : p.unlink(false, e);
    return ok ? 0 : fail(e);
}

int Commands::cmdMultiRun(const QString& hosts, const QStringList& cmd) {
    MultiConnection multi;
    for (const auto& h : hosts.split(',', Qt::SkipEmptyParts)) {
        Error e;
        auto c = open(h.trimmed(), e);
        if (!c) return fail(e);
        multi.add(std::move(c));
    }
    int rc = 0;
    for (const auto& r : multi.runCommand(strList(cmd), cfg_.run)) {
        const QString key = QString::fromStdString(r.key);
        if (!r.ok) {
            err_ << key << ": error: " << QString::fromStdString(r.error.describe()) << '\n';
            rc = 1;
            continue;
        }
        for (const auto& line : QString::fromStdString(r.value.stdoutText).split('\n', Qt::SkipEmptyParts))
            out_ << key << ": " << line << '\n';
        for (const auto& line : QString::fromStdString(r.value.stderrText).split('\n', Qt::SkipEmptyParts))
            err_ << key << ": " << line << '\n';
        if (r.value.returncode != 0 && rc == 0) rc = r.value.returncode;
    }
    multi.closeAll();
    out_.flush();
    err_.flush();
    return rc;
}
