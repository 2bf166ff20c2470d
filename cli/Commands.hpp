// Command dispatch for the sshutils command line tool.
#pragma once
#include "sshutils/HostRegistry.hpp"
#include "sshutils/MultiConnection.hpp"
#include <QStringList>
#include <QTextStream>
#include <memory>

struct CliConfig {
    sshutils::RetryPolicy policy = sshutils::RetryPolicy::standard();
    sshutils::KnownHostsPolicy knownHosts = sshutils::KnownHostsPolicy::AcceptNew;
    sshutils::TransferOptions transfer;
    sshutils::RunOptions run;
    bool showProgress = true;
};

// "strict", "accept-new" or "off".
bool parseKnownHostsPolicy(const QString& s, sshutils::KnownHostsPolicy& out);

class Commands {
public:
    Commands(CliConfig cfg, const sshutils::HostRegistry& hosts, QTextStream& out, QTextStream& err);

    // args[0] is the command name. Returns the process exit code.
    int exec(const QStringList& args);

    static QString usage();

private:
    CliConfig cfg_;
    const sshutils::HostRegistry& hosts_;
    QTextStream& out_;
    QTextStream& err_;

    std::unique_ptr<sshutils::Connection> open(const QString& host, sshutils::Error& err);
    int fail(const sshutils::Error& e);

    int cmdHosts();
    int cmdLs(const QString& host, const QString& path);
    int cmdGlob(const QString& host, const QString& base, const QString& pattern);
    int cmdTransfer(const QString& host, const QString& src, const QString& dst,
                    sshutils::TransferDirection dir);
    int cmdRun(const QString& host, const QStringList& cmd);
    int cmdRm(const QString& host, const QString& path);
    int cmdMultiRun(const QString& hosts, const QStringList& cmd);
};
