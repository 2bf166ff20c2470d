// Entry point: read settings, parse the command line and dispatch.
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QTextStream>
#include <cstdio>
#include "Commands.hpp"

using namespace sshutils;

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("sshutils");
    QCoreApplication::setOrganizationName("sshutils");
    QCoreApplication::setApplicationVersion("0.1.0");

    QTextStream out(stdout);
    QTextStream err(stderr);

    // Defaults from settings; command line options override them.
    QSettings s("sshutils", "sshutils");
    CliConfig cfg;
    cfg.policy.backoff = std::chrono::seconds(s.value("Retry/backoffSeconds", 60).toInt());
    cfg.policy.authAttempts = s.value("Retry/authAttempts", 3).toInt();
    cfg.policy.retryBudget = std::chrono::seconds(s.value("Retry/budgetSeconds", 0).toInt());
    QString sshConfig = s.value("Ssh/configPath", QString::fromStdString(HostRegistry::defaultConfigPath())).toString();
    if (!parseKnownHostsPolicy(s.value("Security/knownHostsPolicy", "accept-new").toString(), cfg.knownHosts)) {
        err << "warning: unknown Security/knownHostsPolicy, using accept-new" << Qt::endl;
        cfg.knownHosts = KnownHostsPolicy::AcceptNew;
    }

    QCommandLineParser p;
    p.setApplicationDescription("Files, directory trees and commands on SSH hosts or this machine.\n\n" +
                                Commands::usage());
    p.addHelpOption();
    p.addVersionOption();
    QCommandLineOption includeOpt("include", "Only transfer files matching PATTERN (repeatable).", "pattern");
    QCommandLineOption excludeOpt("exclude", "Skip files matching PATTERN (repeatable).", "pattern");
    QCommandLineOption removeOpt("remove-source", "Remove the source after a successful transfer.");
    QCommandLineOption cwdOpt("cwd", "Working directory for run.", "dir");
    QCommandLineOption checkOpt("check", "Fail when the command exits non-zero.");
    QCommandLineOption configOpt("ssh-config", "OpenSSH client config with host definitions.", "file");
    QCommandLineOption backoffOpt("backoff", "Seconds between reconnect attempts.", "seconds");
    QCommandLineOption budgetOpt("budget", "Give up after this many seconds of backoff (0: never).", "seconds");
    QCommandLineOption quietOpt("quiet", "No progress output.");
    p.addOptions({includeOpt, excludeOpt, removeOpt, cwdOpt, checkOpt, configOpt, backoffOpt, budgetOpt, quietOpt});
    p.addPositionalArgument("command", "Command to run.", "<command> [args...]");
    p.process(app);

    for (const auto& v : p.values(includeOpt)) cfg.transfer.include.push_back(v.toStdString());
    for (const auto& v : p.values(excludeOpt)) cfg.transfer.exclude.push_back(v.toStdString());
    cfg.transfer.removeSourceAfter = p.isSet(removeOpt);
    cfg.run.cwd = p.value(cwdOpt).toStdString();
    cfg.run.check = p.isSet(checkOpt);
    cfg.showProgress = !p.isSet(quietOpt);
    if (p.isSet(configOpt)) sshConfig = p.value(configOpt);

    auto seconds = [&](const QCommandLineOption& o, std::chrono::seconds& dst) {
        if (!p.isSet(o)) return true;
        bool ok = false;
        const int v = p.value(o).toInt(&ok);
        if (!ok || v < 0) {
            err << "error: --" << o.names().front() << " expects a non-negative number" << Qt::endl;
            return false;
        }
        dst = std::chrono::seconds(v);
        return true;
    };
    if (!seconds(backoffOpt, cfg.policy.backoff) || !seconds(budgetOpt, cfg.policy.retryBudget)) return 2;

    HostRegistry hosts;
    Error e;
    if (!hosts.loadFile(sshConfig.toStdString(), e)) {
        err << "error: " << QString::fromStdString(e.describe()) << Qt::endl;
        return 1;
    }

    Commands commands(cfg, hosts, out, err);
    return commands.exec(p.positionalArguments());
}
