#include "sshutils/ProcessRunner.hpp"
#include "sshutils/Log.hpp"
#include "sshutils/PathUtil.hpp"

#include <cerrno>
#include <cstdlib>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <time.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace sshutils {

namespace {

// A single argument is already a shell command line.
std::string commandLine(const std::vector<std::string>& args) {
    if (args.size() == 1) return args.front();
    return shellJoin(args);
}

// The current environment with the overrides applied, as NAME=VALUE strings.
std::vector<std::string> childEnvironment(const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        const std::string entry(*e);
        const std::string name = entry.substr(0, entry.find('='));
        bool replaced = false;
        for (const auto& kv : overrides) replaced = replaced || kv.first == name;
        if (!replaced) env.push_back(entry);
    }
    for (const auto& kv : overrides) env.push_back(kv.first + "=" + kv.second);
    return env;
}

// Blocks SIGPIPE in the calling thread while feeding a child's stdin; a write to a
// closed pipe then fails with EPIPE and the pending signal is discarded on exit.
class SigpipeBlock {
public:
    SigpipeBlock() {
        sigemptyset(&pipeSet_);
        sigaddset(&pipeSet_, SIGPIPE);
        sigset_t pending;
        sigemptyset(&pending);
        sigpending(&pending);
        wasPending_ = sigismember(&pending, SIGPIPE) == 1;
        blocked_ = pthread_sigmask(SIG_BLOCK, &pipeSet_, &old_) == 0;
    }
    ~SigpipeBlock() {
        if (!blocked_) return;
        if (!wasPending_) {
            sigset_t pending;
            sigemptyset(&pending);
            sigpending(&pending);
            if (sigismember(&pending, SIGPIPE) == 1) {
                const struct timespec zero{0, 0};
                while (sigtimedwait(&pipeSet_, nullptr, &zero) < 0 && errno == EINTR) {}
            }
        }
        pthread_sigmask(SIG_SETMASK, &old_, nullptr);
    }
    SigpipeBlock(const SigpipeBlock&) = delete;
    SigpipeBlock& operator=(const SigpipeBlock&) = delete;

private:
    sigset_t pipeSet_;
    sigset_t old_;
    bool wasPending_ = false;
    bool blocked_ = false;
};

} // namespace

std::string shellQuote(const std::string& s) {
    if (s.empty()) return "''";
    bool safe = true;
    for (char c : s) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                        c == '-' || c == '_' || c == '.' || c == '/' || c == '=' || c == ':' ||
                        c == ',' || c == '+' || c == '@' || c == '%';
        if (!ok) {
            safe = false;
            break;
        }
    }
    if (safe) return s;
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\"'\"'";
        else out.push_back(c);
    }
    out += "'";
    return out;
}

std::string shellJoin(const std::vector<std::string>& args) {
    std::string out;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i) out += ' ';
        out += shellQuote(args[i]);
    }
    return out;
}

bool ProcessRunner::finish(const std::vector<std::string>& args, const RunOptions& opts,
                           CompletedProcess& out, Error& err) {
    out.args = args;
    out.stdoutText = rstrip(out.stdoutText);
    out.stderrText = rstrip(out.stderrText);
    if (opts.check && out.returncode != 0) {
        err.set(ErrorKind::ProcessFailed, "command '" + commandLine(args) + "' returned non-zero exit status " +
                                              std::to_string(out.returncode) +
                                              (out.stderrText.empty() ? std::string() : ": " + out.stderrText));
        return false;
    }
    return true;
}

bool LocalProcessRunner::run(const std::vector<std::string>& args, const RunOptions& opts,
                             CompletedProcess& out, Error& err) {
    out = CompletedProcess{};
    if (args.empty()) {
        err.set(ErrorKind::InvalidArgument, "empty command");
        return false;
    }
    const std::string cmd = commandLine(args);

    int inPipe[2] = {-1, -1}, outPipe[2] = {-1, -1}, errPipe[2] = {-1, -1};
    auto closeAll = [&]() {
        for (int* p : {inPipe, outPipe, errPipe}) {
            for (int i = 0; i < 2; ++i) {
                if (p[i] >= 0) ::close(p[i]);
                p[i] = -1;
            }
        }
    };
    if (::pipe2(inPipe, O_CLOEXEC) != 0 ||
        (opts.captureOutput && (::pipe2(outPipe, O_CLOEXEC) != 0 || ::pipe2(errPipe, O_CLOEXEC) != 0))) {
        setFromErrno(err, errno, "pipe");
        closeAll();
        return false;
    }

    // Everything the child needs is built before fork; it only calls async-signal-safe functions.
    const std::vector<std::string> envStrings = childEnvironment(opts.env);
    std::vector<char*> envp;
    envp.reserve(envStrings.size() + 1);
    for (const auto& s : envStrings) envp.push_back(const_cast<char*>(s.c_str()));
    envp.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        setFromErrno(err, errno, "fork");
        closeAll();
        return false;
    }
    if (pid == 0) {
        ::dup2(inPipe[0], STDIN_FILENO);
        if (opts.captureOutput) {
            ::dup2(outPipe[1], STDOUT_FILENO);
            ::dup2(errPipe[1], STDERR_FILENO);
        }
        if (!opts.cwd.empty() && ::chdir(opts.cwd.c_str()) != 0) _exit(127);
        ::execle("/bin/sh", "sh", "-c", cmd.c_str(), static_cast<char*>(nullptr), envp.data());
        _exit(127);
    }

    ::close(inPipe[0]);
    inPipe[0] = -1;
    if (opts.captureOutput) {
        ::close(outPipe[1]);
        ::close(errPipe[1]);
        outPipe[1] = errPipe[1] = -1;
    }

    // Feed stdin and drain both outputs together.
    SigpipeBlock noSigpipe;
    size_t written = 0;
    if (opts.input.empty()) {
        ::close(inPipe[1]);
        inPipe[1] = -1;
    }
    char buf[16 * 1024];
    for (;;) {
        struct pollfd fds[3];
        nfds_t n = 0;
        if (inPipe[1] >= 0) fds[n++] = {inPipe[1], POLLOUT, 0};
        if (outPipe[0] >= 0) fds[n++] = {outPipe[0], POLLIN, 0};
        if (errPipe[0] >= 0) fds[n++] = {errPipe[0], POLLIN, 0};
        if (n == 0) break;
        if (::poll(fds, n, -1) < 0) {
            if (errno == EINTR) continue;
            setFromErrno(err, errno, "poll");
            break;
        }
        for (nfds_t i = 0; i < n; ++i) {
            if (!fds[i].revents) continue;
            if (fds[i].fd == inPipe[1]) {
                ssize_t w = ::write(inPipe[1], opts.input.data() + written, opts.input.size() - written);
                if (w > 0) written += static_cast<size_t>(w);
                if (w < 0 || written >= opts.input.size()) {
                    ::close(inPipe[1]);
                    inPipe[1] = -1;
                }
                continue;
            }
            ssize_t r = ::read(fds[i].fd, buf, sizeof(buf));
            if (r > 0) {
                (fds[i].fd == outPipe[0] ? out.stdoutText : out.stderrText).append(buf, static_cast<size_t>(r));
            } else if (r == 0 || errno != EINTR) {
                int& fd = fds[i].fd == outPipe[0] ? outPipe[0] : errPipe[0];
                ::close(fd);
                fd = -1;
            }
        }
    }
    closeAll();

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            setFromErrno(err, errno, "waitpid");
            return false;
        }
    }
    if (err) return false;
    out.returncode = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    LOGD("run.local cmd=\"%s\" rc=%d", cmd.c_str(), out.returncode);
    return finish(args, opts, out, err);
}

RemoteProcessRunner::RemoteProcessRunner(Session& session, RetryGuard& guard, RetryPolicy policy)
    : session_(session),
      guard_(guard),
      policy_(policy.excluding({ErrorKind::ProcessFailed, ErrorKind::InvalidArgument})) {}

bool RemoteProcessRunner::run(const std::vector<std::string>& args, const RunOptions& opts,
                              CompletedProcess& out, Error& err) {
    out = CompletedProcess{};
    if (args.empty()) {
        err.set(ErrorKind::InvalidArgument, "empty command");
        return false;
    }
    ExecRequest req;
    req.command = commandLine(args);
    if (!opts.cwd.empty()) req.command = "cd " + shellQuote(opts.cwd) + " && " + req.command;
    req.env = opts.env;
    req.input = opts.input;

    ExecResult res;
    const bool ok = guard_.run(session_, policy_, "run", [&](Error& e) {
        return session_.exec(req, res, e);
    }, err);
    if (!ok) return false;

    out.returncode = res.exit_status;
    if (opts.captureOutput) {
        out.stdoutText = std::move(res.stdout_data);
        out.stderrText = std::move(res.stderr_data);
    }
    LOGD("run.remote host=%s cmd=\"%s\" rc=%d", session_.host().c_str(), req.command.c_str(), out.returncode);
    return finish(args, opts, out, err);
}

} // namespace sshutils
