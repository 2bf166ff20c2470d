// Command execution with the same surface locally and on a remote host.
#pragma once
#include "Error.hpp"
#include "RetryGuard.hpp"
#include "Session.hpp"
#include <string>
#include <utility>
#include <vector>

namespace sshutils {

struct RunOptions {
    std::string cwd;                                          // empty: default directory
    std::vector<std::pair<std::string, std::string>> env;     // added to the environment
    std::string input;                                        // fed to stdin
    bool check = false;                                       // non-zero exit -> ProcessFailed
    bool captureOutput = true;
};

struct CompletedProcess {
    std::vector<std::string> args;
    int returncode = 0;
    std::string stdoutText;   // trailing whitespace removed
    std::string stderrText;
};

// Joins args into a shell command line, quoting arguments that need it.
std::string shellJoin(const std::vector<std::string>& args);
std::string shellQuote(const std::string& s);

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;
    virtual bool run(const std::vector<std::string>& args, const RunOptions& opts,
                     CompletedProcess& out, Error& err) = 0;

protected:
    // Applies check and records the args; shared by both implementations.
    static bool finish(const std::vector<std::string>& args, const RunOptions& opts,
                       CompletedProcess& out, Error& err);
};

// /bin/sh -c through fork/exec with pipes.
class LocalProcessRunner : public ProcessRunner {
public:
    bool run(const std::vector<std::string>& args, const RunOptions& opts,
             CompletedProcess& out, Error& err) override;
};

// exec over the session transport, guarded; ProcessFailed and argument errors are never retried.
class RemoteProcessRunner : public ProcessRunner {
public:
    RemoteProcessRunner(Session& session, RetryGuard& guard, RetryPolicy policy);

    bool run(const std::vector<std::string>& args, const RunOptions& opts,
             CompletedProcess& out, Error& err) override;

private:
    Session& session_;
    RetryGuard& guard_;
    RetryPolicy policy_;
};

} // namespace sshutils
