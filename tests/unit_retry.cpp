#undef NDEBUG
#include "sshutils/Log.hpp"
#include "sshutils/MockSftpClient.hpp"
#include "sshutils/ProcessRunner.hpp"
#include "sshutils/RemoteFileSystem.hpp"
#include "sshutils/RetryGuard.hpp"
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <vector>

using namespace sshutils;
using std::chrono::seconds;

struct Remote {
    MockSftpClient* mock = nullptr;
    std::unique_ptr<Session> session;
};

static Remote make_remote(){
    auto m = std::make_unique<MockSftpClient>();
    Remote r;
    r.mock = m.get();
    SessionOptions opt;
    opt.host = "mock.example";
    opt.username = "tester";
    r.session = std::make_unique<Session>(std::move(m), opt);
    Error err;
    assert(r.session->connect(err));
    return r;
}

static bool contains(const std::vector<std::string>& records, const std::string& needle){
    for (const auto& r : records) if (r.find(needle) != std::string::npos) return true;
    return false;
}

// Transient I/O twice, then success: two repairs, three executions of the body.
static void test_run_survives_two_transient_faults(){
    auto r = make_remote();
    r.mock->setExecHandler([](const ExecRequest&, ExecResult& out, Error&) {
        out.stdout_data = "done\n";
        return true;
    });
    r.mock->injectFault("exec", ErrorKind::Io, 2);

    std::vector<std::string> records;
    setLogSink([&](LogLevel, const std::string& msg) { records.push_back(msg); });

    std::vector<seconds> slept;
    RetryGuard guard([&](seconds s) { slept.push_back(s); });
    RemoteProcessRunner runner(*r.session, guard, RetryPolicy::standard());
    CompletedProcess res;
    Error err;
    assert(runner.run({"make all"}, RunOptions{}, res, err));
    setLogSink({});

    assert(res.stdoutText == "done");
    assert(res.returncode == 0);
    assert(r.mock->calls("exec") == 3);
    assert(guard.stats().invocations == 3);
    assert(guard.stats().faults == 2);
    assert(guard.stats().repairs == 2);
    assert(guard.stats().backoffs == 0);
    assert(slept.empty());
    assert(contains(records, "retry.fault op=run"));
    assert(contains(records, "outcome=ok"));
}

static void test_excluded_kind_propagates_without_repair(){
    auto r = make_remote();
    RetryGuard guard([](seconds) { assert(false); });
    RemoteFileSystem fs(*r.session, guard, RetryPolicy::standard());
    FileInfo info;
    Error err;
    assert(!fs.stat("/nowhere", info, err));
    assert(err.kind == ErrorKind::NotFound);
    assert(guard.stats().repairAttempts == 0);
    assert(guard.stats().propagated == 1);
    assert(r.mock->connectCount() == 1);

    // Excluding a transient kind makes it propagate too
    r.mock->injectFault("list", ErrorKind::Io);
    fs.setPolicy(RetryPolicy::standard().excluding({ErrorKind::Io}));
    std::vector<FileInfo> entries;
    err.clear();
    assert(!fs.list("/", entries, err));
    assert(err.kind == ErrorKind::Io);
    assert(guard.stats().repairAttempts == 0);
}

static void test_unrecognized_kind_is_fatal(){
    auto r = make_remote();
    r.mock->addFile("/f", "x");
    r.mock->injectFault("stat", ErrorKind::Unknown);
    RetryGuard guard([](seconds) {});
    RemoteFileSystem fs(*r.session, guard, RetryPolicy::standard());
    FileInfo info;
    Error err;
    assert(!fs.stat("/f", info, err));
    assert(err.kind == ErrorKind::Unknown);
    assert(guard.stats().repairAttempts == 0);
}

// K transient faults give exactly K repairs and at most K backoffs.
static void test_k_faults_k_repairs(){
    for (int k : {1, 3, 5}) {
        auto r = make_remote();
        r.mock->addDir("/work");
        r.mock->injectFault("list", ErrorKind::ConnectionLost, k);
        // The first repair attempt fails once
        r.mock->failConnect(ErrorKind::ConnectionLost, 1);

        int body = 0;
        std::vector<seconds> slept;
        RetryGuard guard([&](seconds s) { slept.push_back(s); });
        RetryPolicy policy = RetryPolicy::standard();
        policy.backoff = seconds(7);
        std::vector<FileInfo> entries;
        Error err;
        const bool ok = guard.run(*r.session, policy, "listdir", [&](Error& e) {
            ++body;
            return r.session->list("/", entries, e);
        }, err);
        assert(ok);
        assert(!err);
        assert(body == k + 1);
        assert(guard.stats().repairs == static_cast<std::size_t>(k));
        assert(guard.stats().backoffs <= static_cast<std::size_t>(k));
        assert(guard.stats().backoffs == 1);
        assert(slept.size() == 1 && slept[0] == seconds(7));
        assert(entries.size() == 1 && entries[0].name == "work");
        assert(r.session->isReady());
    }
}

static void test_transient_retry_is_unbounded_by_default(){
    auto r = make_remote();
    r.mock->injectFault("stat", ErrorKind::ChannelLost);
    r.mock->failConnect(ErrorKind::ConnectionLost, 20);
    int sleeps = 0;
    RetryGuard guard([&](seconds) { ++sleeps; });
    RemoteFileSystem fs(*r.session, guard, RetryPolicy::standard());
    FileInfo info;
    Error err;
    assert(fs.stat("/", info, err));
    assert(sleeps == 20);
    assert(guard.stats().repairAttempts == 21);
    assert(guard.stats().repairs == 1);
}

static void test_retry_budget_gives_up(){
    auto r = make_remote();
    r.mock->injectFault("stat", ErrorKind::ConnectionLost);
    r.mock->failConnect(ErrorKind::ConnectionLost, 10);
    std::vector<seconds> slept;
    RetryGuard guard([&](seconds s) { slept.push_back(s); });
    RetryPolicy policy = RetryPolicy::standard();
    policy.backoff = seconds(10);
    policy.retryBudget = seconds(25);
    RemoteFileSystem fs(*r.session, guard, policy);
    FileInfo info;
    Error err;
    assert(!fs.stat("/", info, err));
    assert(err.kind == ErrorKind::ConnectionLost);
    assert(err.message.find("retry budget") != std::string::npos);
    assert(slept.size() == 2);
    assert(guard.stats().repairAttempts == 3);
    assert(guard.stats().repairs == 0);
}

static void test_repair_stops_on_argument_error(){
    SessionOptions opt;
    opt.host = "mock.example";
    opt.username = "tester";
    auto m = std::make_unique<MockSftpClient>();
    MockSftpClient* mock = m.get();
    Session session(std::move(m), opt);
    Error err;
    assert(session.connect(err));
    mock->injectFault("stat", ErrorKind::ConnectionLost);
    mock->failConnect(ErrorKind::InvalidArgument, 1);
    int sleeps = 0;
    RetryGuard guard([&](seconds) { ++sleeps; });
    RemoteFileSystem fs(session, guard, RetryPolicy::standard());
    FileInfo info;
    assert(!fs.stat("/", info, err));
    assert(err.kind == ErrorKind::InvalidArgument);
    assert(sleeps == 0);
}

// A full local disk is reported as it is; the healthy session is left alone.
static void test_local_disk_failure_is_not_retried(){
    auto r = make_remote();
    r.mock->addFile("/big.bin", std::string(64 * 1024, 'x'));
    int sleeps = 0;
    RetryGuard guard([&](seconds) { ++sleeps; });
    RemoteFileSystem fs(*r.session, guard, RetryPolicy::standard());
    Error err;
    assert(!fs.download("/big.bin", "/dev/full", {}, err));
    assert(err.kind == ErrorKind::LocalIo);
    assert(!isTransient(err.kind));
    assert(r.mock->calls("get") == 1);
    assert(guard.stats().repairAttempts == 0);
    assert(guard.stats().propagated == 1);
    assert(sleeps == 0);
    assert(r.session->isReady());
    assert(r.mock->connectCount() == 1);
}

static void test_policy_helpers(){
    RetryPolicy p = RetryPolicy::standard();
    assert(p.excludes(ErrorKind::NotFound));
    assert(p.excludes(ErrorKind::InvalidArgument));
    assert(!p.excludes(ErrorKind::Io));
    assert(p.backoff == seconds(60));
    assert(p.authAttempts == 3);
    assert(p.retryBudget == seconds(0));
    RetryPolicy q = p.excluding({ErrorKind::Io, ErrorKind::NotFound});
    assert(q.excludes(ErrorKind::Io));
    assert(q.excluded.size() == p.excluded.size() + 1);
    assert(!p.excludes(ErrorKind::Io));
}

static void test_process_failure_is_not_retried(){
    auto r = make_remote();
    r.mock->setExecHandler([](const ExecRequest&, ExecResult& out, Error&) {
        out.exit_status = 3;
        out.stderr_data = "boom\n";
        return true;
    });
    RetryGuard guard([](seconds) {});
    RemoteProcessRunner runner(*r.session, guard, RetryPolicy::standard());
    RunOptions opts;
    opts.check = true;
    opts.cwd = "/srv/app dir";
    opts.env = {{"LANG", "C"}};
    CompletedProcess res;
    Error err;
    assert(!runner.run({"ls", "-l", "it's"}, opts, res, err));
    assert(err.kind == ErrorKind::ProcessFailed);
    assert(err.message.find("exit status 3") != std::string::npos);
    assert(res.returncode == 3);
    assert(res.stderrText == "boom");
    assert(r.mock->calls("exec") == 1);
    assert(guard.stats().repairAttempts == 0);

    const ExecRequest& sent = r.mock->execLog().back();
    assert(sent.command == "cd '/srv/app dir' && ls -l 'it'\"'\"'s'");
    assert(sent.env.size() == 1 && sent.env[0].first == "LANG");

    err.clear();
    assert(!runner.run({}, RunOptions{}, res, err));
    assert(err.kind == ErrorKind::InvalidArgument);
}

int main(){
    test_run_survives_two_transient_faults();
    test_excluded_kind_propagates_without_repair();
    test_unrecognized_kind_is_fatal();
    test_k_faults_k_repairs();
    test_transient_retry_is_unbounded_by_default();
    test_retry_budget_gives_up();
    test_repair_stops_on_argument_error();
    test_local_disk_failure_is_not_retried();
    test_policy_helpers();
    test_process_failure_is_not_retried();
    std::cout << "All unit tests passed" << std::endl;
    return 0;
}
