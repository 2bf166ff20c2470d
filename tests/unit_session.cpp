#undef NDEBUG
#include "sshutils/MockSftpClient.hpp"
#include "sshutils/Session.hpp"
#include <cassert>
#include <iostream>
#include <memory>

using namespace sshutils;

struct Remote {
    MockSftpClient* mock = nullptr;
    std::unique_ptr<Session> session;
};

static Remote make_remote(int authAttempts = 3, bool threadSafe = false) {
    auto m = std::make_unique<MockSftpClient>();
    Remote r;
    r.mock = m.get();
    SessionOptions opt;
    opt.host = "mock.example";
    opt.username = "tester";
    r.session = std::make_unique<Session>(std::move(m), opt, authAttempts, threadSafe);
    return r;
}

static void test_channel_opens_lazily_once(){
    auto r = make_remote();
    Error err;
    assert(r.session->state() == SessionState::Disconnected);
    assert(r.session->connect(err));
    assert(r.session->state() == SessionState::Connected);
    assert(r.mock->channelOpenCount() == 0);

    FileInfo info;
    assert(r.session->stat("/", info, err));
    assert(info.isDir());
    assert(r.session->isReady());
    assert(r.session->channelWanted());
    assert(r.session->stat("/", info, err));
    assert(r.mock->channelOpenCount() == 1);

    // Connecting again is a no-op
    assert(r.session->connect(err));
    assert(r.mock->connectCount() == 1);
}

static void test_auth_attempts_are_capped(){
    auto r = make_remote(3);
    r.mock->failConnect(ErrorKind::Auth, 5);
    Error err;
    assert(!r.session->connect(err));
    assert(err.kind == ErrorKind::ConnectFailed);
    assert(err.message.find("after 3 attempts") != std::string::npos);
    assert(r.mock->connectCount() == 3);
    assert(r.session->state() == SessionState::Disconnected);
}

static void test_auth_recovers_within_cap(){
    auto r = make_remote(3);
    r.mock->failConnect(ErrorKind::Auth, 2);
    Error err;
    assert(r.session->connect(err));
    assert(r.mock->connectCount() == 3);
    assert(r.session->isConnected());
}

static void test_other_connect_failures_are_not_retried(){
    auto r = make_remote(3);
    r.mock->failConnect(ErrorKind::Protocol, 1);
    Error err;
    assert(!r.session->connect(err));
    assert(err.kind == ErrorKind::Protocol);
    assert(r.mock->connectCount() == 1);
}

static void test_password_and_key_rejected(){
    SessionOptions opt;
    opt.host = "mock.example";
    opt.username = "tester";
    opt.password = "secret";
    opt.private_key_path = "/home/tester/.ssh/id_rsa";
    auto m = std::make_unique<MockSftpClient>();
    MockSftpClient* mock = m.get();
    Session s(std::move(m), opt);
    Error err;
    assert(!s.connect(err));
    assert(err.kind == ErrorKind::InvalidArgument);
    assert(mock->connectCount() == 0);
}

static void test_close_is_idempotent(){
    auto r = make_remote();
    r.session->close(); // never connected
    Error err;
    assert(r.session->connect(err));
    r.session->close();
    r.session->close();
    assert(r.session->state() == SessionState::Disconnected);
    assert(!r.mock->isConnected());
}

static void test_channel_open_failure_keeps_transport(){
    auto r = make_remote();
    Error err;
    assert(r.session->connect(err));
    r.mock->failChannel(1);
    FileInfo info;
    assert(!r.session->stat("/", info, err));
    assert(err.kind == ErrorKind::ChannelOpen);
    assert(r.session->state() == SessionState::Connected);
    err.clear();
    assert(r.session->stat("/", info, err));
    assert(r.session->isReady());
}

static void test_transient_failure_disconnects(){
    auto r = make_remote();
    Error err;
    assert(r.session->connect(err));
    r.mock->addFile("/data/a.txt", "abc");
    r.mock->injectFault("stat", ErrorKind::Io);
    FileInfo info;
    assert(!r.session->stat("/data/a.txt", info, err));
    assert(err.kind == ErrorKind::Io);
    assert(r.session->state() == SessionState::Disconnected);

    err.clear();
    assert(!r.session->stat("/data/a.txt", info, err));
    assert(err.kind == ErrorKind::ConnectionLost);

    // Domain errors leave the session alone
    err.clear();
    assert(r.session->reconnect(err));
    assert(!r.session->stat("/data/missing", info, err));
    assert(err.kind == ErrorKind::NotFound);
    assert(r.session->isReady());
}

static void test_reconnect_reopens_channel(){
    auto r = make_remote();
    Error err;
    assert(r.session->connect(err));
    std::vector<FileInfo> entries;
    assert(r.session->list("/", entries, err));
    r.mock->dropConnection();
    assert(r.session->reconnect(err));
    assert(r.session->isReady());
    assert(r.mock->connectCount() == 2);
    assert(r.mock->channelOpenCount() == 2);

    // Without a prior channel, reconnect stops at Connected
    auto q = make_remote();
    assert(q.session->connect(err));
    assert(q.session->reconnect(err));
    assert(q.session->state() == SessionState::Connected);
    assert(q.mock->channelOpenCount() == 0);
}

static void test_exec_needs_only_transport(){
    auto r = make_remote();
    r.mock->setExecHandler([](const ExecRequest& req, ExecResult& out, Error&) {
        out.stdout_data = "ran " + req.command;
        return true;
    });
    Error err;
    ExecRequest req;
    req.command = "true";
    ExecResult res;
    assert(!r.session->exec(req, res, err));
    assert(err.kind == ErrorKind::ConnectionLost);
    err.clear();
    assert(r.session->connect(err));
    assert(r.session->exec(req, res, err));
    assert(res.stdout_data == "ran true");
    assert(r.mock->channelOpenCount() == 0);
}

static void test_lock_modes(){
    auto plain = make_remote(3, false);
    assert(!plain.session->lock().owns_lock());
    auto safe = make_remote(3, true);
    auto lk = safe.session->lock();
    assert(lk.owns_lock());
    // Re-entrant
    assert(safe.session->lock().owns_lock());
}

int main(){
    test_channel_opens_lazily_once();
    test_auth_attempts_are_capped();
    test_auth_recovers_within_cap();
    test_other_connect_failures_are_not_retried();
    test_password_and_key_rejected();
    test_close_is_idempotent();
    test_channel_open_failure_keeps_transport();
    test_transient_failure_disconnects();
    test_reconnect_reopens_channel();
    test_exec_needs_only_transport();
    test_lock_modes();
    std::cout << "All unit tests passed" << std::endl;
    return 0;
}
