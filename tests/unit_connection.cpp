#undef NDEBUG
#include "sshutils/HostRegistry.hpp"
#include "sshutils/MockSftpClient.hpp"
#include "sshutils/MultiConnection.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

using namespace sshutils;
namespace fs = std::filesystem;

static fs::path make_temp_dir(const char* name){
    fs::path p = fs::absolute(fs::path("unit_tmp") / "connection" / name);
    fs::remove_all(p);
    fs::create_directories(p);
    return p;
}

static void write_file(const fs::path& p, const std::string& content){
    fs::create_directories(p.parent_path());
    std::ofstream o(p, std::ios::binary);
    o << content;
}

// Builds mocks whose exec prints the host they are connected to.
struct MockFactory {
    std::vector<MockSftpClient*> made;
    int authFailures = 0;

    ClientFactory factory() {
        return [this]() {
            auto m = std::make_unique<MockSftpClient>();
            MockSftpClient* raw = m.get();
            if (authFailures) raw->failConnect(ErrorKind::Auth, authFailures);
            raw->setExecHandler([raw](const ExecRequest& req, ExecResult& out, Error& err) {
                if (raw->lastOptions().host == "broken.example") {
                    err.set(ErrorKind::Unknown, "remote shell crashed");
                    return false;
                }
                out.stdout_data = raw->lastOptions().host + ": " + req.command + "\n";
                return true;
            });
            made.push_back(raw);
            return std::unique_ptr<SftpClient>(std::move(m));
        };
    }
};

static ConnectionDescriptor remote_desc(const std::string& name, const std::string& address){
    ConnectionDescriptor d;
    d.serverName = name;
    d.address = address;
    d.username = "tester";
    return d;
}

static void test_descriptor_string_form(){
    ConnectionDescriptor d;
    d.serverName = "alpha";
    d.address = "10.0.0.5";
    d.username = "ops";
    d.keyFile = "/home/ops/.ssh/id_rsa";
    d.port = 2222;
    d.threadSafe = true;
    const std::string s = d.toString();
    assert(s == "<SSHConnection:alpha>(user_name:ops | rsa_key:/home/ops/.ssh/id_rsa | "
                "address:10.0.0.5 | port:2222 | thread_safe:True)");
    ConnectionDescriptor back;
    Error err;
    assert(ConnectionDescriptor::fromString(s, back, err));
    assert(back == d);

    d.keyFile.reset();
    d.threadSafe = false;
    assert(d.toString().find("rsa_key:None") != std::string::npos);
    assert(d.toString().find("thread_safe:False") != std::string::npos);
    assert(ConnectionDescriptor::fromString(d.toString(), back, err));
    assert(!back.keyFile);
    assert(back == d);

    ConnectionDescriptor viaMap;
    assert(ConnectionDescriptor::fromMap(d.toMap(), viaMap, err));
    assert(viaMap == d);

    SessionOptions opt = d.toSessionOptions();
    assert(opt.host == "10.0.0.5" && opt.port == 2222 && opt.username == "ops");
    assert(!opt.private_key_path && !opt.password);
}

static void test_descriptor_rejects_garbage(){
    ConnectionDescriptor out;
    Error err;
    assert(!ConnectionDescriptor::fromString("alpha", out, err));
    assert(err.kind == ErrorKind::InvalidArgument);
    err.clear();
    assert(!ConnectionDescriptor::fromString("<Telnet:alpha>(user_name:u | address:a)", out, err));
    err.clear();
    assert(!ConnectionDescriptor::fromString("<SSHConnection:alpha>(user_name:u | address:a | port:x)", out, err));
    err.clear();
    assert(!ConnectionDescriptor::fromString("<SSHConnection:alpha>(user_name:u | port:22)", out, err));
    err.clear();
    std::map<std::string, std::string> m{{"server_name", "a"}, {"address", "h"}, {"thread_safe", "maybe"}};
    assert(!ConnectionDescriptor::fromMap(m, out, err));
    assert(err.kind == ErrorKind::InvalidArgument);
}

static void test_host_registry(){
    auto dir = make_temp_dir("registry");
    write_file(dir / "config",
               "# hosts\n"
               "Host alpha\n"
               "    HostName alpha.example.com\n"
               "    User ops\n"
               "    IdentityFile ~/.ssh/alpha_key\n"
               "\n"
               "Host beta gamma\n"
               "    HostName=beta.example.com\n"
               "    User deploy\n"
               "    Port 2200\n"
               "Host nouser\n"
               "    HostName nouser.example.com\n"
               "Host db.internal\n"
               "    HostName 10.1.2.3\n"
               "Host *.internal\n"
               "    User internal\n"
               "    Port 2201\n"
               "Host *\n"
               "    Port 2022\n"
               "    ForwardAgent yes\n"
               "Match host alpha\n"
               "    User ignored\n");

    HostRegistry reg("/home/test");
    Error err;
    assert(reg.loadFile((dir / "config").string(), err));
    assert((reg.availableHosts() == std::vector<std::string>{"alpha", "beta", "gamma", "db.internal"}));

    ConnectionDescriptor d;
    assert(reg.lookup("alpha", d, err));
    assert(d.serverName == "alpha" && d.address == "alpha.example.com" && d.username == "ops");
    assert(d.port == 2022);
    assert(d.keyFile && *d.keyFile == "/home/test/.ssh/alpha_key");

    assert(reg.lookup("gamma", d, err));
    assert(d.address == "beta.example.com" && d.username == "deploy" && d.port == 2200 && !d.keyFile);

    assert(reg.lookup("db.internal", d, err));
    assert(d.username == "internal" && d.port == 2201);

    assert(!reg.lookup("nouser", d, err));
    assert(err.kind == ErrorKind::NotFound);
    err.clear();
    assert(!reg.lookup("*.internal", d, err));
    assert(err.kind == ErrorKind::NotFound);
    err.clear();

    ConnectionDescriptor extra = remote_desc("extra", "extra.example.com");
    reg.add(extra);
    assert(reg.contains("extra"));
    assert(reg.availableHosts().back() == "extra");
    assert(reg.lookup("extra", d, err) && d == extra);

    HostRegistry empty;
    assert(empty.loadFile((dir / "does-not-exist").string(), err));
    assert(empty.availableHosts().empty());
}

// A dropped connection in the middle of a tree download restarts the whole transfer.
static void test_connection_restarts_tree_transfer(){
    MockFactory mf;
    Error err;
    auto conn = Connection::openRemote(remote_desc("alpha", "alpha.example"), RetryPolicy::standard(),
                                       mf.factory(), err, [](std::chrono::seconds) {});
    assert(conn);
    assert(conn->isRemote());
    assert(conn->fs().isRemote());
    MockSftpClient* mock = mf.made.at(0);
    mock->addFile("/src/f1.txt", "one");
    mock->addFile("/src/f2.txt", "two");
    mock->addFile("/src/f3.txt", "three");
    mock->injectFault("get", ErrorKind::ConnectionLost, 1, "/src/f2.txt");

    auto dst = make_temp_dir("restart");
    TransferOptions opts;
    opts.removeSourceAfter = true;
    TransferPlan plan;
    assert(conn->downloadTree("/src", dst.string(), opts, plan, err));
    assert(plan.files.size() == 3);
    assert(mock->calls("get") == 5);
    assert(conn->guardStats().repairs == 1);
    assert(fs::exists(dst / "f3.txt"));
    assert(!mock->hasPath("/src"));

    CompletedProcess res;
    assert(conn->run({"hostname"}, RunOptions{}, res, err));
    assert(res.stdoutText == "alpha.example: hostname");

    PathProxy p = conn->path("/src");
    assert(!p.exists());
    std::vector<std::string> found;
    assert(conn->tree().glob("/", "*", found, err));

    conn->close();
    conn->close();
    assert(conn->session()->state() == SessionState::Disconnected);
}

// An I/O failure on one file ends the tree download and keeps the source.
static void test_connection_tree_io_failure_is_final(){
    MockFactory mf;
    Error err;
    auto conn = Connection::openRemote(remote_desc("alpha", "alpha.example"), RetryPolicy::standard(),
                                       mf.factory(), err, [](std::chrono::seconds) { assert(false); });
    assert(conn);
    MockSftpClient* mock = mf.made.at(0);
    mock->addFile("/src/f1.txt", "one");
    mock->addFile("/src/f2.txt", "two");
    mock->addFile("/src/f3.txt", "three");
    mock->injectFault("get", ErrorKind::Io, 100, "/src/f2.txt");

    auto dst = make_temp_dir("io_final");
    TransferOptions opts;
    opts.removeSourceAfter = true;
    TransferPlan plan;
    assert(!conn->downloadTree("/src", dst.string(), opts, plan, err));
    assert(err.kind == ErrorKind::Io);
    assert(err.message.find("failed to copy /src/f2.txt -> ") == 0);
    assert(mock->calls("get") == 2);
    assert(conn->guardStats().repairAttempts == 0);
    assert(mock->hasPath("/src/f1.txt") && mock->hasPath("/src/f2.txt") && mock->hasPath("/src/f3.txt"));
    assert(mock->calls("removeFile") == 0);
    assert(!fs::exists(dst / "f3.txt"));
}

static void test_connection_open_failures(){
    MockFactory mf;
    mf.authFailures = 10;
    Error err;
    RetryPolicy policy = RetryPolicy::standard();
    policy.authAttempts = 2;
    auto conn = Connection::openRemote(remote_desc("alpha", "alpha.example"), policy, mf.factory(), err);
    assert(!conn);
    assert(err.kind == ErrorKind::ConnectFailed);
    assert(mf.made.at(0)->connectCount() == 2);

    ConnectionDescriptor local;
    local.serverName = "laptop";
    local.local = true;
    err.clear();
    assert(!Connection::openRemote(local, policy, mf.factory(), err));
    assert(err.kind == ErrorKind::InvalidArgument);
}

static void test_local_connection(){
    auto conn = Connection::openLocal("laptop");
    assert(!conn->isRemote());
    assert(!conn->fs().isRemote());
    assert(conn->descriptor().local);
    ConnectionDescriptor back;
    Error err;
    assert(ConnectionDescriptor::fromString(conn->descriptor().toString(), back, err));
    assert(back.local && back.serverName == "laptop");

    auto dir = make_temp_dir("local");
    write_file(dir / "in" / "a.txt", "a");
    TransferPlan plan;
    assert(conn->uploadTree((dir / "in").string(), (dir / "out").string(), TransferOptions{}, plan, err));
    assert(fs::exists(dir / "out" / "a.txt"));
    assert(conn->copyFile((dir / "in" / "a.txt").string(), (dir / "b.txt").string(),
                          TransferDirection::Download, {}, err));
    assert(conn->path((dir / "b.txt").string()).isFile());

    CompletedProcess res;
    RunOptions opts;
    opts.cwd = dir.string();
    assert(conn->run({"ls"}, opts, res, err));
    assert(res.stdoutText.find("b.txt") != std::string::npos);
    assert(conn->guardStats().invocations == 0);
    conn->close();
}

static void test_multi_connection_fan_out(){
    MockFactory mf;
    std::vector<ConnectionDescriptor> descs = {remote_desc("alpha", "alpha.example"),
                                               remote_desc("beta", "beta.example"),
                                               remote_desc("gamma", "gamma.example")};
    MultiConnection multi;
    Error err;
    assert(multi.open(descs, RetryPolicy::standard(), mf.factory(), err));
    assert(multi.size() == 3);

    auto extra = Connection::openRemote(remote_desc("beta", "broken.example"), RetryPolicy::standard(),
                                        mf.factory(), err);
    assert(extra);
    multi.add(std::move(extra));
    assert(multi.size() == 4);
    assert((multi.keys() == std::vector<std::string>{"alpha", "beta", "gamma"}));
    assert(multi.get("beta")->descriptor().address == "beta.example");
    assert(multi.get("beta", 1)->descriptor().address == "broken.example");
    assert(multi.get("beta", 2) == nullptr);
    assert(multi.get("delta") == nullptr);

    multi.setMaxConcurrent(2);
    auto results = multi.runCommand({"uptime"}, RunOptions{});
    assert(results.size() == 4);
    assert(results[0].ok && results[0].key == "alpha" && results[0].value.stdoutText == "alpha.example: uptime");
    assert(results[1].ok && results[1].value.stdoutText == "beta.example: uptime");
    assert(results[2].ok && results[2].value.stdoutText == "gamma.example: uptime");
    assert(!results[3].ok && results[3].key == "beta");
    assert(results[3].error.kind == ErrorKind::Unknown);

    auto sizes = multi.runAll<std::size_t>([](Connection& c, std::size_t& n, Error& e) {
        std::vector<FileInfo> entries;
        if (!c.fs().list("/", entries, e)) return false;
        n = entries.size();
        return true;
    });
    for (const auto& s : sizes) assert(s.ok && s.value == 0);

    auto saved = multi.descriptors();
    assert(saved.size() == 4);
    assert(saved[0] == descs[0] && saved[2] == descs[2]);

    multi.closeAll();
    for (std::size_t i = 0; i < multi.size(); ++i)
        assert(multi.at(i).session()->state() == SessionState::Disconnected);

    MultiConnection restored;
    assert(restored.open(saved, RetryPolicy::standard(), mf.factory(), err));
    assert(restored.size() == 4);
}

int main(){
    test_descriptor_string_form();
    test_descriptor_rejects_garbage();
    test_host_registry();
    test_connection_restarts_tree_transfer();
    test_connection_tree_io_failure_is_final();
    test_connection_open_failures();
    test_local_connection();
    test_multi_connection_fan_out();
    std::cout << "All unit tests passed" << std::endl;
    return 0;
}
