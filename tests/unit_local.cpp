#undef NDEBUG
#include "sshutils/FileTree.hpp"
#include "sshutils/LocalFileSystem.hpp"
#include "sshutils/PathProxy.hpp"
#include "sshutils/ProcessRunner.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <pthread.h>
#include <signal.h>
#include <string>
#include <thread>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

using namespace sshutils;
namespace fs = std::filesystem;

static fs::path make_temp_dir(const char* name){
    fs::path p = fs::absolute(fs::path("unit_tmp") / "local" / name);
    fs::remove_all(p);
    fs::create_directories(p);
    return p;
}

static void write_file(const fs::path& p, const std::string& content){
    fs::create_directories(p.parent_path());
    std::ofstream o(p, std::ios::binary);
    o << content;
}

static void test_local_filesystem_basics(){
    auto dir = make_temp_dir("fs");
    const std::string d = dir.string();
    LocalFileSystem lfs;
    Error err;
    assert(!lfs.isRemote() && lfs.name() == "local");

    assert(lfs.mkdir(d + "/sub", 0755, err));
    assert(!lfs.mkdir(d + "/sub", 0755, err));
    assert(err.kind == ErrorKind::AlreadyExists);
    err.clear();
    write_file(dir / "sub" / "a.txt", "abc");
    write_file(dir / "b.txt", "b");

    FileInfo info;
    assert(lfs.stat(d + "/sub/a.txt", info, err));
    assert(info.size == 3 && info.kind() == FileKind::File && info.name == "a.txt");
    assert(!lfs.stat(d + "/none", info, err));
    assert(err.kind == ErrorKind::NotFound);
    err.clear();

    std::vector<FileInfo> entries;
    assert(lfs.list(d, entries, err));
    std::set<std::string> names;
    for (const auto& e : entries) names.insert(e.name);
    assert((names == std::set<std::string>{"sub", "b.txt"}));

    assert(!lfs.rename(d + "/b.txt", d + "/sub/a.txt", false, err));
    assert(err.kind == ErrorKind::AlreadyExists);
    err.clear();
    assert(lfs.rename(d + "/b.txt", d + "/c.txt", false, err));
    assert(lfs.rename(d + "/c.txt", d + "/sub/a.txt", true, err));
    assert(lfs.stat(d + "/sub/a.txt", info, err) && info.size == 1);

    assert(!lfs.removeDir(d + "/sub", err));
    assert(err.kind == ErrorKind::NotEmpty);
    err.clear();
    assert(!lfs.removeFile(d + "/none", err));
    assert(err.kind == ErrorKind::NotFound);
    err.clear();

    assert(lfs.symlink(d + "/sub/a.txt", d + "/ln", err));
    assert(lfs.lstat(d + "/ln", info, err) && info.isLink());
    assert(lfs.stat(d + "/ln", info, err) && info.kind() == FileKind::File);
    std::string real;
    assert(lfs.realpath(d + "/ln", real, err));
    assert(real == fs::canonical(dir / "sub" / "a.txt").string());

    assert(lfs.chmod(d + "/sub/a.txt", 0600, err));
    assert(lfs.stat(d + "/sub/a.txt", info, err) && (info.mode & 0777) == 0600);

    assert(lfs.makedirs(d + "/m/n/o", 0755, false, err));
    assert(lfs.isDir(d + "/m/n/o"));
    assert(!lfs.makedirs(d + "/m/n/o", 0755, false, err));
    err.clear();
    assert(lfs.makedirs(d + "/m/n/o", 0755, true, err));

    bool isDir = false;
    assert(lfs.exists(d + "/m", isDir, err) && isDir);
    assert(!lfs.exists(d + "/zzz", isDir, err));
    assert(!err);

    FileTree tree(lfs);
    assert(tree.rmtree(d + "/m", false, err));
    assert(!fs::exists(dir / "m"));
}

static void test_local_disk_full(){
    auto dir = make_temp_dir("full");
    write_file(dir / "src.bin", std::string(64 * 1024, 'y'));
    LocalFileSystem lfs;
    Error err;
    assert(!lfs.copy((dir / "src.bin").string(), "/dev/full", {}, err));
    assert(err.kind == ErrorKind::LocalIo);
    assert(!isTransient(err.kind));
    assert(err.describe().find("LocalIo: ") == 0);
}

static void test_local_text_files(){
    auto dir = make_temp_dir("text");
    const std::string path = (dir / "t.txt").string();
    LocalFileSystem lfs;
    OpenSpec spec;
    Error err;
    assert(OpenSpec::parse("w", spec, err));
    spec.encoding = "latin1";
    auto f = lfs.openFile(path, spec, err);
    assert(f);
    assert(f->write("caf\xc3\xa9\n", err));
    assert(f->close(err));
    std::ifstream raw(path, std::ios::binary);
    assert(std::string((std::istreambuf_iterator<char>(raw)), {}) == "caf\xe9\n");

    assert(OpenSpec::parse("a", spec, err));
    f = lfs.openFile(path, spec, err);
    assert(f && f->write("more\n", err) && f->close(err));

    assert(OpenSpec::parse("rb", spec, err));
    f = lfs.openFile(path, spec, err);
    std::string bytes;
    assert(f && f->binary() && f->read(bytes, err));
    assert(bytes == "caf\xe9\nmore\n");

    assert(OpenSpec::parse("x", spec, err));
    assert(!lfs.openFile(path, spec, err));
    assert(err.kind == ErrorKind::AlreadyExists);
    err.clear();

    assert(OpenSpec::parse("r", spec, err));
    assert(!lfs.openFile((dir / "absent").string(), spec, err));
    assert(err.kind == ErrorKind::NotFound);
    err.clear();

    DecodeErrors de;
    assert(parseDecodeErrors("replace", de, err) && de == DecodeErrors::Replace);
    assert(!parseDecodeErrors("shout", de, err));
    assert(err.kind == ErrorKind::InvalidArgument);
}

static void test_local_process_runner(){
    auto dir = make_temp_dir("proc");
    LocalProcessRunner runner;
    CompletedProcess res;
    Error err;

    assert(runner.run({"printf", "a b\n\n"}, RunOptions{}, res, err));
    assert(res.stdoutText == "a b");
    assert(res.returncode == 0);
    assert((res.args == std::vector<std::string>{"printf", "a b\n\n"}));

    RunOptions in;
    in.input = "hello\nworld\n";
    assert(runner.run({"cat"}, in, res, err));
    assert(res.stdoutText == "hello\nworld");

    RunOptions where;
    where.cwd = dir.string();
    where.env = {{"GREETING", "hi there"}};
    assert(runner.run({"pwd; echo \"$GREETING\""}, where, res, err));
    assert(res.stdoutText == fs::canonical(dir).string() + "\nhi there");

    assert(runner.run({"exit 4"}, RunOptions{}, res, err));
    assert(res.returncode == 4);
    assert(!err);

    RunOptions check;
    check.check = true;
    assert(!runner.run({"echo oops >&2; exit 1"}, check, res, err));
    assert(err.kind == ErrorKind::ProcessFailed);
    assert(err.message == "command 'echo oops >&2; exit 1' returned non-zero exit status 1: oops");
    assert(res.stderrText == "oops");
    err.clear();

    assert(runner.run({"kill -9 $$"}, RunOptions{}, res, err));
    assert(res.returncode == 128 + 9);

    assert(!runner.run({}, RunOptions{}, res, err));
    assert(err.kind == ErrorKind::InvalidArgument);
}

static void test_process_env_across_threads(){
    setenv("SSHUTILS_T", "outer", 1);
    LocalProcessRunner runner;
    CompletedProcess res;
    Error err;
    assert(runner.run({"echo \"$SSHUTILS_T\""}, RunOptions{}, res, err));
    assert(res.stdoutText == "outer");
    RunOptions over;
    over.env = {{"SSHUTILS_T", "inner"}};
    assert(runner.run({"echo \"$SSHUTILS_T\""}, over, res, err));
    assert(res.stdoutText == "inner");
    assert(std::string(getenv("SSHUTILS_T")) == "outer");

    std::vector<std::thread> workers;
    std::vector<std::string> seen(8);
    std::vector<int> ok(8, 0);
    for (int i = 0; i < 8; ++i) {
        workers.emplace_back([&, i]{
            LocalProcessRunner r;
            CompletedProcess out;
            Error e;
            RunOptions opts;
            opts.env = {{"SSHUTILS_T", "worker" + std::to_string(i)}};
            ok[i] = r.run({"echo \"$SSHUTILS_T\""}, opts, out, e) ? 1 : 0;
            seen[i] = out.stdoutText;
        });
    }
    for (auto& w : workers) w.join();
    for (int i = 0; i < 8; ++i) {
        assert(ok[i] == 1);
        assert(seen[i] == "worker" + std::to_string(i));
    }
}

static void test_process_ignored_input_keeps_sigpipe(){
    LocalProcessRunner runner;
    CompletedProcess res;
    Error err;
    RunOptions in;
    in.input = std::string(1024 * 1024, 'z');
    assert(runner.run({"exit 0"}, in, res, err));
    assert(res.returncode == 0);
    struct sigaction current{};
    assert(sigaction(SIGPIPE, nullptr, &current) == 0);
    assert(current.sa_handler == SIG_DFL);
    sigset_t mask;
    assert(pthread_sigmask(SIG_SETMASK, nullptr, &mask) == 0);
    assert(sigismember(&mask, SIGPIPE) == 0);
}

static void test_shell_quoting(){
    assert(shellQuote("") == "''");
    assert(shellQuote("plain-word_1.txt") == "plain-word_1.txt");
    assert(shellQuote("a b") == "'a b'");
    assert(shellQuote("$HOME") == "'$HOME'");
    assert(shellQuote("it's") == "'it'\"'\"'s'");
    assert(shellJoin({"grep", "-r", "two words", "/tmp"}) == "grep -r 'two words' /tmp");
}

static void test_local_path_proxy(){
    auto dir = make_temp_dir("path");
    setenv("HOME", dir.string().c_str(), 1);
    LocalFileSystem lfs;
    Error err;
    PathProxy home(lfs, "/");
    assert(PathProxy::home(lfs, home, err));
    assert(home.str() == dir.string());
    PathProxy e(lfs, "/");
    assert(PathProxy(lfs, "~/x").expanduser(e, err));
    assert(e.str() == dir.string() + "/x");

    PathProxy f = home / "notes" / "today.md";
    assert(f.parent().mkdir(0755, false, false, err));
    assert(f.writeText("# today\n", err));
    assert(f.isFile() && !f.isSymlink());
    std::string text;
    assert(f.readText(text, err) && text == "# today\n");
    assert(f.suffix() == ".md" && f.stem() == "today");

    // A unix socket and a fifo are reported by kind
    const std::string fifo = (dir / "pipe").string();
    assert(::mkfifo(fifo.c_str(), 0600) == 0);
    assert(PathProxy(lfs, fifo).isFifo());
    const std::string sockPath = (dir / "sock").string();
    int sfd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    assert(sfd >= 0);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (sockPath.size() < sizeof(addr.sun_path)) {
        sockPath.copy(addr.sun_path, sockPath.size());
        assert(::bind(sfd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        assert(PathProxy(lfs, sockPath).isSocket());
        assert(PathProxy(lfs, sockPath).exists());
    }
    ::close(sfd);
    assert(PathProxy(lfs, "/dev/null").isCharDevice());

    std::vector<PathProxy> found;
    assert(home.rglob("*.md", found, err));
    assert(found.empty());
    assert((home / "notes").glob("*.md", found, err));
    assert(found.size() == 1 && found[0] == f);

    PathProxy notes = home / "notes";
    assert(notes.rmdir(err));
    assert(notes.str() == dir.string());
    assert(!fs::exists(dir / "notes"));
}

int main(){
    test_local_filesystem_basics();
    test_local_disk_full();
    test_local_text_files();
    test_local_process_runner();
    test_process_env_across_threads();
    test_process_ignored_input_keeps_sigpipe();
    test_shell_quoting();
    test_local_path_proxy();
    std::cout << "All unit tests passed" << std::endl;
    return 0;
}
