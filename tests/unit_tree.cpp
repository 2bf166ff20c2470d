#undef NDEBUG
#include "sshutils/FileTree.hpp"
#include "sshutils/MockSftpClient.hpp"
#include "sshutils/RemoteFileSystem.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <set>

using namespace sshutils;

struct Remote {
    MockSftpClient* mock = nullptr;
    std::unique_ptr<Session> session;
    std::unique_ptr<RetryGuard> guard;
    std::unique_ptr<RemoteFileSystem> fs;
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
    r.guard = std::make_unique<RetryGuard>([](std::chrono::seconds) {});
    r.fs = std::make_unique<RemoteFileSystem>(*r.session, *r.guard, RetryPolicy::standard());
    return r;
}

static void seed(MockSftpClient& m){
    m.addFile("/t/a.txt", "aaaa");
    m.addFile("/t/d1/b.txt", "bb");
    m.addFile("/t/d1/d2/c.txt", "c");
    m.addDir("/t/d3");
    m.addSymlink("/t/link", "/t/d1");
}

static std::vector<std::string> walk_roots(FileSystem& fs, const std::string& top, bool follow, bool topDown){
    std::vector<std::string> roots;
    TreeWalker w(fs, top, follow, topDown);
    Error err;
    while (w.next(err)) roots.push_back(w.step().root);
    assert(!err);
    return roots;
}

static void test_walk_partitions_each_directory(){
    auto r = make_remote();
    seed(*r.mock);
    TreeWalker w(*r.fs, "/t");
    Error err;
    std::set<std::string> visited;
    while (w.next(err)) {
        const WalkStep& s = w.step();
        assert(visited.insert(s.root).second);
        std::vector<FileInfo> children;
        Error le;
        assert(r.fs->list(s.root, children, le));
        std::multiset<std::string> expected, got;
        for (const auto& c : children) expected.insert(c.name);
        got.insert(s.dirs.begin(), s.dirs.end());
        got.insert(s.files.begin(), s.files.end());
        assert(expected == got);
        assert(s.files.size() == s.fileInfo.size());
    }
    assert(!err);
    assert(visited.size() == 4);
    assert(w.listings() == 4);
}

static void test_walk_orders(){
    auto r = make_remote();
    seed(*r.mock);
    auto td = walk_roots(*r.fs, "/t", false, true);
    assert((td == std::vector<std::string>{"/t", "/t/d1", "/t/d1/d2", "/t/d3"}));
    auto bu = walk_roots(*r.fs, "/t", false, false);
    assert((bu == std::vector<std::string>{"/t/d1/d2", "/t/d1", "/t/d3", "/t"}));

    // Symlinks are leaves unless followed
    TreeWalker w(*r.fs, "/t");
    Error err;
    assert(w.next(err));
    assert((w.step().dirs == std::vector<std::string>{"d1", "d3"}));
    assert((w.step().files == std::vector<std::string>{"a.txt", "link"}));
    assert(w.step().fileInfo[0].size == 4);
    assert(w.step().depth == 0);
}

static void test_walk_follow_symlinks(){
    auto r = make_remote();
    seed(*r.mock);
    r.mock->addSymlink("/t/broken", "/nowhere");
    auto roots = walk_roots(*r.fs, "/t", true, true);
    assert((roots == std::vector<std::string>{"/t", "/t/d1", "/t/d1/d2", "/t/d3", "/t/link", "/t/link/d2"}));

    TreeWalker w(*r.fs, "/t", true);
    Error err;
    assert(w.next(err));
    const auto& files = w.step().files;
    assert(std::find(files.begin(), files.end(), "broken") != files.end());
}

// Links back into the tree are reported as files, so the walk ends.
static void test_walk_symlink_cycle_is_finite(){
    auto r = make_remote();
    seed(*r.mock);
    r.mock->addSymlink("/t/loop", "/t");
    r.mock->addSymlink("/t/d1/up", "/t/d1");
    auto td = walk_roots(*r.fs, "/t", true, true);
    assert((td == std::vector<std::string>{"/t", "/t/d1", "/t/d1/d2", "/t/d3", "/t/link", "/t/link/d2"}));
    auto bu = walk_roots(*r.fs, "/t", true, false);
    assert((bu == std::vector<std::string>{"/t/d1/d2", "/t/d1", "/t/d3", "/t/link/d2", "/t/link", "/t"}));

    TreeWalker w(*r.fs, "/t", true);
    Error err;
    assert(w.next(err));
    const auto& files = w.step().files;
    assert(std::find(files.begin(), files.end(), "loop") != files.end());
    assert(w.next(err));
    assert(w.step().root == "/t/d1");
    assert((w.step().files == std::vector<std::string>{"b.txt", "up"}));
}

static void test_walk_pruning(){
    auto r = make_remote();
    seed(*r.mock);
    TreeWalker w(*r.fs, "/t");
    Error err;
    std::vector<std::string> roots;
    while (w.next(err)) {
        roots.push_back(w.step().root);
        auto& dirs = w.step().dirs;
        dirs.erase(std::remove(dirs.begin(), dirs.end(), "d1"), dirs.end());
    }
    assert((roots == std::vector<std::string>{"/t", "/t/d3"}));
    assert(r.mock->calls("list") == 2);
}

static void test_walk_missing_top(){
    auto r = make_remote();
    TreeWalker w(*r.fs, "/absent");
    Error err;
    assert(!w.next(err));
    assert(err.kind == ErrorKind::NotFound);
    assert(r.guard->stats().repairAttempts == 0);
}

// Single-token pattern: only direct children match and subdirectories are never listed.
static void test_glob_single_token_is_shallow(){
    auto r = make_remote();
    r.mock->addFile("/jobs/y.job", "1");
    r.mock->addFile("/jobs/x/y.job", "2");
    r.mock->addFile("/jobs/x/z/w.job", "3");
    FileTree tree(*r.fs);
    std::vector<std::string> out;
    Error err;
    assert(tree.glob("/jobs", "*.job", out, err));
    assert((out == std::vector<std::string>{"/jobs/y.job"}));
    assert(r.mock->calls("list") == 1);

    // rglob-style "**/" prefix does not make one token recursive
    assert(tree.glob("/jobs", "**/*.job", out, err));
    assert((out == std::vector<std::string>{"/jobs/y.job"}));
}

static void test_glob_two_tokens_recurse(){
    auto r = make_remote();
    r.mock->addFile("/jobs/y.job", "1");
    r.mock->addFile("/jobs/x/y.job", "2");
    r.mock->addFile("/jobs/x/z/w.jab", "3");
    r.mock->addFile("/jobs/x/z/skip.txt", "4");
    FileTree tree(*r.fs);
    std::vector<std::string> out;
    Error err;
    assert(tree.glob("/jobs", "*.j?b", out, err));
    assert((out == std::vector<std::string>{"/jobs/y.job", "/jobs/x/y.job", "/jobs/x/z/w.jab"}));

    assert(tree.glob("/jobs", "*/*.job", out, err));
    assert((out == std::vector<std::string>{"/jobs/x/y.job"}));

    // One token over two components matches exactly two levels down
    r.mock->addFile("/jobs/x2/x3/y.job", "5");
    assert(tree.glob("/jobs", "x*/y.job", out, err));
    assert((out == std::vector<std::string>{"/jobs/x/y.job"}));

    assert(GlobPattern::parse("*.job").wildcardTokens() == 1);
    assert(!GlobPattern::parse("**/*.job").recursive());
    assert(GlobPattern::parse("[ab]*").recursive());
    assert(GlobPattern::parse("run_??").recursive());
    assert(GlobPattern::countWildcardTokens("a***b") == 1);
}

static void test_glob_literal_prefix_narrows_start(){
    auto r = make_remote();
    r.mock->addFile("/base/sub/deep/one.log", "1");
    r.mock->addFile("/base/sub/two.log", "2");
    r.mock->addFile("/base/other/three.log", "3");
    FileTree tree(*r.fs);
    std::vector<std::string> out;
    Error err;
    assert(tree.glob("/base", "sub/*.log", out, err));
    assert((out == std::vector<std::string>{"/base/sub/two.log"}));
    assert(r.mock->calls("list") == 1);

    assert(tree.glob("/base", "nothing/here/*.log", out, err));
    assert(out.empty());
    assert(tree.glob("/base", "sub/two.log/*", out, err));
    assert(out.empty());
}

static void test_rmtree(){
    auto r = make_remote();
    seed(*r.mock);
    FileTree tree(*r.fs);
    Error err;
    assert(!tree.rmtree("/t/link", false, err));
    assert(err.kind == ErrorKind::InvalidArgument);
    assert(r.mock->hasPath("/t/d1/b.txt"));
    err.clear();
    assert(!tree.rmtree("/t/a.txt", false, err));
    assert(err.kind == ErrorKind::NotADirectory);
    err.clear();
    assert(!tree.rmtree("/t/none", false, err));
    assert(err.kind == ErrorKind::NotFound);
    err.clear();
    assert(tree.rmtree("/t/none", true, err));
    assert(!err);

    assert(tree.rmtree("/t/d1", false, err));
    assert(!r.mock->hasPath("/t/d1"));
    assert(!r.mock->hasPath("/t/d1/d2/c.txt"));
    assert(r.mock->hasPath("/t/a.txt"));
    assert(r.mock->hasPath("/t/link"));
}

int main(){
    test_walk_partitions_each_directory();
    test_walk_orders();
    test_walk_follow_symlinks();
    test_walk_symlink_cycle_is_finite();
    test_walk_pruning();
    test_walk_missing_top();
    test_glob_single_token_is_shallow();
    test_glob_two_tokens_recurse();
    test_glob_literal_prefix_narrows_start();
    test_rmtree();
    std::cout << "All unit tests passed" << std::endl;
    return 0;
}
