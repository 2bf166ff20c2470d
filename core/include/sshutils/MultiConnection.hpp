// Several connections keyed by server name; the same call fans out to all of
// them on a bounded pool of worker threads, one connection per worker.
#pragma once
#include "Connection.hpp"
#include <algorithm>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace sshutils {

template <class R>
struct FanOutResult {
    std::string key;
    bool ok = false;
    R value{};
    Error error;
};

class MultiConnection {
public:
    MultiConnection() = default;
    MultiConnection(const MultiConnection&) = delete;
    MultiConnection& operator=(const MultiConnection&) = delete;

    // Reopens a persisted set; local descriptors become local connections.
    bool open(const std::vector<ConnectionDescriptor>& descs, const RetryPolicy& policy,
              const ClientFactory& factory, Error& err);

    // Keeps insertion order; a key may hold several connections.
    void add(std::unique_ptr<Connection> c);
    Connection* get(const std::string& key, std::size_t index = 0);
    std::vector<std::string> keys() const;
    std::size_t size() const { return conns_.size(); }
    Connection& at(std::size_t i) { return *conns_.at(i); }

    void setMaxConcurrent(int n) { maxConcurrent_ = n < 1 ? 1 : n; }
    int maxConcurrent() const { return maxConcurrent_; }

    // fn: bool(Connection&, R&, Error&). Result i belongs to connection i.
    template <class R, class F>
    std::vector<FanOutResult<R>> runAll(F fn);

    std::vector<FanOutResult<CompletedProcess>> runCommand(const std::vector<std::string>& args,
                                                           const RunOptions& opts);

    void closeAll();
    std::vector<ConnectionDescriptor> descriptors() const;

private:
    std::vector<std::unique_ptr<Connection>> conns_;
    int maxConcurrent_ = 8;
};

template <class R, class F>
std::vector<FanOutResult<R>> MultiConnection::runAll(F fn) {
    std::vector<FanOutResult<R>> results(conns_.size());
    if (conns_.empty()) return results;
    for (std::size_t i = 0; i < conns_.size(); ++i) results[i].key = conns_[i]->name();

    std::atomic<std::size_t> next{0};
    auto worker = [&]() {
        for (;;) {
            const std::size_t i = next.fetch_add(1);
            if (i >= conns_.size()) return;
            FanOutResult<R>& r = results[i];
            r.ok = fn(*conns_[i], r.value, r.error);
        }
    };
    const std::size_t n = std::min<std::size_t>(conns_.size(), static_cast<std::size_t>(maxConcurrent_));
    std::vector<std::thread> pool;
    pool.reserve(n);
    for (std::size_t i = 0; i < n; ++i) pool.emplace_back(worker);
    for (auto& t : pool) t.join();
    return results;
}

} // namespace sshutils
