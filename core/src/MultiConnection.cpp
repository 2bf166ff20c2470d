#include "sshutils/MultiConnection.hpp"
#include "sshutils/Log.hpp"

namespace sshutils {

bool MultiConnection::open(const std::vector<ConnectionDescriptor>& descs, const RetryPolicy& policy,
                           const ClientFactory& factory, Error& err) {
    for (const auto& d : descs) {
        std::unique_ptr<Connection> c =
            d.local ? Connection::openLocal(d.serverName) : Connection::openRemote(d, policy, factory, err);
        if (!c) {
            err.message = "could not open " + d.serverName + ": " + err.message;
            return false;
        }
        add(std::move(c));
    }
    return true;
}

void MultiConnection::add(std::unique_ptr<Connection> c) {
    if (c) conns_.push_back(std::move(c));
}

Connection* MultiConnection::get(const std::string& key, std::size_t index) {
    for (auto& c : conns_) {
        if (c->name() != key) continue;
        if (index == 0) return c.get();
        --index;
    }
    return nullptr;
}

std::vector<std::string> MultiConnection::keys() const {
    std::vector<std::string> out;
    for (const auto& c : conns_) {
        if (std::find(out.begin(), out.end(), c->name()) == out.end()) out.push_back(c->name());
    }
    return out;
}

std::vector<FanOutResult<CompletedProcess>> MultiConnection::runCommand(const std::vector<std::string>& args,
                                                                        const RunOptions& opts) {
    auto results = runAll<CompletedProcess>([&](Connection& c, CompletedProcess& out, Error& e) {
        return c.run(args, opts, out, e);
    });
    for (const auto& r : results) {
        if (!r.ok) LOGW("multi.run host=%s kind=%s msg=\"%s\"", r.key.c_str(), errorKindName(r.error.kind),
                        r.error.message.c_str());
    }
    return results;
}

void MultiConnection::closeAll() {
    for (auto& c : conns_) c->close();
}

std::vector<ConnectionDescriptor> MultiConnection::descriptors() const {
    std::vector<ConnectionDescriptor> out;
    out.reserve(conns_.size());
    for (const auto& c : conns_) out.push_back(c->descriptor());
    return out;
}

} // namespace sshutils
