#include "sshutils/HostRegistry.hpp"
#include "sshutils/GlobPattern.hpp"
#include "sshutils/Log.hpp"
#include "sshutils/PathUtil.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace sshutils {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string stripQuotes(const std::string& s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') return s.substr(1, s.size() - 2);
    return s;
}

// "Keyword value", "Keyword=value" or "Keyword = value".
bool splitLine(const std::string& line, std::string& key, std::string& value) {
    const auto b = line.find_first_not_of(" \t");
    if (b == std::string::npos || line[b] == '#') return false;
    const auto e = line.find_first_of(" \t=", b);
    if (e == std::string::npos) return false;
    key = lower(line.substr(b, e - b));
    auto v = line.find_first_not_of(" \t=", e);
    if (v == std::string::npos) return false;
    value = rstrip(line.substr(v));
    return !value.empty();
}

std::vector<std::string> words(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream in(s);
    std::string w;
    while (in >> w) out.push_back(stripQuotes(w));
    return out;
}

} // namespace

HostRegistry::HostRegistry(std::string home) : home_(std::move(home)) {
    if (home_.empty()) {
        const char* h = std::getenv("HOME");
        if (h) home_ = h;
    }
}

std::string HostRegistry::defaultConfigPath() {
    const char* h = std::getenv("HOME");
    return std::string(h ? h : "") + "/.ssh/config";
}

bool HostRegistry::loadFile(const std::string& path, Error& err) {
    std::ifstream in(path);
    if (!in) {
        if (errno == ENOENT) {
            LOGD("hosts.load path=%s missing=1", path.c_str());
            return true;
        }
        setFromErrno(err, errno, "cannot read " + path);
        return false;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parse(ss.str(), err);
}

bool HostRegistry::parse(const std::string& text, Error& err) {
    (void)err;
    std::istringstream in(text);
    std::string line, key, value;
    int lineNo = 0;
    Block* cur = nullptr;
    bool inMatch = false;
    while (std::getline(in, line)) {
        ++lineNo;
        if (!splitLine(line, key, value)) continue;
        if (key == "host") {
            blocks_.push_back(Block{words(value), {}, lineNo});
            cur = &blocks_.back();
            inMatch = false;
            continue;
        }
        if (key == "match") {
            // Match criteria are not evaluated; the block never applies.
            LOGD("hosts.parse line=%d skipped=Match", lineNo);
            inMatch = true;
            continue;
        }
        if (inMatch) continue;
        if (key != "hostname" && key != "user" && key != "port" && key != "identityfile") continue;
        if (!cur) {
            // Options before the first Host line apply to every host.
            blocks_.push_back(Block{{"*"}, {}, 0});
            cur = &blocks_.back();
        }
        cur->values.emplace(key, stripQuotes(value));
    }
    LOGD("hosts.parse blocks=%zu", blocks_.size());
    return true;
}

void HostRegistry::add(const ConnectionDescriptor& desc) {
    if (!extra_.count(desc.serverName)) added_.push_back(desc.serverName);
    extra_[desc.serverName] = desc;
}

bool HostRegistry::blockMatches(const Block& b, const std::string& name) {
    bool matched = false;
    for (const auto& p : b.patterns) {
        if (!p.empty() && p[0] == '!') {
            if (GlobPattern::matchName(p.substr(1), name)) return false;
        } else if (GlobPattern::matchName(p, name)) {
            matched = true;
        }
    }
    return matched;
}

std::map<std::string, std::string> HostRegistry::resolve(const std::string& name) const {
    std::map<std::string, std::string> values;
    for (const auto& b : blocks_) {
        if (!blockMatches(b, name)) continue;
        for (const auto& kv : b.values) values.emplace(kv.first, kv.second);
    }
    return values;
}

std::vector<std::string> HostRegistry::availableHosts() const {
    std::vector<std::string> out;
    auto push = [&](const std::string& n) {
        if (std::find(out.begin(), out.end(), n) == out.end()) out.push_back(n);
    };
    for (const auto& b : blocks_) {
        for (const auto& p : b.patterns) {
            if (p.empty() || p[0] == '!' || GlobPattern::hasWildcard(p)) continue;
            if (extra_.count(p)) continue;
            const auto v = resolve(p);
            if (!v.count("user") || !v.count("hostname")) continue;
            push(p);
        }
    }
    for (const auto& n : added_) push(n);
    return out;
}

bool HostRegistry::contains(const std::string& name) const {
    const auto hosts = availableHosts();
    return std::find(hosts.begin(), hosts.end(), name) != hosts.end();
}

bool HostRegistry::lookup(const std::string& name, ConnectionDescriptor& out, Error& err) const {
    auto it = extra_.find(name);
    if (it != extra_.end()) {
        out = it->second;
        return true;
    }
    if (!GlobPattern::hasWildcard(name)) {
        const auto v = resolve(name);
        if (v.count("user") && v.count("hostname")) {
            std::map<std::string, std::string> m;
            m["server_name"] = name;
            m["address"] = v.at("hostname");
            m["user_name"] = v.at("user");
            if (v.count("port")) m["port"] = v.at("port");
            if (v.count("identityfile")) m["rsa_key"] = expandUser(v.at("identityfile"), home_);
            return ConnectionDescriptor::fromMap(m, out, err);
        }
    }
    err.set(ErrorKind::NotFound, "no such host (" + name + ") available");
    return false;
}

} // namespace sshutils
