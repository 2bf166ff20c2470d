#include "sshutils/PathUtil.hpp"

namespace sshutils {

std::string joinPath(const std::string& base, const std::string& name) {
    if (name.empty()) return base;
    if (base.empty() || isAbsolutePath(name)) return name;
    if (base == "/") return "/" + name;
    return base.back() == '/' ? base + name : base + "/" + name;
}

std::string parentPath(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    auto slash = p.find_last_of('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return p.substr(0, slash);
}

std::string baseName(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    if (p == "/") return "";
    auto slash = p.find_last_of('/');
    return slash == std::string::npos ? p : p.substr(slash + 1);
}

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : path) {
        if (c == '/') {
            if (!cur.empty() && cur != ".") parts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty() && cur != ".") parts.push_back(cur);
    return parts;
}

bool isAbsolutePath(const std::string& path) {
    return !path.empty() && path.front() == '/';
}

std::string normalizePath(const std::string& path) {
    if (path.empty()) return ".";
    const bool abs = isAbsolutePath(path);
    std::vector<std::string> out;
    for (const auto& part : splitPath(path)) {
        if (part == "..") {
            if (!out.empty() && out.back() != "..") out.pop_back();
            else if (!abs) out.push_back(part);
            continue;
        }
        out.push_back(part);
    }
    std::string res = abs ? "/" : "";
    for (size_t i = 0; i < out.size(); ++i) {
        if (i) res += "/";
        res += out[i];
    }
    if (res.empty()) return ".";
    return res;
}

std::string relativePath(const std::string& path, const std::string& root) {
    const std::string p = normalizePath(path);
    const std::string r = normalizePath(root);
    if (p == r) return "";
    if (r == "/" && isAbsolutePath(p)) return p.substr(1);
    if (r == ".") return p;
    if (p.size() > r.size() && p.compare(0, r.size(), r) == 0 && p[r.size()] == '/')
        return p.substr(r.size() + 1);
    return p;
}

std::string expandUser(const std::string& path, const std::string& home) {
    if (path == "~") return home;
    if (path.size() > 1 && path[0] == '~' && path[1] == '/') return joinPath(home, path.substr(2));
    return path;
}

std::string rstrip(const std::string& s) {
    auto end = s.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}

} // namespace sshutils
