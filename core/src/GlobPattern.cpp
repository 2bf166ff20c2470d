#include "sshutils/GlobPattern.hpp"
#include "sshutils/PathUtil.hpp"
#include <fnmatch.h>

namespace sshutils {

bool GlobPattern::hasWildcard(const std::string& component) {
    return countWildcardTokens(component) > 0;
}

int GlobPattern::countWildcardTokens(const std::string& c) {
    int tokens = 0;
    for (size_t i = 0; i < c.size(); ++i) {
        switch (c[i]) {
            case '\\':
                ++i;
                break;
            case '*':
                ++tokens;
                while (i + 1 < c.size() && c[i + 1] == '*') ++i;
                break;
            case '?':
                ++tokens;
                break;
            case '[': {
                // "[]...]" and "[!]...]" allow a leading ']' inside the class.
                size_t j = i + 1;
                if (j < c.size() && (c[j] == '!' || c[j] == '^')) ++j;
                if (j < c.size() && c[j] == ']') ++j;
                while (j < c.size() && c[j] != ']') ++j;
                if (j < c.size()) {
                    ++tokens;
                    i = j;
                }
                break;
            }
            default:
                break;
        }
    }
    return tokens;
}

bool GlobPattern::matchName(const std::string& pattern, const std::string& name) {
    return ::fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

GlobPattern GlobPattern::parse(const std::string& pattern) {
    GlobPattern gp;
    gp.text_ = pattern;
    gp.absolute_ = isAbsolutePath(pattern);
    const auto parts = splitPath(pattern);

    size_t i = 0;
    for (; i + 1 < parts.size(); ++i) {
        if (hasWildcard(parts[i])) break;
        gp.prefix_.push_back(parts[i]);
    }
    for (; i < parts.size(); ++i) {
        if (parts[i] == "**") continue; // descent marker, not a token
        gp.components_.push_back(parts[i]);
        gp.tokens_ += countWildcardTokens(parts[i]);
    }
    if (gp.components_.empty()) {
        gp.components_.push_back("*");
        gp.tokens_ += 1;
    }
    return gp;
}

std::string GlobPattern::startDir(const std::string& base) const {
    std::string start = absolute_ ? std::string("/") : base;
    for (const auto& p : prefix_) start = joinPath(start, p);
    return start;
}

bool GlobPattern::matches(const std::vector<std::string>& relParts) const {
    const size_t n = components_.size();
    if (relParts.size() < n) return false;
    if (!recursive() && relParts.size() != n) return false;
    const size_t off = relParts.size() - n;
    for (size_t k = 0; k < n; ++k) {
        if (!matchName(components_[k], relParts[off + k])) return false;
    }
    return true;
}

bool GlobPattern::mayContainMatches(const std::vector<std::string>& relParts) const {
    if (recursive()) return true;
    if (relParts.size() >= components_.size()) return false;
    for (size_t k = 0; k < relParts.size(); ++k) {
        if (!matchName(components_[k], relParts[k])) return false;
    }
    return true;
}

bool FileFilter::accepts(const std::string& name) const {
    for (const auto& p : exclude_) {
        if (GlobPattern::matchName(p, name)) return false;
    }
    if (include_.empty()) return true;
    for (const auto& p : include_) {
        if (GlobPattern::matchName(p, name)) return true;
    }
    return false;
}

} // namespace sshutils
