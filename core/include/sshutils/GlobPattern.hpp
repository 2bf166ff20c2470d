// Glob pattern model used by FileTree::glob, and the include/exclude filter of tree transfers.
#pragma once
#include <string>
#include <vector>

namespace sshutils {

class GlobPattern {
public:
    static GlobPattern parse(const std::string& pattern);

    const std::string& text() const { return text_; }
    bool absolute() const { return absolute_; }
    // Leading literal components; they narrow the start directory before any listing.
    const std::vector<std::string>& prefix() const { return prefix_; }
    // Components matched against the tree below the start directory ("**" removed).
    const std::vector<std::string>& components() const { return components_; }
    int wildcardTokens() const { return tokens_; }
    // Two or more wildcard tokens: matches at any depth below the start directory.
    bool recursive() const { return tokens_ >= 2; }

    // Start directory for a glob evaluated relative to base.
    std::string startDir(const std::string& base) const;

    // relParts: path of an entry below the start directory, split into components.
    bool matches(const std::vector<std::string>& relParts) const;
    // Whether the directory relParts may contain matches (false prunes it).
    bool mayContainMatches(const std::vector<std::string>& relParts) const;

    static bool hasWildcard(const std::string& component);
    // A run of '*', a '?' and a bracket class each count as one token.
    static int countWildcardTokens(const std::string& component);
    static bool matchName(const std::string& pattern, const std::string& name);

private:
    std::string text_;
    bool absolute_ = false;
    std::vector<std::string> prefix_;
    std::vector<std::string> components_;
    int tokens_ = 0;
};

// File name filter: kept if it matches some include pattern (or there are none)
// and no exclude pattern. Exclude wins.
class FileFilter {
public:
    FileFilter() = default;
    FileFilter(std::vector<std::string> include, std::vector<std::string> exclude)
        : include_(std::move(include)), exclude_(std::move(exclude)) {}

    bool accepts(const std::string& name) const;
    bool empty() const { return include_.empty() && exclude_.empty(); }

private:
    std::vector<std::string> include_;
    std::vector<std::string> exclude_;
};

} // namespace sshutils
