// POSIX-style path string helpers shared by the local and remote sides.
#pragma once
#include <string>
#include <vector>

namespace sshutils {

// "/" + "a" -> "/a", "a/" + "b" -> "a/b"; an absolute name replaces base.
std::string joinPath(const std::string& base, const std::string& name);

// "/a/b" -> "/a", "/a" -> "/", "a" -> ".", "/" -> "/"
std::string parentPath(const std::string& path);

// "/a/b.txt" -> "b.txt", "/a/b/" -> "b", "/" -> ""
std::string baseName(const std::string& path);

// Collapses "//", "." and "..". Keeps a leading "/" and never climbs above it.
std::string normalizePath(const std::string& path);

// Non-empty components other than ".".
std::vector<std::string> splitPath(const std::string& path);

bool isAbsolutePath(const std::string& path);

// Path of "path" below "root" ("" when equal); both are normalized first.
std::string relativePath(const std::string& path, const std::string& root);

// Replaces a leading "~" with home.
std::string expandUser(const std::string& path, const std::string& home);

// Trailing whitespace and newlines removed.
std::string rstrip(const std::string& s);

} // namespace sshutils
