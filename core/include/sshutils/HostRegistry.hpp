// Known hosts for the application, read once from an OpenSSH client config
// and passed explicitly to whatever needs to look a host up.
#pragma once
#include "Connection.hpp"
#include <map>
#include <string>
#include <vector>

namespace sshutils {

class HostRegistry {
public:
    // home is used for "~" in IdentityFile; empty takes $HOME.
    explicit HostRegistry(std::string home = {});

    // ~/.ssh/config
    static std::string defaultConfigPath();

    // A missing file leaves the registry empty and succeeds.
    bool loadFile(const std::string& path, Error& err);
    // Host, HostName, User, Port and IdentityFile are read; other keywords are skipped.
    bool parse(const std::string& text, Error& err);

    // Registered hosts win over config entries of the same name.
    void add(const ConnectionDescriptor& desc);

    // Concrete host names with both user and hostname, config order then added ones.
    std::vector<std::string> availableHosts() const;
    bool contains(const std::string& name) const;
    // First value wins; wildcard Host blocks contribute values they match.
    bool lookup(const std::string& name, ConnectionDescriptor& out, Error& err) const;

private:
    struct Block {
        std::vector<std::string> patterns;
        std::map<std::string, std::string> values;   // lowercase keyword -> first value
        int line = 0;
    };

    std::string home_;
    std::vector<Block> blocks_;
    std::vector<std::string> added_;
    std::map<std::string, ConnectionDescriptor> extra_;

    static bool blockMatches(const Block& b, const std::string& name);
    std::map<std::string, std::string> resolve(const std::string& name) const;
};

} // namespace sshutils
