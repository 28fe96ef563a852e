#pragma once
#include <map>
#include <string>
#include <utility>
#include <vector>

// Name/value pairs of a CGI invocation, ordered by name (byte-wise).
// Fixed once built.
class Environment {
public:
    Environment() = default;
    // First occurrence of a name wins.
    explicit Environment(const std::vector<std::pair<std::string, std::string>>& pairs);

    // Build from an envp-style array of "NAME=VALUE" strings, terminated by nullptr.
    static Environment capture(const char* const* envp);

    std::size_t size() const { return kv_.size(); }
    std::vector<std::pair<std::string, std::string>> list() const;
private:
    std::map<std::string, std::string> kv_;
};
