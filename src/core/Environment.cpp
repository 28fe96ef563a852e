#include "Environment.hpp"

#include <cstring>

Environment::Environment(const std::vector<std::pair<std::string, std::string>>& pairs) {
    for (auto& kv : pairs) kv_.emplace(kv.first, kv.second);
}

Environment Environment::capture(const char* const* envp) {
    Environment env;
    if (!envp) return env;
    for (const char* const* p = envp; *p != nullptr; ++p) {
        const char* entry = *p;
        const char* eq = std::strchr(entry, '=');
        if (!eq) continue; // not NAME=VALUE
        std::string key(entry, static_cast<size_t>(eq - entry));
        // first definition wins, like getenv
        env.kv_.emplace(std::move(key), std::string(eq + 1));
    }
    return env;
}

std::vector<std::pair<std::string, std::string>> Environment::list() const {
    std::vector<std::pair<std::string, std::string>> out;
    out.reserve(kv_.size());
    for (auto& kv : kv_) out.emplace_back(kv.first, kv.second);
    return out;
}
