#include "process/environment.hpp"

#include <algorithm>

extern char** environ;

namespace swarmbed::process {

Environment current_environment() {
    Environment env;
    if (environ == nullptr) {
        return env;
    }
    for (char** cursor = environ; *cursor != nullptr; ++cursor) {
        env.emplace_back(*cursor);
    }
    return env;
}

std::string env_key(const std::string& entry) {
    auto pos = entry.find('=');
    if (pos == std::string::npos) {
        return entry;
    }
    return entry.substr(0, pos);
}

std::string env_lookup(const Environment& env, const std::string& key) {
    for (const auto& entry : env) {
        if (env_key(entry) == key) {
            return entry.substr(std::min(entry.size(), key.size() + 1));
        }
    }
    return {};
}

Environment derive_environment(const Environment& base, const std::vector<EnvOverride>& overrides) {
    Environment result;
    result.reserve(base.size() + overrides.size());

    std::vector<bool> applied(overrides.size(), false);

    for (const auto& entry : base) {
        const std::string key = env_key(entry);

        auto it = std::find_if(overrides.begin(), overrides.end(),
            [&key](const EnvOverride& o) { return o.first == key; });
        if (it == overrides.end()) {
            result.push_back(entry);
            continue;
        }

        const size_t index = static_cast<size_t>(std::distance(overrides.begin(), it));
        if (applied[index]) {
            // duplicate of a key we already rewrote
            continue;
        }
        result.push_back(it->first + "=" + it->second);
        applied[index] = true;
    }

    for (size_t i = 0; i < overrides.size(); ++i) {
        if (!applied[i]) {
            result.push_back(overrides[i].first + "=" + overrides[i].second);
        }
    }

    return result;
}

Environment derive_environment(const Environment& base, const std::string& key, const std::string& value) {
    return derive_environment(base, std::vector<EnvOverride>{{key, value}});
}

} // namespace swarmbed::process
