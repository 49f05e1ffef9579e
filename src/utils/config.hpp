#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace swarmbed::utils {

using json = nlohmann::json;

/**
 * Configuration document backed by JSON.
 * Used both for the harness settings file and for a daemon's own
 * config file, which swarmbed treats as an opaque JSON tree.
 */
class Config {
public:
    Config() = default;
    explicit Config(json data) : data_(std::move(data)) {}

    /**
     * Load configuration from JSON file
     * @throws ConfigException if the file is missing or malformed
     */
    static Config load_from_file(const std::string& path);

    /**
     * Load configuration from JSON string
     */
    static Config load_from_json(const std::string& json_str);

    /**
     * Save configuration to file
     */
    void save_to_file(const std::string& path) const;

    /**
     * Get a value from config. A key holding the wrong type reads as absent.
     */
    template<typename T>
    std::optional<T> get(const std::string& key) const {
        if (!data_.is_object() || !data_.contains(key)) {
            return std::nullopt;
        }
        try {
            return data_.at(key).get<T>();
        } catch (const json::type_error&) {
            return std::nullopt;
        }
    }

    /**
     * Get a value with default
     */
    template<typename T>
    T get_or(const std::string& key, const T& default_value) const {
        auto value = get<T>(key);
        return value.value_or(default_value);
    }

    /**
     * Look up a dotted path such as "Identity.PeerID"
     */
    std::optional<std::string> get_path(const std::string& dotted) const;

    /**
     * Set a value
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        data_[key] = value;
    }

    /**
     * Check if key exists
     */
    bool has(const std::string& key) const {
        return data_.is_object() && data_.contains(key);
    }

    const json& data() const { return data_; }
    json& data() { return data_; }

private:
    json data_ = json::object();
};

} // namespace swarmbed::utils
