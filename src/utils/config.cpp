#include "config.hpp"
#include "swarmbed/error.hpp"
#include <fstream>
#include <sstream>

namespace swarmbed::utils {

Config Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigException(ErrorCode::ConfigReadFailed, "Failed to open config file: " + path);
    }

    Config config;
    try {
        file >> config.data_;
    } catch (const json::parse_error& e) {
        throw ConfigException(ErrorCode::ConfigReadFailed,
            "Failed to parse config file " + path + ": " + std::string(e.what()));
    }

    return config;
}

Config Config::load_from_json(const std::string& json_str) {
    Config config;
    try {
        config.data_ = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw ConfigException(ErrorCode::ConfigReadFailed, "Failed to parse JSON: " + std::string(e.what()));
    }
    return config;
}

void Config::save_to_file(const std::string& path) const {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw ConfigException(ErrorCode::ConfigWriteFailed, "Failed to open file for writing: " + path);
    }

    file << data_.dump(2) << '\n';
    if (!file) {
        throw ConfigException(ErrorCode::ConfigWriteFailed, "Failed to write config file: " + path);
    }
}

std::optional<std::string> Config::get_path(const std::string& dotted) const {
    const json* cursor = &data_;
    std::istringstream parts(dotted);
    std::string part;
    while (std::getline(parts, part, '.')) {
        if (!cursor->is_object() || !cursor->contains(part)) {
            return std::nullopt;
        }
        cursor = &cursor->at(part);
    }
    if (cursor->is_string()) {
        return cursor->get<std::string>();
    }
    if (cursor->is_null()) {
        return std::nullopt;
    }
    return cursor->dump();
}

} // namespace swarmbed::utils
