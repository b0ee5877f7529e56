#include "Config.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <filesystem>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace {

// Integer key with range checking: nlohmann's value() would wrap a negative
// number into a size_t or truncate a large one into an int.
template <typename T>
T ReadInteger(const nlohmann::json& data, const char* key, T fallback) {
    auto it = data.find(key);
    if (it == data.end()) return fallback;

    const std::string name(key);
    if (it->is_number_unsigned()) {
        auto v = it->get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
            throw std::runtime_error(name + " is out of range: " + std::to_string(v));
        }
        return static_cast<T>(v);
    }
    if (it->is_number_integer()) {
        auto v = it->get<std::int64_t>();
        if constexpr (std::is_unsigned_v<T>) {
            if (v < 0 || static_cast<std::uint64_t>(v) > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
                throw std::runtime_error(name + " is out of range: " + std::to_string(v));
            }
        } else {
            if (v < static_cast<std::int64_t>(std::numeric_limits<T>::min()) ||
                v > static_cast<std::int64_t>(std::numeric_limits<T>::max())) {
                throw std::runtime_error(name + " is out of range: " + std::to_string(v));
            }
        }
        return static_cast<T>(v);
    }
    throw std::runtime_error(name + " must be an integer");
}

}

namespace BioVerify {

void Config::Load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }
    if (!data.is_object()) {
        throw std::runtime_error("Config file must contain a JSON object: " + path);
    }

    const Config defaults;
    try {
        profile_base_url = data.value("profile_base_url", defaults.profile_base_url);
        http_timeout_ms = ReadInteger(data, "http_timeout_ms", defaults.http_timeout_ms);
        http_connect_timeout_ms = ReadInteger(data, "http_connect_timeout_ms", defaults.http_connect_timeout_ms);
        http_max_redirects = ReadInteger(data, "http_max_redirects", defaults.http_max_redirects);
        http_user_agent = data.value("http_user_agent", defaults.http_user_agent);
        max_html_bytes = ReadInteger(data, "max_html_bytes", defaults.max_html_bytes);
        max_attempts = ReadInteger(data, "max_attempts", defaults.max_attempts);
        empty_backoff_ms = ReadInteger(data, "empty_backoff_ms", defaults.empty_backoff_ms);
        error_backoff_ms = ReadInteger(data, "error_backoff_ms", defaults.error_backoff_ms);
        log_level = data.value("log_level", defaults.log_level);
        log_dir = data.value("log_dir", defaults.log_dir);
    } catch (const nlohmann::json::type_error& e) {
        throw std::runtime_error("Invalid value type in config file " + path + ": " + e.what());
    }

    while (!profile_base_url.empty() && profile_base_url.back() == '/') {
        profile_base_url.pop_back();
    }
    Validate();

    // Write back missing keys so an existing config.json reflects newly added options.
    // Unknown keys are preserved; only missing ones are appended.
    bool changed = false;
    const nlohmann::json current = ToJson();
    for (const auto& item : current.items()) {
        if (!data.contains(item.key())) {
            data[item.key()] = item.value();
            changed = true;
        }
    }

    if (changed) {
        std::filesystem::path p(path);
        std::filesystem::path bak = p;
        bak += ".bak";
        std::error_code ec;
        std::filesystem::copy_file(p, bak, std::filesystem::copy_options::overwrite_existing, ec);
        // Best effort: a read-only config still loads.
        std::ofstream o(path, std::ios::trunc);
        if (o.is_open()) {
            o << std::setw(4) << data << std::endl;
        }
    }
}

void Config::Validate() const {
    if (profile_base_url.empty()) {
        throw std::runtime_error("profile_base_url must not be empty");
    }
    if (max_attempts < 1) {
        throw std::runtime_error("max_attempts must be at least 1, got " + std::to_string(max_attempts));
    }
    if (empty_backoff_ms < 0 || error_backoff_ms < 0) {
        throw std::runtime_error("backoff delays must not be negative");
    }
    if (http_timeout_ms < 0 || http_connect_timeout_ms < 0) {
        throw std::runtime_error("http timeouts must not be negative");
    }
    if (http_max_redirects < 0) {
        throw std::runtime_error("http_max_redirects must not be negative");
    }
    if (max_html_bytes == 0) {
        throw std::runtime_error("max_html_bytes must be greater than zero");
    }
}

nlohmann::json Config::ToJson() const {
    nlohmann::json data;
    data["profile_base_url"] = profile_base_url;
    data["http_timeout_ms"] = http_timeout_ms;
    data["http_connect_timeout_ms"] = http_connect_timeout_ms;
    data["http_max_redirects"] = http_max_redirects;
    data["http_user_agent"] = http_user_agent;
    data["max_html_bytes"] = max_html_bytes;
    data["max_attempts"] = max_attempts;
    data["empty_backoff_ms"] = empty_backoff_ms;
    data["error_backoff_ms"] = error_backoff_ms;
    data["log_level"] = log_level;
    data["log_dir"] = log_dir;
    return data;
}

void Config::CreateDefault(const std::string& path_str) {
    std::filesystem::path path(path_str);

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    Config defaultConfig;
    nlohmann::json data = defaultConfig.ToJson();

    std::ofstream o(path);
    if (!o.is_open()) {
        throw std::runtime_error("Could not open config file for writing: " + path_str);
    }
    o << std::setw(4) << data << std::endl;
    if (!o.good()) {
        throw std::runtime_error("Failed to write to config file: " + path_str);
    }
}

}
