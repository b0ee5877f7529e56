#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace BioVerify {
    struct Config {
        std::string profile_base_url = "https://www.tiktok.com";
        long http_timeout_ms = 10000;
        long http_connect_timeout_ms = 5000;
        long http_max_redirects = 5;
        std::string http_user_agent = "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";
        size_t max_html_bytes = 8388608; // 8MB
        int max_attempts = 3;
        long empty_backoff_ms = 2000; // page fetched, no bio found
        long error_backoff_ms = 1000; // fetch failed
        std::string log_level = "info";
        std::string log_dir; // empty: console only

        static Config& GetInstance() {
            static Config instance;
            return instance;
        }

        // Throws std::runtime_error if the file cannot be opened or holds invalid values.
        void Load(const std::string& path);
        void CreateDefault(const std::string& path);
        void Validate() const;

        nlohmann::json ToJson() const;
    };
}
