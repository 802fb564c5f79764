#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace Loopnet {
    struct Config {
        double request_delay_seconds = 3.0;
        int max_concurrent_requests = 1;
        double timeout_seconds = 30.0;
        int max_retries = 3;
        std::string impersonate_browser = "chrome136";
        int cache_ttl_seconds = 300;
        size_t cache_max_entries = 500;
        std::string base_url = "https://www.loopnet.com";
        bool browser_enabled = true;
        double browser_timeout_seconds = 30.0;
        double browser_challenge_wait_seconds = 5.0;
        bool browser_headless = true;
        std::string browser_executable = "chromium";
        bool retry_on_forbidden = true; // 403 may be a stale-cookie condition
        double backoff_base_seconds = 1.0;
        bool warmup_enabled = true;
        std::string log_level = "info";

        void Load(const std::string& path);
        void CreateDefault(const std::string& path);

        // Overrides fields from LOOPNET_* environment variables.
        void ApplyEnvironment();
        void Validate() const;
    };

    void to_json(nlohmann::json& j, const Config& c);
}
