#include "Config.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <filesystem>
#include <type_traits>

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : static_cast<char>(c);
    });
    return s;
}

const char* GetEnv(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

void EnvString(const char* name, std::string& out) {
    if (const char* v = GetEnv(name)) out = v;
}

void EnvBool(const char* name, bool& out) {
    const char* v = GetEnv(name);
    if (!v) return;
    std::string t = ToLower(v);
    if (t == "1" || t == "true" || t == "yes" || t == "on") { out = true; return; }
    if (t == "0" || t == "false" || t == "no" || t == "off") { out = false; return; }
    throw std::runtime_error(std::string("Invalid boolean in ") + name + ": " + v);
}

template <typename T>
void EnvNumber(const char* name, T& out) {
    const char* v = GetEnv(name);
    if (!v) return;
    try {
        size_t used = 0;
        std::string s(v);
        if constexpr (std::is_floating_point_v<T>) {
            double d = std::stod(s, &used);
            if (used != s.size()) throw std::invalid_argument("trailing characters");
            out = static_cast<T>(d);
        } else {
            long long n = std::stoll(s, &used);
            if (used != s.size()) throw std::invalid_argument("trailing characters");
            if (std::is_unsigned_v<T> && n < 0) throw std::invalid_argument("negative value");
            out = static_cast<T>(n);
        }
    } catch (const std::logic_error&) {
        throw std::runtime_error(std::string("Invalid number in ") + name + ": " + v);
    }
}

} // anonymous namespace

namespace Loopnet {

void to_json(nlohmann::json& data, const Config& c) {
    data["request_delay_seconds"] = c.request_delay_seconds;
    data["max_concurrent_requests"] = c.max_concurrent_requests;
    data["timeout_seconds"] = c.timeout_seconds;
    data["max_retries"] = c.max_retries;
    data["impersonate_browser"] = c.impersonate_browser;
    data["cache_ttl_seconds"] = c.cache_ttl_seconds;
    data["cache_max_entries"] = c.cache_max_entries;
    data["base_url"] = c.base_url;
    data["browser_enabled"] = c.browser_enabled;
    data["browser_timeout_seconds"] = c.browser_timeout_seconds;
    data["browser_challenge_wait_seconds"] = c.browser_challenge_wait_seconds;
    data["browser_headless"] = c.browser_headless;
    data["browser_executable"] = c.browser_executable;
    data["retry_on_forbidden"] = c.retry_on_forbidden;
    data["backoff_base_seconds"] = c.backoff_base_seconds;
    data["warmup_enabled"] = c.warmup_enabled;
    data["log_level"] = c.log_level;
}

void Config::Load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }
    nlohmann::json data = nlohmann::json::parse(f);
    const Config defaults;

    request_delay_seconds = data.value("request_delay_seconds", defaults.request_delay_seconds);
    max_concurrent_requests = data.value("max_concurrent_requests", defaults.max_concurrent_requests);
    timeout_seconds = data.value("timeout_seconds", defaults.timeout_seconds);
    max_retries = data.value("max_retries", defaults.max_retries);
    impersonate_browser = data.value("impersonate_browser", defaults.impersonate_browser);
    cache_ttl_seconds = data.value("cache_ttl_seconds", defaults.cache_ttl_seconds);
    cache_max_entries = data.value("cache_max_entries", defaults.cache_max_entries);
    base_url = data.value("base_url", defaults.base_url);
    browser_enabled = data.value("browser_enabled", defaults.browser_enabled);
    browser_timeout_seconds = data.value("browser_timeout_seconds", defaults.browser_timeout_seconds);
    browser_challenge_wait_seconds = data.value("browser_challenge_wait_seconds", defaults.browser_challenge_wait_seconds);
    browser_headless = data.value("browser_headless", defaults.browser_headless);
    browser_executable = data.value("browser_executable", defaults.browser_executable);
    retry_on_forbidden = data.value("retry_on_forbidden", defaults.retry_on_forbidden);
    backoff_base_seconds = data.value("backoff_base_seconds", defaults.backoff_base_seconds);
    warmup_enabled = data.value("warmup_enabled", defaults.warmup_enabled);
    log_level = data.value("log_level", defaults.log_level);
    while (!base_url.empty() && base_url.back() == '/') base_url.pop_back();

    // Write back missing keys so existing config.json reflects newly added options.
    // Unknown keys are preserved.
    bool changed = false;
    nlohmann::json current = *this;
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
        (void)ec; // best-effort backup

        // A failed write-back must not prevent startup.
        std::ofstream o(path, std::ios::trunc);
        if (o.is_open()) {
            o << std::setw(4) << data << std::endl;
        }
    }
}

void Config::CreateDefault(const std::string& path_str) {
    std::filesystem::path path(path_str);

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    nlohmann::json data = Config{};

    std::ofstream o(path);
    if (!o.is_open()) {
        throw std::runtime_error("Could not open config file for writing: " + path_str);
    }
    o << std::setw(4) << data << std::endl;
    if (!o.good()) {
        throw std::runtime_error("Failed to write to config file: " + path_str);
    }
}

void Config::ApplyEnvironment() {
    EnvNumber("LOOPNET_REQUEST_DELAY_SECONDS", request_delay_seconds);
    EnvNumber("LOOPNET_MAX_CONCURRENT_REQUESTS", max_concurrent_requests);
    EnvNumber("LOOPNET_TIMEOUT_SECONDS", timeout_seconds);
    EnvNumber("LOOPNET_MAX_RETRIES", max_retries);
    EnvString("LOOPNET_IMPERSONATE_BROWSER", impersonate_browser);
    EnvNumber("LOOPNET_CACHE_TTL_SECONDS", cache_ttl_seconds);
    EnvNumber("LOOPNET_CACHE_MAX_ENTRIES", cache_max_entries);
    EnvString("LOOPNET_BASE_URL", base_url);
    EnvBool("LOOPNET_BROWSER_ENABLED", browser_enabled);
    EnvNumber("LOOPNET_BROWSER_TIMEOUT_SECONDS", browser_timeout_seconds);
    EnvNumber("LOOPNET_BROWSER_CHALLENGE_WAIT_SECONDS", browser_challenge_wait_seconds);
    EnvBool("LOOPNET_BROWSER_HEADLESS", browser_headless);
    EnvString("LOOPNET_BROWSER_EXECUTABLE", browser_executable);
    EnvBool("LOOPNET_RETRY_ON_FORBIDDEN", retry_on_forbidden);
    EnvNumber("LOOPNET_BACKOFF_BASE_SECONDS", backoff_base_seconds);
    EnvBool("LOOPNET_WARMUP_ENABLED", warmup_enabled);
    EnvString("LOOPNET_LOG_LEVEL", log_level);

    // Trailing slash would double up when joining paths.
    while (!base_url.empty() && base_url.back() == '/') base_url.pop_back();
}

void Config::Validate() const {
    if (max_retries < 1) throw std::runtime_error("max_retries must be at least 1");
    if (max_concurrent_requests < 1) throw std::runtime_error("max_concurrent_requests must be at least 1");
    if (cache_max_entries < 1) throw std::runtime_error("cache_max_entries must be at least 1");
    if (request_delay_seconds < 0 || timeout_seconds <= 0 || backoff_base_seconds < 0 ||
        browser_timeout_seconds <= 0 || browser_challenge_wait_seconds < 0) {
        throw std::runtime_error("Delays must be non-negative and timeouts positive");
    }
    if (base_url.rfind("http://", 0) != 0 && base_url.rfind("https://", 0) != 0) {
        throw std::runtime_error("base_url must be an http(s) URL: " + base_url);
    }
}

}
