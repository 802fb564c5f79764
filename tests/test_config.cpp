#include <catch2/catch_all.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "../config/Config.hpp"

using namespace Loopnet;

namespace {

std::filesystem::path TempConfigPath(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / "loopnet_config_test";
    std::filesystem::create_directories(dir);
    auto path = dir / name;
    std::filesystem::remove(path);
    return path;
}

// Sets an environment variable for the lifetime of the guard.
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) { setenv(name, value, 1); }
    ~EnvGuard() { unsetenv(name_); }
private:
    const char* name_;
};

} // namespace

TEST_CASE("Config defaults") {
    Config config;
    CHECK(config.request_delay_seconds == 3.0);
    CHECK(config.max_concurrent_requests == 1);
    CHECK(config.max_retries == 3);
    CHECK(config.impersonate_browser == "chrome136");
    CHECK(config.cache_ttl_seconds == 300);
    CHECK(config.base_url == "https://www.loopnet.com");
    CHECK(config.browser_enabled);
    CHECK_NOTHROW(config.Validate());
}

TEST_CASE("Config round-trips through CreateDefault and Load") {
    auto path = TempConfigPath("default.json");
    Config().CreateDefault(path.string());
    REQUIRE(std::filesystem::exists(path));

    Config loaded;
    loaded.max_retries = 99;
    loaded.Load(path.string());
    CHECK(loaded.max_retries == 3);
    CHECK(loaded.browser_challenge_wait_seconds == 5.0);
}

TEST_CASE("Config Load fills missing keys and keeps unknown ones") {
    auto path = TempConfigPath("partial.json");
    {
        std::ofstream out(path);
        out << R"({"max_retries": 5, "base_url": "https://example.test/", "custom_note": "keep"})";
    }

    Config config;
    config.Load(path.string());
    CHECK(config.max_retries == 5);
    CHECK(config.base_url == "https://example.test");
    CHECK(config.timeout_seconds == 30.0);

    std::ifstream in(path);
    nlohmann::json written = nlohmann::json::parse(in);
    CHECK(written.contains("cache_max_entries"));
    CHECK(written["custom_note"] == "keep");
    CHECK(written["max_retries"] == 5);
}

TEST_CASE("Config Load reports a missing file") {
    Config config;
    CHECK_THROWS_WITH(config.Load(TempConfigPath("absent.json").string()),
                      Catch::Matchers::ContainsSubstring("Could not open config file"));
}

TEST_CASE("Config environment overrides") {
    EnvGuard delay("LOOPNET_REQUEST_DELAY_SECONDS", "0.5");
    EnvGuard retries("LOOPNET_MAX_RETRIES", "7");
    EnvGuard browser("LOOPNET_BROWSER_ENABLED", "false");
    EnvGuard base("LOOPNET_BASE_URL", "http://localhost:8080/");

    Config config;
    config.ApplyEnvironment();
    CHECK(config.request_delay_seconds == 0.5);
    CHECK(config.max_retries == 7);
    CHECK_FALSE(config.browser_enabled);
    CHECK(config.base_url == "http://localhost:8080");
}

TEST_CASE("Config rejects malformed environment values") {
    SECTION("number") {
        EnvGuard retries("LOOPNET_MAX_RETRIES", "3x");
        Config config;
        CHECK_THROWS_AS(config.ApplyEnvironment(), std::runtime_error);
    }
    SECTION("negative count") {
        EnvGuard entries("LOOPNET_CACHE_MAX_ENTRIES", "-1");
        Config config;
        CHECK_THROWS_AS(config.ApplyEnvironment(), std::runtime_error);
        CHECK(config.cache_max_entries == 500);
    }
    SECTION("boolean") {
        EnvGuard headless("LOOPNET_BROWSER_HEADLESS", "maybe");
        Config config;
        CHECK_THROWS_AS(config.ApplyEnvironment(), std::runtime_error);
    }
}

TEST_CASE("Config Validate rejects unusable settings") {
    Config config;
    config.max_retries = 0;
    CHECK_THROWS_AS(config.Validate(), std::runtime_error);

    config = Config();
    config.base_url = "ftp://www.loopnet.com";
    CHECK_THROWS_AS(config.Validate(), std::runtime_error);

    config = Config();
    config.request_delay_seconds = -1;
    CHECK_THROWS_AS(config.Validate(), std::runtime_error);
}
