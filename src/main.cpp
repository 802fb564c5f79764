#include <chrono>
#include <iostream>
#include <memory>
#include <vector>
#include <cstdlib>
#include <curl/curl.h>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include "../config/Config.hpp"
#include "browser/ChromeSession.hpp"
#include "cache/ResponseCache.hpp"
#include "core/EscalationFetcher.hpp"
#include "core/FetchErrors.hpp"
#include "core/FetchOrchestrator.hpp"
#include "core/ListingService.hpp"
#include "network/HttpTransport.hpp"
#include "utils/Logger.hpp"
#include "utils/RateLimiter.hpp"

namespace {

struct CommandLine {
    std::string command;
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
};

void PrintUsage() {
    std::cerr << "Usage:\n"
              << "  loopnet-fetch [--config <path>] search <location> [--type T] [--listing for-sale|for-lease] [--page N]\n"
              << "  loopnet-fetch [--config <path>] detail <url-or-id>\n"
              << "  loopnet-fetch [--config <path>] fetch <url>\n";
}

CommandLine ParseCommandLine(int argc, char* argv[]) {
    CommandLine cl;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argc) throw std::invalid_argument("Missing value for " + arg);
            cl.options[arg.substr(2)] = argv[++i];
        } else if (cl.command.empty()) {
            cl.command = arg;
        } else {
            cl.positional.push_back(arg);
        }
    }
    return cl;
}

std::string OptionOr(const CommandLine& cl, const std::string& key, const std::string& fallback) {
    auto it = cl.options.find(key);
    return it != cl.options.end() ? it->second : fallback;
}

Loopnet::Config LoadConfig(const std::string& config_path) {
    Loopnet::Config config;
    try {
        config.Load(config_path);
        Loopnet::Logger::Log(Loopnet::LogLevel::Info, "Configuration loaded from: " + config_path);
    } catch (const std::runtime_error& e) {
        std::string error_message = e.what();
        if (error_message.find("Could not open config file") == std::string::npos) {
            throw;
        }
        Loopnet::Logger::Log(Loopnet::LogLevel::Warn, "config.json not found. Creating a default one at: " + config_path);
        try {
            config.CreateDefault(config_path);
        } catch (const std::exception& create_e) {
            Loopnet::Logger::Log(Loopnet::LogLevel::Warn, "Failed to create default config: " + std::string(create_e.what()));
        }
    }
    config.ApplyEnvironment();
    config.Validate();
    return config;
}

int RunCommand(const CommandLine& cl, Loopnet::FetchOrchestrator& orchestrator, const Loopnet::Config& config) {
    Loopnet::ListingService service(orchestrator, config.base_url);

    if (cl.command == "search") {
        const std::string location = cl.positional[0];
        const std::string type = OptionOr(cl, "type", "");
        const std::string listing = OptionOr(cl, "listing", "for-sale");
        const int page = std::stoi(OptionOr(cl, "page", "1"));
        try {
            nlohmann::json out = service.Search(location, type, listing, page);
            std::cout << out.dump(2) << std::endl;
        } catch (const Loopnet::FetchError& e) {
            Loopnet::Logger::Log(Loopnet::LogLevel::Error, e.what());
            nlohmann::json out = {
                {"error", e.what()},
                {"query_location", location},
                {"query_property_type", type.empty() ? nlohmann::json(nullptr) : nlohmann::json(type)},
                {"query_listing_type", listing},
                {"page", page},
                {"properties", nlohmann::json::array()},
            };
            std::cout << out.dump(2) << std::endl;
            return 1;
        }
        return 0;
    }

    if (cl.command == "detail") {
        const std::string url = service.ResolveDetailUrl(cl.positional[0]);
        try {
            nlohmann::json out = service.Detail(url);
            std::cout << out.dump(2) << std::endl;
        } catch (const Loopnet::FetchError& e) {
            Loopnet::Logger::Log(Loopnet::LogLevel::Error, e.what());
            std::cout << nlohmann::json{{"error", e.what()}, {"url", url}}.dump(2) << std::endl;
            return 1;
        } catch (const std::runtime_error& e) {
            Loopnet::Logger::Log(Loopnet::LogLevel::Error, e.what());
            std::cout << nlohmann::json{{"error", e.what()}, {"url", url}}.dump(2) << std::endl;
            return 1;
        }
        return 0;
    }

    // fetch
    try {
        std::cout << orchestrator.Fetch(cl.positional[0]) << std::endl;
    } catch (const Loopnet::FetchError& e) {
        Loopnet::Logger::Log(Loopnet::LogLevel::Error, e.what());
        std::cout << nlohmann::json{{"error", e.what()}, {"url", e.url()}}.dump(2) << std::endl;
        return 1;
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc == 0 || argv[0] == nullptr) {
        Loopnet::Logger::Log(Loopnet::LogLevel::Error, "Cannot determine executable path.");
        return 1;
    }
    std::filesystem::path exe_dir = std::filesystem::path(argv[0]).parent_path();

    CommandLine cl;
    try {
        cl = ParseCommandLine(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        PrintUsage();
        return 2;
    }
    if ((cl.command != "search" && cl.command != "detail" && cl.command != "fetch") || cl.positional.size() != 1) {
        PrintUsage();
        return 2;
    }

    const std::string config_path = OptionOr(cl, "config", (exe_dir / "config" / "config.json").string());

    Loopnet::Config config;
    try {
        config = LoadConfig(config_path);
    } catch (const std::exception& e) {
        Loopnet::Logger::Log(Loopnet::LogLevel::Error, "Failed to load config: " + std::string(e.what()));
        return 1;
    }
    Loopnet::Logger::Init(exe_dir.string(), Loopnet::Logger::FromString(config.log_level));

    // Initialize global resources
    curl_global_init(CURL_GLOBAL_ALL);

    int exit_code = 0;
    {
        Loopnet::HttpTransport transport(config);
        Loopnet::ResponseCache cache(config.cache_max_entries, std::chrono::seconds(config.cache_ttl_seconds));
        Loopnet::RateLimiter rate_limiter(std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(config.request_delay_seconds)));

        Loopnet::ChromeSession::Options browser_options;
        browser_options.executable = config.browser_executable;
        browser_options.headless = config.browser_headless;
        browser_options.startup_timeout = std::chrono::milliseconds(static_cast<long long>(config.browser_timeout_seconds * 1000));
        browser_options.command_timeout = browser_options.startup_timeout;
        Loopnet::EscalationFetcher escalation(
            std::chrono::milliseconds(static_cast<long long>(config.browser_challenge_wait_seconds * 1000)),
            [browser_options]() -> std::unique_ptr<Loopnet::IBrowserSession> {
                return Loopnet::ChromeSession::Launch(browser_options);
            });

        Loopnet::FetchOrchestrator orchestrator(config, transport, escalation, cache, rate_limiter);
        try {
            exit_code = RunCommand(cl, orchestrator, config);
        } catch (const std::exception& e) {
            Loopnet::Logger::Log(Loopnet::LogLevel::Error, e.what());
            std::cout << nlohmann::json{{"error", e.what()}}.dump(2) << std::endl;
            exit_code = 1;
        }
        orchestrator.Close();
    }

    // Cleanup global resources
    curl_global_cleanup();
    return exit_code;
}
