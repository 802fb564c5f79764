#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <sys/types.h>
#include "../interfaces/IBrowserSession.hpp"

namespace Loopnet {

// A Chromium-family browser process with its remote debugging endpoint open.
// Each session uses a private, temporary profile directory.
class ChromeSession : public IBrowserSession {
public:
    struct Options {
        std::string executable = "chromium";
        bool headless = true;
        std::chrono::milliseconds startup_timeout{30000};
        std::chrono::milliseconds command_timeout{30000};
    };

    // Starts the browser and waits for its DevTools endpoint.
    // Throws std::runtime_error if the executable is missing or never becomes ready.
    static std::unique_ptr<ChromeSession> Launch(const Options& options);

    ~ChromeSession() override;

    ChromeSession(const ChromeSession&) = delete;
    ChromeSession& operator=(const ChromeSession&) = delete;

    std::unique_ptr<IBrowserPage> Open(const std::string& url) override;
    void Stop() override;

private:
    ChromeSession(pid_t pid, std::filesystem::path profile_dir, const Options& options);

    void WaitForEndpoint();
    std::string DevToolsRequest(const std::string& path, bool put = false);

    std::atomic<pid_t> pid_; // -1 once stopped
    std::filesystem::path profile_dir_;
    Options options_;
    int port_ = 0;
};

// Resolves name against PATH (or checks it directly if it contains '/').
// Returns an empty string when no executable is found.
std::string FindBrowserExecutable(const std::string& name);

}
