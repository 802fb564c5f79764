#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "../interfaces/IBrowserSession.hpp"
#include "../interfaces/IEscalationFetcher.hpp"

namespace Loopnet {

// Resolves challenge pages by loading them in a real browser.
// The browser session is started on first use and shared by later fetches.
class EscalationFetcher : public IEscalationFetcher {
public:
    using SessionFactory = std::function<std::unique_ptr<IBrowserSession>()>;

    // Pages of this many characters or fewer are still considered loading.
    static constexpr size_t kMinContentLength = 1000;

    EscalationFetcher(std::chrono::milliseconds challenge_wait, SessionFactory factory,
                      std::chrono::milliseconds poll_interval = std::chrono::seconds(1));
    ~EscalationFetcher() override;

    std::string Fetch(const std::string& url) override;
    void Close() override;

    bool IsRunning() const;

private:
    std::shared_ptr<IBrowserSession> EnsureSession(const std::string& url);
    std::string PollUntilResolved(IBrowserPage& page, const std::string& url);

    std::chrono::milliseconds challenge_wait_;
    std::chrono::milliseconds poll_interval_;
    SessionFactory factory_;
    std::shared_ptr<IBrowserSession> session_; // accessed with std::atomic_load/store
    std::mutex session_mutex_;
};

}
