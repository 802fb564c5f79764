#include "EscalationFetcher.hpp"
#include <thread>
#include "ChallengeDetector.hpp"
#include "FetchErrors.hpp"
#include "../utils/Logger.hpp"

namespace Loopnet {

namespace {
enum class PollState { Pending, Resolved, Expired };
}

EscalationFetcher::EscalationFetcher(std::chrono::milliseconds challenge_wait, SessionFactory factory,
                                     std::chrono::milliseconds poll_interval)
    : challenge_wait_(challenge_wait), poll_interval_(poll_interval), factory_(std::move(factory)) {}

EscalationFetcher::~EscalationFetcher() {
    Close();
}

bool EscalationFetcher::IsRunning() const {
    return std::atomic_load(&session_) != nullptr;
}

std::shared_ptr<IBrowserSession> EscalationFetcher::EnsureSession(const std::string& url) {
    if (auto session = std::atomic_load(&session_)) {
        return session;
    }

    std::lock_guard<std::mutex> lock(session_mutex_);
    if (auto session = std::atomic_load(&session_)) {
        return session;
    }

    std::shared_ptr<IBrowserSession> created;
    try {
        created = factory_();
    } catch (const std::exception& e) {
        throw EscalationError("Browser unavailable for URL: " + url + ": " + e.what(), url);
    }
    if (!created) {
        throw EscalationError("Browser unavailable for URL: " + url, url);
    }
    std::atomic_store(&session_, created);
    Logger::Log(LogLevel::Info, "Browser session started");
    return created;
}

std::string EscalationFetcher::Fetch(const std::string& url) {
    auto session = EnsureSession(url);
    Logger::Log(LogLevel::Info, "Fetching with browser: " + url);

    try {
        // The page closes when it goes out of scope, on every path.
        std::unique_ptr<IBrowserPage> page = session->Open(url);
        return PollUntilResolved(*page, url);
    } catch (const EscalationError&) {
        throw;
    } catch (const std::exception& e) {
        throw EscalationError("Browser fetch failed for URL: " + url + ": " + e.what(), url);
    }
}

std::string EscalationFetcher::PollUntilResolved(IBrowserPage& page, const std::string& url) {
    const auto deadline = std::chrono::steady_clock::now() + challenge_wait_;
    PollState state = PollState::Pending;
    std::string html;

    while (state == PollState::Pending) {
        if (std::chrono::steady_clock::now() >= deadline) {
            state = PollState::Expired;
            break;
        }
        std::this_thread::sleep_for(poll_interval_);
        html = page.Content();
        if (!IsChallengePage(html) && CharacterCount(html) > kMinContentLength) {
            state = PollState::Resolved;
        }
    }

    if (html.empty()) {
        html = page.Content();
    }
    if (IsChallengePage(html)) {
        throw EscalationError("Challenge page persisted after browser fetch for URL: " + url, url);
    }
    Logger::Log(LogLevel::Info, std::string("Browser fetch ") +
        (state == PollState::Resolved ? "resolved" : "reached its wait budget") + " for " + url);
    return html;
}

void EscalationFetcher::Close() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    auto session = std::atomic_exchange(&session_, std::shared_ptr<IBrowserSession>());
    if (!session) return;
    try {
        session->Stop();
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Warn, std::string("Browser shutdown error ignored: ") + e.what());
    }
    Logger::Log(LogLevel::Info, "Browser session closed");
}

}
