#include "FetchOrchestrator.hpp"
#include <thread>
#include "ChallengeDetector.hpp"
#include "FetchErrors.hpp"
#include "../utils/Logger.hpp"

namespace Loopnet {

namespace {
constexpr std::chrono::milliseconds kWarmupSettleDelay{1000};
}

FetchOrchestrator::FetchOrchestrator(const Config& config, IHttpTransport& transport, IEscalationFetcher& escalation,
                                     ResponseCache& cache, IRateLimiter& rate_limiter, Sleeper sleeper)
    : config_(config), transport_(transport), escalation_(escalation), cache_(cache), rate_limiter_(rate_limiter),
      sleeper_(std::move(sleeper)), slots_(config.max_concurrent_requests) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

FetchOrchestrator::~FetchOrchestrator() {
    Close();
}

std::string FetchOrchestrator::Fetch(const std::string& url) {
    if (auto cached = cache_.Get(url)) {
        Logger::Log(LogLevel::Debug, "Cache hit for URL: " + url);
        return *cached;
    }

    if (config_.warmup_enabled) {
        std::call_once(warmup_once_, [this] { Warmup(); });
    }

    SemaphoreGuard slot(slots_);
    // Another caller may have fetched it while we waited for the slot.
    if (auto cached = cache_.Get(url)) {
        Logger::Log(LogLevel::Debug, "Cache hit after wait for URL: " + url);
        return *cached;
    }
    return FetchWithRetries(url);
}

void FetchOrchestrator::Warmup() {
    // Establishes session cookies. Never fails the caller.
    Logger::Log(LogLevel::Debug, "Warming up session at " + config_.base_url);
    try {
        HttpResponse response = transport_.Get(config_.base_url);
        if (!response.error.empty()) {
            Logger::Log(LogLevel::Warn, "Warmup request failed: " + response.error);
        } else if (response.status_code != 200) {
            Logger::Log(LogLevel::Debug, "Warmup returned status " + std::to_string(response.status_code));
        }
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Warn, std::string("Warmup request failed: ") + e.what());
    }
    sleeper_(kWarmupSettleDelay);
}

std::string FetchOrchestrator::FetchWithRetries(const std::string& url) {
    std::exception_ptr last_error;

    for (int attempt = 0; attempt < config_.max_retries; ++attempt) {
        rate_limiter_.WaitTurn();
        Logger::Log(LogLevel::Debug, "Fetching " + url + " (attempt " + std::to_string(attempt + 1) + "/" +
                                         std::to_string(config_.max_retries) + ")");

        AttemptOutcome outcome = Classify(url, transport_.Get(url));
        switch (outcome.kind) {
            case AttemptOutcome::Kind::Success:
                if (IsChallengePage(outcome.content)) {
                    Logger::Log(LogLevel::Info, "Challenge page detected for " + url + ", falling back to browser");
                    return Escalate(url);
                }
                cache_.Set(url, outcome.content);
                return outcome.content;
            case AttemptOutcome::Kind::Fatal:
                std::rethrow_exception(outcome.error);
            case AttemptOutcome::Kind::Retryable:
                last_error = outcome.error;
                break;
        }

        if (attempt < config_.max_retries - 1) {
            auto delay = BackoffDelay(attempt);
            Logger::Log(LogLevel::Debug, "Backing off " + std::to_string(delay.count()) + " ms before retrying " + url);
            sleeper_(delay);
        }
    }

    Logger::Log(LogLevel::Error, "Giving up on " + url + " after " + std::to_string(config_.max_retries) + " attempts");
    std::rethrow_exception(last_error);
}

FetchOrchestrator::AttemptOutcome FetchOrchestrator::Classify(const std::string& url, HttpResponse response) const {
    using Kind = AttemptOutcome::Kind;
    auto retryable = [](auto error) {
        Logger::Log(LogLevel::Warn, error.what());
        return AttemptOutcome{Kind::Retryable, {}, std::make_exception_ptr(error)};
    };

    if (!response.error.empty()) {
        return retryable(TransportError("Request failed for URL: " + url + ": " + response.error, url));
    }

    const long status = response.status_code;
    if (status == 200) {
        return {Kind::Success, std::move(response.body), nullptr};
    }
    if (status == 403) {
        BlockedError error("Blocked by Loopnet (403) for URL: " + url, url);
        if (!config_.retry_on_forbidden) {
            return {Kind::Fatal, {}, std::make_exception_ptr(error)};
        }
        return retryable(error);
    }
    if (status == 429) {
        return retryable(RateLimitedError("Rate limited (429) for URL: " + url, url));
    }
    if (status >= 500) {
        return retryable(TransportError("Server error (" + std::to_string(status) + ") for URL: " + url, url));
    }
    return {Kind::Fatal, {},
            std::make_exception_ptr(TransportError("Unexpected status " + std::to_string(status) + " for URL: " + url, url))};
}

std::string FetchOrchestrator::Escalate(const std::string& url) {
    if (!config_.browser_enabled) {
        throw FetchError("Challenge page detected but browser fallback is disabled for URL: " + url, url);
    }
    std::string html = escalation_.Fetch(url);
    cache_.Set(url, html);
    return html;
}

std::chrono::milliseconds FetchOrchestrator::BackoffDelay(int attempt) const {
    const double seconds = config_.backoff_base_seconds * static_cast<double>(1LL << attempt);
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
}

void FetchOrchestrator::Close() {
    escalation_.Close();
    transport_.Close();
}

}
