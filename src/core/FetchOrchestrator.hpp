#pragma once
#include <chrono>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include "../../config/Config.hpp"
#include "../cache/ResponseCache.hpp"
#include "../interfaces/IEscalationFetcher.hpp"
#include "../interfaces/IHttpTransport.hpp"
#include "../interfaces/IRateLimiter.hpp"
#include "../utils/Semaphore.hpp"

namespace Loopnet {

// Single entry point for page retrieval: cache, warmup, concurrency cap,
// rate limiting, retries with exponential backoff, challenge detection and
// browser escalation.
//
// Fetch() throws BlockedError, RateLimitedError, TransportError or
// EscalationError, or a plain FetchError for a challenge page when the
// browser is disabled.
class FetchOrchestrator {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    FetchOrchestrator(const Config& config, IHttpTransport& transport, IEscalationFetcher& escalation,
                      ResponseCache& cache, IRateLimiter& rate_limiter, Sleeper sleeper = {});
    ~FetchOrchestrator();

    FetchOrchestrator(const FetchOrchestrator&) = delete;
    FetchOrchestrator& operator=(const FetchOrchestrator&) = delete;

    std::string Fetch(const std::string& url);

    // Releases the browser session and the transport. Safe to call repeatedly.
    void Close();

private:
    struct AttemptOutcome {
        enum class Kind { Success, Retryable, Fatal };
        Kind kind;
        std::string content;
        std::exception_ptr error;
    };

    void Warmup();
    std::string FetchWithRetries(const std::string& url);
    AttemptOutcome Classify(const std::string& url, HttpResponse response) const;
    std::string Escalate(const std::string& url);
    std::chrono::milliseconds BackoffDelay(int attempt) const;

    const Config config_;
    IHttpTransport& transport_;
    IEscalationFetcher& escalation_;
    ResponseCache& cache_;
    IRateLimiter& rate_limiter_;
    Sleeper sleeper_;
    Semaphore slots_;
    std::once_flag warmup_once_;
};

}
