#pragma once
#include <stdexcept>
#include <string>

namespace Loopnet {

// Base of every error FetchOrchestrator::Fetch reports. Carries the request URL.
class FetchError : public std::runtime_error {
public:
    FetchError(const std::string& message, std::string url)
        : std::runtime_error(message), url_(std::move(url)) {}
    const std::string& url() const noexcept { return url_; }
private:
    std::string url_;
};

// Origin answered 403 until retries ran out.
class BlockedError : public FetchError {
public:
    using FetchError::FetchError;
};

// Origin answered 429 until retries ran out.
class RateLimitedError : public FetchError {
public:
    using FetchError::FetchError;
};

// Network fault, 5xx after retries, or an unexpected status.
class TransportError : public FetchError {
public:
    using FetchError::FetchError;
};

// Challenge page not resolved by the browser, or no browser available.
class EscalationError : public FetchError {
public:
    using FetchError::FetchError;
};

}
