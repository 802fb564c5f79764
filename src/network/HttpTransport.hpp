#pragma once
#include <string>
#include <functional>
#include <vector>
#include <mutex>
#include <thread>
#include <condition_variable>
#include "../interfaces/IHttpTransport.hpp"
#include "../../config/Config.hpp"

// Forward declare cURL handles
typedef void CURLM;
typedef void CURLSH;
struct curl_slist;

namespace Loopnet {

// Primary transport. A single worker thread drives a curl multi handle; all
// transfers share one cookie jar so cookies set during warmup are replayed.
// Requests carry the headers of the configured browser profile.
class HttpTransport : public IHttpTransport {
public:
    using Callback = std::function<void(HttpResponse)>;

    explicit HttpTransport(const Config& config);
    ~HttpTransport() override;

    // Non-copyable
    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    // Queues a GET; cb runs on the worker thread.
    void Fetch(const std::string& url, Callback cb);

    // Blocking GET.
    HttpResponse Get(const std::string& url) override;

    // Stops the worker and fails queued requests. Idempotent.
    void Close() override;

private:
    void Run();

    struct Request {
        std::string url;
        Callback callback;
    };

    long timeout_ms_;
    std::string user_agent_;
    curl_slist* headers_ = nullptr;
    CURLM* multi_handle_ = nullptr;
    CURLSH* share_handle_ = nullptr;
    std::thread worker_thread_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    bool closed_ = false;
    std::vector<Request> pending_requests_;
};

}
