#include "HttpTransport.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <future>
#include <stdexcept>
#include "BrowserProfile.hpp"
#include "../utils/Logger.hpp"

namespace {

// Context for a single cURL easy handle transfer
struct TransferContext {
    std::string buffer;
    Loopnet::HttpTransport::Callback callback;
    char error_buffer[CURL_ERROR_SIZE] = {0};
};

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t chunk = size * nmemb;
    auto* ctx = static_cast<TransferContext*>(userp);
    if (!ctx) return 0;
    try {
        ctx->buffer.append(static_cast<char*>(contents), chunk);
    } catch (const std::bad_alloc&) {
        return 0; // Aborts the transfer
    }
    return chunk;
}

void Deliver(TransferContext& ctx, Loopnet::HttpResponse response) {
    if (!ctx.callback) return;
    try {
        ctx.callback(std::move(response));
    } catch (const std::exception& e) {
        Loopnet::Logger::Log(Loopnet::LogLevel::Error, "Exception in fetch callback: " + std::string(e.what()));
    }
}

} // anonymous namespace

namespace Loopnet {

HttpTransport::HttpTransport(const Config& config)
    : timeout_ms_(static_cast<long>(config.timeout_seconds * 1000)) {
    if (!IsKnownBrowserProfile(config.impersonate_browser)) {
        Logger::Log(LogLevel::Warn, "Unknown impersonation profile '" + config.impersonate_browser + "', using default");
    }
    const BrowserProfile& profile = LookupBrowserProfile(config.impersonate_browser);
    user_agent_ = profile.user_agent;
    for (const auto& h : profile.headers) {
        curl_slist* next = curl_slist_append(headers_, h.c_str());
        if (!next) {
            curl_slist_free_all(headers_);
            throw std::runtime_error("Failed to build request headers");
        }
        headers_ = next;
    }

    share_handle_ = curl_share_init();
    multi_handle_ = curl_multi_init();
    if (!share_handle_ || !multi_handle_) {
        if (multi_handle_) curl_multi_cleanup(multi_handle_);
        if (share_handle_) curl_share_cleanup(share_handle_);
        curl_slist_free_all(headers_);
        throw std::runtime_error("Failed to initialize cURL handles");
    }
    // Only the worker thread touches shared data, so no lock callbacks are set.
    curl_share_setopt(share_handle_, CURLSHOPT_SHARE, CURL_LOCK_DATA_COOKIE);
    curl_share_setopt(share_handle_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(share_handle_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);

    Logger::Log(LogLevel::Debug, "HttpTransport using browser profile " + profile.id);
    worker_thread_ = std::thread(&HttpTransport::Run, this);
}

HttpTransport::~HttpTransport() {
    Close();
}

void HttpTransport::Close() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (closed_) return;
        closed_ = true;
        stop_ = true;
    }
    cv_.notify_one();
    curl_multi_wakeup(multi_handle_);
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    curl_multi_cleanup(multi_handle_);
    multi_handle_ = nullptr;
    curl_share_cleanup(share_handle_);
    share_handle_ = nullptr;
    curl_slist_free_all(headers_);
    headers_ = nullptr;
}

void HttpTransport::Fetch(const std::string& url, Callback cb) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            lock.unlock();
            HttpResponse closed;
            closed.error = "transport closed";
            cb(std::move(closed));
            return;
        }
        pending_requests_.push_back({url, std::move(cb)});
        curl_multi_wakeup(multi_handle_);
    }
    cv_.notify_one();
}

HttpResponse HttpTransport::Get(const std::string& url) {
    auto promise = std::make_shared<std::promise<HttpResponse>>();
    auto future = promise->get_future();
    Fetch(url, [promise](HttpResponse response) {
        promise->set_value(std::move(response));
    });
    return future.get();
}

void HttpTransport::Run() {
    Logger::Log(LogLevel::Debug, "HttpTransport worker thread started.");
    int still_running = 0;
    std::vector<Request> leftover;
    std::vector<CURL*> in_flight;

    auto create_easy_handle = [this](const std::string& url, TransferContext* ctx) -> CURL* {
        CURL* curl = curl_easy_init();
        if (!curl) return nullptr;

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, ctx);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_);
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
        curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
        curl_easy_setopt(curl, CURLOPT_COOKIEFILE, "");
        curl_easy_setopt(curl, CURLOPT_SHARE, share_handle_);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_AUTOREFERER, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, ctx->error_buffer);
        curl_easy_setopt(curl, CURLOPT_PRIVATE, ctx);

        long allowed_protocols = CURLPROTO_HTTP | CURLPROTO_HTTPS;
        curl_easy_setopt(curl, CURLOPT_PROTOCOLS, allowed_protocols);
        curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS, allowed_protocols);
        return curl;
    };

    while (true) {
        std::vector<Request> current_requests;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this, &still_running] { return stop_ || !pending_requests_.empty() || still_running > 0; });
            if (stop_) {
                std::swap(leftover, pending_requests_);
                break;
            }
            std::swap(current_requests, pending_requests_);
        }

        for (auto& req : current_requests) {
            auto* ctx = new TransferContext{};
            ctx->callback = std::move(req.callback);
            CURL* easy_handle = create_easy_handle(req.url, ctx);
            if (easy_handle && curl_multi_add_handle(multi_handle_, easy_handle) == CURLM_OK) {
                in_flight.push_back(easy_handle);
                Logger::Log(LogLevel::Debug, "Added easy handle for URL: " + req.url);
            } else {
                if (easy_handle) curl_easy_cleanup(easy_handle);
                Logger::Log(LogLevel::Error, "Failed to create cURL easy handle for: " + req.url);
                HttpResponse failed;
                failed.error = "failed to create transfer";
                Deliver(*ctx, std::move(failed));
                delete ctx;
            }
        }

        curl_multi_perform(multi_handle_, &still_running);

        int msgs_in_queue;
        CURLMsg* msg;
        while ((msg = curl_multi_info_read(multi_handle_, &msgs_in_queue))) {
            if (msg->msg != CURLMSG_DONE) continue;
            CURL* easy_handle = msg->easy_handle;
            TransferContext* ctx = nullptr;
            curl_easy_getinfo(easy_handle, CURLINFO_PRIVATE, &ctx);

            HttpResponse response;
            response.body = std::move(ctx->buffer);
            if (msg->data.result == CURLE_OK) {
                curl_easy_getinfo(easy_handle, CURLINFO_RESPONSE_CODE, &response.status_code);
                char* eff_url = nullptr;
                curl_easy_getinfo(easy_handle, CURLINFO_EFFECTIVE_URL, &eff_url);
                if (eff_url) response.effective_url = eff_url;
            } else {
                response.error = ctx->error_buffer;
                if (response.error.empty()) {
                    response.error = curl_easy_strerror(msg->data.result);
                }
            }

            curl_multi_remove_handle(multi_handle_, easy_handle);
            curl_easy_cleanup(easy_handle);
            in_flight.erase(std::remove(in_flight.begin(), in_flight.end(), easy_handle), in_flight.end());
            Deliver(*ctx, std::move(response));
            delete ctx;
        }

        if (still_running > 0) {
            curl_multi_poll(multi_handle_, nullptr, 0, 1000, nullptr);
        }
    }

    // Shutting down: fail whatever is still queued or in flight.
    for (CURL* easy_handle : in_flight) {
        TransferContext* ctx = nullptr;
        curl_easy_getinfo(easy_handle, CURLINFO_PRIVATE, &ctx);
        curl_multi_remove_handle(multi_handle_, easy_handle);
        curl_easy_cleanup(easy_handle);
        HttpResponse aborted;
        aborted.error = "transport closed";
        Deliver(*ctx, std::move(aborted));
        delete ctx;
    }
    for (auto& req : leftover) {
        HttpResponse aborted;
        aborted.error = "transport closed";
        if (req.callback) req.callback(std::move(aborted));
    }
    Logger::Log(LogLevel::Debug, "HttpTransport worker thread stopped.");
}

}
