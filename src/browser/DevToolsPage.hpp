#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <nlohmann/json.hpp>
#include "../interfaces/IBrowserSession.hpp"

namespace Loopnet {

// A browser tab driven over its DevTools WebSocket.
class DevToolsPage : public IBrowserPage {
public:
    using CloseHook = std::function<void(const std::string& target_id)>;

    DevToolsPage(std::string target_id, const std::string& ws_url,
                 std::chrono::milliseconds timeout, CloseHook on_close);
    ~DevToolsPage() override;

    DevToolsPage(const DevToolsPage&) = delete;
    DevToolsPage& operator=(const DevToolsPage&) = delete;

    // Serialized DOM of the current document.
    std::string Content() override;

private:
    nlohmann::json Call(const std::string& method, nlohmann::json params);

    std::string target_id_;
    std::chrono::milliseconds timeout_;
    CloseHook on_close_;
    int next_id_ = 1;
    boost::asio::io_context ioc_;
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
};

}
