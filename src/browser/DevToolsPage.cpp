#include "DevToolsPage.hpp"
#include <stdexcept>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include "../utils/Logger.hpp"

namespace net = boost::asio;
namespace beast = boost::beast;
using tcp = net::ip::tcp;

namespace {

struct WsUrl {
    std::string host, port, target;
};

// ws://host:port/devtools/page/<id>
WsUrl ParseWsUrl(const std::string& url) {
    const std::string scheme = "ws://";
    if (url.rfind(scheme, 0) != 0) {
        throw std::runtime_error("Unsupported DevTools URL: " + url);
    }
    WsUrl res;
    auto rest = url.substr(scheme.size());
    auto slash = rest.find('/');
    std::string host_port = slash == std::string::npos ? rest : rest.substr(0, slash);
    res.target = slash == std::string::npos ? "/" : rest.substr(slash);
    auto colon = host_port.rfind(':');
    if (colon == std::string::npos) {
        res.host = host_port;
        res.port = "80";
    } else {
        res.host = host_port.substr(0, colon);
        res.port = host_port.substr(colon + 1);
    }
    if (res.host.empty()) {
        throw std::runtime_error("Unsupported DevTools URL: " + url);
    }
    return res;
}

} // anonymous namespace

namespace Loopnet {

DevToolsPage::DevToolsPage(std::string target_id, const std::string& ws_url,
                           std::chrono::milliseconds timeout, CloseHook on_close)
    : target_id_(std::move(target_id)), timeout_(timeout), on_close_(std::move(on_close)), ws_(ioc_) {
    auto url = ParseWsUrl(ws_url);
    tcp::resolver resolver{ioc_};
    auto results = resolver.resolve(url.host, url.port);

    beast::get_lowest_layer(ws_).expires_after(timeout_);
    beast::get_lowest_layer(ws_).connect(results);
    ws_.handshake(url.host + ":" + url.port, url.target);
    ws_.text(true);
    Logger::Log(LogLevel::Debug, "DevTools connected to page " + target_id_);
}

DevToolsPage::~DevToolsPage() {
    beast::error_code ec;
    ws_.close(beast::websocket::close_code::normal, ec);
    if (!on_close_) return;
    try {
        on_close_(target_id_);
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Warn, "Failed to close page " + target_id_ + ": " + e.what());
    }
}

std::string DevToolsPage::Content() {
    auto result = Call("Runtime.evaluate", {
        {"expression", "document.documentElement ? document.documentElement.outerHTML : ''"},
        {"returnByValue", true},
    });
    const auto& value = result["result"]["value"];
    return value.is_string() ? value.get<std::string>() : std::string();
}

nlohmann::json DevToolsPage::Call(const std::string& method, nlohmann::json params) {
    const int id = next_id_++;
    nlohmann::json request = {{"id", id}, {"method", method}, {"params", std::move(params)}};
    ws_.write(net::buffer(request.dump()));

    // Reads are async so the stream deadline applies; events without our id are skipped.
    while (true) {
        beast::flat_buffer buffer;
        beast::error_code ec;
        beast::get_lowest_layer(ws_).expires_after(timeout_);
        ws_.async_read(buffer, [&ec](beast::error_code e, std::size_t) { ec = e; });
        ioc_.restart();
        ioc_.run();
        if (ec) {
            throw std::runtime_error("DevTools " + method + " failed: " + ec.message());
        }

        auto message = nlohmann::json::parse(beast::buffers_to_string(buffer.data()), nullptr, false);
        if (message.is_discarded() || message.value("id", -1) != id) continue;
        if (message.contains("error")) {
            throw std::runtime_error("DevTools " + method + " error: " + message["error"].dump());
        }
        return message.value("result", nlohmann::json::object());
    }
}

}
