#include "ChromeSession.hpp"
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <fstream>
#include <stdexcept>
#include <sstream>
#include <thread>
#include <unistd.h>
#include <vector>
#include <sys/wait.h>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include "DevToolsPage.hpp"
#include "../utils/Logger.hpp"

namespace {

size_t AppendToString(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

bool IsExecutable(const std::string& path) {
    return !path.empty() && access(path.c_str(), X_OK) == 0 && !std::filesystem::is_directory(path);
}

} // anonymous namespace

namespace Loopnet {

std::string FindBrowserExecutable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return IsExecutable(name) ? name : std::string();
    }
    const char* path_env = std::getenv("PATH");
    if (!path_env) return {};
    std::stringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) continue;
        std::string candidate = (std::filesystem::path(dir) / name).string();
        if (IsExecutable(candidate)) return candidate;
    }
    return {};
}

std::unique_ptr<ChromeSession> ChromeSession::Launch(const Options& options) {
    std::string bin_path = FindBrowserExecutable(options.executable);
    if (bin_path.empty()) {
        throw std::runtime_error("Browser executable not found: " + options.executable);
    }

    std::string profile_template = (std::filesystem::temp_directory_path() / "loopnet-browser-XXXXXX").string();
    std::vector<char> profile_buf(profile_template.begin(), profile_template.end());
    profile_buf.push_back('\0');
    if (!mkdtemp(profile_buf.data())) {
        throw std::runtime_error("Failed to create browser profile directory");
    }
    std::filesystem::path profile_dir(profile_buf.data());

    // Argument strings must outlive execv.
    std::vector<std::string> arg_strings = {
        bin_path,
        "--remote-debugging-port=0",
        "--user-data-dir=" + profile_dir.string(),
        "--no-first-run",
        "--no-default-browser-check",
        "--disable-blink-features=AutomationControlled",
        "--window-size=1920,1080",
    };
    if (options.headless) arg_strings.push_back("--headless=new");
    if (geteuid() == 0) arg_strings.push_back("--no-sandbox");
    arg_strings.push_back("about:blank");

    std::vector<char*> argv;
    for (auto& s : arg_strings) argv.push_back(s.data());
    argv.push_back(nullptr);

    Logger::Log(LogLevel::Info, "Starting browser: " + bin_path + (options.headless ? " (headless)" : ""));
    pid_t pid = fork();
    if (pid == 0) {
        int null_fd = open("/dev/null", O_WRONLY);
        if (null_fd != -1) {
            dup2(null_fd, STDOUT_FILENO);
            dup2(null_fd, STDERR_FILENO);
            close(null_fd);
        }
        execv(bin_path.c_str(), argv.data());
        _exit(127);
    } else if (pid < 0) {
        std::error_code ec;
        std::filesystem::remove_all(profile_dir, ec);
        throw std::runtime_error("Failed to fork browser process");
    }

    std::unique_ptr<ChromeSession> session(new ChromeSession(pid, profile_dir, options));
    session->WaitForEndpoint();
    return session;
}

ChromeSession::ChromeSession(pid_t pid, std::filesystem::path profile_dir, const Options& options)
    : pid_(pid), profile_dir_(std::move(profile_dir)), options_(options) {}

ChromeSession::~ChromeSession() {
    Stop();
}

void ChromeSession::WaitForEndpoint() {
    // The browser writes the chosen port as the first line of DevToolsActivePort.
    const auto port_file = profile_dir_ / "DevToolsActivePort";
    const auto deadline = std::chrono::steady_clock::now() + options_.startup_timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        int status = 0;
        const pid_t pid = pid_;
        if (waitpid(pid, &status, WNOHANG) == pid) {
            pid_ = -1;
            Stop();
            throw std::runtime_error("Browser exited during startup");
        }
        std::ifstream in(port_file);
        int port = 0;
        if (in >> port && port > 0) {
            port_ = port;
            try {
                DevToolsRequest("/json/version");
                Logger::Log(LogLevel::Info, "Browser DevTools endpoint ready on port " + std::to_string(port_));
                return;
            } catch (const std::runtime_error& e) {
                Logger::Log(LogLevel::Debug, std::string("DevTools endpoint not ready: ") + e.what());
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    Stop();
    throw std::runtime_error("Browser DevTools endpoint not ready within timeout");
}

std::string ChromeSession::DevToolsRequest(const std::string& path, bool put) {
    CURL* curl = curl_easy_init();
    if (!curl) throw std::runtime_error("Failed to create cURL handle");

    std::string body;
    char errbuf[CURL_ERROR_SIZE] = {0};
    std::string url = "http://127.0.0.1:" + std::to_string(port_) + path;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, AppendToString);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.command_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    if (put) curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw std::runtime_error("DevTools request " + path + " failed: " + (errbuf[0] ? errbuf : curl_easy_strerror(res)));
    }
    if (status != 200) {
        throw std::runtime_error("DevTools request " + path + " returned " + std::to_string(status));
    }
    return body;
}

std::unique_ptr<IBrowserPage> ChromeSession::Open(const std::string& url) {
    if (pid_ <= 0) throw std::runtime_error("Browser is not running");

    std::string escaped;
    if (char* e = curl_easy_escape(nullptr, url.c_str(), static_cast<int>(url.size()))) {
        escaped = e;
        curl_free(e);
    } else {
        throw std::runtime_error("Failed to escape URL: " + url);
    }

    auto target = nlohmann::json::parse(DevToolsRequest("/json/new?" + escaped, true));
    std::string id = target.value("id", "");
    std::string ws_url = target.value("webSocketDebuggerUrl", "");
    if (id.empty() || ws_url.empty()) {
        throw std::runtime_error("DevTools did not return a page target for " + url);
    }
    Logger::Log(LogLevel::Debug, "Opened browser page " + id + " for " + url);

    auto close_hook = [this](const std::string& target_id) {
        if (pid_ > 0) DevToolsRequest("/json/close/" + target_id);
    };
    try {
        return std::make_unique<DevToolsPage>(id, ws_url, options_.command_timeout, close_hook);
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Warn, "Could not attach to page " + id + ": " + e.what());
        try {
            close_hook(id);
        } catch (const std::runtime_error& close_error) {
            Logger::Log(LogLevel::Warn, std::string("Failed to close page: ") + close_error.what());
        }
        throw;
    }
}

void ChromeSession::Stop() {
    const pid_t pid = pid_.exchange(-1);
    if (pid > 0) {
        Logger::Log(LogLevel::Info, "Stopping browser (PID: " + std::to_string(pid) + ")");
        kill(pid, SIGTERM);

        // Wait up to 2 seconds for graceful shutdown
        bool exited = false;
        for (int i = 0; i < 20; i++) {
            int status;
            if (waitpid(pid, &status, WNOHANG) != 0) {
                exited = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (!exited) {
            Logger::Log(LogLevel::Warn, "Force killing browser process");
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
        }
    }

    if (!profile_dir_.empty()) {
        std::error_code ec;
        std::filesystem::remove_all(profile_dir_, ec);
        if (ec) {
            Logger::Log(LogLevel::Warn, "Failed to remove browser profile " + profile_dir_.string() + ": " + ec.message());
        }
        profile_dir_.clear();
    }
}

}
