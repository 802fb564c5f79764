#include "Logger.hpp"
#include <iostream>
#include <iomanip>
#include <chrono>
#include <fstream>
#include <sstream>

namespace Loopnet {

std::mutex Logger::log_mutex;
LogLevel Logger::min_level_ = LogLevel::Info;
std::filesystem::path Logger::logs_dir_{};
std::string Logger::current_date_{};

namespace {

std::ofstream& GetFileStream() {
    static std::ofstream ofs;
    return ofs;
}

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "Debug";
        case LogLevel::Info:  return "Info";
        case LogLevel::Warn:  return "Warn";
        case LogLevel::Error: return "Error";
    }
    return "";
}

} // anonymous namespace

void Logger::Init(const std::string& base_dir, LogLevel min_level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    logs_dir_ = std::filesystem::path(base_dir) / "logs";
    std::error_code ec;
    std::filesystem::create_directories(logs_dir_, ec);
    if (ec) {
        std::cerr << "Logger: cannot create " << logs_dir_.string() << ": " << ec.message() << std::endl;
        logs_dir_.clear();
    }
    min_level_ = min_level;
}

void Logger::SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    min_level_ = level;
}

LogLevel Logger::FromString(const std::string& s) {
    std::string t;
    t.reserve(s.size());
    for (unsigned char c : s) t.push_back((c >= 'A' && c <= 'Z') ? char(c + 32) : char(c));
    if (t == "debug") return LogLevel::Debug;
    if (t == "info")  return LogLevel::Info;
    if (t == "warn" || t == "warning")  return LogLevel::Warn;
    if (t == "error" || t == "err") return LogLevel::Error;
    return LogLevel::Info;
}

void Logger::OpenLogFileForDate(const std::string& date) {
    auto& ofs = GetFileStream();
    if (ofs.is_open()) ofs.close();
    ofs.open(logs_dir_ / (date + ".log"), std::ios::out | std::ios::app);
}

void Logger::EnsureLogFileUnlocked(const std::tm& now_tm) {
    std::ostringstream date;
    date << std::put_time(&now_tm, "%Y-%m-%d");
    if (date.str() != current_date_) {
        current_date_ = date.str();
        OpenLogFileForDate(current_date_);
    }
}

void Logger::Log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < min_level_) return;
    auto in_time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::tm buf;
    localtime_r(&in_time_t, &buf);

    std::ostringstream line;
    line << std::put_time(&buf, "%Y-%m-%d %X") << " [" << LevelName(level) << "] " << message;

    std::cerr << line.str() << std::endl;

    if (!logs_dir_.empty()) {
        EnsureLogFileUnlocked(buf);
        auto& ofs = GetFileStream();
        if (ofs.is_open()) {
            ofs << line.str() << std::endl;
        }
    }
}

}
