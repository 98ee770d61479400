#include "logger.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>

namespace minekeeper {
namespace logging {

Level Logger::threshold_ = Level::LVL_INFO;
std::mutex Logger::mutex_;
std::ofstream Logger::file_;

namespace {

const char *level_tag(Level level) {
    switch (level) {
        case Level::LVL_DEBUG:
            return " [DEBUG] ";
        case Level::LVL_INFO:
            return " [INFO]  ";
        case Level::LVL_WARN:
            return " [WARN]  ";
        case Level::LVL_ERROR:
            return " [ERROR] ";
        default:
            return " ";
    }
}

}  // namespace

void Logger::set_level(Level level) { threshold_ = level; }

Level Logger::level() { return threshold_; }

bool Logger::open_file(const std::string &path, std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    file_.open(path, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        error = "Cannot open log file: " + path;
        return false;
    }
    return true;
}

void Logger::close_file() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

void Logger::log(Level level, const char *file, int line, const std::string &message) {
    (void)file;
    (void)line;

    if (level < threshold_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    // Build the line once so console and file stay identical
    std::ostringstream out;
    out << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    out << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
    out << level_tag(level) << message << "\n";
    const std::string text = out.str();

    std::lock_guard<std::mutex> lock(mutex_);

    std::cerr << text;
    if (level >= Level::LVL_ERROR) {
        std::cerr << std::flush;
    }

    if (file_.is_open()) {
        file_ << text;
        file_.flush();
    }
}

Level string_to_level(const std::string &level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);

    if (s == "DEBUG") return Level::LVL_DEBUG;
    if (s == "INFO") return Level::LVL_INFO;
    if (s == "WARN") return Level::LVL_WARN;
    if (s == "ERROR") return Level::LVL_ERROR;

    return Level::LVL_INFO;  // Default
}

}  // namespace logging
}  // namespace minekeeper
