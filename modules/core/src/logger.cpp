#include "logger.h"
#include <mutex>
#include <string>
#include <iostream>
#include <queue>
#include <thread>
#include <memory>
#include <condition_variable>
#include <atomic>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

/**
 * @brief Tag printed in front of every line.
 */
static std::string g_tag = "lightlink";

/**
 * @brief Protects the tag, the level and the callback.
 */
static std::mutex g_logMutex;

static std::atomic<LogLevel> g_log_level(LogLevel::INFO);

static std::function<void(const std::string&)> g_log_callback;

/**
 * @brief Async logging state
 */
static std::atomic<bool> g_async_logging_enabled(false);
static std::queue<std::string> g_log_queue;
static std::mutex g_log_queue_mutex;
static std::condition_variable g_log_queue_cv;
static bool g_log_thread_running = false;
static std::unique_ptr<std::thread> g_log_thread;

namespace {

std::string timestamp_now() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

// Must be called without g_log_queue_mutex held.
void write_line(const std::string& line) {
    std::function<void(const std::string&)> cb;
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        cb = g_log_callback;
    }
    if (cb) {
        cb(line);
        return;
    }
    std::lock_guard<std::mutex> lock(g_logMutex);
    std::cerr << line << std::endl;
}

void async_log_worker() {
    std::unique_lock<std::mutex> lock(g_log_queue_mutex);
    for (;;) {
        g_log_queue_cv.wait(lock, [] { return !g_log_queue.empty() || !g_log_thread_running; });
        while (!g_log_queue.empty()) {
            std::string line = std::move(g_log_queue.front());
            g_log_queue.pop();
            lock.unlock();
            write_line(line);
            lock.lock();
        }
        if (!g_log_thread_running) {
            return;
        }
    }
}

} // namespace

void setLogTag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_tag = tag;
}

void setLogCallback(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_log_callback = std::move(callback);
}

void set_log_level(LogLevel level) {
    g_log_level.store(level);
}

LogLevel get_log_level() {
    return g_log_level.load();
}

LogLevel log_level_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "none" || lower == "off") return LogLevel::NONE;
    return LogLevel::INFO;
}

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::NONE: return "NONE";
    }
    return "INFO";
}

void enable_async_logging() {
    std::lock_guard<std::mutex> lock(g_log_queue_mutex);
    if (g_async_logging_enabled) return;
    g_log_thread_running = true;
    g_log_thread = std::make_unique<std::thread>(async_log_worker);
    g_async_logging_enabled = true;
}

void disable_async_logging() {
    std::unique_ptr<std::thread> worker;
    {
        std::lock_guard<std::mutex> lock(g_log_queue_mutex);
        if (!g_async_logging_enabled) return;
        g_async_logging_enabled = false;
        g_log_thread_running = false;
        worker = std::move(g_log_thread);
    }
    g_log_queue_cv.notify_all();
    if (worker && worker->joinable()) {
        worker->join();
    }
}

bool is_async_logging_enabled() {
    return g_async_logging_enabled.load();
}

void nativeLog(LogLevel level, const std::string& message) {
    std::string tag;
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        tag = g_tag;
    }
    std::string line = timestamp_now() + " [" + tag + "] " + log_level_to_string(level) + ": " + message;

    if (is_async_logging_enabled()) {
        {
            std::lock_guard<std::mutex> lock(g_log_queue_mutex);
            if (g_log_thread_running) {
                g_log_queue.push(std::move(line));
                g_log_queue_cv.notify_one();
                return;
            }
        }
    }
    write_line(line);
}
