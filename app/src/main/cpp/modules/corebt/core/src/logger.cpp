#include "logger.h"
#include <mutex>
#include <string>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <chrono>
#include <ctime>
#include <cctype>
#include <queue>
#include <thread>
#include <memory>
#include <condition_variable>
#include <atomic>

#ifdef HAVE_JNI
#include <android/log.h>
#endif

/**
 * @brief Tag printed in front of every line.
 */
static std::string g_logTag = "litebt";

/**
 * @brief Mutex for protecting the logger state and the default sink.
 */
static std::mutex g_logMutex;

/**
 * @brief Global log level (for conditional logging)
 */
static LogLevel g_log_level = LogLevel::INFO;

static std::function<void(const std::string&)> g_log_callback;

/**
 * @brief Global async logging state
 */
static std::atomic<bool> g_async_logging_enabled(false);
static std::queue<std::string> g_log_queue;
static std::mutex g_log_queue_mutex;
static std::condition_variable g_log_queue_cv;
static std::atomic<bool> g_log_thread_running(false);
static std::unique_ptr<std::thread> g_log_thread;

static const char* level_label(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::NONE: break;
    }
    return "-";
}

static std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S") << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

/**
 * @brief Writes one formatted line to the active sink. Caller holds g_logMutex.
 */
static void write_line(const std::string& line) {
    if (g_log_callback) {
        g_log_callback(line);
        return;
    }
#ifdef HAVE_JNI
    __android_log_print(ANDROID_LOG_INFO, "LiteBT_Native", "%s", line.c_str());
#else
    std::cerr << line << std::endl;
#endif
}

void setLogTag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_logTag = tag;
}

void setLogCallback(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_log_callback = std::move(callback);
}

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_log_level = level;
}

LogLevel get_log_level() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_log_level;
}

LogLevel parse_log_level(const std::string& value) {
    std::string v = value;
    for (auto& c : v) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warn" || v == "warning") return LogLevel::WARNING;
    if (v == "error") return LogLevel::ERROR;
    if (v == "none") return LogLevel::NONE;
    return LogLevel::INFO;
}

/**
 * @brief Background thread worker for async logging.
 * Drains whatever is queued before exiting.
 */
static void async_log_worker() {
    while (true) {
        std::unique_lock<std::mutex> lock(g_log_queue_mutex);
        g_log_queue_cv.wait(lock, [] { return !g_log_queue.empty() || !g_log_thread_running; });

        if (g_log_queue.empty()) {
            if (!g_log_thread_running) break;
            continue;
        }

        auto msg = std::move(g_log_queue.front());
        g_log_queue.pop();
        lock.unlock();

        std::lock_guard<std::mutex> sink_lock(g_logMutex);
        write_line(msg);
    }
}

void enable_async_logging() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_async_logging_enabled) return;
    g_log_thread_running = true;
    g_log_thread = std::make_unique<std::thread>(async_log_worker);
    g_async_logging_enabled = true;
}

void disable_async_logging() {
    if (!g_async_logging_enabled) return;

    {
        std::lock_guard<std::mutex> lock(g_log_queue_mutex);
        g_log_thread_running = false;
    }
    g_log_queue_cv.notify_all();

    if (g_log_thread && g_log_thread->joinable()) {
        g_log_thread->join();
    }
    g_log_thread.reset();
    g_async_logging_enabled = false;
}

bool is_async_logging_enabled() {
    return g_async_logging_enabled.load();
}

void logAt(LogLevel level, const std::string& message) {
    std::string tag;
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        tag = g_logTag;
    }
    std::string line = "[" + timestamp() + "] [" + level_label(level) + "] [" + tag + "] " + message;

    if (is_async_logging_enabled()) {
        {
            std::lock_guard<std::mutex> lock(g_log_queue_mutex);
            g_log_queue.push(std::move(line));
        }
        g_log_queue_cv.notify_one();
        return;
    }

    std::lock_guard<std::mutex> lock(g_logMutex);
    write_line(line);
}

void nativeLog(const std::string& message) {
    logAt(LogLevel::INFO, message);
}
