#include "cpp_logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <deque>
#include <iostream>
#include <mutex>

namespace capturehub {
namespace devices {
namespace logging {

std::atomic<LogLevel> current_log_level{LogLevel::INFO};

namespace {
    const size_t MAX_LOG_QUEUE_SIZE = 2048;
    std::atomic<bool> stderr_mirror_enabled{false};

    struct LoggerState {
        std::deque<LogEntry> queue;
        std::mutex mutex;
        std::condition_variable cv;
        bool shutdown_requested = false;
        bool overflow_message_logged_since_clear = false;
    };

    // Never destroyed: abandoned scanner threads may still log while statics are torn down.
    LoggerState& logger_state() {
        static LoggerState* state = new LoggerState();
        return *state;
    }

    const char* level_tag(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARNING: return "WARNING";
            case LogLevel::ERR: return "ERROR";
        }
        return "UNKNOWN";
    }
}

const char* get_base_filename(const char* path) {
    if (!path) {
        return "";
    }
    const char* last_slash = strrchr(path, '/');
    const char* last_backslash = strrchr(path, '\\');

    const char* base = path;
    if (last_slash && last_backslash) {
        base = (last_slash > last_backslash) ? last_slash + 1 : last_backslash + 1;
    } else if (last_slash) {
        base = last_slash + 1;
    } else if (last_backslash) {
        base = last_backslash + 1;
    }
    return base;
}

void set_cpp_log_level(LogLevel level) {
    current_log_level = level;
}

void set_cpp_log_stderr_mirror(bool enabled) {
    stderr_mirror_enabled = enabled;
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    if (upper == "DEBUG") {
        out = LogLevel::DEBUG;
    } else if (upper == "INFO") {
        out = LogLevel::INFO;
    } else if (upper == "WARNING" || upper == "WARN") {
        out = LogLevel::WARNING;
    } else if (upper == "ERROR" || upper == "ERR") {
        out = LogLevel::ERR;
    } else {
        return false;
    }
    return true;
}

void log_message(LogLevel level, const char* file, int line, const char* format, ...) {
    if (static_cast<int>(level) < static_cast<int>(current_log_level.load())) {
        return;
    }

    std::vector<char> buffer(1024);
    va_list args;
    va_start(args, format);
    int needed = vsnprintf(buffer.data(), buffer.size(), format, args);
    va_end(args);

    if (needed < 0) {
        std::cerr << "CppLogger: Encoding error in log_message for file " << (file ? file : "unknown_file") << ":" << line << std::endl;
        return;
    }

    if (static_cast<size_t>(needed) >= buffer.size()) {
        buffer.resize(static_cast<size_t>(needed) + 1);
        va_start(args, format);
        vsnprintf(buffer.data(), buffer.size(), format, args);
        va_end(args);
    }

    LogEntry new_entry;
    new_entry.level = level;
    new_entry.message = std::string(buffer.data());
    new_entry.filename = (file ? std::string(file) : "unknown_file");
    new_entry.line_number = line;

    if (stderr_mirror_enabled) {
        std::fprintf(stderr, "[%s][%s:%d] %s\n", level_tag(level), new_entry.filename.c_str(), line,
                     new_entry.message.c_str());
    }

    LoggerState& state = logger_state();
    {
        std::unique_lock<std::mutex> lock(state.mutex);
        if (state.shutdown_requested) {
            return;
        }

        if (state.queue.size() >= MAX_LOG_QUEUE_SIZE) {
            state.queue.pop_front();
            if (!state.overflow_message_logged_since_clear) {
                LogEntry overflow_entry;
                overflow_entry.level = LogLevel::WARNING;
                overflow_entry.message = "C++ log queue overflow. Oldest messages dropped.";
                overflow_entry.filename = "cpp_logger.cpp";
                overflow_entry.line_number = __LINE__;
                state.queue.push_back(std::move(overflow_entry));
                state.overflow_message_logged_since_clear = true;
            }
        }
        state.queue.push_back(std::move(new_entry));
        lock.unlock();
        state.cv.notify_one();
    }
}

std::vector<LogEntry> retrieve_log_entries(int timeout_ms) {
    std::vector<LogEntry> batch;
    LoggerState& state = logger_state();
    std::unique_lock<std::mutex> lock(state.mutex);

    if (!state.cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                           [&state] { return !state.queue.empty() || state.shutdown_requested; })) {
        return batch;
    }

    if (state.shutdown_requested && state.queue.empty()) {
        return batch;
    }

    size_t items_to_grab = std::min(state.queue.size(), static_cast<size_t>(100));
    batch.reserve(items_to_grab);
    for (size_t i = 0; i < items_to_grab && !state.queue.empty(); ++i) {
        batch.push_back(std::move(state.queue.front()));
        state.queue.pop_front();
    }

    // Re-arm the overflow warning once the host has caught up.
    if (state.overflow_message_logged_since_clear && state.queue.size() < (MAX_LOG_QUEUE_SIZE / 2)) {
        state.overflow_message_logged_since_clear = false;
    }

    return batch;
}

void shutdown_cpp_logger() {
    LoggerState& state = logger_state();
    std::unique_lock<std::mutex> lock(state.mutex);
    state.shutdown_requested = true;
    lock.unlock();
    state.cv.notify_all();
}

} // namespace logging
} // namespace devices
} // namespace capturehub
