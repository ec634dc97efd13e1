/**
 * Sky Mesh Extractor - Logging System
 *
 * Leveled, timestamped log lines sent to the console, a file and/or a
 * callback. A Logger is an explicit object handed to whoever needs it; the
 * decode pipeline never reads process-wide debug switches.
 */

#pragma once

#include <string>
#include <string_view>
#include <fstream>
#include <iostream>
#include <mutex>
#include <atomic>
#include <sstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <filesystem>
#include <functional>
#include <optional>
#include <cctype>

namespace skymesh {

/**
 * Log severity levels
 */
enum class LogLevel {
    Debug = 0,   // Strategy attempts, offsets, candidate decisions
    Info = 1,    // Per-file progress
    Warning = 2, // Skipped inputs, ignored settings
    Error = 3,   // Failed files
    None = 4     // Disable all logging
};

constexpr const char* log_level_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::None:    return "NONE";
        default:                return "UNKNOWN";
    }
}

/**
 * Parse a level name ("debug", "info", "warn"/"warning", "error", "none").
 */
inline std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string lower(name);
    for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "none") return LogLevel::None;
    return std::nullopt;
}

class Logger {
public:
    using Callback = std::function<void(LogLevel, const std::string&)>;

    explicit Logger(LogLevel level = LogLevel::Info, bool console = false)
        : min_level_(level), console_(console) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool is_enabled(LogLevel level) const {
        return level != LogLevel::None && level >= min_level_.load(std::memory_order_acquire);
    }

    /**
     * Append to path as well, creating its directory. False if it cannot be opened.
     */
    bool set_file(const std::filesystem::path& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (file_.is_open()) file_.close();

        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        file_.open(path, std::ios::app);
        return file_.is_open();
    }

    /**
     * Receives every formatted line that passes the level filter.
     */
    void set_callback(Callback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(callback);
    }

    void write(LogLevel level, std::string_view tag, const std::string& text) {
        if (!is_enabled(level)) return;

        const std::string line = format_line(level, tag, text);

        std::lock_guard<std::mutex> lock(mutex_);
        if (console_) {
            (level == LogLevel::Error ? std::cerr : std::cout) << line << std::endl;
        }
        if (file_.is_open()) {
            file_ << line << std::endl;
        }
        if (callback_) {
            callback_(level, line);
        }
    }

private:
    // HH:MM:SS.mmm [LEVEL] [Tag] text
    static std::string format_line(LogLevel level, std::string_view tag, const std::string& text) {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm tm_buf;
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif

        std::ostringstream ss;
        ss << std::put_time(&tm_buf, "%H:%M:%S") << '.'
           << std::setfill('0') << std::setw(3) << ms.count() << ' '
           << '[' << log_level_string(level) << "] ";
        if (!tag.empty()) {
            ss << '[' << tag << "] ";
        }
        ss << text;
        return ss.str();
    }

    std::mutex mutex_;
    std::atomic<LogLevel> min_level_;
    bool console_;
    std::ofstream file_;
    Callback callback_;
};

// Stream-style macros: LOG_INFO(logger, "Tag", "message " << value << " more")
#define SKYMESH_LOG(logger, level, tag, msg) \
    do { \
        if ((logger).is_enabled(level)) { \
            std::ostringstream _log_ss; \
            _log_ss << msg; \
            (logger).write(level, tag, _log_ss.str()); \
        } \
    } while(0)

#define LOG_DEBUG(logger, tag, msg)   SKYMESH_LOG(logger, skymesh::LogLevel::Debug, tag, msg)
#define LOG_INFO(logger, tag, msg)    SKYMESH_LOG(logger, skymesh::LogLevel::Info, tag, msg)
#define LOG_WARNING(logger, tag, msg) SKYMESH_LOG(logger, skymesh::LogLevel::Warning, tag, msg)
#define LOG_ERROR(logger, tag, msg)   SKYMESH_LOG(logger, skymesh::LogLevel::Error, tag, msg)

} // namespace skymesh
