/*
 * File: src/bridge_log.hpp
 * Project: Print Telemetry Bridge
 * Purpose: Line logging to stderr and an optional log file
 * Notes:
 *  - Snapshot and status files are only ever replaced via include/atomic_write.hpp
 *  - One line per event: <UTC ms timestamp> <LEVEL>: <message>
 *  - Malformed frames are skipped; the session never drops on bad data
 * Last updated: 2026-10-16
 */

#pragma once
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

enum class LogLevel
{
    debug = 0,
    info,
    warn,
    error
};

inline const char *to_string(LogLevel l)
{
    switch (l)
    {
    case LogLevel::debug:
        return "DEBUG";
    case LogLevel::info:
        return "INFO";
    case LogLevel::warn:
        return "WARN";
    case LogLevel::error:
        return "ERROR";
    }
    return "?";
}

inline std::optional<LogLevel> parse_log_level(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "debug")
        return LogLevel::debug;
    if (s == "info")
        return LogLevel::info;
    if (s == "warn" || s == "warning")
        return LogLevel::warn;
    if (s == "error")
        return LogLevel::error;
    return std::nullopt;
}

// RFC3339 UTC with milliseconds (e.g., 2025-09-12T14:59:01.234Z)
inline std::string iso8601_now_ms()
{
    using namespace std::chrono;
    auto now = time_point_cast<milliseconds>(system_clock::now());
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char base[32];
    std::strftime(base, sizeof(base), "%Y-%m-%dT%H:%M:%S", &tm);

    std::ostringstream oss;
    oss << base << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
    return oss.str();
}

class Logger
{
    std::mutex m_;
    LogLevel level_ = LogLevel::info;
    std::ofstream file_;

public:
    static Logger &instance()
    {
        static Logger l;
        return l;
    }

    void set_level(LogLevel l)
    {
        std::scoped_lock lk(m_);
        level_ = l;
    }

    bool enabled(LogLevel l)
    {
        std::scoped_lock lk(m_);
        return l >= level_;
    }

    // Appends; throws when the file cannot be opened
    void open_file(const std::string &path)
    {
        std::scoped_lock lk(m_);
        file_.close();
        file_.clear();
        file_.open(path, std::ios::app);
        if (!file_)
            throw std::runtime_error("open log file failed: " + path);
    }

    void write(LogLevel l, const std::string &msg)
    {
        std::scoped_lock lk(m_);
        if (l < level_)
            return;
        std::string line = iso8601_now_ms() + " " + to_string(l) + ": " + msg + "\n";
        std::cerr << line;
        if (file_.is_open())
        {
            file_ << line;
            file_.flush();
        }
    }
};

template <typename... Args>
inline void log_at(LogLevel l, const Args &...args)
{
    auto &lg = Logger::instance();
    if (!lg.enabled(l))
        return;
    std::ostringstream oss;
    (oss << ... << args);
    lg.write(l, oss.str());
}

template <typename... Args>
inline void log_debug(const Args &...args) { log_at(LogLevel::debug, args...); }
template <typename... Args>
inline void log_info(const Args &...args) { log_at(LogLevel::info, args...); }
template <typename... Args>
inline void log_warn(const Args &...args) { log_at(LogLevel::warn, args...); }
template <typename... Args>
inline void log_error(const Args &...args) { log_at(LogLevel::error, args...); }
