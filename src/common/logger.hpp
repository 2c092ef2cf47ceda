// SPDX-License-Identifier: Apache-2.0
// Header-only asynchronous logger.
//  - Level filtering via TTT_LOG_LEVEL (trace|debug|info|warn|error)
//  - JSON lines via TTT_LOG_JSON presence
//  - Optional instance tag prefix via TTT_LOG_APP_ID
//  - Lines are queued and written to stderr by a background thread; before start() (or after
//    shutdown()) writes go straight to stderr.

#pragma once

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>

namespace ttt::log {

enum class level
{
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4
};

namespace detail {

struct line
{
    level lv;
    std::string text;
    std::chrono::system_clock::time_point ts;
};

inline std::atomic<int> g_level{static_cast<int>(level::info)};
inline std::atomic<bool> g_json{false};
inline std::atomic<bool> g_started{false};
inline std::atomic<bool> g_running{false};
inline std::string g_app_id; // written once in start(), guarded by g_io_mtx afterwards
inline std::mutex g_q_mtx;
inline std::condition_variable g_q_cv;
inline std::deque<line> g_pending;
inline std::mutex g_io_mtx;
inline std::thread g_writer;

inline const char *level_name(level lv)
{
    switch (lv) {
        case level::trace:
            return "trace";
        case level::debug:
            return "debug";
        case level::info:
            return "info";
        case level::warn:
            return "warn";
        case level::error:
            return "error";
    }
    return "info";
}

inline char level_tag(level lv)
{
    switch (lv) {
        case level::trace:
            return 'T';
        case level::debug:
            return 'D';
        case level::info:
            return 'I';
        case level::warn:
            return 'W';
        case level::error:
            return 'E';
    }
    return 'I';
}

inline level parse_level(std::string_view s)
{
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return level::trace;
    if (v == "debug")
        return level::debug;
    if (v == "warn" || v == "warning")
        return level::warn;
    if (v == "error" || v == "err")
        return level::error;
    return level::info;
}

inline void emit(const line &ln)
{
    std::time_t tt = std::chrono::system_clock::to_time_t(ln.ts);
    std::tm tm{};
    localtime_r(&tt, &tm);
    std::lock_guard lk(g_io_mtx);
    if (g_json.load(std::memory_order_relaxed)) {
        std::cerr << "{\"ts\":\"" << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "\",\"level\":\""
                  << level_name(ln.lv) << "\"";
        if (!g_app_id.empty())
            std::cerr << ",\"app\":\"" << g_app_id << "\"";
        std::cerr << ",\"msg\":\"";
        for (char c : ln.text) {
            if (c == '"' || c == '\\')
                std::cerr << '\\';
            std::cerr << c;
        }
        std::cerr << "\"}" << std::endl;
        return;
    }
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
    if (!g_app_id.empty())
        std::cerr << g_app_id << ' ';
    std::cerr << '[' << level_tag(ln.lv) << ' ' << buf << "] " << ln.text << std::endl;
}

inline void writer_loop()
{
    std::unique_lock lk(g_q_mtx);
    while (true) {
        g_q_cv.wait(lk, [] { return !g_running.load(std::memory_order_acquire) || !g_pending.empty(); });
        std::deque<line> batch;
        batch.swap(g_pending);
        bool stop = !g_running.load(std::memory_order_acquire);
        lk.unlock();
        for (auto &ln : batch)
            emit(ln);
        lk.lock();
        if (stop && g_pending.empty())
            break;
    }
}

inline void shutdown()
{
    if (!g_running.exchange(false, std::memory_order_acq_rel))
        return;
    g_q_cv.notify_all();
    if (g_writer.joinable())
        g_writer.join();
}

inline void start()
{
    if (g_started.exchange(true, std::memory_order_acq_rel))
        return;
    if (const char *lvl = std::getenv("TTT_LOG_LEVEL"))
        g_level.store(static_cast<int>(parse_level(lvl)), std::memory_order_relaxed);
    if (std::getenv("TTT_LOG_JSON"))
        g_json.store(true, std::memory_order_relaxed);
    if (const char *app = std::getenv("TTT_LOG_APP_ID")) {
        std::lock_guard lk(g_io_mtx);
        g_app_id.assign(app);
    }
    g_running.store(true, std::memory_order_release);
    g_writer = std::thread(writer_loop);
    std::atexit(shutdown);
}

} // namespace detail

namespace detail_format {

template <typename T>
inline std::string to_text(const T &v)
{
    using D = std::decay_t<T>;
    if constexpr (std::is_same_v<D, std::string>)
        return v;
    else if constexpr (std::is_same_v<D, const char *> || std::is_same_v<D, char *>)
        return v ? std::string(v) : std::string();
    else if constexpr (std::is_convertible_v<T, std::string_view>)
        return std::string(std::string_view(v));
    else if constexpr (std::is_same_v<D, bool>)
        return v ? "true" : "false";
    else if constexpr (std::is_floating_point_v<D>) {
        std::ostringstream oss;
        oss.setf(std::ios::fixed, std::ios::floatfield);
        oss.precision(2);
        oss << v;
        return oss.str();
    } else if constexpr (std::is_arithmetic_v<D>)
        return std::to_string(v);
    else {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }
}

// Replaces each "{}" in order; surplus args are appended space-separated.
template <typename... Args>
inline std::string tiny_format(std::string_view fmt, Args &&...args)
{
    if constexpr (sizeof...(Args) == 0) {
        return std::string(fmt);
    } else {
        std::array<std::string, sizeof...(Args)> values{to_text(std::forward<Args>(args))...};
        std::string out;
        out.reserve(fmt.size() + values.size() * 8);
        size_t pos = 0;
        size_t idx = 0;
        while (idx < values.size()) {
            size_t p = fmt.find("{}", pos);
            if (p == std::string_view::npos)
                break;
            out.append(fmt.substr(pos, p - pos));
            out += values[idx++];
            pos = p + 2;
        }
        out.append(fmt.substr(pos));
        for (; idx < values.size(); ++idx) {
            out.push_back(' ');
            out += values[idx];
        }
        return out;
    }
}

} // namespace detail_format

inline void init()
{
    detail::start();
}

inline void set_level(level lv) noexcept
{
    detail::g_level.store(static_cast<int>(lv), std::memory_order_relaxed);
}

inline bool enabled(level lv) noexcept
{
    return static_cast<int>(lv) >= detail::g_level.load(std::memory_order_relaxed);
}

inline void write(level lv, std::string_view msg)
{
    if (!enabled(lv))
        return;
    detail::line ln{lv, std::string(msg), std::chrono::system_clock::now()};
    if (!detail::g_running.load(std::memory_order_acquire)) {
        detail::emit(ln);
        return;
    }
    {
        std::lock_guard lk(detail::g_q_mtx);
        detail::g_pending.push_back(std::move(ln));
    }
    detail::g_q_cv.notify_one();
}

template <typename... Args>
inline void write(level lv, const char *fmt, Args &&...args)
{
    if (enabled(lv))
        write(lv, std::string_view(detail_format::tiny_format(fmt, std::forward<Args>(args)...)));
}

template <typename... Args>
inline void trace(const char *fmt, Args &&...args)
{
    write(level::trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void debug(const char *fmt, Args &&...args)
{
    write(level::debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void info(const char *fmt, Args &&...args)
{
    write(level::info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void warn(const char *fmt, Args &&...args)
{
    write(level::warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void error(const char *fmt, Args &&...args)
{
    write(level::error, fmt, std::forward<Args>(args)...);
}

} // namespace ttt::log
