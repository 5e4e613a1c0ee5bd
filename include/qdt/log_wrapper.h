#pragma once

#include <functional>
#include <atomic>
#include <mutex>
#include <iostream>
#include <sstream>
#include <string_view>
#include <array>
#include <format>
#include <chrono>
#include <exception>

/*! Logging for the engine wrapper libraries.
 *
 * The wrappers are built without a dependency on the application's logger.
 * Log lines go to a callback installed by the application, or to std::clog
 * if no callback is set.
 */

namespace qdt::logfwd {

// Same order and values as logfault::LogLevel
enum class Level { NONE, ERROR, WARN, NOTICE, INFO, DEBUG, TRACE };

struct SourceLoc {
    const char* file{};
    int line{};
    const char* func{};
};

using callback_t = std::function<void(Level lvl, SourceLoc loc, std::string_view msg, std::string_view tag)>;

inline std::string_view to_name(Level l) {
    constexpr static auto names = std::to_array<std::string_view>({
        "", "ERROR", "WARN", "NOTICE", "INFO", "DEBUG", "TRACE"
    });

    return names.at(static_cast<size_t>(l));
}

struct Sink {
    std::mutex mutex;
    callback_t cb;
    std::string tag;
    std::atomic<Level> level{Level::INFO};
};

inline Sink& sink() {
    static Sink s;
    return s;
}

inline void setCallback(callback_t cb, std::string_view tag) {
    auto& s = sink();
    std::lock_guard lock{s.mutex};
    s.tag = tag;
    s.cb = std::move(cb);
}

inline void setLevel(Level lvl) noexcept {
    sink().level = lvl;
}

inline bool relevant(Level lvl) noexcept {
    return lvl <= sink().level.load(std::memory_order_relaxed);
}

class Line {
public:
    Line(Level lvl, SourceLoc loc) : lvl_(lvl), loc_(loc) {}
    ~Line() { flush(); }

    std::ostream& stream() { return ss_; }

private:
    void flush() noexcept {
        try {
            const auto msg = ss_.str();
            if (msg.empty()) return;

            auto& s = sink();
            std::lock_guard lock{s.mutex};
            if (s.cb) {
                s.cb(lvl_, loc_, msg, s.tag);
                return;
            }

            const auto now = std::chrono::system_clock::now();
            std::clog << std::format("{:%FT%T} [{}] {} {}", now, to_name(lvl_), s.tag, msg) << std::endl;
        } catch (const std::exception& ex) {
            std::cerr << "Failed to write log line: " << ex.what() << std::endl;
        }
    }

    Level lvl_;
    SourceLoc loc_;
    std::ostringstream ss_;
};

#ifdef _LOGFAULT_H
inline void forward_to_logfault(Level lvl, SourceLoc loc, std::string_view msg, std::string_view tag) {
    const auto lf_level = static_cast<logfault::LogLevel>(lvl);
    if (::logfault::LogManager::Instance().IsRelevant(lf_level)) {
        ::logfault::Log(lf_level, loc.file, loc.line, loc.func).Line() << tag << ' ' << msg;
    }
}
#endif

} // namespace qdt::logfwd

#if defined(QDT_LOGFWD_ENABLE_LOGGING) && QDT_LOGFWD_ENABLE_LOGGING

#if defined(__GNUC__) || defined(__clang__)
#define QDT_LOGFWD_FUNC __PRETTY_FUNCTION__
#else
#define QDT_LOGFWD_FUNC __func__
#endif

#define QDT_LOGFWD_LINE(lvl) \
    ::qdt::logfwd::relevant(lvl) && ::qdt::logfwd::Line(lvl, {__FILE__, __LINE__, QDT_LOGFWD_FUNC}).stream()

#define LOG_ERROR  QDT_LOGFWD_LINE(::qdt::logfwd::Level::ERROR)
#define LOG_WARN   QDT_LOGFWD_LINE(::qdt::logfwd::Level::WARN)
#define LOG_INFO   QDT_LOGFWD_LINE(::qdt::logfwd::Level::INFO)
#define LOG_DEBUG  QDT_LOGFWD_LINE(::qdt::logfwd::Level::DEBUG)
#define LOG_TRACE  QDT_LOGFWD_LINE(::qdt::logfwd::Level::TRACE)

#endif // QDT_LOGFWD_ENABLE_LOGGING
