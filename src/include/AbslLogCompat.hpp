#pragma once

/**
 * Abseil-style logging macros on top of spdlog.
 * Lets the code keep writing LOG(INFO) << ... while spdlog owns the sinks.
 */

#include <spdlog/spdlog.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>
#include <string>

namespace detail {

class LogStream {
    std::ostringstream oss;
    spdlog::level::level_enum level;
    bool enabled;

   public:
    explicit LogStream(spdlog::level::level_enum l, bool enabled = true)
        : level(l), enabled(enabled) {}

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template <typename T>
    LogStream& operator<<(const T& value) {
        if (enabled) {
            oss << value;
        }
        return *this;
    }

    LogStream& operator<<(std::ostream& (*manip)(std::ostream&)) {
        if (enabled) {
            manip(oss);
        }
        return *this;
    }

    ~LogStream() {
        if (!enabled) {
            return;
        }
        const std::string msg = oss.str();
        if (!msg.empty()) {
            spdlog::log(level, "{}", msg);
        }
    }
};

// Rate limiter backing LOG_EVERY_N_SEC, one instance per call site.
class EveryNSec {
    std::atomic<std::int64_t> last{0};

   public:
    bool shouldLog(double seconds) {
        const std::int64_t now =
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now().time_since_epoch())
                .count();
        const auto interval = static_cast<std::int64_t>(seconds * 1000);
        std::int64_t prev = last.load(std::memory_order_relaxed);
        if (prev != 0 && now - prev < interval) {
            return false;
        }
        return last.compare_exchange_strong(prev, now,
                                            std::memory_order_relaxed);
    }
};

}  // namespace detail

#define LOG(severity) ::detail::LogStream(spdlog::level::severity)

#define LOG_IF(severity, condition) \
    ::detail::LogStream(spdlog::level::severity, static_cast<bool>(condition))

#ifdef NDEBUG
#define DLOG(severity) ::detail::LogStream(spdlog::level::severity, false)
#else
#define DLOG(severity) ::detail::LogStream(spdlog::level::severity)
#endif

// Log with errno description appended first.
#define PLOG(severity) \
    ::detail::LogStream(spdlog::level::severity) << std::strerror(errno) << ": "

#define LOG_EVERY_N_SEC_CONCAT_(a, b) a##b
#define LOG_EVERY_N_SEC_NAME_(line) LOG_EVERY_N_SEC_CONCAT_(log_every_n_sec_, line)
#define LOG_EVERY_N_SEC(severity, n)                                        \
    static ::detail::EveryNSec LOG_EVERY_N_SEC_NAME_(__LINE__);             \
    ::detail::LogStream(spdlog::level::severity,                            \
                        LOG_EVERY_N_SEC_NAME_(__LINE__).shouldLog(n))

// Severity names used as LOG() arguments
#define INFO info
#define WARNING warn
#define ERROR err
#define FATAL critical
