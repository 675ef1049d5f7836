#pragma once

#include "steptime/error.hpp"

#include <string_view>

#include <cstdint>
#include <cstdio>

namespace steptime {

enum class LogLevel : int8_t {
    quiet = -1, ///< Never emitted; as a sink level it silences everything
    error = 0,
    warning,
    info,
    debug
};

constexpr const char* log_level_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::quiet:
            return "quiet";
        case LogLevel::error:
            return "error";
        case LogLevel::warning:
            return "warning";
        case LogLevel::info:
            return "info";
        case LogLevel::debug:
            return "debug";
        default:
            return "unknown";
    }
}

/**
 * Destination for library diagnostics.
 *
 * Filters by level, then hands the formatted line to send(). Implementations
 * only provide send().
 */
class LogSink {
public:
    virtual ~LogSink() = default;

    void log(LogLevel level, const char* msg) {
        if (enabled(level)) {
            send(level, msg);
        }
    }

    [[nodiscard]] bool enabled(LogLevel level) const noexcept {
        return level != LogLevel::quiet && level <= level_;
    }

    void set_level(LogLevel level) noexcept { level_ = level; }
    [[nodiscard]] LogLevel level() const noexcept { return level_; }

private:
    virtual void send(LogLevel level, const char* msg) = 0;

    LogLevel level_ = LogLevel::warning;
};

/// Writes `[steptime][level] message` lines to stderr
class ConsoleLogSink final : public LogSink {
private:
    void send(LogLevel level, const char* msg) override {
        std::fprintf(stderr, "[steptime][%s] %s\n", log_level_string(level), msg);
    }
};

class NullLogSink final : public LogSink {
private:
    void send(LogLevel, const char*) override {}
};

namespace detail {

inline ConsoleLogSink& console_log_sink() {
    static ConsoleLogSink sink;
    return sink;
}

inline LogSink*& current_log_sink() {
    static LogSink* sink = &console_log_sink();
    return sink;
}

} // namespace detail

/// Current process-wide sink (console at warning level by default)
inline LogSink& log_sink() {
    return *detail::current_log_sink();
}

/**
 * Install a sink. The sink must outlive its installation; pass nullptr to
 * restore the console sink.
 */
inline void set_log_sink(LogSink* sink) {
    detail::current_log_sink() = sink != nullptr ? sink : &detail::console_log_sink();
}

inline void set_log_level(LogLevel level) {
    log_sink().set_level(level);
}

/// Parse "quiet", "error", "warning", "info" or "debug"
inline expected<LogLevel, TimeError> parse_log_level(std::string_view text) noexcept {
    if (text == "quiet") {
        return LogLevel::quiet;
    }
    if (text == "error") {
        return LogLevel::error;
    }
    if (text == "warning") {
        return LogLevel::warning;
    }
    if (text == "info") {
        return LogLevel::info;
    }
    if (text == "debug") {
        return LogLevel::debug;
    }
    return make_time_error(TimeError::invalid_argument);
}

/**
 * printf-style message to the current sink.
 *
 * Formatting is skipped entirely when the level is filtered out.
 */
template <typename... Args>
void log_message(LogLevel level, const char* fmt, Args... args) {
    LogSink& sink = log_sink();
    if (!sink.enabled(level)) {
        return;
    }
    if constexpr (sizeof...(Args) == 0) {
        sink.log(level, fmt);
    } else {
        char msg[256];
        std::snprintf(msg, sizeof msg, fmt, args...);
        sink.log(level, msg);
    }
}

} // namespace steptime
