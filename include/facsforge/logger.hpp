#pragma once

#include <array>
#include <chrono>
#include <cstdio>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace facsforge
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5
};

inline constexpr size_t LOG_LEVEL_COUNT = 6;

namespace detail
{

// Text for one `{}` argument. Floating point uses %.10g so solved logicle
// coefficients and percentages stay readable.
template <typename T>
std::string log_arg(const T& v)
{
    if constexpr (std::is_same_v<T, std::string>)
        return v;
    else if constexpr (std::is_same_v<T, std::string_view>)
        return std::string(v);
    else if constexpr (std::is_convertible_v<T, const char*>)
    {
        const char* p = v;
        return p ? std::string(p) : std::string("(null)");
    }
    else if constexpr (std::is_same_v<T, bool>)
        return v ? "true" : "false";
    else if constexpr (std::is_floating_point_v<T>)
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.10g", static_cast<double>(v));
        return buf;
    }
    else
        return std::to_string(v);
}

// Substitute arguments into `{}` placeholders left to right. Surplus
// placeholders stay as written; surplus arguments are dropped.
template <typename... Args>
std::string format_log(std::string_view format, const Args&... args)
{
    std::string out(format);
    if constexpr (sizeof...(Args) > 0)
    {
        size_t cursor = 0;
        auto   put    = [&](const std::string& text)
        {
            const auto pos = out.find("{}", cursor);
            if (pos == std::string::npos)
                return;
            out.replace(pos, 2, text);
            cursor = pos + text.size();
        };
        (put(log_arg(args)), ...);
    }
    return out;
}

}   // namespace detail

// Process-wide logger. Library code logs through the FACSFORGE_LOG_* macros;
// only the application installs sinks.
class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;
    bool     is_enabled(LogLevel level) const;

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel level, std::string_view category, std::string_view message);

    template <typename... Args>
    void log_formatted(LogLevel level, std::string_view category, std::string_view format,
                       const Args&... args)
    {
        if (!is_enabled(level))
            return;
        log(level, category, detail::format_log(format, args...));
    }

    // Entries emitted at `level` since the last reset_counts().
    size_t count(LogLevel level) const;
    void   reset_counts();

    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

    // "2024-03-01 12:00:00.250 WARN [import] message"
    static std::string format_entry(const LogEntry& entry);

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex                    mutex_;
    LogLevel                              min_level_ = LogLevel::Info;
    std::vector<LogSink>                  sinks_;
    std::array<size_t, LOG_LEVEL_COUNT>   counts_{};
};

// Accepts "trace", "debug", "info", "warn"/"warning", "error", "critical".
std::optional<LogLevel> parse_log_level(std::string_view name);

namespace sinks
{
// Colored, stdout.
Logger::LogSink console_sink();
// Plain, stderr. Used by the CLI so stdout stays free for data.
Logger::LogSink stderr_sink();
// Appends to `filename`. Throws IoError when the file cannot be opened.
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();
}   // namespace sinks

#define FACSFORGE_LOG_AT(lvl, category, ...)                                           \
    do                                                                                 \
    {                                                                                  \
        if (::facsforge::Logger::instance().is_enabled(lvl))                           \
            ::facsforge::Logger::instance().log_formatted(lvl, category, __VA_ARGS__); \
    } while (0)

#define FACSFORGE_LOG_TRACE(category, ...) \
    FACSFORGE_LOG_AT(::facsforge::LogLevel::Trace, category, __VA_ARGS__)
#define FACSFORGE_LOG_DEBUG(category, ...) \
    FACSFORGE_LOG_AT(::facsforge::LogLevel::Debug, category, __VA_ARGS__)
#define FACSFORGE_LOG_INFO(category, ...) \
    FACSFORGE_LOG_AT(::facsforge::LogLevel::Info, category, __VA_ARGS__)
#define FACSFORGE_LOG_WARN(category, ...) \
    FACSFORGE_LOG_AT(::facsforge::LogLevel::Warning, category, __VA_ARGS__)
#define FACSFORGE_LOG_ERROR(category, ...) \
    FACSFORGE_LOG_AT(::facsforge::LogLevel::Error, category, __VA_ARGS__)
#define FACSFORGE_LOG_CRITICAL(category, ...) \
    FACSFORGE_LOG_AT(::facsforge::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace facsforge
