#include <facsforge/error.hpp>
#include <facsforge/logger.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

namespace facsforge
{

namespace
{

struct LevelInfo
{
    const char* name;
    const char* color;   // ANSI, console sink only
};

constexpr std::array<LevelInfo, LOG_LEVEL_COUNT> LEVELS = {{
    {"TRACE", "\033[37m"},
    {"DEBUG", "\033[36m"},
    {"INFO", "\033[32m"},
    {"WARN", "\033[33m"},
    {"ERROR", "\033[31m"},
    {"CRITICAL", "\033[35m"},
}};

const LevelInfo* level_info(LogLevel level)
{
    const auto i = static_cast<size_t>(level);
    return i < LEVELS.size() ? &LEVELS[i] : nullptr;
}

}   // namespace

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_level() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

bool Logger::is_enabled(LogLevel level) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_;
}

void Logger::add_sink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks()
{
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::log(LogLevel level, std::string_view category, std::string_view message)
{
    LogEntry entry{.timestamp = std::chrono::system_clock::now(),
                   .level     = level,
                   .category  = std::string(category),
                   .message   = std::string(message)};

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_)
        return;
    if (level_info(level))
        ++counts_[static_cast<size_t>(level)];
    for (const auto& sink : sinks_)
        sink(entry);
}

size_t Logger::count(LogLevel level) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level_info(level) ? counts_[static_cast<size_t>(level)] : 0;
}

void Logger::reset_counts()
{
    std::lock_guard<std::mutex> lock(mutex_);
    counts_.fill(0);
}

std::string Logger::level_to_string(LogLevel level)
{
    const auto* info = level_info(level);
    return info ? info->name : "UNKNOWN";
}

std::string Logger::timestamp_to_string(const std::chrono::system_clock::time_point& tp)
{
    const auto t  = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&t, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
       << ms.count();
    return ss.str();
}

std::string Logger::format_entry(const LogEntry& entry)
{
    return timestamp_to_string(entry.timestamp) + " " + level_to_string(entry.level) + " ["
           + entry.category + "] " + entry.message;
}

std::optional<LogLevel> parse_log_level(std::string_view name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "warning")
        lower = "warn";

    for (size_t i = 0; i < LEVELS.size(); ++i)
    {
        std::string level_name = LEVELS[i].name;
        std::transform(level_name.begin(), level_name.end(), level_name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == level_name)
            return static_cast<LogLevel>(i);
    }
    return std::nullopt;
}

namespace sinks
{

Logger::LogSink console_sink()
{
    return [](const Logger::LogEntry& entry)
    {
        const auto* info = level_info(entry.level);
        std::cout << (info ? info->color : "") << Logger::format_entry(entry) << "\033[0m"
                  << std::endl;
    };
}

Logger::LogSink stderr_sink()
{
    return [](const Logger::LogEntry& entry) { std::cerr << Logger::format_entry(entry) << std::endl; };
}

Logger::LogSink file_sink(const std::string& filename)
{
    auto file = std::make_shared<std::ofstream>(filename, std::ios::app);
    if (!file->is_open())
        throw IoError("Cannot open log file: " + filename);
    return [file](const Logger::LogEntry& entry)
    {
        *file << Logger::format_entry(entry) << '\n';
        file->flush();
    };
}

Logger::LogSink null_sink()
{
    return [](const Logger::LogEntry&) {};
}

}   // namespace sinks

}   // namespace facsforge
