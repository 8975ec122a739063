#include <charconv>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <memory>
#include <motionline/logger.hpp>
#include <string>
#include <system_error>

namespace motionline
{

namespace
{

const char* level_tag(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Critical:
            return "CRIT";
        case LogLevel::Off:
            break;
    }
    return "OFF";
}

}   // anonymous namespace

const char* log_level_name(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Trace:
            return "trace";
        case LogLevel::Debug:
            return "debug";
        case LogLevel::Info:
            return "info";
        case LogLevel::Warning:
            return "warning";
        case LogLevel::Error:
            return "error";
        case LogLevel::Critical:
            return "critical";
        case LogLevel::Off:
            break;
    }
    return "off";
}

std::optional<LogLevel> parse_log_level(std::string_view name)
{
    if (name == "warn")
        return LogLevel::Warning;
    for (int i = 0; i <= static_cast<int>(LogLevel::Off); ++i)
    {
        auto level = static_cast<LogLevel>(i);
        if (name == log_level_name(level))
            return level;
    }
    return std::nullopt;
}

namespace detail
{

void append_number(std::string& out, double value)
{
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec == std::errc())
        out.append(buf, end);
}

}   // namespace detail

// ─── Logger ──────────────────────────────────────────────────────────────────

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level)
{
    global_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::level() const
{
    return global_.load(std::memory_order_relaxed);
}

void Logger::set_category_level(const std::string& category, LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    overrides_[category] = level;
    has_overrides_.store(true, std::memory_order_release);
}

void Logger::clear_category_levels()
{
    std::lock_guard<std::mutex> lock(mutex_);
    overrides_.clear();
    has_overrides_.store(false, std::memory_order_release);
}

bool Logger::enabled(LogLevel level, std::string_view category) const
{
    if (level == LogLevel::Off)
        return false;
    if (has_overrides_.load(std::memory_order_acquire))
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = overrides_.find(category);
        if (it != overrides_.end())
            return level >= it->second;
    }
    return level >= global_.load(std::memory_order_relaxed);
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

size_t Logger::sink_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_.size();
}

void Logger::write(LogLevel level, std::string_view category, std::string message)
{
    LogRecord record;
    record.time     = std::chrono::system_clock::now();
    record.level    = level;
    record.category = std::string(category);
    record.message  = std::move(message);

    std::vector<LogSink> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets = sinks_;
    }
    for (const auto& sink : targets)
        sink(record);
}

std::string Logger::format_line(const LogRecord& record)
{
    using std::chrono::milliseconds;
    auto    secs = std::chrono::system_clock::to_time_t(record.time);
    auto    ms   = std::chrono::duration_cast<milliseconds>(record.time.time_since_epoch()).count() % 1000;
    std::tm local{};
    localtime_r(&secs, &local);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

    char millis[8];
    std::snprintf(millis, sizeof(millis), ".%03d", static_cast<int>(ms));

    std::string line;
    line.reserve(48 + record.category.size() + record.message.size());
    line += stamp;
    line += millis;
    line += ' ';
    line += level_tag(record.level);
    line += " [";
    line += record.category;
    line += "] ";
    line += record.message;
    return line;
}

// ─── Sinks ───────────────────────────────────────────────────────────────────

namespace sinks
{

LogSink console_sink()
{
    return [](const LogRecord& record)
    {
        auto& os = record.level >= LogLevel::Warning ? std::cerr : std::cout;
        os << Logger::format_line(record) << '\n';
    };
}

LogSink file_sink(const std::string& path)
{
    auto file = std::make_shared<std::ofstream>(path, std::ios::app);
    if (!file->is_open())
        std::cerr << "motionline: cannot open log file '" << path << "'\n";
    return [file](const LogRecord& record)
    {
        if (file->is_open())
            *file << Logger::format_line(record) << std::endl;
    };
}

LogSink null_sink()
{
    return [](const LogRecord&) {};
}

}   // namespace sinks

}   // namespace motionline
