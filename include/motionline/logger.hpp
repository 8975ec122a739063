#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace motionline
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6,
};

// Lowercase names as written in the timeline config ("warning").
const char*             log_level_name(LogLevel level);
std::optional<LogLevel> parse_log_level(std::string_view name);   // also takes "warn"

struct LogRecord
{
    std::chrono::system_clock::time_point time;
    LogLevel                              level = LogLevel::Info;
    std::string                           category;   // "timeline", "interaction", ...
    std::string                           message;
};

using LogSink = std::function<void(const LogRecord&)>;

namespace detail
{

void append_number(std::string& out, double value);

template <typename T>
void append_arg(std::string& out, const T& value)
{
    if constexpr (std::is_same_v<T, bool>)
        out += value ? "true" : "false";
    else if constexpr (std::is_floating_point_v<T>)
        append_number(out, static_cast<double>(value));
    else if constexpr (std::is_integral_v<T>)
        out += std::to_string(value);
    else if constexpr (std::is_convertible_v<const T&, std::string_view>)
        out += std::string_view(value);
    else
    {
        std::ostringstream os;
        os << value;
        out += os.str();
    }
}

// Fill "{}" holes left to right. Doubles print in their shortest round-trip
// form; holes without an argument are kept verbatim.
template <typename... Args>
std::string format(std::string_view fmt, const Args&... args)
{
    std::string out;
    out.reserve(fmt.size() + 12 * sizeof...(Args));
    size_t pos  = 0;
    auto   fill = [&](const auto& arg)
    {
        size_t hole = fmt.find("{}", pos);
        if (hole == std::string_view::npos)
            return;
        out.append(fmt.substr(pos, hole - pos));
        append_arg(out, arg);
        pos = hole + 2;
    };
    (fill(args), ...);
    out.append(fmt.substr(pos));
    return out;
}

}   // namespace detail

// Logger — process-wide router for the engine's diagnostics.
//
// Every record carries a category. A category may override the global
// threshold, so gesture tracing ("interaction" at Debug) can be switched on
// while the rest of the engine stays at Warning. Sinks run on the logging
// thread, outside the logger's lock.
class Logger
{
   public:
    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel level() const;

    void set_category_level(const std::string& category, LogLevel level);
    void clear_category_levels();

    bool enabled(LogLevel level, std::string_view category) const;

    void   add_sink(LogSink sink);
    void   clear_sinks();
    size_t sink_count() const;

    void write(LogLevel level, std::string_view category, std::string message);

    template <typename... Args>
    void writef(LogLevel level, std::string_view category, std::string_view fmt, const Args&... args)
    {
        write(level, category, detail::format(fmt, args...));
    }

    // "2026-01-31 17:04:05.123 WARN [timeline] message"
    static std::string format_line(const LogRecord& record);

   private:
    Logger() = default;

    std::atomic<LogLevel> global_{LogLevel::Info};
    std::atomic<bool>     has_overrides_{false};

    mutable std::mutex                           mutex_;
    std::map<std::string, LogLevel, std::less<>> overrides_;
    std::vector<LogSink>                         sinks_;
};

namespace sinks
{
LogSink console_sink();   // Warning and above to stderr, the rest to stdout
LogSink file_sink(const std::string& path);
LogSink null_sink();
}   // namespace sinks

#define MOTIONLINE_LOG(level, category, ...)                          \
    do                                                                \
    {                                                                 \
        auto& motionline_logger_ = ::motionline::Logger::instance();  \
        if (motionline_logger_.enabled(level, category))              \
            motionline_logger_.writef(level, category, __VA_ARGS__);  \
    } while (0)

#define MOTIONLINE_LOG_TRACE(category, ...) MOTIONLINE_LOG(::motionline::LogLevel::Trace, category, __VA_ARGS__)
#define MOTIONLINE_LOG_DEBUG(category, ...) MOTIONLINE_LOG(::motionline::LogLevel::Debug, category, __VA_ARGS__)
#define MOTIONLINE_LOG_INFO(category, ...)  MOTIONLINE_LOG(::motionline::LogLevel::Info, category, __VA_ARGS__)
#define MOTIONLINE_LOG_WARN(category, ...) \
    MOTIONLINE_LOG(::motionline::LogLevel::Warning, category, __VA_ARGS__)
#define MOTIONLINE_LOG_ERROR(category, ...) MOTIONLINE_LOG(::motionline::LogLevel::Error, category, __VA_ARGS__)
#define MOTIONLINE_LOG_CRITICAL(category, ...) \
    MOTIONLINE_LOG(::motionline::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace motionline
