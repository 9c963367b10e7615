#ifndef VUSD_LOG_HPP
#define VUSD_LOG_HPP

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace vusd {

enum class LogLevel { DEBUG, INFO, WARNING, ERROR, CRITICAL };

// =============================================================================
// Logger - Process-wide Levelled Log Sink
// =============================================================================

class Logger {
public:
    static void set_level(LogLevel level);
    static LogLevel level();
    static bool enabled(LogLevel level);

    // Defaults to std::clog; the stream must outlive its use here.
    // Pass nullptr to restore the default.
    static void set_sink(std::ostream* sink);

    static void log(LogLevel level, const std::string& message, const char* file, int line);

    static const char* level_name(LogLevel level);
    static std::optional<LogLevel> parse_level(std::string_view name);
};

} // namespace vusd

#define VUSD_LOG(level, msg) \
    do { \
        if (::vusd::Logger::enabled(level)) { \
            ::vusd::Logger::log((level), (msg), __FILE__, __LINE__); \
        } \
    } while (0)

#define VUSD_LOG_DEBUG(msg) VUSD_LOG(::vusd::LogLevel::DEBUG, msg)
#define VUSD_LOG_INFO(msg) VUSD_LOG(::vusd::LogLevel::INFO, msg)
#define VUSD_LOG_WARNING(msg) VUSD_LOG(::vusd::LogLevel::WARNING, msg)
#define VUSD_LOG_ERROR(msg) VUSD_LOG(::vusd::LogLevel::ERROR, msg)
#define VUSD_LOG_CRITICAL(msg) VUSD_LOG(::vusd::LogLevel::CRITICAL, msg)

#endif // VUSD_LOG_HPP
