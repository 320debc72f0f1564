/*
 * NovelForge C++ - Logger
 *
 * Printf-style process-wide logger writing to stderr. Every line carries a
 * timestamp, the level and a short tag for the calling thread, since
 * requests run on pool workers. At debug level the caller's
 * Class::function and file:line are added.
 */
#ifndef novelforge_CORE_LOGGER_HPP
#define novelforge_CORE_LOGGER_HPP

#include <atomic>
#include <mutex>
#include <string>
#include <cstdarg>

namespace novelforge {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug", "info", "warn" or "error". Unknown names map to INFO.
LogLevel log_level_from_string(const std::string& name);
const char* log_level_name(LogLevel level);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) { level_ = level; }
    LogLevel level() const { return level_; }
    bool enabled(LogLevel level) const { return level >= level_.load(); }

    // ANSI colors; on by default when stderr is a terminal
    void set_color(bool on) { color_ = on; }

    void write(LogLevel level, const char* file, int line, const char* func,
               const char* fmt, ...)
#ifdef __GNUC__
        __attribute__((format(printf, 6, 7)))
#endif
        ;

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void vwrite(LogLevel level, const char* file, int line, const char* func,
                const char* fmt, va_list args);

    std::atomic<LogLevel> level_;
    std::atomic<bool> color_;
    std::mutex write_mutex_;
};

#define NOVELFORGE_LOG(level, ...) \
    do { \
        if (novelforge::Logger::instance().enabled(level)) \
            novelforge::Logger::instance().write(level, __FILE__, __LINE__, \
                                                 __PRETTY_FUNCTION__, __VA_ARGS__); \
    } while (0)

#define LOG_DEBUG(...) NOVELFORGE_LOG(novelforge::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  NOVELFORGE_LOG(novelforge::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...)  NOVELFORGE_LOG(novelforge::LogLevel::WARN, __VA_ARGS__)
#define LOG_ERROR(...) NOVELFORGE_LOG(novelforge::LogLevel::ERROR, __VA_ARGS__)

} // namespace novelforge

#endif // novelforge_CORE_LOGGER_HPP
