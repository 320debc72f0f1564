#include <novelforge/core/logger.hpp>

#include <cstdio>
#include <ctime>
#include <functional>
#include <thread>
#include <unistd.h>

namespace novelforge {

namespace {

const char* kReset = "\033[0m";

const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[34m";
        case LogLevel::INFO: return "\033[32m";
        case LogLevel::WARN: return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
    }
    return kReset;
}

// "Class::method" or "function" from __PRETTY_FUNCTION__, with the
// return type, arguments, template arguments and our namespace removed
std::string caller_name(const char* pretty_function) {
    std::string signature = pretty_function;
    size_t paren = signature.find('(');
    if (paren != std::string::npos) signature.erase(paren);

    // Drop the return type, skipping spaces inside template arguments
    int depth = 0;
    size_t start = 0;
    for (size_t i = 0; i < signature.size(); ++i) {
        char c = signature[i];
        if (c == '<') ++depth;
        else if (c == '>') --depth;
        else if (c == ' ' && depth == 0) start = i + 1;
    }
    std::string name = signature.substr(start);
    while (!name.empty() && (name[0] == '*' || name[0] == '&')) name.erase(0, 1);

    std::string out;
    depth = 0;
    for (size_t i = 0; i < name.size(); ++i) {
        if (name[i] == '<') ++depth;
        else if (name[i] == '>') --depth;
        else if (depth == 0) out += name[i];
    }

    static const std::string ns = "novelforge::";
    if (out.compare(0, ns.size(), ns) == 0) out.erase(0, ns.size());
    return out;
}

// Short stable tag for the current thread
unsigned thread_tag() {
    return static_cast<unsigned>(std::hash<std::thread::id>()(std::this_thread::get_id()) % 0xFFFF);
}

} // namespace

LogLevel log_level_from_string(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level_(LogLevel::INFO)
    , color_(isatty(fileno(stderr)) != 0)
{}

void Logger::write(LogLevel level, const char* file, int line, const char* func,
                   const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    vwrite(level, file, line, func, fmt, args);
    va_end(args);
}

void Logger::vwrite(LogLevel level, const char* file, int line, const char* func,
                    const char* fmt, va_list args)
{
    time_t now = time(NULL);
    struct tm t;
    localtime_r(&now, &t);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &t);

    bool color = color_;
    const char* on = color ? level_color(level) : "";
    const char* off = color ? kReset : "";

    std::lock_guard<std::mutex> lock(write_mutex_);

    fprintf(stderr, "[%s] %s[%s]%s <%04x> ", timestamp, on, log_level_name(level), off, thread_tag());
    if (level_ == LogLevel::DEBUG) {
        fprintf(stderr, "(%s) at %s:%d ", caller_name(func).c_str(), file, line);
    }
    vfprintf(stderr, fmt, args);
    fputc('\n', stderr);
    fflush(stderr);
}

} // namespace novelforge
