#ifndef LOG_HPP
#define LOG_HPP

#include <iostream>
#include <utility>

enum class LogLevel
{
    VERBOSE,
    INFO,
    WARNING,
    ERROR
};

inline LogLevel &log_threshold()
{
    static LogLevel level = LogLevel::INFO;
    return level;
}

inline void set_log_level(LogLevel level)
{
    log_threshold() = level;
}

template <class... Args>
void log_message(LogLevel level, const char *prefix, Args &&...args)
{
    if (level < log_threshold())
        return;
    std::cerr << prefix;
    (std::cerr << ... << std::forward<Args>(args)) << std::endl;
}

template <class... Args>
void log_debug(Args &&...args)
{
    log_message(LogLevel::VERBOSE, "Debug: ", std::forward<Args>(args)...);
}

template <class... Args>
void log_info(Args &&...args)
{
    log_message(LogLevel::INFO, "", std::forward<Args>(args)...);
}

template <class... Args>
void log_warning(Args &&...args)
{
    log_message(LogLevel::WARNING, "Warning: ", std::forward<Args>(args)...);
}

template <class... Args>
void log_error(Args &&...args)
{
    log_message(LogLevel::ERROR, "Error: ", std::forward<Args>(args)...);
}

#endif
