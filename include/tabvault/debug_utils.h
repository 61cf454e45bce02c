// include/tabvault/debug_utils.h
#pragma once

#include <string>
#include <sstream>
#include <iomanip>
#include <cctype>
#include <iostream>
#include <mutex>
#include <atomic>

// Renders binary keys (order-preserving encodings) readable in log lines
inline std::string format_key_for_print(const std::string& key) {
    std::ostringstream oss;
    for (unsigned char c : key) {
        if (std::isprint(c)) {
            oss << c;
        } else {
            oss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

inline std::string hex_dump_string(const std::string& str) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char c : str) {
        oss << std::setw(2) << static_cast<int>(c);
    }
    return oss.str();
}

namespace tabvault {
namespace log {

enum class Level : int { TRACE = 0, DEBUG = 1, INFO = 2, WARN = 3, ERROR = 4, FATAL = 5, OFF = 6 };

inline std::atomic<int>& levelStorage() {
    static std::atomic<int> level{static_cast<int>(Level::INFO)};
    return level;
}

inline void setLevel(Level level) { levelStorage().store(static_cast<int>(level)); }
inline Level getLevel() { return static_cast<Level>(levelStorage().load()); }
inline bool isEnabled(Level level) { return static_cast<int>(level) >= levelStorage().load(); }

// Parses "trace", "debug", "info", "warn", "error"; anything else maps to INFO.
Level levelFromString(const std::string& name);

inline std::mutex& outputMutex() {
    static std::mutex mtx;
    return mtx;
}

namespace detail {

inline void append_formatted(std::ostringstream& oss, const std::string& fmt, size_t pos) {
    oss << fmt.substr(pos);
}

// Substitutes each "{}" in order; arguments without a placeholder are appended.
template<typename T, typename... Rest>
void append_formatted(std::ostringstream& oss, const std::string& fmt, size_t pos, T&& arg, Rest&&... rest) {
    size_t placeholder = fmt.find("{}", pos);
    if (placeholder == std::string::npos) {
        oss << fmt.substr(pos) << std::forward<T>(arg);
        (oss << ... << std::forward<Rest>(rest));
        return;
    }
    oss << fmt.substr(pos, placeholder - pos) << std::forward<T>(arg);
    append_formatted(oss, fmt, placeholder + 2, std::forward<Rest>(rest)...);
}

} // namespace detail

template<typename... Args>
std::string format_message(const std::string& fmt, Args&&... args) {
    std::ostringstream oss;
    detail::append_formatted(oss, fmt, 0, std::forward<Args>(args)...);
    return oss.str();
}

template<typename... Args>
void print_log_line(Level level, const char* prefix, const std::string& fmt, Args&&... args) {
    if (!isEnabled(level)) return;
    std::string line = format_message(fmt, std::forward<Args>(args)...);
    std::ostream& os = (level == Level::INFO || level == Level::TRACE || level == Level::DEBUG) ? std::cout : std::cerr;
    std::lock_guard<std::mutex> lock(outputMutex());
    os << prefix << line << std::endl;
}

} // namespace log
} // namespace tabvault

// #define TABVAULT_DEBUG_LOG
#ifdef TABVAULT_DEBUG_LOG
    #define LOG_DEBUG(...) ::tabvault::log::print_log_line(::tabvault::log::Level::DEBUG, "[DEBUG] ", __VA_ARGS__)
#else
    #define LOG_DEBUG(...) do {} while(0)
#endif

#define LOG_TRACE(...) ::tabvault::log::print_log_line(::tabvault::log::Level::TRACE, "[TRACE] ", __VA_ARGS__)
#define LOG_INFO(...)  ::tabvault::log::print_log_line(::tabvault::log::Level::INFO,  "[INFO] ",  __VA_ARGS__)
#define LOG_WARN(...)  ::tabvault::log::print_log_line(::tabvault::log::Level::WARN,  "[WARN] ",  __VA_ARGS__)
#define LOG_ERROR(...) ::tabvault::log::print_log_line(::tabvault::log::Level::ERROR, "[ERROR] ", __VA_ARGS__)
#define LOG_FATAL(...) ::tabvault::log::print_log_line(::tabvault::log::Level::FATAL, "[FATAL] ", __VA_ARGS__)
