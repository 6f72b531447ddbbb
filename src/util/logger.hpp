#pragma once

#include <cstdarg>
#include <cstdio>
#include <string>
#include <utility>

namespace genotrack {

// Leveled logger writing to stderr. Each message is formatted first and
// written with a single call, so lines from concurrent workers do not
// interleave.
class Logger {
public:
    enum Level { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kInfo, std::string tag = {})
        : level_(level), tag_(std::move(tag)) {}

    void set_level(Level level) { level_ = level; }
    Level level() const { return level_; }
    bool verbose() const { return level_ >= kDebug; }

    void error(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        log_impl(kError, "ERROR", fmt, ap);
        va_end(ap);
    }

    void warn(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        log_impl(kWarn, "WARN", fmt, ap);
        va_end(ap);
    }

    void info(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        log_impl(kInfo, "INFO", fmt, ap);
        va_end(ap);
    }

    void debug(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        log_impl(kDebug, "DEBUG", fmt, ap);
        va_end(ap);
    }

private:
    Level level_;
    std::string tag_;

    void log_impl(Level msg_level, const char* name, const char* fmt, va_list ap) const {
        if (level_ < msg_level) return;

        char body[1024];
        std::vsnprintf(body, sizeof(body), fmt, ap);
        if (tag_.empty()) {
            std::fprintf(stderr, "[%s] %s\n", name, body);
        } else {
            std::fprintf(stderr, "[%s] %s: %s\n", name, tag_.c_str(), body);
        }
    }
};

} // namespace genotrack
