#pragma once

#include <cstdarg>
#include <cstdio>
#include <string>
#include <utility>

namespace fastxio {

// stderr logger for the command-line tools. Lines look like
// "[ERROR] fastxstats: message". The library itself never logs.
class Logger {
public:
    enum Level { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kInfo, std::string prefix = {})
        : level_(level), prefix_(std::move(prefix)) {}

    void error(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        log(kError, fmt, ap);
        va_end(ap);
    }

    void info(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        log(kInfo, fmt, ap);
        va_end(ap);
    }

    void debug(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        log(kDebug, fmt, ap);
        va_end(ap);
    }

private:
    Level level_;
    std::string prefix_;

    static const char* tag(Level level) {
        switch (level) {
            case kError: return "ERROR";
            case kWarn:  return "WARN";
            case kInfo:  return "INFO";
            case kDebug: return "DEBUG";
        }
        return "?";
    }

    void log(Level level, const char* fmt, va_list ap) const {
        if (level > level_) return;
        // Build the line first so concurrent workers do not interleave
        char body[1024];
        std::vsnprintf(body, sizeof(body), fmt, ap);
        if (prefix_.empty()) {
            std::fprintf(stderr, "[%s] %s\n", tag(level), body);
        } else {
            std::fprintf(stderr, "[%s] %s: %s\n", tag(level), prefix_.c_str(), body);
        }
    }
};

} // namespace fastxio
