#pragma once

#include <cstdarg>
#include <cstdio>
#include <string>
#include <utility>

namespace fastaseek {

// printf-style logger. Each message is one line, "prog: [LEVEL] message",
// written under the stream lock so lines from fetch workers never interleave.
class Logger {
public:
    enum Level { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kInfo, std::FILE* stream = stderr,
                    std::string prog = {})
        : level_(level), stream_(stream), prog_(std::move(prog)) {}

    Level level() const { return level_; }
    bool verbose() const { return level_ >= kDebug; }
    bool enabled(Level level) const { return level <= level_; }
    const std::string& prog() const { return prog_; }

    void error(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        vlog(kError, fmt, ap);
        va_end(ap);
    }

    void warn(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        vlog(kWarn, fmt, ap);
        va_end(ap);
    }

    void info(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        vlog(kInfo, fmt, ap);
        va_end(ap);
    }

    void debug(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        vlog(kDebug, fmt, ap);
        va_end(ap);
    }

    void vlog(Level level, const char* fmt, va_list ap) const {
        if (!enabled(level) || !stream_) return;
        static const char* const kTags[] = {"ERROR", "WARN", "INFO", "DEBUG"};
        flockfile(stream_);
        if (!prog_.empty()) std::fprintf(stream_, "%s: ", prog_.c_str());
        std::fprintf(stream_, "[%s] ", kTags[level]);
        std::vfprintf(stream_, fmt, ap);
        std::fputc('\n', stream_);
        funlockfile(stream_);
    }

private:
    Level level_;
    std::FILE* stream_;
    std::string prog_;
};

} // namespace fastaseek
