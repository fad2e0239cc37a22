#pragma once
#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <string>

namespace rudp {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

bool parse_log_level(const std::string& name, LogLevel& out);

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_; }
    bool enabled(LogLevel lvl) const { return lvl >= level_; }
    // Lines go to stderr unless redirected; the caller keeps ownership of out.
    void set_sink(std::FILE* out);
    void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
private:
    Logger() = default;
    std::mutex mtx_;
    LogLevel level_ = LogLevel::INFO;
    std::FILE* sink_ = nullptr;
    const char* level_str(LogLevel lvl);
};

} // namespace rudp
