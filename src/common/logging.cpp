#include "logging.hpp"
#include <chrono>
#include <ctime>

namespace rudp {

bool parse_log_level(const std::string &name, LogLevel &out) {
  if (name == "trace")
    out = LogLevel::TRACE;
  else if (name == "debug")
    out = LogLevel::DEBUG;
  else if (name == "info")
    out = LogLevel::INFO;
  else if (name == "warn")
    out = LogLevel::WARN;
  else if (name == "error")
    out = LogLevel::ERROR;
  else
    return false;
  return true;
}

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}
void Logger::set_level(LogLevel lvl) { level_ = lvl; }

void Logger::set_sink(std::FILE *out) {
  std::lock_guard<std::mutex> lk(mtx_);
  sink_ = out;
}

const char *Logger::level_str(LogLevel lvl) {
  switch (lvl) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  default:
    return "ERROR";
  }
}

void Logger::log(LogLevel lvl, const char *fmt, ...) {
  if (!enabled(lvl))
    return;
  std::lock_guard<std::mutex> lk(mtx_);
  std::FILE *out = sink_ ? sink_ : stderr;
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
  localtime_r(&t, &tm);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);
  std::fprintf(out, "%s.%03d [%s] ", ts, (int)ms, level_str(lvl));
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(out, fmt, ap);
  va_end(ap);
  std::fprintf(out, "\n");
  std::fflush(out);
}

} // namespace rudp
