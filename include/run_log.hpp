#pragma once

#include <ostream>
#include <sstream>
#include <string>

namespace cavegeo
{

  enum class LogLevel
  {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
  };

  const char *log_level_name(LogLevel level);
  /** Accepts "debug", "info", "warning"/"warn", "error" in any case; falls back to Info. */
  LogLevel parse_log_level(const std::string &name);

  /**
   * Per-run logging context. Lines go to the stream given at construction as
   * "YYYY-MM-DD HH:MM:SS - LEVEL - message".
   */
  class RunLog
  {
  public:
    explicit RunLog(std::ostream &out, LogLevel min_level = LogLevel::Info);

    template <typename... Args>
    void debug(const Args &...args) { log(LogLevel::Debug, args...); }
    template <typename... Args>
    void info(const Args &...args) { log(LogLevel::Info, args...); }
    template <typename... Args>
    void warn(const Args &...args) { log(LogLevel::Warning, args...); }
    template <typename... Args>
    void error(const Args &...args) { log(LogLevel::Error, args...); }

    template <typename... Args>
    void log(LogLevel level, const Args &...args)
    {
      std::ostringstream oss;
      (oss << ... << args);
      write(level, oss.str());
    }

    void write(LogLevel level, const std::string &message);

    /** Plain console text (prompts, banners), not a log record. */
    std::ostream &console() { return out_; }

    int warning_count() const { return warnings_; }
    int error_count() const { return errors_; }
    const std::string &last_warning() const { return last_warning_; }

  private:
    std::ostream &out_;
    LogLevel min_level_;
    int warnings_ = 0;
    int errors_ = 0;
    std::string last_warning_;
  };

}
