#include "run_log.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>

namespace cavegeo
{

  const char *log_level_name(LogLevel level)
  {
    switch (level)
    {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warning:
      return "WARNING";
    case LogLevel::Error:
      return "ERROR";
    }
    return "INFO";
  }

  LogLevel parse_log_level(const std::string &name)
  {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    if (lower == "debug")
      return LogLevel::Debug;
    if (lower == "warning" || lower == "warn")
      return LogLevel::Warning;
    if (lower == "error")
      return LogLevel::Error;
    return LogLevel::Info;
  }

  RunLog::RunLog(std::ostream &out, LogLevel min_level) : out_(out), min_level_(min_level) {}

  void RunLog::write(LogLevel level, const std::string &message)
  {
    if (level == LogLevel::Warning)
    {
      ++warnings_;
      last_warning_ = message;
    }
    else if (level == LogLevel::Error)
    {
      ++errors_;
    }
    if (level < min_level_)
      return;

    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_tm{};
    localtime_r(&now, &local_tm);
    out_ << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << " - " << log_level_name(level)
         << " - " << message << "\n";
  }

}
