#pragma once
#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

enum class LogLevel
{
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3
};

// "debug", "info", "warn"/"warning", "error" (case-insensitive)
std::optional<LogLevel> log_level_from_string(const std::string& name);

/**
 * Process-wide logger. Lines look like
 *   2025-11-24 12:01:39.512 [scopekeeper] INFO  calculated 0.3000000 t CO2e ...
 * and go to std::clog unless redirected with set_output() or enable_file_logging().
 */
class Logger
{
  public:
    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel level() const;
    void     set_output(std::ostream* os);
    bool     enable_file_logging(const std::string& path);

    void log(LogLevel level, const std::string& message);

  private:
    Logger() = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex mu_;
    LogLevel           level_  = LogLevel::Info;
    std::ostream*      output_ = nullptr;
    std::ofstream      file_;
};

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
