#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static const char* level_name(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO ";
    case LogLevel::Warn:
        return "WARN ";
    case LogLevel::Error:
        return "ERROR";
    }
    return "?????";
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::string timestamp()
{
    const auto now  = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    const auto ms   = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::optional<LogLevel> log_level_from_string(const std::string& name)
{
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (n == "debug")
        return LogLevel::Debug;
    if (n == "info")
        return LogLevel::Info;
    if (n == "warn" || n == "warning")
        return LogLevel::Warn;
    if (n == "error")
        return LogLevel::Error;
    return std::nullopt;
}

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level)
{
    std::scoped_lock lk(mu_);
    level_ = level;
}

LogLevel Logger::level() const
{
    std::scoped_lock lk(mu_);
    return level_;
}

void Logger::set_output(std::ostream* os)
{
    std::scoped_lock lk(mu_);
    output_ = os;
}

bool Logger::enable_file_logging(const std::string& path)
{
    std::scoped_lock lk(mu_);
    if (file_.is_open())
        file_.close();
    file_.open(path, std::ios::app);
    if (!file_.is_open())
        return false;
    output_ = &file_;
    return true;
}

void Logger::log(LogLevel level, const std::string& message)
{
    std::scoped_lock lk(mu_);
    if (level < level_)
        return;
    std::ostream& os = output_ != nullptr ? *output_ : std::clog;
    os << timestamp() << " [scopekeeper] " << level_name(level) << ' ' << message << '\n';
}

void log_debug(const std::string& message)
{
    Logger::instance().log(LogLevel::Debug, message);
}

void log_info(const std::string& message)
{
    Logger::instance().log(LogLevel::Info, message);
}

void log_warn(const std::string& message)
{
    Logger::instance().log(LogLevel::Warn, message);
}

void log_error(const std::string& message)
{
    Logger::instance().log(LogLevel::Error, message);
}
