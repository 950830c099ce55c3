#pragma once
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError,
};

// Throws std::invalid_argument for anything but debug/info/warn/error
LogLevel parse_log_level(const std::string& name);

// Timestamped lines to std::clog, and appended to filePath when one is given.
class Logger {
public:
    explicit Logger(const std::string& filePath = "", LogLevel minLevel = LogLevel::kInfo);

    void log(LogLevel level, std::string_view message);

    void debug(std::string_view message) { log(LogLevel::kDebug, message); }
    void info(std::string_view message)  { log(LogLevel::kInfo, message); }
    void warn(std::string_view message)  { log(LogLevel::kWarn, message); }
    void error(std::string_view message) { log(LogLevel::kError, message); }

    void setMinLevel(LogLevel level);

private:
    static const char* levelName(LogLevel level);
    void ensureStream();

    std::mutex    m_mutex;
    std::ofstream m_stream;
    std::string   m_filePath;
    LogLevel      m_minLevel;
};
