#include "Logger.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {
    std::string now_local() {
        const auto now = std::chrono::system_clock::now();
        const std::time_t t = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
    #if defined(_WIN32)
        localtime_s(&tm, &t);
    #else
        localtime_r(&t, &tm);
    #endif
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        return oss.str();
    }
}

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::kDebug;
    if (name == "info")  return LogLevel::kInfo;
    if (name == "warn")  return LogLevel::kWarn;
    if (name == "error") return LogLevel::kError;
    throw std::invalid_argument("unknown log level: " + name);
}

Logger::Logger(const std::string& filePath, LogLevel minLevel)
    : m_filePath(filePath), m_minLevel(minLevel)
{
    ensureStream();
}

void Logger::ensureStream() {
    if (m_filePath.empty() || m_stream.is_open()) {
        return;
    }
    const auto parent = std::filesystem::path(m_filePath).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    m_stream.open(m_filePath, std::ios::app);
    if (!m_stream) {
        throw std::runtime_error("Failed to open log file: " + m_filePath);
    }
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo:  return "INFO";
        case LogLevel::kWarn:  return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "INFO";
}

void Logger::setMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_minLevel = level;
}

void Logger::log(LogLevel level, std::string_view message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (level < m_minLevel) {
        return;
    }
    const std::string stamp = now_local();
    if (m_stream.is_open()) {
        m_stream << stamp << " [" << levelName(level) << "] " << message << '\n';
        m_stream.flush();
    }
    std::clog << stamp << " [" << levelName(level) << "] " << message << '\n';
}
