#pragma once
#include <string>

#include "Logger.hpp"
#include "PasswordHasher.hpp"

struct AppConfig {
    std::string database_file = "data/fittrack.sqlite";
    std::string session_file  = "data/session.json";
    std::string log_file;                 // empty: console only
    LogLevel    log_level = LogLevel::kInfo;
    KdfParams   kdf;
};

// Reads "key = value" lines. A missing file yields the defaults.
// Throws std::invalid_argument on a malformed value.
AppConfig load_config(const std::string& path);
