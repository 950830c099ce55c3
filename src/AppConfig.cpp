#include "AppConfig.hpp"
#include "validation.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace {
    std::uint32_t parse_u32(const std::string& key, const std::string& value) {
        std::size_t used = 0;
        unsigned long parsed = 0;
        try {
            parsed = std::stoul(value, &used);
        } catch (const std::logic_error&) {
            throw std::invalid_argument("config: " + key + " expects a number, got '" + value + "'");
        }
        if (used != value.size() || parsed > UINT32_MAX) {
            throw std::invalid_argument("config: " + key + " expects a number, got '" + value + "'");
        }
        return static_cast<std::uint32_t>(parsed);
    }
}

AppConfig load_config(const std::string& path) {
    AppConfig config;
    std::ifstream stream(path);
    if (!stream.is_open()) {
        std::cerr << "[WARN] Unable to open config file " << path
                  << ", falling back to defaults\n";
        return config;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim_copy(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        const std::string key   = trim_copy(line.substr(0, eq));
        const std::string value = trim_copy(line.substr(eq + 1));

        if (key == "database_file") {
            config.database_file = value;
        } else if (key == "session_file") {
            config.session_file = value;
        } else if (key == "log_file") {
            config.log_file = value;
        } else if (key == "log_level") {
            config.log_level = parse_log_level(value);
        } else if (key == "kdf_iterations") {
            config.kdf.iterations = parse_u32(key, value);
        } else if (key == "kdf_memory_kib") {
            config.kdf.memory_kib = parse_u32(key, value);
        } else if (key == "kdf_parallelism") {
            config.kdf.parallelism = parse_u32(key, value);
        }
    }

    return config;
}
