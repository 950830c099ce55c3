#pragma once
#include <chrono>
#include <ctime>
#include <string>

namespace detail {
    inline std::tm utc_tm(std::chrono::system_clock::time_point tp) {
        std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
    #if defined(_WIN32)
        gmtime_s(&tm, &t);
    #else
        gmtime_r(&t, &tm);
    #endif
        return tm;
    }

    inline std::string format_tm(const std::tm& tm, const char* fmt) {
        char buf[32];
        std::strftime(buf, sizeof(buf), fmt, &tm);
        return std::string(buf);
    }
}

// UTC now in ISO-8601 "YYYY-MM-DDTHH:MM:SSZ"
inline std::string now_utc_iso8601() {
    return detail::format_tm(detail::utc_tm(std::chrono::system_clock::now()),
                             "%Y-%m-%dT%H:%M:%SZ");
}

// UTC calendar date "YYYY-MM-DD", optionally shifted back by whole days
inline std::string utc_date(int daysAgo = 0) {
    auto tp = std::chrono::system_clock::now() - std::chrono::hours(24 * daysAgo);
    return detail::format_tm(detail::utc_tm(tp), "%Y-%m-%d");
}
