#pragma once
#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

inline std::string trim_copy(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

// Emails are stored and looked up trimmed + lower-cased
inline std::string normalize_email(const std::string& email) {
    std::string out = trim_copy(email);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// local@domain.tld : exactly one '@', no whitespace, a '.' in the domain
// with at least one character on each side of it.
inline bool is_valid_email(const std::string& email) {
    if (email.empty()) return false;
    for (char ch : email) {
        if (std::isspace(static_cast<unsigned char>(ch))) return false;
    }
    const auto at = email.find('@');
    if (at == std::string::npos || at == 0) return false;
    if (email.find('@', at + 1) != std::string::npos) return false;

    const std::string domain = email.substr(at + 1);
    for (std::size_t dot = domain.find('.'); dot != std::string::npos;
         dot = domain.find('.', dot + 1)) {
        if (dot > 0 && dot + 1 < domain.size()) return true;
    }
    return false;
}

// Empty result means the password is acceptable.
inline std::vector<std::string> password_policy_errors(const std::string& password) {
    std::vector<std::string> errors;
    bool upper = false, lower = false, digit = false;
    for (char ch : password) {
        const auto c = static_cast<unsigned char>(ch);
        if (std::isupper(c)) upper = true;
        else if (std::islower(c)) lower = true;
        else if (std::isdigit(c)) digit = true;
    }
    if (password.size() < 8) errors.emplace_back("Password must be at least 8 characters long");
    if (!upper) errors.emplace_back("Password must contain at least one uppercase letter");
    if (!lower) errors.emplace_back("Password must contain at least one lowercase letter");
    if (!digit) errors.emplace_back("Password must contain at least one number");
    return errors;
}

inline bool is_valid_full_name(const std::string& fullName) {
    return trim_copy(fullName).size() >= 2;
}

inline int days_in_month(int year, int month) {
    static const int kDays[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return (month == 2 && leap) ? 29 : kDays[month - 1];
}

// Strict "YYYY-MM-DD" naming a real calendar day
inline bool is_iso_date(const std::string& date) {
    if (date.size() != 10 || date[4] != '-' || date[7] != '-') return false;
    for (std::size_t i = 0; i < date.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(date[i]))) return false;
    }
    const int year  = std::stoi(date.substr(0, 4));
    const int month = std::stoi(date.substr(5, 2));
    const int day   = std::stoi(date.substr(8, 2));
    if (month < 1 || month > 12) return false;
    return day >= 1 && day <= days_in_month(year, month);
}
