#pragma once
#include <optional>
#include <string>

#include "Records.hpp"

// Persists "who is logged in" as a small JSON key-value file,
// independent of the relational store.
class SessionStore {
public:
    static constexpr const char* kSessionKey = "@fitness_tracker_session";

    explicit SessionStore(const std::string& filePath);

    // Writes {user, timestamp} under kSessionKey. Throws std::runtime_error on I/O failure.
    void createSession(const User& user);

    // nullopt when absent, unreadable or corrupt. Never throws.
    std::optional<User> getCurrentUser() const;

    // Removes the record; no-op when there is none.
    void clearSession();

    const std::string& path() const { return m_filePath; }

private:
    std::string m_filePath;
};
