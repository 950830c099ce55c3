#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "DatabaseManager.hpp"
#include "Logger.hpp"
#include "PasswordHasher.hpp"
#include "Records.hpp"
#include "SessionStore.hpp"

// The only entry point for the presentation layer.
// States: anonymous -> authenticated (register/login) -> anonymous (logout).
//
// Errors: ValidationError, DuplicateEmailError, InvalidCredentialsError,
// NotFoundError; anything from SQLite propagates as StorageError.
class AccountService {
public:
    AccountService(DatabaseManager& db, SessionStore& session,
                   PasswordHasher hasher, Logger& log);

    // ---- Account lifecycle
    User registerUser(const std::string& email, const std::string& password,
                      const std::string& fullName);
    User login(const std::string& email, const std::string& password);
    void logout();
    // Restores the authenticated state from a persisted session
    std::optional<User> getCurrentUser();
    bool isAuthenticated() const { return m_currentUser.has_value(); }

    void changePassword(int userId, const std::string& currentPassword,
                        const std::string& newPassword);
    void updateProfile(int userId, const ProfileData& profile);
    std::optional<UserProfile> getProfile(int userId) const;

    // ---- Activities
    std::vector<Activity> listActivities(int userId) const;
    int createActivity(int userId, const ActivityData& activity);
    void updateActivity(int userId, int activityId, const ActivityData& activity);
    void deleteActivity(int userId, int activityId);

    void logActivity(int userId, int activityId, const std::string& date, bool completed,
                     const std::optional<double>& value = std::nullopt,
                     const std::optional<std::string>& notes = std::nullopt);
    // activity id -> that day's entry
    std::map<int, LogEntry> getTodayLogs(int userId, const std::string& date) const;
    std::vector<ActivityStat> getStats(int userId, const std::string& startDate,
                                       const std::string& endDate) const;

    // ---- Workouts & measurements
    int logWorkout(int userId, const WorkoutData& workout);
    std::vector<WorkoutSession> listWorkouts(int userId, const std::string& startDate,
                                             const std::string& endDate) const;
    int logMeasurement(int userId, const MeasurementData& measurement);
    std::vector<BodyMeasurement> listMeasurements(int userId, int limit = 30) const;

    // ---- Data management
    void clearUserData(int userId);
    void deleteAccount(int userId);

    // Catalog every new account starts with
    static const std::vector<ActivityData>& defaultActivities();

private:
    void requireUser(int userId) const;
    Activity requireOwnedActivity(int userId, int activityId) const;
    void startSession(const User& user);

    static void requireDate(const std::string& date, const char* field);
    static void requirePasswordPolicy(const std::string& password);

    DatabaseManager& m_db;
    SessionStore&    m_session;
    PasswordHasher   m_hasher;
    Logger&          m_log;
    std::optional<User> m_currentUser;
};
