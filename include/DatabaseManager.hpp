#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "Records.hpp"

// Forward-declare sqlite3 so consumers of this header don't need sqlite3.h
struct sqlite3;

// Owns the single SQLite connection and the fitness schema.
// Every public call holds m_mutex, so writes to the same (activity, date)
// key are serialized and readers never observe an open transaction.
// All failures surface as StorageError.
class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& dbPath);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    // Create tables & indices if not present
    void init();

    // Scoped SAVEPOINT. Rolls back on destruction unless commit() was called.
    // Holds the store lock for its whole lifetime; nests.
    class Transaction {
    public:
        explicit Transaction(DatabaseManager& db);
        ~Transaction();
        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();

    private:
        DatabaseManager& m_db;
        std::unique_lock<std::recursive_mutex> m_lock;
        std::string m_name;
        bool m_done = false;
    };

    // ---- Users
    int createUser(const std::string& email,
                   const std::string& passwordHash,
                   const std::string& fullName);
    std::optional<UserCredentials> getUserByEmail(const std::string& email) const;
    std::optional<UserCredentials> getUserCredentialsById(int userId) const;
    std::optional<User> getUserById(int userId) const;
    bool updatePasswordHash(int userId, const std::string& passwordHash);
    // Child rows go with it (ON DELETE CASCADE)
    bool deleteUser(int userId);

    // ---- Profiles (one per user, upsert on user_id)
    void createOrUpdateProfile(int userId, const ProfileData& profile);
    std::optional<UserProfile> getUserProfile(int userId) const;

    // ---- Activities
    int createActivity(int userId, const ActivityData& activity);
    std::optional<Activity> getActivityById(int activityId) const;
    // Active only, newest first
    std::vector<Activity> getActivitiesByUser(int userId) const;
    bool updateActivity(int activityId, const ActivityData& activity);
    // Soft delete: is_active = 0 for this id only
    bool deleteActivity(int activityId);

    // ---- Activity logs
    // Upsert keyed on (activity_id, log_date)
    void logActivity(int userId, int activityId, const std::string& date, bool completed,
                     const std::optional<double>& actualValue = std::nullopt,
                     const std::optional<std::string>& notes = std::nullopt);
    std::vector<ActivityLogDetail> getActivityLogsForDate(int userId, const std::string& date) const;
    std::vector<ActivityStat> getActivityStats(int userId,
                                               const std::string& startDate,
                                               const std::string& endDate) const;

    // ---- Workout sessions
    int createWorkoutSession(int userId, const WorkoutData& session);
    std::vector<WorkoutSession> getWorkoutSessions(int userId,
                                                   const std::string& startDate,
                                                   const std::string& endDate) const;

    // ---- Body measurements
    int addBodyMeasurement(int userId, const MeasurementData& measurement);
    std::vector<BodyMeasurement> getBodyMeasurements(int userId, int limit = 30) const;

    // ---- Maintenance
    // Removes every child row of the user in one transaction; keeps the users row
    void clearUserData(int userId);

    // ---- Test-only helpers
    int test_countRows(const std::string& table, int userId) const;
    int test_countLogs(int activityId, const std::string& date) const;

private:
    std::string m_dbPath;
    sqlite3*    m_db = nullptr; // persistent DB connection
    mutable std::recursive_mutex m_mutex;
    int m_savepointDepth = 0;

    // helper to run raw SQL without parameters on m_db
    void exec(const std::string& sql) const;
    // single bound statement, returns sqlite3_changes()
    int deleteByUser(const char* table, int userId);
};
