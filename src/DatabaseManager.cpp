// src/DatabaseManager.cpp
#include "DatabaseManager.hpp"
#include "Errors.hpp"
#include "time_util.hpp"

#include <sqlite3.h>
#include <iostream>
#include <memory>     // std::unique_ptr
#include <optional>   // std::optional
#include <stdexcept>
#include <string>
#include <vector>

// Helper: RAII closer for sqlite3_stmt* + small helpers
namespace {
    struct StmtCloser {
        void operator()(sqlite3_stmt* stmt) const {
            if (stmt) sqlite3_finalize(stmt);
        }
    };
    using Stmt = std::unique_ptr<sqlite3_stmt, StmtCloser>;

    [[noreturn]] void fail(sqlite3* db, const std::string& what) {
        throw StorageError(what + ": " + sqlite3_errmsg(db), sqlite3_extended_errcode(db));
    }

    Stmt prepare(sqlite3* db, const char* sql, const char* what) {
        sqlite3_stmt* stmtRaw = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmtRaw, nullptr) != SQLITE_OK) {
            fail(db, std::string("prepare ") + what);
        }
        return Stmt(stmtRaw);
    }

    // Binds throw on failure; optionals bind as NULL when empty
    class Binder {
    public:
        Binder(sqlite3* db, sqlite3_stmt* st) : m_db(db), m_st(st) {}

        Binder& integer(int v) {
            check(sqlite3_bind_int(m_st, ++m_idx, v));
            return *this;
        }
        Binder& text(const std::string& v) {
            check(sqlite3_bind_text(m_st, ++m_idx, v.c_str(), -1, SQLITE_TRANSIENT));
            return *this;
        }
        Binder& integer(const std::optional<int>& v) {
            return v ? integer(*v) : null();
        }
        Binder& real(const std::optional<double>& v) {
            if (!v) return null();
            check(sqlite3_bind_double(m_st, ++m_idx, *v));
            return *this;
        }
        Binder& text(const std::optional<std::string>& v) {
            return v ? text(*v) : null();
        }
        Binder& null() {
            check(sqlite3_bind_null(m_st, ++m_idx));
            return *this;
        }

    private:
        void check(int rc) {
            if (rc != SQLITE_OK) fail(m_db, "bind #" + std::to_string(m_idx));
        }

        sqlite3* m_db;
        sqlite3_stmt* m_st;
        int m_idx = 0;
    };

    void step_done(sqlite3* db, sqlite3_stmt* st, const char* what) {
        if (sqlite3_step(st) != SQLITE_DONE) {
            fail(db, std::string("step ") + what);
        }
    }

    // Null-safe reads
    inline std::string read_text_nullable(sqlite3_stmt* st, int col) {
        const unsigned char* p = sqlite3_column_text(st, col);
        return p ? reinterpret_cast<const char*>(p) : std::string{};
    }

    inline std::optional<std::string> read_text_opt(sqlite3_stmt* st, int col) {
        if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
        return read_text_nullable(st, col);
    }

    inline std::optional<double> read_real_opt(sqlite3_stmt* st, int col) {
        if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
        return sqlite3_column_double(st, col);
    }

    inline std::optional<int> read_int_opt(sqlite3_stmt* st, int col) {
        if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
        return sqlite3_column_int(st, col);
    }

    // Column order of kActivityColumns
    Activity read_activity(sqlite3_stmt* st) {
        Activity a{};
        a.id           = sqlite3_column_int(st, 0);
        a.user_id      = sqlite3_column_int(st, 1);
        a.name         = read_text_nullable(st, 2);
        a.description  = read_text_nullable(st, 3);
        a.icon         = read_text_nullable(st, 4);
        a.target_value = read_real_opt(st, 5);
        a.target_unit  = read_text_nullable(st, 6);
        a.category     = read_text_nullable(st, 7);
        a.is_active    = sqlite3_column_int(st, 8) != 0;
        a.created_at   = read_text_nullable(st, 9);
        return a;
    }

    const char* const kActivityColumns =
        "id, user_id, name, description, icon, target_value, target_unit, "
        "category, is_active, created_at";

    // Tables holding rows owned by a user, children before parents
    const char* const kUserChildTables[] = {
        "activity_logs",
        "fitness_activities",
        "workout_sessions",
        "body_measurements",
        "user_profiles",
    };
}

bool StorageError::isUniqueViolation() const {
    return m_code == SQLITE_CONSTRAINT_UNIQUE || m_code == SQLITE_CONSTRAINT_PRIMARYKEY;
}

// ---- Persistent-connection ctor/dtor ----
DatabaseManager::DatabaseManager(const std::string& dbPath)
    : m_dbPath(dbPath), m_db(nullptr)
{
    int rc = sqlite3_open_v2(
        m_dbPath.c_str(),
        &m_db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr
    );
    if (rc != SQLITE_OK || !m_db) {
        std::string msg = m_db ? sqlite3_errmsg(m_db) : "unknown";
        if (m_db) sqlite3_close(m_db);
        m_db = nullptr;
        throw StorageError("sqlite3_open_v2 failed: " + msg, rc);
    }

    try {
        // Cascades depend on this; it is per-connection and off by default
        exec("PRAGMA foreign_keys = ON;");
    } catch (const StorageError&) {
        sqlite3_close(m_db);
        m_db = nullptr;
        throw;
    }
}

DatabaseManager::~DatabaseManager() {
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

// Run raw SQL (no parameters) on the same connection
void DatabaseManager::exec(const std::string& sql) const {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string msg = errMsg ? errMsg : "unknown";
        sqlite3_free(errMsg);
        throw StorageError("sqlite3_exec failed: " + msg, sqlite3_extended_errcode(m_db));
    }
}

void DatabaseManager::init() {
    static const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS users (
  id            INTEGER PRIMARY KEY AUTOINCREMENT,
  email         TEXT UNIQUE NOT NULL,
  password_hash TEXT NOT NULL,
  full_name     TEXT NOT NULL,
  created_at    TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS user_profiles (
  id           INTEGER PRIMARY KEY AUTOINCREMENT,
  user_id      INTEGER UNIQUE NOT NULL,
  age          INTEGER,
  weight       REAL,
  height       REAL,
  gender       TEXT,
  fitness_goal TEXT,
  FOREIGN KEY (user_id) REFERENCES users (id) ON DELETE CASCADE
);

CREATE TABLE IF NOT EXISTS fitness_activities (
  id           INTEGER PRIMARY KEY AUTOINCREMENT,
  user_id      INTEGER NOT NULL,
  name         TEXT NOT NULL,
  description  TEXT,
  icon         TEXT,
  target_value REAL,
  target_unit  TEXT,
  category     TEXT,
  is_active    INTEGER NOT NULL DEFAULT 1,
  created_at   TEXT NOT NULL,
  FOREIGN KEY (user_id) REFERENCES users (id) ON DELETE CASCADE
);

CREATE TABLE IF NOT EXISTS activity_logs (
  id           INTEGER PRIMARY KEY AUTOINCREMENT,
  activity_id  INTEGER NOT NULL,
  user_id      INTEGER NOT NULL,
  completed    INTEGER NOT NULL DEFAULT 0,
  actual_value REAL,
  notes        TEXT,
  log_date     TEXT NOT NULL,
  logged_at    TEXT NOT NULL,
  FOREIGN KEY (activity_id) REFERENCES fitness_activities (id) ON DELETE CASCADE,
  FOREIGN KEY (user_id) REFERENCES users (id) ON DELETE CASCADE,
  UNIQUE (activity_id, log_date)
);

CREATE TABLE IF NOT EXISTS workout_sessions (
  id               INTEGER PRIMARY KEY AUTOINCREMENT,
  user_id          INTEGER NOT NULL,
  workout_type     TEXT NOT NULL,
  duration_minutes INTEGER,
  calories_burned  REAL,
  intensity        TEXT,
  notes            TEXT,
  session_date     TEXT NOT NULL,
  created_at       TEXT NOT NULL,
  FOREIGN KEY (user_id) REFERENCES users (id) ON DELETE CASCADE
);

CREATE TABLE IF NOT EXISTS body_measurements (
  id                  INTEGER PRIMARY KEY AUTOINCREMENT,
  user_id             INTEGER NOT NULL,
  weight              REAL,
  body_fat_percentage REAL,
  muscle_mass         REAL,
  waist_circumference REAL,
  measurement_date    TEXT NOT NULL,
  created_at          TEXT NOT NULL,
  FOREIGN KEY (user_id) REFERENCES users (id) ON DELETE CASCADE
);

CREATE INDEX IF NOT EXISTS idx_activity_logs_date ON activity_logs(log_date);
CREATE INDEX IF NOT EXISTS idx_activity_logs_user ON activity_logs(user_id);
CREATE INDEX IF NOT EXISTS idx_fitness_activities_user ON fitness_activities(user_id);
CREATE INDEX IF NOT EXISTS idx_workout_sessions_user ON workout_sessions(user_id);
CREATE INDEX IF NOT EXISTS idx_body_measurements_user ON body_measurements(user_id);
)SQL";

    Transaction tx(*this);
    exec(kSchema);
    tx.commit();
}

// ---- Transactions (SAVEPOINT so they nest) ----

DatabaseManager::Transaction::Transaction(DatabaseManager& db)
    : m_db(db), m_lock(db.m_mutex)
{
    m_name = "fittrack_tx_" + std::to_string(++m_db.m_savepointDepth);
    try {
        m_db.exec("SAVEPOINT " + m_name + ";");
    } catch (const StorageError&) {
        --m_db.m_savepointDepth;
        throw;
    }
}

void DatabaseManager::Transaction::commit() {
    m_db.exec("RELEASE " + m_name + ";");
    m_done = true;
    --m_db.m_savepointDepth;
}

DatabaseManager::Transaction::~Transaction() {
    if (m_done) return;
    try {
        m_db.exec("ROLLBACK TO " + m_name + ";");
        m_db.exec("RELEASE " + m_name + ";");
    } catch (const StorageError& ex) {
        std::cerr << "[DB] rollback of " << m_name << " failed: " << ex.what() << "\n";
    }
    --m_db.m_savepointDepth;
}

// ---- Users ----

int DatabaseManager::createUser(const std::string& email,
                                const std::string& passwordHash,
                                const std::string& fullName) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto stmt = prepare(m_db,
        "INSERT INTO users (email, password_hash, full_name, created_at) VALUES (?, ?, ?, ?);",
        "createUser");
    Binder(m_db, stmt.get()).text(email).text(passwordHash).text(fullName).text(now_utc_iso8601());
    step_done(m_db, stmt.get(), "createUser");
    return static_cast<int>(sqlite3_last_insert_rowid(m_db));
}

std::optional<UserCredentials> DatabaseManager::getUserByEmail(const std::string& email) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto stmt = prepare(m_db,
        "SELECT id, email, password_hash, full_name, created_at FROM users WHERE email = ?;",
        "getUserByEmail");
    Binder(m_db, stmt.get()).text(email);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        UserCredentials c{};
        c.user.id         = sqlite3_column_int(stmt.get(), 0);
        c.user.email      = read_text_nullable(stmt.get(), 1);
        c.password_hash   = read_text_nullable(stmt.get(), 2);
        c.user.full_name  = read_text_nullable(stmt.get(), 3);
        c.user.created_at = read_text_nullable(stmt.get(), 4);
        return c;
    } else if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    fail(m_db, "step getUserByEmail");
}

std::optional<UserCredentials> DatabaseManager::getUserCredentialsById(int userId) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto stmt = prepare(m_db,
        "SELECT id, email, password_hash, full_name, created_at FROM users WHERE id = ?;",
        "getUserCredentialsById");
    Binder(m_db, stmt.get()).integer(userId);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        UserCredentials c{};
        c.user.id         = sqlite3_column_int(stmt.get(), 0);
        c.user.email      = read_text_nullable(stmt.get(), 1);
        c.password_hash   = read_text_nullable(stmt.get(), 2);
        c.user.full_name  = read_text_nullable(stmt.get(), 3);
        c.user.created_at = read_text_nullable(stmt.get(), 4);
        return c;
    } else if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    fail(m_db, "step getUserCredentialsById");
}

std::optional<User> DatabaseManager::getUserById(int userId) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto stmt = prepare(m_db,
        "SELECT id, email, full_name, created_at FROM users WHERE id = ?;",
        "getUserById");
    Binder(m_db, stmt.get()).integer(userId);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        User u{};
        u.id         = sqlite3_column_int(stmt.get(), 0);
        u.email      = read_text_nullable(stmt.get(), 1);
        u.full_name  = read_text_nullable(stmt.get(), 2);
        u.created_at = read_text_nullable(stmt.get(), 3);
        return u;
    } else if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    fail(m_db, "step getUserById");
}

bool DatabaseManager::updatePasswordHash(int userId, const std::string& passwordHash) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto stmt = prepare(m_db, "UPDATE users SET password_hash = ? WHERE id = ?;",
                        "updatePasswordHash");
    Binder(m_db, stmt.get()).text(passwordHash).integer(userId);
    step_done(m_db, stmt.get(), "updatePasswordHash");
    return sqlite3_changes(m_db) > 0;
}

bool DatabaseManager::deleteUser(int userId) {
    Transaction tx(*this);
    auto stmt = prepare(m_db, "DELETE FROM users WHERE id = ?;", "deleteUser");
    Binder(m_db, stmt.get()).integer(userId);
    step_done(m_db, stmt.get(), "deleteUser");
    const bool removed = sqlite3_changes(m_db) > 0;
    tx.commit();
    return removed;
}

// ---- Profiles ----

void DatabaseManager::createOrUpdateProfile(int userId, const ProfileData& profile) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto stmt = prepare(m_db, R"SQL(
        INSERT INTO user_profiles (user_id, age, weight, height, gender, fitness_goal)
        VALUES (?, ?, ?, ?, ?, ?)
        ON CONFLICT(user_id) DO UPDATE SET
          age = excluded.age, weight = excluded.weight, height = excluded.height,
          gender = excluded.gender, fitness_goal = excluded.fitness_goal;
    )SQL", "createOrUpdateProfile");

    Binder(m_db, stmt.get())
        .integer(userId)
        .integer(profile.age)
        .real(profile.weight)
        .real(profile.height)
        .text(profile.gender)
        .text(profile.fitness_goal);
    step_done(m_db, stmt.get(), "createOrUpdateProfile");
}

std::optional<UserProfile> DatabaseManager::getUserProfile(int userId) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto stmt = prepare(m_db, R"SQL(
        SELECT id, user_id, age, weight, height, gender, fitness_goal
        FROM user_profiles WHERE user_id = ?;
    )SQL", "getUserProfile");
    Binder(m_db, stmt.get()).integer(userId);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        UserProfile p{};
        p.id                = sqlite3_column_int(stmt.get(), 0);
        p.user_id           = sqlite3_column_int(stmt.get(), 1);
        p.data.age          = read_int_opt(stmt.get(), 2);
        p.data.weight       = read_real_opt(stmt.get(), 3);
        p.data.height       = read_real_opt(stmt.get(), 4);
        p.data.gender       = read_text_opt(stmt.get(), 5);
        p.data.fitness_goal = read_text_opt(stmt.get(), 6);
        return p;
    } else if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    fail(m_db, "step getUserProfile");
}

// ---- Activities ----

int DatabaseManager::createActivity(int userId, const ActivityData& activity) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto stmt = prepare(m_db, R"SQL(
        INSERT INTO fitness_activities
          (user_id, name, description, icon, target_value, target_unit, category, created_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?);
    )SQL", "createActivity");

    Binder(m_db, stmt.get())
        .integer(userId)
        .text(activity.name)
        .text(activity.description)
        .text(activity.icon)
        .real(activity.target_value)
        .text(activity.target_unit)
        .text(activity.category)
        .text(now_utc_iso8601());
    step_done(m_db, stmt.get(), "createActivity");
    return static_cast<int>(sqlite3_last_insert_rowid(m_db));
}

std::optional<Activity> DatabaseManager::getActivityById(int activityId) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    const std::string sql =
        std::string("SELECT ") + kActivityColumns + " FROM fitness_activities WHERE id = ?;";
    auto stmt = prepare(m_db, sql.c_str(), "getActivityById");
    Binder(m_db, stmt.get()).integer(activityId);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return read_activity(stmt.get());
    } else if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    fail(m_db, "step getActivityById");
}

std::vector<Activity> DatabaseManager::getActivitiesByUser(int userId) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    const std::string sql =
        std::string("SELECT ") + kActivityColumns +
        " FROM fitness_activities WHERE user_id = ? AND is_active = 1"
        " ORDER BY created_at DESC, id DESC;";
    auto stmt = prepare(m_db, sql.c_str(), "getActivitiesByUser");
    Binder(m_db, stmt.get()).integer(userId);

    std::vector<Activity> out;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        out.push_back(read_activity(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        fail(m_db, "step getActivitiesByUser");
    }
    return out;
}

bool DatabaseManager::updateActivity(int activityId, const ActivityData& activity) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto stmt = prepare(m_db, R"SQL(
        UPDATE fitness_activities
        SET name = ?, description = ?, icon = ?, target_value = ?, target_unit = ?, category = ?
        WHERE id = ?;
    )SQL", "updateActivity");

    Binder(m_db, stmt.get())
        .text(activity.name)
        .text(activity.description)
        .text(activity.icon)
        .real(activity.target_value)
        .text(activity.target_unit)
        .text(activity.category)
        .integer(activityId);
    step_done(m_db, stmt.get(), "updateActivity");
    return sqlite3_changes(m_db) > 0;
}

bool DatabaseManager::deleteActivity(int activityId) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto stmt = prepare(m_db, "UPDATE fitness_activities SET is_active = 0 WHERE id = ?;",
                        "deleteActivity");
    Binder(m_db, stmt.get()).integer(activityId);
    step_done(m_db, stmt.get(), "deleteActivity");
    return sqlite3_changes(m_db) > 0;
}

// ---- Activity logs ----

void DatabaseManager::logActivity(int userId, int activityId, const std::string& date,
                                  bool completed,
                                  const std::optional<double>& actualValue,
                                  const std::optional<std::string>& notes) {
    Transaction tx(*this);
    auto stmt = prepare(m_db, R"SQL(
        INSERT INTO activity_logs
          (activity_id, user_id, completed, actual_value, notes, log_date, logged_at)
        VALUES (?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(activity_id, log_date) DO UPDATE SET
          user_id = excluded.user_id, completed = excluded.completed,
          actual_value = excluded.actual_value, notes = excluded.notes,
          logged_at = excluded.logged_at;
    )SQL", "logActivity");

    Binder(m_db, stmt.get())
        .integer(activityId)
        .integer(userId)
        .integer(completed ? 1 : 0)
        .real(actualValue)
        .text(notes)
        .text(date)
        .text(now_utc_iso8601());
    step_done(m_db, stmt.get(), "logActivity");
    tx.commit();
}

std::vector<ActivityLogDetail>
DatabaseManager::getActivityLogsForDate(int userId, const std::string& date) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto stmt = prepare(m_db, R"SQL(
        SELECT al.id, al.activity_id, al.user_id, al.log_date, al.completed,
               al.actual_value, al.notes, al.logged_at,
               fa.name, fa.description, fa.icon, fa.target_value, fa.target_unit, fa.category
        FROM activity_logs al
        JOIN fitness_activities fa ON al.activity_id = fa.id
        WHERE al.user_id = ? AND al.log_date = ?
        ORDER BY al.activity_id;
    )SQL", "getActivityLogsForDate");
    Binder(m_db, stmt.get()).integer(userId).text(date);

    std::vector<ActivityLogDetail> out;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        ActivityLogDetail d{};
        d.id                 = sqlite3_column_int(stmt.get(), 0);
        d.activity_id        = sqlite3_column_int(stmt.get(), 1);
        d.user_id            = sqlite3_column_int(stmt.get(), 2);
        d.log_date           = read_text_nullable(stmt.get(), 3);
        d.entry.completed    = sqlite3_column_int(stmt.get(), 4) != 0;
        d.entry.actual_value = read_real_opt(stmt.get(), 5);
        d.entry.notes        = read_text_opt(stmt.get(), 6);
        d.logged_at          = read_text_nullable(stmt.get(), 7);
        d.name               = read_text_nullable(stmt.get(), 8);
        d.description        = read_text_nullable(stmt.get(), 9);
        d.icon               = read_text_nullable(stmt.get(), 10);
        d.target_value       = read_real_opt(stmt.get(), 11);
        d.target_unit        = read_text_nullable(stmt.get(), 12);
        d.category           = read_text_nullable(stmt.get(), 13);
        out.push_back(std::move(d));
    }
    if (rc != SQLITE_DONE) {
        fail(m_db, "step getActivityLogsForDate");
    }
    return out;
}

std::vector<ActivityStat> DatabaseManager::getActivityStats(int userId,
                                                            const std::string& startDate,
                                                            const std::string& endDate) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    // COUNT(al.id) so an activity without logs in range reports 0, not 1
    auto stmt = prepare(m_db, R"SQL(
        SELECT fa.id, fa.name, fa.category,
               COUNT(CASE WHEN al.completed = 1 THEN 1 END) AS completed_count,
               COUNT(al.id) AS total_count
        FROM fitness_activities fa
        LEFT JOIN activity_logs al ON fa.id = al.activity_id
          AND al.log_date BETWEEN ? AND ?
        WHERE fa.user_id = ? AND fa.is_active = 1
        GROUP BY fa.id
        ORDER BY fa.id;
    )SQL", "getActivityStats");
    Binder(m_db, stmt.get()).text(startDate).text(endDate).integer(userId);

    std::vector<ActivityStat> out;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        ActivityStat s{};
        s.activity_id     = sqlite3_column_int(stmt.get(), 0);
        s.name            = read_text_nullable(stmt.get(), 1);
        s.category        = read_text_nullable(stmt.get(), 2);
        s.completed_count = sqlite3_column_int(stmt.get(), 3);
        s.total_count     = sqlite3_column_int(stmt.get(), 4);
        s.completion_rate = s.total_count > 0
            ? s.completed_count * 100.0 / s.total_count
            : 0.0;
        out.push_back(std::move(s));
    }
    if (rc != SQLITE_DONE) {
        fail(m_db, "step getActivityStats");
    }
    return out;
}

// ---- Workout sessions ----

int DatabaseManager::createWorkoutSession(int userId, const WorkoutData& session) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto stmt = prepare(m_db, R"SQL(
        INSERT INTO workout_sessions
          (user_id, workout_type, duration_minutes, calories_burned, intensity, notes,
           session_date, created_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?);
    )SQL", "createWorkoutSession");

    Binder(m_db, stmt.get())
        .integer(userId)
        .text(session.workout_type)
        .integer(session.duration_minutes)
        .real(session.calories_burned)
        .text(session.intensity)
        .text(session.notes)
        .text(session.session_date)
        .text(now_utc_iso8601());
    step_done(m_db, stmt.get(), "createWorkoutSession");
    return static_cast<int>(sqlite3_last_insert_rowid(m_db));
}

std::vector<WorkoutSession> DatabaseManager::getWorkoutSessions(int userId,
                                                                const std::string& startDate,
                                                                const std::string& endDate) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto stmt = prepare(m_db, R"SQL(
        SELECT id, user_id, workout_type, duration_minutes, calories_burned, intensity,
               notes, session_date, created_at
        FROM workout_sessions
        WHERE user_id = ? AND session_date BETWEEN ? AND ?
        ORDER BY session_date DESC, id DESC;
    )SQL", "getWorkoutSessions");
    Binder(m_db, stmt.get()).integer(userId).text(startDate).text(endDate);

    std::vector<WorkoutSession> out;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        WorkoutSession w{};
        w.id                    = sqlite3_column_int(stmt.get(), 0);
        w.user_id               = sqlite3_column_int(stmt.get(), 1);
        w.data.workout_type     = read_text_nullable(stmt.get(), 2);
        w.data.duration_minutes = read_int_opt(stmt.get(), 3);
        w.data.calories_burned  = read_real_opt(stmt.get(), 4);
        w.data.intensity        = read_text_opt(stmt.get(), 5);
        w.data.notes            = read_text_opt(stmt.get(), 6);
        w.data.session_date     = read_text_nullable(stmt.get(), 7);
        w.created_at            = read_text_nullable(stmt.get(), 8);
        out.push_back(std::move(w));
    }
    if (rc != SQLITE_DONE) {
        fail(m_db, "step getWorkoutSessions");
    }
    return out;
}

// ---- Body measurements ----

int DatabaseManager::addBodyMeasurement(int userId, const MeasurementData& measurement) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto stmt = prepare(m_db, R"SQL(
        INSERT INTO body_measurements
          (user_id, weight, body_fat_percentage, muscle_mass, waist_circumference,
           measurement_date, created_at)
        VALUES (?, ?, ?, ?, ?, ?, ?);
    )SQL", "addBodyMeasurement");

    Binder(m_db, stmt.get())
        .integer(userId)
        .real(measurement.weight)
        .real(measurement.body_fat_percentage)
        .real(measurement.muscle_mass)
        .real(measurement.waist_circumference)
        .text(measurement.measurement_date)
        .text(now_utc_iso8601());
    step_done(m_db, stmt.get(), "addBodyMeasurement");
    return static_cast<int>(sqlite3_last_insert_rowid(m_db));
}

std::vector<BodyMeasurement> DatabaseManager::getBodyMeasurements(int userId, int limit) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto stmt = prepare(m_db, R"SQL(
        SELECT id, user_id, weight, body_fat_percentage, muscle_mass, waist_circumference,
               measurement_date, created_at
        FROM body_measurements
        WHERE user_id = ?
        ORDER BY measurement_date DESC, id DESC
        LIMIT ?;
    )SQL", "getBodyMeasurements");
    Binder(m_db, stmt.get()).integer(userId).integer(limit);

    std::vector<BodyMeasurement> out;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        BodyMeasurement m{};
        m.id                       = sqlite3_column_int(stmt.get(), 0);
        m.user_id                  = sqlite3_column_int(stmt.get(), 1);
        m.data.weight              = read_real_opt(stmt.get(), 2);
        m.data.body_fat_percentage = read_real_opt(stmt.get(), 3);
        m.data.muscle_mass         = read_real_opt(stmt.get(), 4);
        m.data.waist_circumference = read_real_opt(stmt.get(), 5);
        m.data.measurement_date    = read_text_nullable(stmt.get(), 6);
        m.created_at               = read_text_nullable(stmt.get(), 7);
        out.push_back(std::move(m));
    }
    if (rc != SQLITE_DONE) {
        fail(m_db, "step getBodyMeasurements");
    }
    return out;
}

// ---- Maintenance ----

int DatabaseManager::deleteByUser(const char* table, int userId) {
    const std::string sql = std::string("DELETE FROM ") + table + " WHERE user_id = ?;";
    auto stmt = prepare(m_db, sql.c_str(), "deleteByUser");
    Binder(m_db, stmt.get()).integer(userId);
    step_done(m_db, stmt.get(), table);
    return sqlite3_changes(m_db);
}

void DatabaseManager::clearUserData(int userId) {
    Transaction tx(*this);
    for (const char* table : kUserChildTables) {
        deleteByUser(table, userId);
    }
    tx.commit();
}

// ---- Test helpers ----

int DatabaseManager::test_countRows(const std::string& table, int userId) const {
    std::string column;
    if (table == "users") {
        column = "id";
    } else {
        for (const char* t : kUserChildTables) {
            if (table == t) column = "user_id";
        }
    }
    if (column.empty()) {
        throw std::invalid_argument("test_countRows: unknown table " + table);
    }

    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    const std::string sql = "SELECT COUNT(*) FROM " + table + " WHERE " + column + " = ?;";
    auto stmt = prepare(m_db, sql.c_str(), "test_countRows");
    Binder(m_db, stmt.get()).integer(userId);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        fail(m_db, "step test_countRows");
    }
    return sqlite3_column_int(stmt.get(), 0);
}

int DatabaseManager::test_countLogs(int activityId, const std::string& date) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto stmt = prepare(m_db,
        "SELECT COUNT(*) FROM activity_logs WHERE activity_id = ? AND log_date = ?;",
        "test_countLogs");
    Binder(m_db, stmt.get()).integer(activityId).text(date);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        fail(m_db, "step test_countLogs");
    }
    return sqlite3_column_int(stmt.get(), 0);
}
