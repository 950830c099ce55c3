#include "AccountService.hpp"
#include "Errors.hpp"
#include "validation.hpp"

#include <stdexcept>
#include <utility>

AccountService::AccountService(DatabaseManager& db, SessionStore& session,
                               PasswordHasher hasher, Logger& log)
    : m_db(db), m_session(session), m_hasher(std::move(hasher)), m_log(log)
{
}

const std::vector<ActivityData>& AccountService::defaultActivities() {
    static const std::vector<ActivityData> kDefaults = {
        { "💧 Hydration",      "Drink water throughout the day", "💧", 8.0,  "glasses", "nutrition" },
        { "🏃 Cardio",         "Cardiovascular exercise",        "🏃", 30.0, "minutes", "exercise"  },
        { "🏋️ Strength",       "Strength training workout",      "🏋️", 45.0, "minutes", "exercise"  },
        { "🧘 Stretching",     "Flexibility and mobility work",  "🧘", 15.0, "minutes", "recovery"  },
        { "😴 Sleep",          "Quality sleep",                  "😴", 8.0,  "hours",   "recovery"  },
        { "🥗 Healthy Meal",   "Balanced, nutritious meal",      "🥗", 3.0,  "meals",   "nutrition" },
        { "📊 Track Progress", "Log weight or measurements",     "📊", 1.0,  "entry",   "tracking"  },
    };
    return kDefaults;
}

// ---- Helpers ----

void AccountService::requireDate(const std::string& date, const char* field) {
    if (!is_iso_date(date)) {
        throw ValidationError(std::string(field) + " must be a YYYY-MM-DD date");
    }
}

void AccountService::requirePasswordPolicy(const std::string& password) {
    auto errors = password_policy_errors(password);
    if (!errors.empty()) {
        throw ValidationError(std::move(errors));
    }
}

void AccountService::requireUser(int userId) const {
    if (!m_db.getUserById(userId)) {
        throw NotFoundError("User " + std::to_string(userId) + " not found");
    }
}

Activity AccountService::requireOwnedActivity(int userId, int activityId) const {
    auto activity = m_db.getActivityById(activityId);
    if (!activity || activity->user_id != userId) {
        throw NotFoundError("Activity " + std::to_string(activityId) + " not found");
    }
    return *activity;
}

void AccountService::startSession(const User& user) {
    m_session.createSession(user);
    m_currentUser = user;
}

// ---- Account lifecycle ----

User AccountService::registerUser(const std::string& email, const std::string& password,
                                  const std::string& fullName) {
    const std::string normalized = normalize_email(email);
    if (!is_valid_email(normalized)) {
        throw ValidationError("Invalid email format");
    }
    requirePasswordPolicy(password);
    if (!is_valid_full_name(fullName)) {
        throw ValidationError("Full name must be at least 2 characters");
    }

    if (m_db.getUserByEmail(normalized)) {
        m_log.warn("registration rejected, email already registered");
        throw DuplicateEmailError();
    }

    // KDF runs before the store lock is taken
    const std::string credential = m_hasher.createCredential(password);

    int userId = 0;
    try {
        DatabaseManager::Transaction tx(m_db);
        userId = m_db.createUser(normalized, credential, trim_copy(fullName));
        m_db.createOrUpdateProfile(userId, ProfileData{});
        for (const auto& activity : defaultActivities()) {
            m_db.createActivity(userId, activity);
        }
        tx.commit();
    } catch (const StorageError& ex) {
        if (ex.isUniqueViolation()) {
            m_log.warn("registration lost a race for its email");
            throw DuplicateEmailError();
        }
        throw;
    }

    auto user = m_db.getUserById(userId);
    if (!user) {
        throw NotFoundError("User " + std::to_string(userId) + " vanished after insert");
    }
    // The account is committed at this point; a session that cannot be
    // persisted only costs a login after restart
    try {
        startSession(*user);
    } catch (const std::runtime_error& ex) {
        m_currentUser = *user;
        m_log.error(std::string("session not persisted after registration: ") + ex.what());
    }
    m_log.info("registered user " + std::to_string(user->id));
    return *user;
}

User AccountService::login(const std::string& email, const std::string& password) {
    const std::string normalized = normalize_email(email);
    auto creds = m_db.getUserByEmail(normalized);
    if (!creds) {
        // Same KDF cost as a real check so latency does not reveal unknown emails
        m_hasher.burnVerification(password);
        m_log.warn("login failed");
        throw InvalidCredentialsError();
    }
    if (!m_hasher.verifyPassword(password, creds->password_hash)) {
        m_log.warn("login failed");
        throw InvalidCredentialsError();
    }

    startSession(creds->user);
    m_log.info("user " + std::to_string(creds->user.id) + " logged in");
    return creds->user;
}

void AccountService::logout() {
    m_session.clearSession();
    if (m_currentUser) {
        m_log.info("user " + std::to_string(m_currentUser->id) + " logged out");
    }
    m_currentUser.reset();
}

std::optional<User> AccountService::getCurrentUser() {
    m_currentUser = m_session.getCurrentUser();
    return m_currentUser;
}

void AccountService::changePassword(int userId, const std::string& currentPassword,
                                    const std::string& newPassword) {
    auto creds = m_db.getUserCredentialsById(userId);
    if (!creds) {
        throw NotFoundError("User " + std::to_string(userId) + " not found");
    }
    if (!m_hasher.verifyPassword(currentPassword, creds->password_hash)) {
        m_log.warn("password change rejected for user " + std::to_string(userId));
        throw InvalidCredentialsError("Current password is incorrect");
    }
    requirePasswordPolicy(newPassword);

    m_db.updatePasswordHash(userId, m_hasher.createCredential(newPassword));
    m_log.info("password changed for user " + std::to_string(userId));
}

void AccountService::updateProfile(int userId, const ProfileData& profile) {
    if (profile.age && *profile.age < 0) {
        throw ValidationError("Age must not be negative");
    }
    requireUser(userId);
    m_db.createOrUpdateProfile(userId, profile);
}

std::optional<UserProfile> AccountService::getProfile(int userId) const {
    return m_db.getUserProfile(userId);
}

// ---- Activities ----

std::vector<Activity> AccountService::listActivities(int userId) const {
    return m_db.getActivitiesByUser(userId);
}

int AccountService::createActivity(int userId, const ActivityData& activity) {
    if (trim_copy(activity.name).empty()) {
        throw ValidationError("Activity name is required");
    }
    requireUser(userId);
    return m_db.createActivity(userId, activity);
}

void AccountService::updateActivity(int userId, int activityId, const ActivityData& activity) {
    if (trim_copy(activity.name).empty()) {
        throw ValidationError("Activity name is required");
    }
    requireOwnedActivity(userId, activityId);
    m_db.updateActivity(activityId, activity);
}

void AccountService::deleteActivity(int userId, int activityId) {
    requireOwnedActivity(userId, activityId);
    m_db.deleteActivity(activityId);
    m_log.debug("activity " + std::to_string(activityId) + " deactivated");
}

void AccountService::logActivity(int userId, int activityId, const std::string& date,
                                 bool completed, const std::optional<double>& value,
                                 const std::optional<std::string>& notes) {
    requireDate(date, "Log date");
    const Activity activity = requireOwnedActivity(userId, activityId);
    if (!activity.is_active) {
        throw NotFoundError("Activity " + std::to_string(activityId) + " not found");
    }
    m_db.logActivity(userId, activityId, date, completed, value, notes);
}

std::map<int, LogEntry> AccountService::getTodayLogs(int userId, const std::string& date) const {
    requireDate(date, "Log date");
    std::map<int, LogEntry> out;
    for (auto& row : m_db.getActivityLogsForDate(userId, date)) {
        out[row.activity_id] = std::move(row.entry);
    }
    return out;
}

std::vector<ActivityStat> AccountService::getStats(int userId, const std::string& startDate,
                                                   const std::string& endDate) const {
    requireDate(startDate, "Start date");
    requireDate(endDate, "End date");
    if (startDate > endDate) {
        throw ValidationError("Start date must not be after end date");
    }
    return m_db.getActivityStats(userId, startDate, endDate);
}

// ---- Workouts & measurements ----

int AccountService::logWorkout(int userId, const WorkoutData& workout) {
    if (trim_copy(workout.workout_type).empty()) {
        throw ValidationError("Workout type is required");
    }
    if (workout.duration_minutes && *workout.duration_minutes < 0) {
        throw ValidationError("Duration must not be negative");
    }
    requireDate(workout.session_date, "Session date");
    requireUser(userId);
    return m_db.createWorkoutSession(userId, workout);
}

std::vector<WorkoutSession> AccountService::listWorkouts(int userId, const std::string& startDate,
                                                         const std::string& endDate) const {
    requireDate(startDate, "Start date");
    requireDate(endDate, "End date");
    return m_db.getWorkoutSessions(userId, startDate, endDate);
}

int AccountService::logMeasurement(int userId, const MeasurementData& measurement) {
    requireDate(measurement.measurement_date, "Measurement date");
    requireUser(userId);
    return m_db.addBodyMeasurement(userId, measurement);
}

std::vector<BodyMeasurement> AccountService::listMeasurements(int userId, int limit) const {
    if (limit <= 0) {
        throw ValidationError("Limit must be positive");
    }
    return m_db.getBodyMeasurements(userId, limit);
}

// ---- Data management ----

void AccountService::clearUserData(int userId) {
    requireUser(userId);
    m_db.clearUserData(userId);
    m_log.info("cleared data of user " + std::to_string(userId));
}

void AccountService::deleteAccount(int userId) {
    if (!m_db.deleteUser(userId)) {
        throw NotFoundError("User " + std::to_string(userId) + " not found");
    }
    m_log.info("deleted user " + std::to_string(userId));

    auto persisted = m_session.getCurrentUser();
    if ((persisted && persisted->id == userId) ||
        (m_currentUser && m_currentUser->id == userId)) {
        logout();
    }
}
