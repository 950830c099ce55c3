#pragma once
#include <optional>
#include <string>

// Public user record. Never carries the password hash.
struct User {
    int id = 0;
    std::string email;
    std::string full_name;
    std::string created_at;   // ISO-8601 (UTC)
};

// Internal row used by login / change-password only
struct UserCredentials {
    User user;
    std::string password_hash; // "salt:digest"
};

struct ProfileData {
    std::optional<int>         age;
    std::optional<double>      weight;
    std::optional<double>      height;
    std::optional<std::string> gender;
    std::optional<std::string> fitness_goal;
};

struct UserProfile {
    int id = 0;
    int user_id = 0;
    ProfileData data;
};

// Editable fields of an activity
struct ActivityData {
    std::string name;
    std::string description;
    std::string icon;
    std::optional<double> target_value;
    std::string target_unit;
    std::string category;
};

struct Activity {
    int id = 0;
    int user_id = 0;
    std::string name;
    std::string description;
    std::string icon;
    std::optional<double> target_value;
    std::string target_unit;
    std::string category;
    bool is_active = true;
    std::string created_at;
};

// Per-day log state of one activity, as handed to the presentation layer
struct LogEntry {
    bool completed = false;
    std::optional<double> actual_value;
    std::optional<std::string> notes;
};

// activity_logs row joined with its activity
struct ActivityLogDetail {
    int id = 0;
    int activity_id = 0;
    int user_id = 0;
    std::string log_date;     // YYYY-MM-DD
    LogEntry entry;
    std::string logged_at;

    std::string name;
    std::string description;
    std::string icon;
    std::optional<double> target_value;
    std::string target_unit;
    std::string category;
};

struct ActivityStat {
    int activity_id = 0;
    std::string name;
    std::string category;
    int completed_count = 0;
    int total_count = 0;
    double completion_rate = 0.0; // percent, 0 when total_count == 0
};

struct WorkoutData {
    std::string workout_type;
    std::optional<int> duration_minutes;
    std::optional<double> calories_burned;
    std::optional<std::string> intensity;
    std::optional<std::string> notes;
    std::string session_date; // YYYY-MM-DD
};

struct WorkoutSession {
    int id = 0;
    int user_id = 0;
    WorkoutData data;
    std::string created_at;
};

struct MeasurementData {
    std::optional<double> weight;
    std::optional<double> body_fat_percentage;
    std::optional<double> muscle_mass;
    std::optional<double> waist_circumference;
    std::string measurement_date; // YYYY-MM-DD
};

struct BodyMeasurement {
    int id = 0;
    int user_id = 0;
    MeasurementData data;
    std::string created_at;
};
