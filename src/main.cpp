// src/main.cpp
#include "AccountService.hpp"
#include "AppConfig.hpp"
#include "DatabaseManager.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "SessionStore.hpp"
#include "console_io.hpp"
#include "time_util.hpp"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

// ----- Small helpers -----

static std::optional<int> prompt_id(const std::string& message) {
    try {
        return std::stoi(prompt_line(message));
    } catch (const std::logic_error&) {
        std::cout << "Invalid id.\n";
        return std::nullopt;
    }
}

static void ensure_parent_dir(const std::string& path) {
    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);
}

// ----- Anonymous state -----

static std::optional<User> action_register(AccountService& accounts) {
    std::string email    = prompt_line("Email: ");
    std::string fullName = prompt_line("Full name: ");
    std::string pw1      = prompt_hidden("Password: ");
    std::string pw2      = prompt_hidden("Confirm password: ");
    if (pw1 != pw2) {
        std::cout << "Passwords do not match.\n";
        return std::nullopt;
    }
    try {
        User user = accounts.registerUser(email, pw1, fullName);
        std::cout << "Account created successfully!\n";
        return user;
    } catch (const FitTrackError& ex) {
        std::cout << "Error: " << ex.what() << "\n";
    }
    return std::nullopt;
}

static std::optional<User> action_login(AccountService& accounts) {
    std::string email = prompt_line("Email: ");
    std::string pw    = prompt_hidden("Password: ");
    try {
        User user = accounts.login(email, pw);
        std::cout << "Welcome back, " << user.full_name << "!\n";
        return user;
    } catch (const FitTrackError& ex) {
        std::cout << "Error: " << ex.what() << "\n";
    }
    return std::nullopt;
}

// ----- Authenticated menu actions -----

static void action_list(AccountService& accounts, const User& user) {
    const std::string today = utc_date();
    auto activities = accounts.listActivities(user.id);
    auto logs = accounts.getTodayLogs(user.id, today);

    std::size_t done = 0;
    for (const auto& a : activities) {
        auto it = logs.find(a.id);
        const bool completed = it != logs.end() && it->second.completed;
        if (completed) ++done;
        std::cout << "  [" << (completed ? "x" : " ") << "] " << a.id << ") " << a.name;
        if (a.target_value) std::cout << "  target " << *a.target_value << " " << a.target_unit;
        std::cout << "\n";
    }
    const int pct = activities.empty()
        ? 0 : static_cast<int>(done * 100 / activities.size());
    std::cout << today << ": " << done << "/" << activities.size()
              << " done (" << pct << "%)\n";
}

static void action_toggle(AccountService& accounts, const User& user) {
    auto id = prompt_id("Activity id to toggle: ");
    if (!id) return;
    const std::string today = utc_date();
    auto logs = accounts.getTodayLogs(user.id, today);
    auto it = logs.find(*id);
    const bool next = !(it != logs.end() && it->second.completed);

    std::optional<double> value;
    if (next) value = prompt_optional_number("Actual value (blank=skip): ");
    accounts.logActivity(user.id, *id, today, next, value);
    std::cout << (next ? "Marked done.\n" : "Marked not done.\n");
}

static void action_add(AccountService& accounts, const User& user) {
    ActivityData a;
    a.name         = prompt_line("Name: ");
    a.description  = prompt_line("Description: ");
    a.icon         = prompt_line("Icon: ");
    a.target_value = prompt_optional_number("Target value (blank=none): ");
    a.target_unit  = prompt_line("Target unit: ");
    a.category     = prompt_line("Category (exercise/nutrition/recovery/tracking): ");
    if (a.category.empty()) a.category = "exercise";
    int id = accounts.createActivity(user.id, a);
    std::cout << "Added activity with id " << id << "\n";
}

static void action_delete(AccountService& accounts, const User& user) {
    auto id = prompt_id("Activity id to delete: ");
    if (!id) return;
    if (prompt_line("Type 'YES' to confirm deletion: ") == "YES") {
        accounts.deleteActivity(user.id, *id);
        std::cout << "Deleted activity " << *id << ".\n";
    } else {
        std::cout << "Aborted.\n";
    }
}

static void action_stats(AccountService& accounts, const User& user) {
    const std::string start = utc_date(6);
    const std::string end   = utc_date();
    std::cout << "Stats " << start << " .. " << end << "\n";
    for (const auto& s : accounts.getStats(user.id, start, end)) {
        std::cout << "  " << s.name << " [" << s.category << "]  "
                  << s.completed_count << "/" << s.total_count << "  "
                  << std::fixed << std::setprecision(1) << s.completion_rate << "%\n";
    }
}

static void action_workout(AccountService& accounts, const User& user) {
    WorkoutData w;
    w.workout_type    = prompt_line("Workout type: ");
    w.duration_minutes = prompt_optional_count("Duration minutes (blank=skip): ");
    w.calories_burned = prompt_optional_number("Calories burned (blank=skip): ");
    w.intensity       = prompt_optional_text("Intensity (blank=skip): ");
    w.notes           = prompt_optional_text("Notes (blank=skip): ");
    w.session_date    = utc_date();
    int id = accounts.logWorkout(user.id, w);
    std::cout << "Logged workout " << id << "\n";
}

static void action_measurement(AccountService& accounts, const User& user) {
    MeasurementData m;
    m.weight              = prompt_optional_number("Weight (blank=skip): ");
    m.body_fat_percentage = prompt_optional_number("Body fat % (blank=skip): ");
    m.muscle_mass         = prompt_optional_number("Muscle mass (blank=skip): ");
    m.waist_circumference = prompt_optional_number("Waist (blank=skip): ");
    m.measurement_date    = utc_date();
    int id = accounts.logMeasurement(user.id, m);
    std::cout << "Logged measurement " << id << "\n";
}

static void action_profile(AccountService& accounts, const User& user) {
    ProfileData p = accounts.getProfile(user.id).value_or(UserProfile{}).data;
    if (auto age = prompt_optional_count("Age (blank=keep): ")) p.age = age;
    if (auto w = prompt_optional_number("Weight (blank=keep): ")) p.weight = w;
    if (auto h = prompt_optional_number("Height (blank=keep): ")) p.height = h;
    if (auto g = prompt_optional_text("Gender (blank=keep): ")) p.gender = g;
    if (auto goal = prompt_optional_text("Fitness goal (blank=keep): ")) p.fitness_goal = goal;
    accounts.updateProfile(user.id, p);
    std::cout << "Profile updated.\n";
}

static void action_change_password(AccountService& accounts, const User& user) {
    std::string current = prompt_hidden("Current password: ");
    std::string new1    = prompt_hidden("New password: ");
    std::string new2    = prompt_hidden("Confirm new password: ");
    if (new1 != new2) {
        std::cout << "Mismatch.\n";
    } else {
        accounts.changePassword(user.id, current, new1);
        std::cout << "Password changed.\n";
    }
    std::fill(current.begin(), current.end(), '\0');
    std::fill(new1.begin(), new1.end(), '\0');
    std::fill(new2.begin(), new2.end(), '\0');
}

// ----- Main -----

int main(int argc, char** argv) {
    try {
        const std::string configPath = argc > 1 ? argv[1] : "fittrack.conf";
        AppConfig config = load_config(configPath);

        Logger log(config.log_file, config.log_level);
        log.info("fittrack starting, database " + config.database_file);

        ensure_parent_dir(config.database_file);
        DatabaseManager db(config.database_file);
        db.init();

        SessionStore session(config.session_file);
        AccountService accounts(db, session, PasswordHasher(config.kdf), log);

        std::optional<User> user = accounts.getCurrentUser();
        if (user) std::cout << "Signed in as " << user->email << "\n";

        for (;;) {
            if (!user) {
                std::cout << "\n=== fittrack ===\n"
                             "1) Login\n"
                             "2) Register\n"
                             "q) Quit\n";
                std::string choice = prompt_line("> ");
                if (choice == "1") user = action_login(accounts);
                else if (choice == "2") user = action_register(accounts);
                else if (choice == "q" || choice == "Q" || std::cin.eof()) break;
                else std::cout << "Unknown option.\n";
                continue;
            }

            std::cout << "\n=== " << user->full_name << " ===\n"
                         "1) Today's activities\n"
                         "2) Toggle activity for today\n"
                         "3) Add activity\n"
                         "4) Delete activity\n"
                         "5) Last 7 days stats\n"
                         "6) Log workout\n"
                         "7) Log body measurement\n"
                         "8) Update profile\n"
                         "9) Change password\n"
                         "l) Logout\n"
                         "q) Quit\n";
            std::string choice = prompt_line("> ");

            try {
                if (choice == "1") action_list(accounts, *user);
                else if (choice == "2") action_toggle(accounts, *user);
                else if (choice == "3") action_add(accounts, *user);
                else if (choice == "4") action_delete(accounts, *user);
                else if (choice == "5") action_stats(accounts, *user);
                else if (choice == "6") action_workout(accounts, *user);
                else if (choice == "7") action_measurement(accounts, *user);
                else if (choice == "8") action_profile(accounts, *user);
                else if (choice == "9") action_change_password(accounts, *user);
                else if (choice == "l" || choice == "L") {
                    accounts.logout();
                    user.reset();
                }
                else if (choice == "q" || choice == "Q" || std::cin.eof()) break;
                else std::cout << "Unknown option.\n";
            } catch (const FitTrackError& ex) {
                if (dynamic_cast<const StorageError*>(&ex)) throw;
                std::cout << "Error: " << ex.what() << "\n";
            }
        }

        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "[Fatal] " << ex.what() << "\n";
        return 99;
    }
}
