// tests/account_service.cpp
#include <catch2/catch_all.hpp>
#include "AccountService.hpp"
#include "Errors.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace {
    // Fresh store, session file and service per test case
    struct Env {
        TempFile dbFile{ "tmp_test_accounts.sqlite" };
        TempFile sessionFile{ "tmp_test_accounts_session.json" };
        Logger log{ "", LogLevel::kError };
        DatabaseManager db{ dbFile.path };
        SessionStore session{ sessionFile.path };
        AccountService accounts{ db, session, PasswordHasher(fast_kdf()), log };

        Env() { db.init(); }
        explicit Env(const KdfParams& kdf)
            : accounts(db, session, PasswordHasher(kdf), log) { db.init(); }
    };

    double median_login_ms(AccountService& accounts, const std::string& email,
                           const std::string& pw, int rounds) {
        std::vector<double> samples;
        for (int i = 0; i < rounds; ++i) {
            const auto start = std::chrono::steady_clock::now();
            REQUIRE_THROWS_AS(accounts.login(email, pw), InvalidCredentialsError);
            const std::chrono::duration<double, std::milli> took =
                std::chrono::steady_clock::now() - start;
            samples.push_back(took.count());
        }
        std::sort(samples.begin(), samples.end());
        return samples[samples.size() / 2];
    }

    std::string message_of_login(AccountService& accounts,
                                 const std::string& email, const std::string& pw) {
        try {
            accounts.login(email, pw);
        } catch (const InvalidCredentialsError& ex) {
            return ex.what();
        }
        return "<no error>";
    }
}

TEST_CASE("Register then login returns the same user", "[account]") {
    Env env;
    User alice = env.accounts.registerUser("alice@test.com", "Passw0rd!", "Alice A");
    REQUIRE(alice.id > 0);
    REQUIRE(alice.email == "alice@test.com");
    REQUIRE(alice.full_name == "Alice A");
    REQUIRE(env.accounts.isAuthenticated());

    REQUIRE(env.accounts.listActivities(alice.id).size() == 7);
    REQUIRE(env.accounts.getProfile(alice.id).has_value());

    env.accounts.logout();
    REQUIRE_FALSE(env.accounts.isAuthenticated());

    User again = env.accounts.login("alice@test.com", "Passw0rd!");
    REQUIRE(again.id == alice.id);
    REQUIRE(env.accounts.isAuthenticated());

    // Email is case-normalized on both paths
    env.accounts.logout();
    REQUIRE(env.accounts.login("  ALICE@Test.com ", "Passw0rd!").id == alice.id);
}

TEST_CASE("Default catalog matches the stored activities", "[account]") {
    Env env;
    User u = env.accounts.registerUser("cat@test.com", "Passw0rd!", "Cat C");
    const auto& defaults = AccountService::defaultActivities();
    REQUIRE(defaults.size() == 7);

    auto stored = env.accounts.listActivities(u.id);
    for (const auto& d : defaults) {
        bool found = false;
        for (const auto& a : stored) {
            if (a.name == d.name && a.category == d.category && a.target_unit == d.target_unit) {
                found = true;
            }
        }
        INFO(d.name);
        REQUIRE(found);
    }
}

TEST_CASE("Login failures are indistinguishable", "[account]") {
    Env env;
    env.accounts.registerUser("alice@test.com", "Passw0rd!", "Alice A");
    env.accounts.logout();

    const std::string wrongPw  = message_of_login(env.accounts, "alice@test.com", "wrongpass");
    const std::string unknown  = message_of_login(env.accounts, "nobody@test.com", "Passw0rd!");
    REQUIRE(wrongPw == "Invalid email or password");
    REQUIRE(unknown == wrongPw);
    REQUIRE_FALSE(env.accounts.isAuthenticated());
}

TEST_CASE("Unknown email pays the same KDF cost as a wrong password", "[account][timing]") {
    KdfParams kdf;
    kdf.iterations  = 2;
    kdf.memory_kib  = 8 * 1024;
    kdf.parallelism = 1;
    Env env(kdf);
    env.accounts.registerUser("tim@test.com", "Passw0rd!", "Tim T");
    env.accounts.logout();

    const int rounds = 7;
    const double wrongPw = median_login_ms(env.accounts, "tim@test.com", "Wr0ngPass!", rounds);
    const double unknown = median_login_ms(env.accounts, "ghost@test.com", "Wr0ngPass!", rounds);
    INFO("wrong password median " << wrongPw << " ms, unknown email median " << unknown << " ms");
    REQUIRE(unknown >= wrongPw * 0.5);
    REQUIRE(unknown <= wrongPw * 2.0);
}

TEST_CASE("Registration validation", "[account]") {
    Env env;

    SECTION("bad email") {
        REQUIRE_THROWS_AS(env.accounts.registerUser("alice.test.com", "Passw0rd!", "Alice"),
                          ValidationError);
    }
    SECTION("weak password lists each violated rule") {
        try {
            env.accounts.registerUser("alice@test.com", "weak", "Alice");
            FAIL("weak password accepted");
        } catch (const ValidationError& ex) {
            REQUIRE(ex.errors().size() == 3); // length, uppercase, digit
            REQUIRE(std::string(ex.what()).find(". ") != std::string::npos);
        }
    }
    SECTION("short name") {
        REQUIRE_THROWS_AS(env.accounts.registerUser("alice@test.com", "Passw0rd!", " A "),
                          ValidationError);
    }
    SECTION("duplicate email, regardless of case") {
        env.accounts.registerUser("alice@test.com", "Passw0rd!", "Alice A");
        REQUIRE_THROWS_AS(env.accounts.registerUser("Alice@TEST.com", "Passw0rd!", "Alice B"),
                          DuplicateEmailError);
    }
    REQUIRE(env.db.getUserByEmail("alice@test.com").has_value() == env.accounts.isAuthenticated());
}

TEST_CASE("Registration keeps the account when the session cannot be written", "[account][session]") {
    TempFile dbFile("tmp_test_accounts_nosession.sqlite");
    TempFile blocker("tmp_test_session_blocker");
    { std::ofstream(blocker.path) << "regular file"; }

    Logger log("", LogLevel::kError);
    DatabaseManager db(dbFile.path);
    db.init();
    // Parent of the session file is a regular file, so the write fails
    SessionStore session(blocker.path + "/session.json");
    AccountService accounts(db, session, PasswordHasher(fast_kdf()), log);

    User u;
    REQUIRE_NOTHROW(u = accounts.registerUser("ivy@test.com", "Passw0rd!", "Ivy I"));
    REQUIRE(u.id > 0);
    REQUIRE(accounts.isAuthenticated());
    REQUIRE(db.getUserByEmail("ivy@test.com").has_value());
    REQUIRE(accounts.listActivities(u.id).size() == 7);
    REQUIRE_FALSE(session.getCurrentUser().has_value());
}

TEST_CASE("Rejected registrations and logins keep the email out of the log", "[account][logging]") {
    TempFile dbFile("tmp_test_accounts_pii.sqlite");
    TempFile sessionFile("tmp_test_accounts_pii_session.json");
    TempFile logFile("tmp_test_accounts_pii.log");
    {
        Logger log(logFile.path, LogLevel::kDebug);
        DatabaseManager db(dbFile.path);
        db.init();
        SessionStore session(sessionFile.path);
        AccountService accounts(db, session, PasswordHasher(fast_kdf()), log);

        accounts.registerUser("secret.person@test.com", "Passw0rd!", "Sec S");
        REQUIRE_THROWS_AS(accounts.registerUser("secret.person@test.com", "Passw0rd!", "Sec S"),
                          DuplicateEmailError);
        accounts.logout();
        REQUIRE_THROWS_AS(accounts.login("secret.person@test.com", "Wr0ngPass!"),
                          InvalidCredentialsError);
        REQUIRE_THROWS_AS(accounts.login("other.person@test.com", "Wr0ngPass!"),
                          InvalidCredentialsError);
    }

    std::ifstream in(logFile.path);
    const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(text.find("registration rejected") != std::string::npos);
    REQUIRE(text.find("login failed") != std::string::npos);
    REQUIRE(text.find("person@test.com") == std::string::npos);
}

TEST_CASE("Change password", "[account]") {
    Env env;
    User u = env.accounts.registerUser("pat@test.com", "Passw0rd!", "Pat P");

    REQUIRE_THROWS_AS(env.accounts.changePassword(u.id, "WrongPass1", "N3wPassword"),
                      InvalidCredentialsError);
    REQUIRE_THROWS_AS(env.accounts.changePassword(u.id, "Passw0rd!", "short"),
                      ValidationError);
    REQUIRE_THROWS_AS(env.accounts.changePassword(u.id + 100, "Passw0rd!", "N3wPassword"),
                      NotFoundError);

    env.accounts.changePassword(u.id, "Passw0rd!", "N3wPassword");
    env.accounts.logout();
    REQUIRE_THROWS_AS(env.accounts.login("pat@test.com", "Passw0rd!"), InvalidCredentialsError);
    REQUIRE(env.accounts.login("pat@test.com", "N3wPassword").id == u.id);
}

TEST_CASE("Session survives restart and logout is idempotent", "[account]") {
    Env env;
    User u = env.accounts.registerUser("sam@test.com", "Passw0rd!", "Sam S");

    AccountService restarted(env.db, env.session, PasswordHasher(fast_kdf()), env.log);
    REQUIRE_FALSE(restarted.isAuthenticated());
    auto current = restarted.getCurrentUser();
    REQUIRE(current.has_value());
    REQUIRE(current->id == u.id);
    REQUIRE(restarted.isAuthenticated());

    restarted.logout();
    REQUIRE_NOTHROW(restarted.logout());
    REQUIRE_FALSE(restarted.getCurrentUser().has_value());
}

TEST_CASE("Logging the same day twice keeps one row with the last state", "[account][logs]") {
    Env env;
    User u = env.accounts.registerUser("lee@test.com", "Passw0rd!", "Lee L");
    int a = env.accounts.listActivities(u.id).front().id;

    env.accounts.logActivity(u.id, a, "2024-01-01", true);
    env.accounts.logActivity(u.id, a, "2024-01-01", true);
    REQUIRE(env.db.test_countLogs(a, "2024-01-01") == 1);
    REQUIRE(env.accounts.getTodayLogs(u.id, "2024-01-01").at(a).completed);

    env.accounts.logActivity(u.id, a, "2024-01-01", false, 3.0, std::string("tired"));
    REQUIRE(env.db.test_countLogs(a, "2024-01-01") == 1);

    auto logs = env.accounts.getTodayLogs(u.id, "2024-01-01");
    REQUIRE(logs.size() == 1);
    REQUIRE_FALSE(logs.at(a).completed);
    REQUIRE(logs.at(a).actual_value.value() == Catch::Approx(3.0));
    REQUIRE(logs.at(a).notes == std::string("tired"));

    REQUIRE_THROWS_AS(env.accounts.logActivity(u.id, a, "01/01/2024", true), ValidationError);
}

TEST_CASE("Stats over an empty range report zero rates", "[account][stats]") {
    Env env;
    User u = env.accounts.registerUser("zed@test.com", "Passw0rd!", "Zed Z");

    auto stats = env.accounts.getStats(u.id, "2024-01-01", "2024-01-31");
    REQUIRE(stats.size() == 7);
    for (const auto& s : stats) {
        REQUIRE(s.total_count == 0);
        REQUIRE(s.completion_rate == 0.0);
    }
    REQUIRE_THROWS_AS(env.accounts.getStats(u.id, "2024-02-01", "2024-01-01"), ValidationError);
}

TEST_CASE("Users cannot touch each other's activities", "[account][isolation]") {
    Env env;
    User a = env.accounts.registerUser("a@test.com", "Passw0rd!", "Aa Aa");
    User b = env.accounts.registerUser("b@test.com", "Passw0rd!", "Bb Bb");
    int bActivity = env.accounts.listActivities(b.id).front().id;

    REQUIRE_THROWS_AS(env.accounts.logActivity(a.id, bActivity, "2024-01-01", true), NotFoundError);
    REQUIRE_THROWS_AS(env.accounts.deleteActivity(a.id, bActivity), NotFoundError);
    REQUIRE_THROWS_AS(env.accounts.updateActivity(a.id, bActivity, ActivityData{ "Mine", "", "", std::nullopt, "", "" }),
                      NotFoundError);
    REQUIRE(env.accounts.listActivities(b.id).size() == 7);
    REQUIRE(env.accounts.getTodayLogs(b.id, "2024-01-01").empty());
}

TEST_CASE("Custom activities: create, edit, soft delete", "[account][activities]") {
    Env env;
    User u = env.accounts.registerUser("kim@test.com", "Passw0rd!", "Kim K");

    REQUIRE_THROWS_AS(env.accounts.createActivity(u.id, ActivityData{ "  ", "", "", std::nullopt, "", "" }),
                      ValidationError);

    int id = env.accounts.createActivity(u.id, ActivityData{ "Plank", "core", "P", 2.0, "minutes", "exercise" });
    REQUIRE(env.accounts.listActivities(u.id).size() == 8);

    env.accounts.updateActivity(u.id, id, ActivityData{ "Side plank", "core", "P", 3.0, "minutes", "exercise" });
    REQUIRE(env.accounts.listActivities(u.id).front().name == "Side plank");

    env.accounts.deleteActivity(u.id, id);
    REQUIRE(env.accounts.listActivities(u.id).size() == 7);
    // A deactivated activity cannot be logged any more
    REQUIRE_THROWS_AS(env.accounts.logActivity(u.id, id, "2024-01-01", true), NotFoundError);
}

TEST_CASE("Profile, workouts and measurements", "[account]") {
    Env env;
    User u = env.accounts.registerUser("max@test.com", "Passw0rd!", "Max M");

    ProfileData p;
    p.age = 40;
    p.fitness_goal = "lose weight";
    env.accounts.updateProfile(u.id, p);
    REQUIRE(env.accounts.getProfile(u.id)->data.age == 40);
    REQUIRE_THROWS_AS(env.accounts.updateProfile(u.id + 100, p), NotFoundError);
    p.age = -1;
    REQUIRE_THROWS_AS(env.accounts.updateProfile(u.id, p), ValidationError);
    REQUIRE(env.accounts.getProfile(u.id)->data.age == 40);

    WorkoutData w;
    w.workout_type = "row";
    w.session_date = "2024-06-01";
    REQUIRE(env.accounts.logWorkout(u.id, w) > 0);
    REQUIRE(env.accounts.listWorkouts(u.id, "2024-06-01", "2024-06-30").size() == 1);
    w.duration_minutes = -30;
    REQUIRE_THROWS_AS(env.accounts.logWorkout(u.id, w), ValidationError);
    w.duration_minutes = 30;
    w.session_date = "2024-02-30";
    REQUIRE_THROWS_AS(env.accounts.logWorkout(u.id, w), ValidationError);
    w.session_date = "2024-06-01";
    REQUIRE(env.accounts.listWorkouts(u.id, "2024-06-01", "2024-06-30").size() == 1);
    w.workout_type = "";
    REQUIRE_THROWS_AS(env.accounts.logWorkout(u.id, w), ValidationError);

    MeasurementData m;
    m.weight = 90.0;
    m.measurement_date = "2024-06-01";
    REQUIRE(env.accounts.logMeasurement(u.id, m) > 0);
    REQUIRE(env.accounts.listMeasurements(u.id).size() == 1);
    REQUIRE_THROWS_AS(env.accounts.listMeasurements(u.id, 0), ValidationError);
}

TEST_CASE("Deleting an account cascades and ends its session", "[account][cascade]") {
    Env env;
    User keep = env.accounts.registerUser("keep@test.com", "Passw0rd!", "Keep K");
    User gone = env.accounts.registerUser("gone@test.com", "Passw0rd!", "Gone G");
    env.accounts.logActivity(gone.id, env.accounts.listActivities(gone.id).front().id, "2024-01-01", true);
    env.accounts.logActivity(keep.id, env.accounts.listActivities(keep.id).front().id, "2024-01-01", true);

    env.accounts.deleteAccount(gone.id);
    REQUIRE_FALSE(env.accounts.isAuthenticated());
    REQUIRE_FALSE(env.session.getCurrentUser().has_value());
    REQUIRE(env.db.test_countRows("fitness_activities", gone.id) == 0);
    REQUIRE(env.db.test_countRows("activity_logs", gone.id) == 0);
    REQUIRE(env.db.test_countRows("user_profiles", gone.id) == 0);
    REQUIRE(env.db.test_countRows("fitness_activities", keep.id) == 7);
    REQUIRE(env.db.test_countRows("activity_logs", keep.id) == 1);
    REQUIRE_THROWS_AS(env.accounts.login("gone@test.com", "Passw0rd!"), InvalidCredentialsError);
    REQUIRE_THROWS_AS(env.accounts.deleteAccount(gone.id), NotFoundError);

    env.accounts.clearUserData(keep.id);
    REQUIRE(env.db.test_countRows("fitness_activities", keep.id) == 0);
    REQUIRE(env.accounts.login("keep@test.com", "Passw0rd!").id == keep.id);
}
