// tests/db_schema.cpp
#include <catch2/catch_all.hpp>
#include "DatabaseManager.hpp"
#include "Errors.hpp"
#include "test_support.hpp"

TEST_CASE("DB: users are unique by email and never expose the hash publicly", "[db][users]") {
    TempFile file("tmp_test_users.sqlite");
    DatabaseManager db(file.path);
    REQUIRE_NOTHROW(db.init());
    REQUIRE_NOTHROW(db.init()); // idempotent

    REQUIRE_FALSE(db.getUserByEmail("alice@test.com").has_value());

    int id = db.createUser("alice@test.com", "salt:hash", "Alice A");
    REQUIRE(id > 0);

    auto creds = db.getUserByEmail("alice@test.com");
    REQUIRE(creds.has_value());
    REQUIRE(creds->user.id == id);
    REQUIRE(creds->password_hash == "salt:hash");
    REQUIRE(creds->user.created_at.size() == 20); // YYYY-MM-DDTHH:MM:SSZ

    auto user = db.getUserById(id);
    REQUIRE(user.has_value());
    REQUIRE(user->email == "alice@test.com");
    REQUIRE(user->full_name == "Alice A");

    try {
        db.createUser("alice@test.com", "other:hash", "Imposter");
        FAIL("duplicate email accepted");
    } catch (const StorageError& ex) {
        REQUIRE(ex.isUniqueViolation());
    }

    REQUIRE(db.updatePasswordHash(id, "new:hash"));
    REQUIRE(db.getUserCredentialsById(id)->password_hash == "new:hash");
    REQUIRE_FALSE(db.updatePasswordHash(id + 100, "x:y"));
}

TEST_CASE("DB: profile upsert keeps exactly one row per user", "[db][profile]") {
    TempFile file("tmp_test_profile.sqlite");
    DatabaseManager db(file.path);
    db.init();
    int id = db.createUser("bob@test.com", "s:h", "Bob B");

    db.createOrUpdateProfile(id, ProfileData{});
    auto empty = db.getUserProfile(id);
    REQUIRE(empty.has_value());
    REQUIRE_FALSE(empty->data.age.has_value());
    REQUIRE_FALSE(empty->data.gender.has_value());

    ProfileData p;
    p.age = 33;
    p.weight = 72.5;
    p.height = 180.0;
    p.gender = "male";
    p.fitness_goal = "run a marathon";
    db.createOrUpdateProfile(id, p);

    auto got = db.getUserProfile(id);
    REQUIRE(got->id == empty->id);
    REQUIRE(got->data.age == 33);
    REQUIRE(got->data.weight.value() == Catch::Approx(72.5));
    REQUIRE(got->data.fitness_goal == std::string("run a marathon"));
    REQUIRE(db.test_countRows("user_profiles", id) == 1);

    // Profile for a missing user violates the foreign key
    REQUIRE_THROWS_AS(db.createOrUpdateProfile(id + 50, p), StorageError);
}

TEST_CASE("DB: activity CRUD and scoped soft delete", "[db][activities]") {
    TempFile file("tmp_test_activities.sqlite");
    DatabaseManager db(file.path);
    db.init();
    int uid = db.createUser("carol@test.com", "s:h", "Carol C");

    ActivityData walk{ "Walk", "Evening walk", "W", 5000.0, "steps", "exercise" };
    ActivityData read{ "Read", "", "", std::nullopt, "", "recovery" };
    int a1 = db.createActivity(uid, walk);
    int a2 = db.createActivity(uid, read);

    auto list = db.getActivitiesByUser(uid);
    REQUIRE(list.size() == 2);
    REQUIRE(list.front().id == a2); // newest first

    auto got = db.getActivityById(a1);
    REQUIRE(got.has_value());
    REQUIRE(got->target_value.value() == Catch::Approx(5000.0));
    REQUIRE(got->is_active);
    REQUIRE_FALSE(db.getActivityById(a2)->target_value.has_value());

    walk.name = "Long walk";
    REQUIRE(db.updateActivity(a1, walk));
    REQUIRE(db.getActivityById(a1)->name == "Long walk");
    REQUIRE(db.getActivityById(a2)->name == "Read");

    REQUIRE(db.deleteActivity(a1));
    auto after = db.getActivitiesByUser(uid);
    REQUIRE(after.size() == 1);
    REQUIRE(after.front().id == a2);                 // the other one untouched
    REQUIRE(db.getActivityById(a1).has_value());     // row still there
    REQUIRE_FALSE(db.getActivityById(a1)->is_active);
    REQUIRE_FALSE(db.deleteActivity(9999));
}

TEST_CASE("DB: free text is bound, never interpolated", "[db][activities]") {
    TempFile file("tmp_test_injection.sqlite");
    DatabaseManager db(file.path);
    db.init();
    int uid = db.createUser("dave@test.com", "s:h", "Dave D");

    const std::string evil = "x'); DELETE FROM users; --";
    int aid = db.createActivity(uid, ActivityData{ evil, evil, "", std::nullopt, "", evil });
    db.logActivity(uid, aid, "2024-01-01", true, std::nullopt, evil);

    REQUIRE(db.getActivityById(aid)->name == evil);
    REQUIRE(db.getActivityLogsForDate(uid, "2024-01-01").front().entry.notes == evil);
    REQUIRE(db.getUserById(uid).has_value());
}

TEST_CASE("DB: workout sessions and body measurements", "[db][workouts]") {
    TempFile file("tmp_test_workouts.sqlite");
    DatabaseManager db(file.path);
    db.init();
    int uid = db.createUser("erin@test.com", "s:h", "Erin E");

    WorkoutData w;
    w.workout_type = "run";
    w.duration_minutes = 30;
    w.calories_burned = 310.5;
    w.session_date = "2024-03-02";
    db.createWorkoutSession(uid, w);
    w.workout_type = "swim";
    db.createWorkoutSession(uid, w);   // same day allowed
    w.session_date = "2024-03-10";
    db.createWorkoutSession(uid, w);

    auto inRange = db.getWorkoutSessions(uid, "2024-03-01", "2024-03-05");
    REQUIRE(inRange.size() == 2);
    REQUIRE(inRange.front().data.workout_type == "swim");
    REQUIRE(inRange.front().data.duration_minutes == 30);
    REQUIRE_FALSE(inRange.front().data.intensity.has_value());
    REQUIRE(db.getWorkoutSessions(uid, "2024-03-01", "2024-03-31").front().data.session_date == "2024-03-10");

    for (int day = 1; day <= 5; ++day) {
        MeasurementData m;
        m.weight = 80.0 - day;
        m.measurement_date = "2024-04-0" + std::to_string(day);
        db.addBodyMeasurement(uid, m);
    }
    auto latest = db.getBodyMeasurements(uid, 3);
    REQUIRE(latest.size() == 3);
    REQUIRE(latest.front().data.measurement_date == "2024-04-05");
    REQUIRE(latest.front().data.weight.value() == Catch::Approx(75.0));
    REQUIRE(db.getBodyMeasurements(uid).size() == 5);
}
