#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "json.hpp"

#include <functional>
#include <limits>

using namespace std::chrono;

namespace {
ErrorKind KindOf(const std::function<void()> &fn) {
    try {
        fn();
    } catch (const StoreError &e) {
        return e.Kind();
    }
    FAIL("expected StoreError");
    return ErrorKind::Storage;
}
} // namespace

TEST_CASE("Request body parsing") {
    JsonParse parse;

    SUBCASE("Object body") {
        const auto j = parse.ParseObject(R"({"name":"Run","emoji":"🏃"})");
        CHECK(parse.GetString(j, "name") == "Run");
        CHECK(parse.GetOptionalString(j, "emoji").value() == "🏃");
    }

    SUBCASE("Rejects bodies that are not objects") {
        CHECK(KindOf([&] { parse.ParseObject(""); }) == ErrorKind::Validation);
        CHECK(KindOf([&] { parse.ParseObject("{not json"); }) == ErrorKind::Validation);
        CHECK(KindOf([&] { parse.ParseObject("[1,2]"); }) == ErrorKind::Validation);
        CHECK(KindOf([&] { parse.ParseObject("\"Run\""); }) == ErrorKind::Validation);
    }

    SUBCASE("Missing and mistyped fields") {
        const auto j = parse.ParseObject(R"({"name":5,"habit_id":"1","emoji":null})");
        CHECK(KindOf([&] { parse.GetString(j, "name"); }) == ErrorKind::Validation);
        CHECK(KindOf([&] { parse.GetString(j, "missing"); }) == ErrorKind::Validation);
        CHECK(KindOf([&] { parse.GetInt(j, "habit_id"); }) == ErrorKind::Validation);
        CHECK_FALSE(parse.GetOptionalString(j, "emoji").has_value());
        CHECK_FALSE(parse.GetOptionalString(j, "absent").has_value());
        CHECK(KindOf([&] { parse.GetOptionalString(j, "name"); }) == ErrorKind::Validation);
    }

    SUBCASE("Integers") {
        const auto j = parse.ParseObject(R"({"habit_id":7,"fraction":1.5})");
        CHECK(parse.GetInt(j, "habit_id") == 7);
        CHECK(KindOf([&] { parse.GetInt(j, "fraction"); }) == ErrorKind::Validation);

        const auto big = parse.ParseObject(
            R"({"max":9223372036854775807,"over":9223372036854775808,"huge":18446744073709551615})");
        CHECK(parse.GetInt(big, "max") == std::numeric_limits<std::int64_t>::max());
        CHECK(KindOf([&] { parse.GetInt(big, "over"); }) == ErrorKind::Validation);
        CHECK(KindOf([&] { parse.GetInt(big, "huge"); }) == ErrorKind::Validation);
    }

    SUBCASE("Dates") {
        const auto j = parse.ParseObject(
            R"({"completed_date":"2026-10-19","bad":"19/10/2026","num":20261019})");
        CHECK(parse.GetDate(j, "completed_date") == sys_days{2026y / October / 19});
        CHECK(KindOf([&] { parse.GetDate(j, "bad"); }) == ErrorKind::Validation);
        CHECK(KindOf([&] { parse.GetDate(j, "num"); }) == ErrorKind::Validation);
    }
}

TEST_CASE("Path ids") {
    CHECK(ParseId("42") == 42);
    CHECK(KindOf([] { ParseId(""); }) == ErrorKind::Validation);
    CHECK(KindOf([] { ParseId("abc"); }) == ErrorKind::Validation);
    CHECK(KindOf([] { ParseId("4x"); }) == ErrorKind::Validation);
    CHECK(KindOf([] { ParseId("99999999999999999999999"); }) == ErrorKind::Validation);
}

TEST_CASE("Response shapes") {
    Habit habit;
    habit.id = 3;
    habit.name = "Run";
    habit.emoji = "🏃";
    habit.created_at = sys_days{2026y / October / 1};

    const auto h = HabitToJson(habit, 5);
    CHECK(h["id"] == 3);
    CHECK(h["name"] == "Run");
    CHECK(h["emoji"] == "🏃");
    CHECK(h["current_streak"] == 5);
    CHECK(h["created_at"] == "2026-10-01");

    Completion completion;
    completion.id = 9;
    completion.habit_id = 3;
    completion.completed_date = sys_days{2026y / October / 19};

    const auto c = CompletionToJson(completion);
    CHECK(c["id"] == 9);
    CHECK(c["habit_id"] == 3);
    CHECK(c["completed_date"] == "2026-10-19");

    CHECK(ErrorToJson("Habit not found")["detail"] == "Habit not found");
}
