#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "streak.hpp"

#include <algorithm>
#include <thread>
#include <vector>

using namespace std::chrono;

namespace {
const Date kToday = sys_days{2026y / October / 19};

Date DaysAgo(int n) {
    return kToday - days{n};
}
} // namespace

// ===========================================
// Current streak
// ===========================================

TEST_CASE("Empty completion set has no streak") {
    CHECK(CurrentStreak({}, kToday) == 0);
}

TEST_CASE("Run that includes today") {
    SUBCASE("Only today") {
        CHECK(CurrentStreak({kToday}, kToday) == 1);
    }

    SUBCASE("Today and the two days before") {
        CHECK(CurrentStreak({kToday, DaysAgo(1), DaysAgo(2)}, kToday) == 3);
    }

    SUBCASE("Stops at the first gap") {
        CHECK(CurrentStreak({kToday, DaysAgo(1), DaysAgo(3), DaysAgo(4)}, kToday) == 2);
    }

    SUBCASE("Order of the input does not matter") {
        std::vector<Date> dates = {DaysAgo(2), kToday, DaysAgo(1)};
        CHECK(CurrentStreak(dates, kToday) == 3);
        std::reverse(dates.begin(), dates.end());
        CHECK(CurrentStreak(dates, kToday) == 3);
    }
}

TEST_CASE("Grace day when today is not logged yet") {
    SUBCASE("Yesterday only") {
        CHECK(CurrentStreak({DaysAgo(1)}, kToday) == 1);
    }

    SUBCASE("Yesterday and the day before") {
        CHECK(CurrentStreak({DaysAgo(1), DaysAgo(2)}, kToday) == 2);
    }

    SUBCASE("Grace is a single day") {
        CHECK(CurrentStreak({DaysAgo(2), DaysAgo(3), DaysAgo(4)}, kToday) == 0);
    }

    SUBCASE("Gap after yesterday ends the run") {
        CHECK(CurrentStreak({DaysAgo(1), DaysAgo(2), DaysAgo(4), DaysAgo(5), DaysAgo(6)},
                            kToday) == 2);
    }
}

TEST_CASE("Older runs do not count") {
    std::vector<Date> dates;
    for (int i = 10; i < 40; ++i) {
        dates.push_back(DaysAgo(i));
    }
    CHECK(CurrentStreak(dates, kToday) == 0);

    dates.push_back(kToday);
    CHECK(CurrentStreak(dates, kToday) == 1);
}

TEST_CASE("Future dates are ignored") {
    CHECK(CurrentStreak({kToday + days{1}}, kToday) == 0);
    CHECK(CurrentStreak({kToday + days{1}, kToday, DaysAgo(1)}, kToday) == 2);
}

TEST_CASE("Duplicate dates count once") {
    CHECK(CurrentStreak({kToday, kToday, DaysAgo(1), DaysAgo(1)}, kToday) == 2);
}

TEST_CASE("Runs across month and year boundaries") {
    const Date newYear = sys_days{2027y / January / 1};
    const std::vector<Date> dates = {newYear, newYear - days{1}, newYear - days{2}};
    CHECK(CurrentStreak(dates, newYear) == 3);

    const Date march1 = sys_days{2028y / March / 1};
    CHECK(CurrentStreak({march1 - days{1}, march1 - days{2}}, march1) == 2);
}

TEST_CASE("Same input gives the same result") {
    const std::vector<Date> dates = {kToday, DaysAgo(1), DaysAgo(2), DaysAgo(5)};
    const int first = CurrentStreak(dates, kToday);
    CHECK(first == 3);
    CHECK(CurrentStreak(dates, kToday) == first);

    std::vector<int> results(8, -1);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i] { results[i] = CurrentStreak(dates, kToday); });
    }
    for (auto &t : threads) {
        t.join();
    }
    for (int r : results) {
        CHECK(r == first);
    }
}
