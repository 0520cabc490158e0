#include "streak.hpp"

#include <set>

// ─────────────────────────────────────
int CurrentStreak(const std::vector<Date> &completedDates, Date today) {
    if (completedDates.empty()) {
        return 0;
    }

    const std::set<Date> done(completedDates.begin(), completedDates.end());

    Date cursor = today;
    if (!done.contains(cursor)) {
        cursor -= std::chrono::days{1};
    }

    int streak = 0;
    while (done.contains(cursor)) {
        ++streak;
        cursor -= std::chrono::days{1};
    }

    return streak;
}
