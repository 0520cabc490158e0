#pragma once

#include <vector>

#include "date.hpp"

// Length of the unbroken run of completed days ending at `today`, or at the
// day before when `today` has no completion yet. Only one grace day is
// allowed; dates after `today` are ignored.
//
// `completedDates` must belong to a single habit. Order and duplicates do
// not matter.
int CurrentStreak(const std::vector<Date> &completedDates, Date today);
