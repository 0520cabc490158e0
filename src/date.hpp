#pragma once

#include <chrono>
#include <string>

// Calendar date without time of day.
using Date = std::chrono::sys_days;

// Current date in the local time zone.
Date Today();

// Strict YYYY-MM-DD. Returns false for anything that is not a real date.
bool ParseDate(const std::string &s, Date &out);
std::string FormatDate(Date date);
