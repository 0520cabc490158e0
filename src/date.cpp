#include "date.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

// ─────────────────────────────────────
Date Today() {
    using namespace std::chrono;

    const zoned_time zt{current_zone(), system_clock::now()};
    const auto local_midnight = floor<days>(zt.get_local_time());
    return Date{local_midnight.time_since_epoch()};
}

// ─────────────────────────────────────
bool ParseDate(const std::string &s, Date &out) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') {
        return false;
    }
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 4 || i == 7) {
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }

    const int y = std::stoi(s.substr(0, 4));
    const unsigned m = static_cast<unsigned>(std::stoi(s.substr(5, 2)));
    const unsigned d = static_cast<unsigned>(std::stoi(s.substr(8, 2)));

    const std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{m},
                                          std::chrono::day{d}};
    if (!ymd.ok()) {
        return false;
    }

    out = Date{ymd};
    return true;
}

// ─────────────────────────────────────
std::string FormatDate(Date date) {
    const std::chrono::year_month_day ymd{date};
    std::ostringstream oss;
    oss << std::setw(4) << std::setfill('0') << static_cast<int>(ymd.year()) << "-"
        << std::setw(2) << std::setfill('0') << static_cast<unsigned>(ymd.month()) << "-"
        << std::setw(2) << std::setfill('0') << static_cast<unsigned>(ymd.day());
    return oss.str();
}
