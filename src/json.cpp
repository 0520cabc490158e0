#include "json.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <limits>

namespace {
StoreError FieldError(const std::string &key, const std::string &what) {
    spdlog::debug("JsonParse: field '{}' {}", key, what);
    return StoreError(ErrorKind::Validation, "field '" + key + "' " + what);
}
} // namespace

// ─────────────────────────────────────
nlohmann::json JsonParse::ParseObject(const std::string &body) {
    if (body.empty()) {
        throw StoreError(ErrorKind::Validation, "empty request body");
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error &e) {
        spdlog::debug("JsonParse: invalid JSON: {}", e.what());
        throw StoreError(ErrorKind::Validation, "invalid JSON");
    }

    if (!j.is_object()) {
        spdlog::debug("JsonParse: expected object, got {}", j.type_name());
        throw StoreError(ErrorKind::Validation, "request body must be a JSON object");
    }
    return j;
}

// ─────────────────────────────────────
std::string JsonParse::GetString(const nlohmann::json &j, const std::string &key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        throw FieldError(key, "is required");
    }
    if (!j.at(key).is_string()) {
        throw FieldError(key, "must be a string");
    }
    return j.at(key).get<std::string>();
}

// ─────────────────────────────────────
std::optional<std::string> JsonParse::GetOptionalString(const nlohmann::json &j,
                                                        const std::string &key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    if (!j.at(key).is_string()) {
        throw FieldError(key, "must be a string");
    }
    return j.at(key).get<std::string>();
}

// ─────────────────────────────────────
std::int64_t JsonParse::GetInt(const nlohmann::json &j, const std::string &key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        throw FieldError(key, "is required");
    }
    const nlohmann::json &value = j.at(key);
    if (!value.is_number_integer()) {
        throw FieldError(key, "must be an integer");
    }
    if (value.is_number_unsigned() &&
        value.get<std::uint64_t>() >
            static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        throw FieldError(key, "is out of range");
    }
    return value.get<std::int64_t>();
}

// ─────────────────────────────────────
Date JsonParse::GetDate(const nlohmann::json &j, const std::string &key) {
    const std::string text = GetString(j, key);
    Date date{};
    if (!ParseDate(text, date)) {
        throw FieldError(key, "must be a date formatted YYYY-MM-DD");
    }
    return date;
}

// ─────────────────────────────────────
std::int64_t ParseId(const std::string &s) {
    std::int64_t id = 0;
    const char *first = s.data();
    const char *last = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(first, last, id);
    if (s.empty() || ec != std::errc() || ptr != last) {
        throw StoreError(ErrorKind::Validation, "id must be an integer");
    }
    return id;
}

// ─────────────────────────────────────
nlohmann::json HabitToJson(const Habit &habit, int currentStreak) {
    return {{"id", habit.id},
            {"name", habit.name},
            {"emoji", habit.emoji},
            {"current_streak", currentStreak},
            {"created_at", FormatDate(habit.created_at)}};
}

// ─────────────────────────────────────
nlohmann::json CompletionToJson(const Completion &completion) {
    return {{"id", completion.id},
            {"habit_id", completion.habit_id},
            {"completed_date", FormatDate(completion.completed_date)}};
}

// ─────────────────────────────────────
nlohmann::json ErrorToJson(const std::string &detail) {
    return {{"detail", detail}};
}
