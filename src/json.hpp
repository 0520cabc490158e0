#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common.hpp"
#include "date.hpp"

// Request body readers. Every failure is a Validation StoreError naming the
// offending field.
class JsonParse {
  public:
    nlohmann::json ParseObject(const std::string &body);

    std::string GetString(const nlohmann::json &j, const std::string &key);
    // Absent or null -> nullopt.
    std::optional<std::string> GetOptionalString(const nlohmann::json &j, const std::string &key);
    std::int64_t GetInt(const nlohmann::json &j, const std::string &key);
    Date GetDate(const nlohmann::json &j, const std::string &key);
};

// Path parameter such as the `{id}` in /api/habits/{id}.
std::int64_t ParseId(const std::string &s);

nlohmann::json HabitToJson(const Habit &habit, int currentStreak);
nlohmann::json CompletionToJson(const Completion &completion);
nlohmann::json ErrorToJson(const std::string &detail);
