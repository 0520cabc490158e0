#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "date.hpp"

enum LogLevel { LOG_DEBUG, LOG_INFO, LOG_OFF };

enum class ErrorKind { Validation, NotFound, Conflict, Storage };

inline constexpr const char *kDefaultEmoji = "⭐";

struct Habit {
    std::int64_t id = 0;
    std::string name;
    std::string emoji = kDefaultEmoji;
    Date created_at{};
};

struct Completion {
    std::int64_t id = 0;
    std::int64_t habit_id = 0;
    Date completed_date{};
};

// Raised by the store and the request parsers. what() is the internal
// message; storage details must not reach API clients.
class StoreError : public std::runtime_error {
  public:
    StoreError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), m_Kind(kind) {}

    ErrorKind Kind() const {
        return m_Kind;
    }

  private:
    ErrorKind m_Kind;
};

const char *ErrorKindName(ErrorKind kind);
