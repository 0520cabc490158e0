#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common.hpp"
#include "date.hpp"

// Habits and their completions on a single SQLite connection.
//
// Every public call holds m_Mutex for its whole duration, and every write runs
// in its own transaction, so calls are serialized against each other. All
// failures are reported as StoreError.
class HabitStore {
  public:
    static constexpr int kSchemaVersion = 1;

    explicit HabitStore(const std::filesystem::path &db_path);
    ~HabitStore();

    HabitStore(const HabitStore &) = delete;
    HabitStore &operator=(const HabitStore &) = delete;

    // Provisioning: create tables and stamp the schema version. Safe to run
    // more than once.
    void Migrate();
    // Throws a Storage error when the database was never migrated.
    void VerifySchema();
    int SchemaVersion();

    // Habits
    std::vector<Habit> ListHabits();
    Habit GetHabit(std::int64_t id);
    Habit CreateHabit(const std::string &name, const std::string &emoji = kDefaultEmoji);
    Habit UpdateHabit(std::int64_t id, const std::string &name, const std::string &emoji);
    void DeleteHabit(std::int64_t id);

    // Completions
    std::vector<Completion> ListCompletions();
    Completion CreateCompletion(std::int64_t habitId, Date completedDate);
    void DeleteCompletion(std::int64_t id);

    // Streak inputs
    std::vector<Date> CompletionDates(std::int64_t habitId);
    std::unordered_map<std::int64_t, std::vector<Date>> CompletionDatesByHabit();

    const std::filesystem::path &Path() const {
        return m_DbPath;
    }

  private:
    // Finalizes on scope exit.
    class Statement {
      public:
        Statement(sqlite3 *db, const char *sql);
        ~Statement();
        Statement(const Statement &) = delete;
        Statement &operator=(const Statement &) = delete;

        void Bind(int index, std::int64_t value);
        void Bind(int index, const std::string &value);
        // SQLITE_ROW -> true, SQLITE_DONE -> false, anything else throws.
        bool Step();
        int StepRaw();

        std::int64_t ColumnInt(int col) const;
        std::string ColumnText(int col) const;
        Date ColumnDate(int col) const;

      private:
        sqlite3 *m_Db;
        sqlite3_stmt *m_Stmt = nullptr;
        std::string m_Sql;
    };

    // Rolls back unless Commit() was reached.
    class TxGuard {
      public:
        TxGuard(sqlite3 *db, const char *begin_sql = "BEGIN");
        ~TxGuard();
        TxGuard(const TxGuard &) = delete;
        TxGuard &operator=(const TxGuard &) = delete;

        void Commit();

      private:
        sqlite3 *m_Db;
        bool m_Active = false;
    };

    void Exec(const std::string &sql);
    void ExecIgnoringErrors(const std::string &sql);
    bool HabitExists(std::int64_t id);
    Habit ReadHabit(std::int64_t id);
    static Habit HabitFromRow(const Statement &stmt);

  private:
    sqlite3 *m_Db = nullptr;
    std::filesystem::path m_DbPath;
    std::mutex m_Mutex;
};
