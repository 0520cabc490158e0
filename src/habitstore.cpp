#include "habitstore.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <system_error>

namespace {
StoreError StorageError(sqlite3 *db, const std::string &what) {
    const std::string message = what + ": " + (db ? sqlite3_errmsg(db) : "no connection");
    spdlog::error("HabitStore: {}", message);
    return StoreError(ErrorKind::Storage, message);
}

bool IsBlank(const std::string &s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}
} // namespace

// ─────────────────────────────────────
HabitStore::Statement::Statement(sqlite3 *db, const char *sql) : m_Db(db), m_Sql(sql) {
    if (sqlite3_prepare_v2(m_Db, sql, -1, &m_Stmt, nullptr) != SQLITE_OK) {
        m_Stmt = nullptr;
        throw StorageError(m_Db, "db prepare failed");
    }
}

// ─────────────────────────────────────
HabitStore::Statement::~Statement() {
    if (m_Stmt) {
        sqlite3_finalize(m_Stmt);
        m_Stmt = nullptr;
    }
}

// ─────────────────────────────────────
void HabitStore::Statement::Bind(int index, std::int64_t value) {
    if (sqlite3_bind_int64(m_Stmt, index, value) != SQLITE_OK) {
        throw StorageError(m_Db, "db bind failed");
    }
}

// ─────────────────────────────────────
void HabitStore::Statement::Bind(int index, const std::string &value) {
    if (sqlite3_bind_text(m_Stmt, index, value.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
        throw StorageError(m_Db, "db bind failed");
    }
}

// ─────────────────────────────────────
int HabitStore::Statement::StepRaw() {
    return sqlite3_step(m_Stmt);
}

// ─────────────────────────────────────
bool HabitStore::Statement::Step() {
    const int rc = sqlite3_step(m_Stmt);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw StorageError(m_Db, "db step failed");
}

// ─────────────────────────────────────
std::int64_t HabitStore::Statement::ColumnInt(int col) const {
    return sqlite3_column_int64(m_Stmt, col);
}

// ─────────────────────────────────────
std::string HabitStore::Statement::ColumnText(int col) const {
    const char *text = reinterpret_cast<const char *>(sqlite3_column_text(m_Stmt, col));
    return text ? text : "";
}

// ─────────────────────────────────────
Date HabitStore::Statement::ColumnDate(int col) const {
    const std::string text = ColumnText(col);
    Date date{};
    if (!ParseDate(text, date)) {
        spdlog::error("HabitStore: malformed date '{}' in column {}", text, col);
        throw StoreError(ErrorKind::Storage, "malformed date in database: '" + text + "'");
    }
    return date;
}

// ─────────────────────────────────────
HabitStore::TxGuard::TxGuard(sqlite3 *db, const char *begin_sql) : m_Db(db) {
    if (sqlite3_exec(m_Db, begin_sql, nullptr, nullptr, nullptr) != SQLITE_OK) {
        throw StorageError(m_Db, "begin transaction failed");
    }
    m_Active = true;
}

// ─────────────────────────────────────
HabitStore::TxGuard::~TxGuard() {
    if (m_Active) {
        if (sqlite3_exec(m_Db, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
            spdlog::error("HabitStore: rollback failed: {}", sqlite3_errmsg(m_Db));
        }
    }
}

// ─────────────────────────────────────
void HabitStore::TxGuard::Commit() {
    if (sqlite3_exec(m_Db, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
        throw StorageError(m_Db, "commit failed");
    }
    m_Active = false;
}

// ─────────────────────────────────────
HabitStore::HabitStore(const std::filesystem::path &db_path) : m_DbPath(db_path) {
    if (m_DbPath.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(m_DbPath.parent_path(), ec);
        if (ec) {
            spdlog::error("unable to create database directory {}: {}",
                          m_DbPath.parent_path().string(), ec.message());
            throw StoreError(ErrorKind::Storage, "unable to create database directory");
        }
    }

    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(m_DbPath.c_str(), &m_Db, flags, nullptr) != SQLITE_OK) {
        spdlog::error("unable to open database: {}", m_DbPath.string());
        const StoreError error = StorageError(m_Db, "unable to open database");
        sqlite3_close(m_Db);
        m_Db = nullptr;
        throw error;
    }

    spdlog::debug("SQLite database opened: {}", m_DbPath.string());

    sqlite3_extended_result_codes(m_Db, 1);
    sqlite3_busy_timeout(m_Db, 2000);
    ExecIgnoringErrors("PRAGMA journal_mode=WAL");
    ExecIgnoringErrors("PRAGMA journal_size_limit=10485760");

    try {
        // Commits must be on disk before a request is acknowledged.
        Exec("PRAGMA synchronous=FULL");
        Exec("PRAGMA foreign_keys=ON");
    } catch (...) {
        sqlite3_close(m_Db);
        m_Db = nullptr;
        throw;
    }
}

// ─────────────────────────────────────
HabitStore::~HabitStore() {
    if (m_Db) {
        sqlite3_close(m_Db);
        m_Db = nullptr;
        spdlog::debug("SQLite database closed: {}", m_DbPath.string());
    }
}

// ─────────────────────────────────────
void HabitStore::Migrate() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    spdlog::info("Provisioning schema v{} in {}", kSchemaVersion, m_DbPath.string());

    TxGuard tx(m_Db, "BEGIN IMMEDIATE");

    Exec("CREATE TABLE IF NOT EXISTS habits ("
         "id INTEGER PRIMARY KEY AUTOINCREMENT,"
         "name TEXT NOT NULL CHECK (length(trim(name)) > 0),"
         "emoji TEXT NOT NULL DEFAULT '⭐',"
         "created_at TEXT NOT NULL"
         ")");

    Exec("CREATE TABLE IF NOT EXISTS completions ("
         "id INTEGER PRIMARY KEY AUTOINCREMENT,"
         "habit_id INTEGER NOT NULL REFERENCES habits(id) ON DELETE CASCADE,"
         "completed_date TEXT NOT NULL,"
         "UNIQUE (habit_id, completed_date)"
         ")");

    Exec("CREATE INDEX IF NOT EXISTS idx_completions_habit ON completions(habit_id)");
    Exec("PRAGMA user_version = " + std::to_string(kSchemaVersion));

    tx.Commit();
    spdlog::info("Schema ready");
}

// ─────────────────────────────────────
int HabitStore::SchemaVersion() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    Statement stmt(m_Db, "PRAGMA user_version");
    if (!stmt.Step()) {
        return 0;
    }
    return static_cast<int>(stmt.ColumnInt(0));
}

// ─────────────────────────────────────
void HabitStore::VerifySchema() {
    const int version = SchemaVersion();
    if (version != kSchemaVersion) {
        spdlog::error("Database {} has schema version {}, expected {}; run with --migrate",
                      m_DbPath.string(), version, kSchemaVersion);
        throw StoreError(ErrorKind::Storage, "database schema is not provisioned");
    }
}

// ─────────────────────────────────────
std::vector<Habit> HabitStore::ListHabits() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    Statement stmt(m_Db, "SELECT id, name, emoji, created_at FROM habits ORDER BY id");

    std::vector<Habit> habits;
    while (stmt.Step()) {
        habits.push_back(HabitFromRow(stmt));
    }

    spdlog::debug("Fetched {} habits", habits.size());
    return habits;
}

// ─────────────────────────────────────
Habit HabitStore::GetHabit(std::int64_t id) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return ReadHabit(id);
}

// ─────────────────────────────────────
Habit HabitStore::CreateHabit(const std::string &name, const std::string &emoji) {
    if (IsBlank(name)) {
        throw StoreError(ErrorKind::Validation, "name must not be empty");
    }

    std::lock_guard<std::mutex> lock(m_Mutex);

    Habit habit;
    habit.name = name;
    habit.emoji = emoji.empty() ? kDefaultEmoji : emoji;
    habit.created_at = Today();

    TxGuard tx(m_Db);
    Statement stmt(m_Db, "INSERT INTO habits (name, emoji, created_at) VALUES (?, ?, ?)");
    stmt.Bind(1, habit.name);
    stmt.Bind(2, habit.emoji);
    stmt.Bind(3, FormatDate(habit.created_at));
    stmt.Step();
    habit.id = sqlite3_last_insert_rowid(m_Db);
    tx.Commit();

    spdlog::debug("Created habit id={} name='{}'", habit.id, habit.name);
    return habit;
}

// ─────────────────────────────────────
Habit HabitStore::UpdateHabit(std::int64_t id, const std::string &name, const std::string &emoji) {
    if (IsBlank(name)) {
        throw StoreError(ErrorKind::Validation, "name must not be empty");
    }

    std::lock_guard<std::mutex> lock(m_Mutex);

    TxGuard tx(m_Db);
    {
        Statement stmt(m_Db, "UPDATE habits SET name = ?, emoji = ? WHERE id = ?");
        stmt.Bind(1, name);
        stmt.Bind(2, emoji);
        stmt.Bind(3, id);
        stmt.Step();
    }

    if (sqlite3_changes(m_Db) == 0) {
        throw StoreError(ErrorKind::NotFound, "Habit not found");
    }

    Habit habit = ReadHabit(id);
    tx.Commit();

    spdlog::debug("Updated habit id={} name='{}'", habit.id, habit.name);
    return habit;
}

// ─────────────────────────────────────
void HabitStore::DeleteHabit(std::int64_t id) {
    std::lock_guard<std::mutex> lock(m_Mutex);

    TxGuard tx(m_Db, "BEGIN IMMEDIATE");
    if (!HabitExists(id)) {
        throw StoreError(ErrorKind::NotFound, "Habit not found");
    }

    // Children first, then the habit; the foreign key would also cascade.
    int removed = 0;
    {
        Statement stmt(m_Db, "DELETE FROM completions WHERE habit_id = ?");
        stmt.Bind(1, id);
        stmt.Step();
        removed = sqlite3_changes(m_Db);
    }
    {
        Statement stmt(m_Db, "DELETE FROM habits WHERE id = ?");
        stmt.Bind(1, id);
        stmt.Step();
    }

    tx.Commit();
    spdlog::debug("Deleted habit id={} with {} completions", id, removed);
}

// ─────────────────────────────────────
std::vector<Completion> HabitStore::ListCompletions() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    Statement stmt(m_Db, "SELECT id, habit_id, completed_date FROM completions ORDER BY id");

    std::vector<Completion> completions;
    while (stmt.Step()) {
        Completion c;
        c.id = stmt.ColumnInt(0);
        c.habit_id = stmt.ColumnInt(1);
        c.completed_date = stmt.ColumnDate(2);
        completions.push_back(c);
    }

    spdlog::debug("Fetched {} completions", completions.size());
    return completions;
}

// ─────────────────────────────────────
Completion HabitStore::CreateCompletion(std::int64_t habitId, Date completedDate) {
    std::lock_guard<std::mutex> lock(m_Mutex);

    const std::string day = FormatDate(completedDate);

    // IMMEDIATE takes the write lock up front, so no other connection can
    // insert between the checks below and our insert.
    TxGuard tx(m_Db, "BEGIN IMMEDIATE");

    if (!HabitExists(habitId)) {
        throw StoreError(ErrorKind::NotFound, "Habit not found");
    }

    {
        Statement stmt(m_Db,
                       "SELECT 1 FROM completions WHERE habit_id = ? AND completed_date = ?");
        stmt.Bind(1, habitId);
        stmt.Bind(2, day);
        if (stmt.Step()) {
            throw StoreError(ErrorKind::Conflict, "Completion already exists");
        }
    }

    Statement stmt(m_Db, "INSERT INTO completions (habit_id, completed_date) VALUES (?, ?)");
    stmt.Bind(1, habitId);
    stmt.Bind(2, day);

    const int rc = stmt.StepRaw();
    if (rc == SQLITE_CONSTRAINT_UNIQUE) {
        throw StoreError(ErrorKind::Conflict, "Completion already exists");
    }
    if (rc == SQLITE_CONSTRAINT_FOREIGNKEY) {
        throw StoreError(ErrorKind::NotFound, "Habit not found");
    }
    if (rc != SQLITE_DONE) {
        throw StorageError(m_Db, "insert completion failed");
    }

    Completion completion;
    completion.id = sqlite3_last_insert_rowid(m_Db);
    completion.habit_id = habitId;
    completion.completed_date = completedDate;
    tx.Commit();

    spdlog::debug("Created completion id={} habit_id={} date={}", completion.id, habitId, day);
    return completion;
}

// ─────────────────────────────────────
void HabitStore::DeleteCompletion(std::int64_t id) {
    std::lock_guard<std::mutex> lock(m_Mutex);

    TxGuard tx(m_Db);
    {
        Statement stmt(m_Db, "DELETE FROM completions WHERE id = ?");
        stmt.Bind(1, id);
        stmt.Step();
    }

    if (sqlite3_changes(m_Db) == 0) {
        throw StoreError(ErrorKind::NotFound, "Completion not found");
    }

    tx.Commit();
    spdlog::debug("Deleted completion id={}", id);
}

// ─────────────────────────────────────
std::vector<Date> HabitStore::CompletionDates(std::int64_t habitId) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    Statement stmt(m_Db, "SELECT completed_date FROM completions WHERE habit_id = ? "
                         "ORDER BY completed_date DESC");
    stmt.Bind(1, habitId);

    std::vector<Date> dates;
    while (stmt.Step()) {
        dates.push_back(stmt.ColumnDate(0));
    }
    return dates;
}

// ─────────────────────────────────────
std::unordered_map<std::int64_t, std::vector<Date>> HabitStore::CompletionDatesByHabit() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    Statement stmt(m_Db, "SELECT habit_id, completed_date FROM completions");

    std::unordered_map<std::int64_t, std::vector<Date>> byHabit;
    while (stmt.Step()) {
        byHabit[stmt.ColumnInt(0)].push_back(stmt.ColumnDate(1));
    }
    return byHabit;
}

// ─────────────────────────────────────
bool HabitStore::HabitExists(std::int64_t id) {
    Statement stmt(m_Db, "SELECT 1 FROM habits WHERE id = ?");
    stmt.Bind(1, id);
    return stmt.Step();
}

// ─────────────────────────────────────
Habit HabitStore::ReadHabit(std::int64_t id) {
    Statement stmt(m_Db, "SELECT id, name, emoji, created_at FROM habits WHERE id = ?");
    stmt.Bind(1, id);
    if (!stmt.Step()) {
        throw StoreError(ErrorKind::NotFound, "Habit not found");
    }
    return HabitFromRow(stmt);
}

// ─────────────────────────────────────
Habit HabitStore::HabitFromRow(const Statement &stmt) {
    Habit habit;
    habit.id = stmt.ColumnInt(0);
    habit.name = stmt.ColumnText(1);
    habit.emoji = stmt.ColumnText(2);
    habit.created_at = stmt.ColumnDate(3);
    return habit;
}

// ─────────────────────────────────────
void HabitStore::Exec(const std::string &sql) {
    char *errmsg = nullptr;
    if (sqlite3_exec(m_Db, sql.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
        const std::string message = errmsg ? errmsg : sqlite3_errmsg(m_Db);
        sqlite3_free(errmsg);
        spdlog::error("sqlite exec error: {} ({})", message, sql);
        throw StoreError(ErrorKind::Storage, "sqlite exec failed: " + message);
    }
}

// ─────────────────────────────────────
void HabitStore::ExecIgnoringErrors(const std::string &sql) {
    char *errmsg = nullptr;
    sqlite3_exec(m_Db, sql.c_str(), nullptr, nullptr, &errmsg);
    if (errmsg) {
        spdlog::warn("sqlite exec error: {}", errmsg);
        sqlite3_free(errmsg);
    }
}
