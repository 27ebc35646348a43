#include "daemon/hwid_store.hpp"

#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>

#include <sqlite3.h>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/paths.hpp"

namespace hwidwatch {

namespace {

constexpr const char *kCreateCurrentReportTable =
    "CREATE TABLE IF NOT EXISTS current_report ("
    "    slot INTEGER PRIMARY KEY CHECK (slot = 0),"
    "    created_at INTEGER NOT NULL,"
    "    fingerprint TEXT NOT NULL,"
    "    fingerprint_valid INTEGER NOT NULL,"
    "    snapshot TEXT NOT NULL"
    ");";

constexpr const char *kCreateReportHistoryTable =
    "CREATE TABLE IF NOT EXISTS report_history ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    created_at INTEGER NOT NULL,"
    "    fingerprint TEXT NOT NULL,"
    "    fingerprint_valid INTEGER NOT NULL,"
    "    snapshot TEXT NOT NULL"
    ");";

constexpr const char *kCreateHistoryIndex =
    "CREATE INDEX IF NOT EXISTS idx_report_history_created "
    "ON report_history(created_at);";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite prepare failed: ")
                                     + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw std::runtime_error(message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

void bindReport(sqlite3_stmt *stmt, const Report &report)
{
    sqlite3_bind_int64(stmt, 1, toEpochMs(report.createdAt));
    bindText(stmt, 2, report.fingerprint.digest);
    sqlite3_bind_int(stmt, 3, report.fingerprint.valid ? 1 : 0);
    bindText(stmt, 4, nlohmann::json(report.snapshot).dump());
}

// Columns: created_at, fingerprint, fingerprint_valid, snapshot.
Report readReport(sqlite3_stmt *stmt)
{
    Report report;
    report.createdAt = fromEpochMs(sqlite3_column_int64(stmt, 0));
    report.fingerprint.digest = columnText(stmt, 1);
    report.fingerprint.valid = sqlite3_column_int(stmt, 2) != 0;
    try {
        report.snapshot = nlohmann::json::parse(columnText(stmt, 3)).get<Snapshot>();
    } catch (const nlohmann::json::exception &) {
        report.snapshot = Snapshot{};
        report.snapshot.collectedAt = report.createdAt;
    }
    return report;
}

class Transaction {
public:
    explicit Transaction(sqlite3 *db)
        : m_db(db)
    {
        execOrThrow(m_db, "BEGIN IMMEDIATE;");
    }

    ~Transaction()
    {
        if (!m_committed) {
            sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    void commit()
    {
        execOrThrow(m_db, "COMMIT;");
        m_committed = true;
    }

private:
    sqlite3 *m_db;
    bool m_committed = false;
};

} // namespace

struct HwidStore::Impl {
    sqlite3 *db = nullptr;
    mutable std::mutex mutex;
};

HwidStore::HwidStore()
    : HwidStore(databasePath())
{
}

HwidStore::HwidStore(const std::filesystem::path &dbPath)
    : impl(std::make_unique<Impl>())
{
    std::filesystem::create_directories(dbPath.parent_path());

    if (sqlite3_open(dbPath.string().c_str(), &impl->db) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw std::runtime_error("failed to open hwidwatch database: " + message);
    }
    sqlite3_busy_timeout(impl->db, 2000);

    execOrThrow(impl->db, kCreateCurrentReportTable);
    execOrThrow(impl->db, kCreateReportHistoryTable);
    execOrThrow(impl->db, kCreateHistoryIndex);
    execOrThrow(impl->db, kCreateMetaTable);
}

HwidStore::~HwidStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

void HwidStore::writeReport(const Report &report, bool appendHistory, int maxHistory)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Transaction tx(impl->db);

    {
        Statement stmt(impl->db,
                       "INSERT OR REPLACE INTO current_report "
                       "(slot, created_at, fingerprint, fingerprint_valid, snapshot) "
                       "VALUES (0, ?, ?, ?, ?);");
        bindReport(stmt.get(), report);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            throw std::runtime_error("failed to write current report");
        }
    }

    if (appendHistory) {
        {
            Statement stmt(impl->db,
                           "INSERT INTO report_history "
                           "(created_at, fingerprint, fingerprint_valid, snapshot) "
                           "VALUES (?, ?, ?, ?);");
            bindReport(stmt.get(), report);
            if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
                throw std::runtime_error("failed to append report history");
            }
        }

        Statement evict(impl->db,
                        "DELETE FROM report_history WHERE id NOT IN ("
                        "    SELECT id FROM report_history"
                        "    ORDER BY created_at DESC, id DESC LIMIT ?"
                        ");");
        sqlite3_bind_int(evict.get(), 1, maxHistory < 1 ? 1 : maxHistory);
        if (sqlite3_step(evict.get()) != SQLITE_DONE) {
            throw std::runtime_error("failed to trim report history");
        }
    }

    tx.commit();
}

std::optional<Report> HwidStore::currentReport() const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "SELECT created_at, fingerprint, fingerprint_valid, snapshot "
                   "FROM current_report WHERE slot = 0;");
    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        throw std::runtime_error(std::string("failed to read current report: ")
                                 + sqlite3_errmsg(impl->db));
    }
    return readReport(stmt.get());
}

std::vector<Report> HwidStore::listHistory() const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "SELECT created_at, fingerprint, fingerprint_valid, snapshot "
                   "FROM report_history ORDER BY created_at DESC, id DESC;");

    std::vector<Report> reports;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        reports.push_back(readReport(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("failed to read report history: ")
                                 + sqlite3_errmsg(impl->db));
    }
    return reports;
}

std::size_t HwidStore::historyCount() const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "SELECT COUNT(*) FROM report_history;");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw std::runtime_error("failed to count report history");
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

std::optional<std::string> HwidStore::getMeta(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "SELECT value FROM meta WHERE key = ?;");
    bindText(stmt.get(), 1, key);
    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return columnText(stmt.get(), 0);
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("failed to read meta value " + key + ": "
                                 + sqlite3_errmsg(impl->db));
    }
    return std::nullopt;
}

void HwidStore::setMeta(const std::string &key, const std::string &value)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "INSERT INTO meta (key, value) VALUES (?, ?) "
                   "ON CONFLICT(key) DO UPDATE SET value = excluded.value;");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("failed to set meta value");
    }
}

bool HwidStore::integrityCheck(std::string *message) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "PRAGMA integrity_check;");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        if (message) {
            *message = "integrity_check failed to return a result";
        }
        return false;
    }
    const std::string result = columnText(stmt.get(), 0);
    if (message) {
        *message = result;
    }
    return result == "ok";
}

} // namespace hwidwatch
