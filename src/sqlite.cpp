#include "sqlite.hpp"

#include <chrono>
#include <stdexcept>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
SQLite::SQLite(const std::string &db_path) : m_Db(nullptr), m_DbPath(db_path) {
    if (sqlite3_open(m_DbPath.c_str(), &m_Db) != SQLITE_OK) {
        spdlog::error("unable to open database: {}", m_DbPath);
        if (m_Db) {
            sqlite3_close(m_Db);
            m_Db = nullptr;
        }
        throw std::runtime_error("unable to open database");
    }

    spdlog::debug("SQLite database opened: {}", m_DbPath);

    sqlite3_db_config(m_Db, SQLITE_DBCONFIG_LOOKASIDE, m_Lookaside.data(), kLookasideSlotSize,
                      kLookasideSlotCount);

    sqlite3_busy_timeout(m_Db, 2000);
    ExecIgnoringErrors("PRAGMA journal_mode=WAL");
    ExecIgnoringErrors("PRAGMA wal_autocheckpoint=1000");
    ExecIgnoringErrors("PRAGMA synchronous=NORMAL");
    ExecIgnoringErrors("PRAGMA temp_store=FILE");
    ExecIgnoringErrors("PRAGMA cache_size = -1000;");

    Init();
    PrepareStatements();
}

// ─────────────────────────────────────
SQLite::~SQLite() {
    if (m_InsertAssessmentStmt) {
        sqlite3_finalize(m_InsertAssessmentStmt);
        m_InsertAssessmentStmt = nullptr;
    }
    if (m_Db) {
        sqlite3_close(m_Db);
        m_Db = nullptr;
    }
}

// ─────────────────────────────────────
double SQLite::GetLocalDayStartEpoch(int days) {
    using namespace std::chrono;

    if (days < 0) {
        days = 0;
    }

    const auto now = system_clock::now();
    const auto *tz = current_zone();
    const zoned_time zt{tz, now};

    const auto local_now = zt.get_local_time();
    const auto local_midnight = floor<std::chrono::days>(local_now) - std::chrono::days{days};
    const auto sys_midnight = tz->to_sys(local_midnight, choose::earliest);

    return duration<double>(sys_midnight.time_since_epoch()).count();
}

// ─────────────────────────────────────
void SQLite::Init() {
    spdlog::debug("Initializing SQLite database tables");

    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS assessments ("
                       "at REAL NOT NULL,"
                       "target TEXT,"
                       "title TEXT,"
                       "intention TEXT,"
                       "relevant INTEGER NOT NULL,"
                       "confidence INTEGER NOT NULL,"
                       "reason TEXT,"
                       "action TEXT NOT NULL"
                       ")");
    ExecIgnoringErrors("CREATE INDEX IF NOT EXISTS idx_assessments_at ON assessments(at)");

    spdlog::debug("SQLite database tables initialized");
}

// ─────────────────────────────────────
void SQLite::PrepareStatements() {
    const char *sql = R"(
        INSERT INTO assessments
        (at, target, title, intention, relevant, confidence, reason, action)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )";
    if (sqlite3_prepare_v2(m_Db, sql, -1, &m_InsertAssessmentStmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed for InsertAssessment stmt: {}", sqlite3_errmsg(m_Db));
        m_InsertAssessmentStmt = nullptr;
    }
}

// ─────────────────────────────────────
void SQLite::InsertAssessment(const Assessment &a, double at) {
    if (!m_InsertAssessmentStmt) {
        spdlog::error("InsertAssessment stmt not prepared");
        return;
    }

    sqlite3_reset(m_InsertAssessmentStmt);
    sqlite3_clear_bindings(m_InsertAssessmentStmt);

    sqlite3_bind_double(m_InsertAssessmentStmt, 1, at);
    sqlite3_bind_text(m_InsertAssessmentStmt, 2, a.targetKey.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(m_InsertAssessmentStmt, 3, a.title.empty() ? nullptr : a.title.c_str(), -1,
                      SQLITE_TRANSIENT);
    sqlite3_bind_text(m_InsertAssessmentStmt, 4,
                      a.intention.empty() ? nullptr : a.intention.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(m_InsertAssessmentStmt, 5, a.relevant ? 1 : 0);
    sqlite3_bind_int(m_InsertAssessmentStmt, 6, a.confidence);
    sqlite3_bind_text(m_InsertAssessmentStmt, 7, a.reason.empty() ? nullptr : a.reason.c_str(),
                      -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(m_InsertAssessmentStmt, 8, a.action.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(m_InsertAssessmentStmt);
    if (rc != SQLITE_DONE) {
        spdlog::error("InsertAssessment failed: {}", sqlite3_errmsg(m_Db));
        return;
    }

    spdlog::debug("Inserted assessment: target={}, relevant={}, action={}", a.targetKey,
                  a.relevant, a.action);
}

// ─────────────────────────────────────
nlohmann::json SQLite::FetchAssessments(int limit) {
    sqlite3_stmt *stmt = nullptr;

    if (limit < 1) {
        limit = 1;
    }
    if (limit > 5000) {
        limit = 5000;
    }

    const char *sql = R"(
        SELECT at, target, title, intention, relevant, confidence, reason, action
        FROM assessments
        ORDER BY at DESC
        LIMIT ?
    )";

    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in FetchAssessments: {}", sqlite3_errmsg(m_Db));
        return nlohmann::json::array();
    }

    sqlite3_bind_int(stmt, 1, limit);

    auto text = [stmt](int col) {
        const char *v = reinterpret_cast<const char *>(sqlite3_column_text(stmt, col));
        return std::string(v ? v : "");
    };

    nlohmann::json rows = nlohmann::json::array();
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        nlohmann::json row;
        row["at"] = sqlite3_column_double(stmt, 0);
        row["target"] = text(1);
        row["title"] = text(2);
        row["intention"] = text(3);
        row["relevant"] = sqlite3_column_int(stmt, 4) != 0;
        row["confidence"] = sqlite3_column_int(stmt, 5);
        row["reason"] = text(6);
        row["action"] = text(7);
        rows.push_back(row);
    }

    sqlite3_finalize(stmt);
    spdlog::debug("Fetched {} assessments", rows.size());
    return rows;
}

// ─────────────────────────────────────
nlohmann::json SQLite::GetTodayAssessmentSummary() {
    const double dayStart = GetLocalDayStartEpoch(0);

    nlohmann::json summary = {
        {"day_start", dayStart}, {"total", 0}, {"relevant", 0}, {"off_target", 0}};
    summary["actions"] = nlohmann::json::object();

    sqlite3_stmt *stmt = nullptr;
    const char *totals = R"(
        SELECT COUNT(*), COALESCE(SUM(relevant), 0)
        FROM assessments
        WHERE at >= ?
    )";
    if (sqlite3_prepare_v2(m_Db, totals, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in GetTodayAssessmentSummary: {}",
                      sqlite3_errmsg(m_Db));
        return summary;
    }
    sqlite3_bind_double(stmt, 1, dayStart);
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const int total = sqlite3_column_int(stmt, 0);
        const int relevant = sqlite3_column_int(stmt, 1);
        summary["total"] = total;
        summary["relevant"] = relevant;
        summary["off_target"] = total - relevant;
    }
    sqlite3_finalize(stmt);
    stmt = nullptr;

    const char *byAction = R"(
        SELECT action, COUNT(*)
        FROM assessments
        WHERE at >= ?
        GROUP BY action
    )";
    if (sqlite3_prepare_v2(m_Db, byAction, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in GetTodayAssessmentSummary: {}",
                      sqlite3_errmsg(m_Db));
        return summary;
    }
    sqlite3_bind_double(stmt, 1, dayStart);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char *action = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
        summary["actions"][action ? action : "none"] = sqlite3_column_int(stmt, 1);
    }
    sqlite3_finalize(stmt);

    return summary;
}

// ─────────────────────────────────────
void SQLite::ExecIgnoringErrors(const std::string &sql) {
    char *errmsg = nullptr;
    sqlite3_exec(m_Db, sql.c_str(), nullptr, nullptr, &errmsg);
    if (errmsg) {
        spdlog::error("sqlite exec error: {}", errmsg);
        sqlite3_free(errmsg);
    }
}
