#pragma once

#include <sqlite3.h>
#include <nlohmann/json.hpp>

#include <array>
#include <string>

#include "common.hpp"

// Assessment history: every verdict the enforcer acted on, with what it did about it.
class SQLite {
  public:
    SQLite(const std::string &db_path);
    ~SQLite();

    SQLite(const SQLite &) = delete;
    SQLite &operator=(const SQLite &) = delete;

    void InsertAssessment(const Assessment &assessment, double at);
    nlohmann::json FetchAssessments(int limit = 200);
    nlohmann::json GetTodayAssessmentSummary();

  private:
    // Returns Unix epoch seconds (UTC) for local midnight N days ago.
    double GetLocalDayStartEpoch(int days);

    void Init();
    void PrepareStatements();
    void ExecIgnoringErrors(const std::string &sql);

  private:
    sqlite3 *m_Db;
    std::string m_DbPath;

    sqlite3_stmt *m_InsertAssessmentStmt = nullptr;

    static constexpr int kLookasideSlotSize = 128;
    static constexpr int kLookasideSlotCount = 128; // 16 KiB
    std::array<unsigned char, kLookasideSlotSize * kLookasideSlotCount> m_Lookaside{};
};
