#pragma once

#include <QString>

#include <optional>
#include <utility>

#include <sqlite3.h>

namespace tp {

// LearningDatabase -- owner of one SQLite connection to the learning
// database. Opening creates the file, applies pragmas and runs migrations.
// Not thread-safe; each user keeps its own connection.
class LearningDatabase {
public:
    ~LearningDatabase();

    // Move-only (owns sqlite3* handle)
    LearningDatabase(LearningDatabase&& other) noexcept
        : m_db(other.m_db)
        , m_path(std::move(other.m_path))
    {
        other.m_db = nullptr;
    }
    LearningDatabase& operator=(LearningDatabase&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            m_path = std::move(other.m_path);
            other.m_db = nullptr;
        }
        return *this;
    }
    LearningDatabase(const LearningDatabase&) = delete;
    LearningDatabase& operator=(const LearningDatabase&) = delete;

    // ":memory:" is accepted for tests.
    static std::optional<LearningDatabase> open(const QString& dbPath, QString* errorOut = nullptr);

    bool execSql(const char* sql, QString* errorOut = nullptr);

    bool beginTransaction(QString* errorOut = nullptr);
    bool commitTransaction(QString* errorOut = nullptr);
    void rollbackTransaction();

    QString lastError() const;

    sqlite3* handle() const { return m_db; }
    const QString& path() const { return m_path; }

private:
    LearningDatabase() = default;
    bool init(const QString& dbPath, QString* errorOut);

    sqlite3* m_db = nullptr;
    QString m_path;
};

} // namespace tp
