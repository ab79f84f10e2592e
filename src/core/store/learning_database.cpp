#include "core/store/learning_database.h"
#include "core/store/migration.h"
#include "core/store/schema.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace tp {

namespace {

void setError(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
}

} // namespace

LearningDatabase::~LearningDatabase()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::optional<LearningDatabase> LearningDatabase::open(const QString& dbPath, QString* errorOut)
{
    LearningDatabase db;
    if (!db.init(dbPath, errorOut)) {
        return std::nullopt;
    }
    return db;
}

bool LearningDatabase::init(const QString& dbPath, QString* errorOut)
{
    if (dbPath.isEmpty()) {
        setError(errorOut, QStringLiteral("Database path is empty"));
        return false;
    }

    const bool inMemory = dbPath == QLatin1String(":memory:");
    if (!inMemory) {
        const QFileInfo info(dbPath);
        if (!QDir().mkpath(info.absolutePath())) {
            setError(errorOut, QStringLiteral("Cannot create directory %1").arg(info.absolutePath()));
            LOG_ERROR(tpStore, "Cannot create database directory: %s",
                      qUtf8Printable(info.absolutePath()));
            return false;
        }
    }

    m_path = dbPath;
    int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        const QString message = QString::fromUtf8(m_db ? sqlite3_errmsg(m_db) : "out of memory");
        setError(errorOut, message);
        LOG_ERROR(tpStore, "Failed to open database: %s", qUtf8Printable(message));
        return false;
    }

    // Set busy_timeout first so the busy handler covers the pragmas below.
    sqlite3_busy_timeout(m_db, 10000);

    if (!execSql(kConnectionPragmas, errorOut)) {
        LOG_ERROR(tpStore, "Failed to set connection pragmas");
        return false;
    }

    if (currentSchemaVersion(m_db) == 0 && !inMemory) {
        if (!execSql(kDatabasePragmas, errorOut)) {
            LOG_ERROR(tpStore, "Failed to set database pragmas");
            return false;
        }

        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, "PRAGMA journal_mode", -1, &stmt, nullptr) == SQLITE_OK
            && sqlite3_step(stmt) == SQLITE_ROW) {
            const char* mode = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            if (mode && QString::fromUtf8(mode) != QLatin1String("wal")) {
                LOG_WARN(tpStore, "Expected WAL journal mode, got: %s", mode);
            }
        }
        sqlite3_finalize(stmt);
    }

    if (!applyMigrations(m_db, kCurrentSchemaVersion)) {
        setError(errorOut, QStringLiteral("Schema migration failed"));
        LOG_ERROR(tpStore, "Migration failed for %s", qUtf8Printable(dbPath));
        return false;
    }

    if (!inMemory) {
        // Learning data is per-household; keep it owner-only.
        QFile(dbPath).setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    }

    LOG_INFO(tpStore, "Database opened: %s", qUtf8Printable(dbPath));
    return true;
}

bool LearningDatabase::execSql(const char* sql, QString* errorOut)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        const QString message = QString::fromUtf8(errMsg ? errMsg : "unknown");
        LOG_ERROR(tpStore, "SQL error: %s", qUtf8Printable(message));
        setError(errorOut, message);
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

bool LearningDatabase::beginTransaction(QString* errorOut)
{
    return execSql("BEGIN IMMEDIATE", errorOut);
}

bool LearningDatabase::commitTransaction(QString* errorOut)
{
    return execSql("COMMIT", errorOut);
}

void LearningDatabase::rollbackTransaction()
{
    char* errMsg = nullptr;
    if (sqlite3_exec(m_db, "ROLLBACK", nullptr, nullptr, &errMsg) != SQLITE_OK) {
        LOG_WARN(tpStore, "Rollback failed: %s", errMsg ? errMsg : "unknown");
    }
    sqlite3_free(errMsg);
}

QString LearningDatabase::lastError() const
{
    return m_db ? QString::fromUtf8(sqlite3_errmsg(m_db)) : QString();
}

} // namespace tp
