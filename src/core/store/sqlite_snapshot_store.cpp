#include "core/store/sqlite_snapshot_store.h"
#include "core/shared/logging.h"

#include <QByteArray>

#include <cmath>

#include <sqlite3.h>

namespace tp {

namespace {

QString toDbTimestamp(const QDateTime& dt)
{
    return dt.isValid() ? dt.toUTC().toString(Qt::ISODateWithMs) : QString();
}

QDateTime fromDbTimestamp(const char* text)
{
    if (!text || !*text) {
        return {};
    }
    return QDateTime::fromString(QString::fromUtf8(text), Qt::ISODateWithMs);
}

QString columnText(sqlite3_stmt* stmt, int column)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
}

void fail(QString* errorOut, sqlite3* db, const char* what)
{
    const QString message = QStringLiteral("%1: %2")
                                .arg(QString::fromLatin1(what), QString::fromUtf8(sqlite3_errmsg(db)));
    LOG_WARN(tpStore, "%s", qUtf8Printable(message));
    if (errorOut) {
        *errorOut = message;
    }
}

} // namespace

std::unique_ptr<SqliteSnapshotStore> SqliteSnapshotStore::open(const QString& dbPath, QString* errorOut)
{
    auto db = LearningDatabase::open(dbPath, errorOut);
    if (!db) {
        return nullptr;
    }
    return std::make_unique<SqliteSnapshotStore>(std::move(*db));
}

SqliteSnapshotStore::SqliteSnapshotStore(LearningDatabase db)
    : m_db(std::move(db))
{
}

bool SqliteSnapshotStore::save(const LearningSnapshot& snapshot, QString* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_db.beginTransaction(errorOut)) {
        return false;
    }
    if (!writeLocked(snapshot, errorOut)) {
        m_db.rollbackTransaction();
        return false;
    }
    if (!m_db.commitTransaction(errorOut)) {
        m_db.rollbackTransaction();
        return false;
    }
    LOG_DEBUG(tpStore, "Saved snapshot with %d entities", static_cast<int>(snapshot.entities.size()));
    return true;
}

bool SqliteSnapshotStore::writeLocked(const LearningSnapshot& snapshot, QString* errorOut)
{
    sqlite3* db = m_db.handle();

    // Cascades to q_values and adaptation_history.
    if (!m_db.execSql("DELETE FROM entity_state; DELETE FROM engine_state;", errorOut)) {
        return false;
    }

    static constexpr const char* kEngineSql =
        "INSERT INTO engine_state (key, value) VALUES (?1, ?2)";
    static constexpr const char* kEntitySql = R"(
        INSERT INTO entity_state (entity_id, total_recommendations, successful_recommendations,
                                  personalized_bias, last_update)
        VALUES (?1, ?2, ?3, ?4, ?5)
    )";
    static constexpr const char* kQValueSql = R"(
        INSERT INTO q_values (entity_id, outdoor_band, target_band, room, action, q_value, visits)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)
    )";
    static constexpr const char* kHistorySql = R"(
        INSERT INTO adaptation_history (entity_id, timestamp, adjustment, reward, bias)
        VALUES (?1, ?2, ?3, ?4, ?5)
    )";

    sqlite3_stmt* engineStmt = nullptr;
    sqlite3_stmt* entityStmt = nullptr;
    sqlite3_stmt* qStmt = nullptr;
    sqlite3_stmt* historyStmt = nullptr;

    bool ok = true;
    if (sqlite3_prepare_v2(db, kEngineSql, -1, &engineStmt, nullptr) != SQLITE_OK ||
        sqlite3_prepare_v2(db, kEntitySql, -1, &entityStmt, nullptr) != SQLITE_OK ||
        sqlite3_prepare_v2(db, kQValueSql, -1, &qStmt, nullptr) != SQLITE_OK ||
        sqlite3_prepare_v2(db, kHistorySql, -1, &historyStmt, nullptr) != SQLITE_OK) {
        fail(errorOut, db, "snapshot prepare failed");
        ok = false;
    }

    auto putEngineValue = [&](const char* key, const QString& value) {
        sqlite3_reset(engineStmt);
        sqlite3_clear_bindings(engineStmt);
        const QByteArray valueUtf8 = value.toUtf8();
        sqlite3_bind_text(engineStmt, 1, key, -1, SQLITE_STATIC);
        sqlite3_bind_text(engineStmt, 2, valueUtf8.constData(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(engineStmt) != SQLITE_DONE) {
            fail(errorOut, db, "engine_state insert failed");
            return false;
        }
        return true;
    };

    if (ok) {
        ok = putEngineValue("version", QString::number(snapshot.version))
             && putEngineValue("epsilon", QString::number(snapshot.epsilon, 'g', 17))
             && putEngineValue("saved_at", toDbTimestamp(snapshot.savedAt.isValid()
                                                             ? snapshot.savedAt
                                                             : QDateTime::currentDateTimeUtc()));
    }

    for (auto it = snapshot.entities.cbegin(); ok && it != snapshot.entities.cend(); ++it) {
        const QByteArray entityUtf8 = it.key().toUtf8();
        const LearningState& state = it.value();

        sqlite3_reset(entityStmt);
        sqlite3_clear_bindings(entityStmt);
        sqlite3_bind_text(entityStmt, 1, entityUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_int(entityStmt, 2, state.totalRecommendations);
        sqlite3_bind_int(entityStmt, 3, state.successfulRecommendations);
        sqlite3_bind_double(entityStmt, 4, state.personalizedBias);
        const QByteArray lastUpdateUtf8 = toDbTimestamp(state.lastUpdate).toUtf8();
        if (lastUpdateUtf8.isEmpty()) {
            sqlite3_bind_null(entityStmt, 5);
        } else {
            sqlite3_bind_text(entityStmt, 5, lastUpdateUtf8.constData(), -1, SQLITE_STATIC);
        }
        if (sqlite3_step(entityStmt) != SQLITE_DONE) {
            fail(errorOut, db, "entity_state insert failed");
            ok = false;
            break;
        }

        for (auto qIt = state.qTable.cbegin(); ok && qIt != state.qTable.cend(); ++qIt) {
            const ContextKey& key = qIt.key();
            const ActionCounts visits = state.visitCounts.value(key, ActionCounts{});
            const QByteArray outdoorUtf8 = outdoorBandToString(key.outdoor).toUtf8();
            const QByteArray targetUtf8 = targetBandToString(key.target).toUtf8();
            const QByteArray roomUtf8 = roomCategoryToString(key.room).toUtf8();

            for (Action action : kAllActions) {
                const QByteArray actionUtf8 = actionToString(action).toUtf8();
                sqlite3_reset(qStmt);
                sqlite3_clear_bindings(qStmt);
                sqlite3_bind_text(qStmt, 1, entityUtf8.constData(), -1, SQLITE_STATIC);
                sqlite3_bind_text(qStmt, 2, outdoorUtf8.constData(), -1, SQLITE_STATIC);
                sqlite3_bind_text(qStmt, 3, targetUtf8.constData(), -1, SQLITE_STATIC);
                sqlite3_bind_text(qStmt, 4, roomUtf8.constData(), -1, SQLITE_STATIC);
                sqlite3_bind_text(qStmt, 5, actionUtf8.constData(), -1, SQLITE_STATIC);
                sqlite3_bind_double(qStmt, 6, qIt.value()[actionIndex(action)]);
                sqlite3_bind_int(qStmt, 7, visits[actionIndex(action)]);
                if (sqlite3_step(qStmt) != SQLITE_DONE) {
                    fail(errorOut, db, "q_values insert failed");
                    ok = false;
                    break;
                }
            }
        }

        for (const AdaptationEvent& event : state.adaptationHistory) {
            if (!ok) {
                break;
            }
            const QByteArray tsUtf8 = toDbTimestamp(event.timestamp).toUtf8();
            sqlite3_reset(historyStmt);
            sqlite3_clear_bindings(historyStmt);
            sqlite3_bind_text(historyStmt, 1, entityUtf8.constData(), -1, SQLITE_STATIC);
            sqlite3_bind_text(historyStmt, 2, tsUtf8.constData(), -1, SQLITE_STATIC);
            sqlite3_bind_int(historyStmt, 3, event.adjustment);
            sqlite3_bind_double(historyStmt, 4, event.reward);
            sqlite3_bind_double(historyStmt, 5, event.bias);
            if (sqlite3_step(historyStmt) != SQLITE_DONE) {
                fail(errorOut, db, "adaptation_history insert failed");
                ok = false;
            }
        }
    }

    sqlite3_finalize(engineStmt);
    sqlite3_finalize(entityStmt);
    sqlite3_finalize(qStmt);
    sqlite3_finalize(historyStmt);
    return ok;
}

bool SqliteSnapshotStore::load(LearningSnapshot* out, QString* errorOut)
{
    if (!out) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);

    LearningSnapshot snapshot;
    if (!readEngineState(&snapshot, errorOut)
        || !readEntities(&snapshot, errorOut)
        || !readQValues(&snapshot, errorOut)
        || !readHistory(&snapshot, errorOut)) {
        return false;
    }

    *out = snapshot;
    LOG_INFO(tpStore, "Loaded snapshot with %d entities (epsilon %.4f)",
             static_cast<int>(snapshot.entities.size()), snapshot.epsilon);
    return true;
}

bool SqliteSnapshotStore::readEngineState(LearningSnapshot* out, QString* errorOut)
{
    sqlite3* db = m_db.handle();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT key, value FROM engine_state", -1, &stmt, nullptr) != SQLITE_OK) {
        fail(errorOut, db, "engine_state query failed");
        return false;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const QString key = columnText(stmt, 0);
        const QString value = columnText(stmt, 1);
        if (key == QLatin1String("epsilon")) {
            bool ok = false;
            const double epsilon = value.toDouble(&ok);
            if (ok && std::isfinite(epsilon)) {
                out->epsilon = epsilon;
            } else {
                LOG_WARN(tpStore, "Ignoring malformed stored epsilon '%s'", qUtf8Printable(value));
            }
        } else if (key == QLatin1String("version")) {
            out->version = value.toInt();
        } else if (key == QLatin1String("saved_at")) {
            out->savedAt = fromDbTimestamp(value.toUtf8().constData());
        }
    }
    sqlite3_finalize(stmt);
    return true;
}

bool SqliteSnapshotStore::readEntities(LearningSnapshot* out, QString* errorOut)
{
    static constexpr const char* kSql = R"(
        SELECT entity_id, total_recommendations, successful_recommendations,
               personalized_bias, last_update
        FROM entity_state
    )";

    sqlite3* db = m_db.handle();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        fail(errorOut, db, "entity_state query failed");
        return false;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        LearningState state;
        state.totalRecommendations = sqlite3_column_int(stmt, 1);
        state.successfulRecommendations = sqlite3_column_int(stmt, 2);
        state.personalizedBias = sqlite3_column_double(stmt, 3);
        state.lastUpdate = fromDbTimestamp(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 4)));
        out->entities.insert(columnText(stmt, 0), state);
    }
    sqlite3_finalize(stmt);
    return true;
}

bool SqliteSnapshotStore::readQValues(LearningSnapshot* out, QString* errorOut)
{
    static constexpr const char* kSql = R"(
        SELECT entity_id, outdoor_band, target_band, room, action, q_value, visits
        FROM q_values
    )";

    sqlite3* db = m_db.handle();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        fail(errorOut, db, "q_values query failed");
        return false;
    }

    int skipped = 0;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        auto entityIt = out->entities.find(columnText(stmt, 0));
        const auto outdoor = outdoorBandFromString(columnText(stmt, 1));
        const auto target = targetBandFromString(columnText(stmt, 2));
        const auto action = actionFromString(columnText(stmt, 4));
        if (entityIt == out->entities.end() || !outdoor || !target || !action) {
            ++skipped;
            continue;
        }

        ContextKey key;
        key.outdoor = *outdoor;
        key.target = *target;
        key.room = roomCategoryFromString(columnText(stmt, 3));

        LearningState& state = entityIt.value();
        auto qIt = state.qTable.find(key);
        if (qIt == state.qTable.end()) {
            ActionValues initial;
            initial.fill(0.5);
            qIt = state.qTable.insert(key, initial);
        }
        qIt.value()[actionIndex(*action)] = sqlite3_column_double(stmt, 5);

        const int visits = sqlite3_column_int(stmt, 6);
        auto countsIt = state.visitCounts.find(key);
        if (countsIt == state.visitCounts.end()) {
            if (visits == 0) {
                continue;
            }
            ActionCounts zero;
            zero.fill(0);
            countsIt = state.visitCounts.insert(key, zero);
        }
        countsIt.value()[actionIndex(*action)] = visits;
    }
    sqlite3_finalize(stmt);

    if (skipped > 0) {
        LOG_WARN(tpStore, "Skipped %d q_values rows with unknown labels", skipped);
    }
    return true;
}

bool SqliteSnapshotStore::readHistory(LearningSnapshot* out, QString* errorOut)
{
    static constexpr const char* kSql = R"(
        SELECT entity_id, timestamp, adjustment, reward, bias
        FROM adaptation_history
        ORDER BY id ASC
    )";

    sqlite3* db = m_db.handle();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        fail(errorOut, db, "adaptation_history query failed");
        return false;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        auto entityIt = out->entities.find(columnText(stmt, 0));
        if (entityIt == out->entities.end()) {
            continue;
        }
        AdaptationEvent event;
        event.timestamp = fromDbTimestamp(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)));
        event.adjustment = sqlite3_column_int(stmt, 2);
        event.reward = sqlite3_column_double(stmt, 3);
        event.bias = sqlite3_column_double(stmt, 4);
        entityIt.value().adaptationHistory.push_back(event);
    }
    sqlite3_finalize(stmt);
    return true;
}

} // namespace tp
