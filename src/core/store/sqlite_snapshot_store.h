#pragma once

#include "core/store/learning_database.h"
#include "core/store/snapshot_store.h"

#include <memory>
#include <mutex>

namespace tp {

// SqliteSnapshotStore -- relational snapshot storage in the learning
// database. Each save replaces all learning rows in one transaction, so a
// reader sees either the previous or the new snapshot.
class SqliteSnapshotStore : public SnapshotStore {
public:
    static std::unique_ptr<SqliteSnapshotStore> open(const QString& dbPath, QString* errorOut = nullptr);

    explicit SqliteSnapshotStore(LearningDatabase db);

    bool load(LearningSnapshot* out, QString* errorOut) override;
    bool save(const LearningSnapshot& snapshot, QString* errorOut) override;

private:
    bool writeLocked(const LearningSnapshot& snapshot, QString* errorOut);
    bool readEngineState(LearningSnapshot* out, QString* errorOut);
    bool readEntities(LearningSnapshot* out, QString* errorOut);
    bool readQValues(LearningSnapshot* out, QString* errorOut);
    bool readHistory(LearningSnapshot* out, QString* errorOut);

    std::mutex m_mutex;
    LearningDatabase m_db;
};

} // namespace tp
