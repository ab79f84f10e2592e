#pragma once

#include <QHash>
#include <QString>
#include <cstdint>

namespace tp {

struct EngineSettings {
    // Storage
    QString dbPath;

    // Bandit
    double learningRate = 0.1;
    double initialEpsilon = 0.1;
    double minEpsilon = 0.01;
    double epsilonDecay = 0.995;
    double optimisticInitialValue = 0.5;
    int historyCapacity = 100;

    // Delayed feedback
    int64_t monitoringWindowMs = 60LL * 60LL * 1000LL;  // 1 hour
    double sustainedReward = 0.5;
    double overrideReward = -0.5;

    // Persistence retry queue
    int maxSaveAttempts = 3;
    int64_t initialSaveBackoffMs = 1000;
    int64_t maxSaveBackoffMs = 30000;

    // Activity log
    bool activityLogEnabled = true;
    int activityRetentionDays = 90;

    // Room categories keyed by entity id ("small", "medium", "large", "xlarge")
    QHash<QString, QString> roomCategories;
    QString defaultRoomCategory = QStringLiteral("medium");
};

} // namespace tp
