#include <QtTest/QtTest>

#include "core/feedback/room_category_provider.h"
#include "core/learning/context_discretizer.h"
#include "core/learning/recommendation_engine.h"
#include "core/store/persistence_gateway.h"
#include "manual_timer_service.h"
#include "recording_activity_logger.h"
#include "scriptable_snapshot_store.h"

#include <QJsonArray>

#include <chrono>
#include <cmath>
#include <limits>
#include <memory>
#include <vector>

using namespace std::chrono_literals;

namespace {

const QString kLiving = QStringLiteral("climate.living");
constexpr auto kHour = std::chrono::milliseconds(60 * 60 * 1000);

// Exploration disabled so every recommendation is the greedy one.
tp::EngineSettings greedySettings()
{
    tp::EngineSettings settings;
    settings.initialEpsilon = 0.0;
    settings.minEpsilon = 0.0;
    return settings;
}

tp::PersistenceGateway::RetryPolicy fastPolicy()
{
    tp::PersistenceGateway::RetryPolicy policy;
    policy.initialBackoff = 5ms;
    policy.maxBackoff = 10ms;
    return policy;
}

struct Harness {
    tp::test::ManualTimerService timers;
    tp::test::RecordingActivityLogger logger;
    tp::test::ScriptableSnapshotStore* snapshots = nullptr;
    std::unique_ptr<tp::PersistenceGateway> gateway;
    tp::ConfiguredRoomCategoryProvider rooms;
    std::unique_ptr<tp::RecommendationEngine> engine;
    std::vector<tp::WindowResolution> resolutions;

    explicit Harness(const tp::EngineSettings& settings = greedySettings(),
                     const tp::LearningSnapshot* persisted = nullptr)
    {
        auto store = std::make_unique<tp::test::ScriptableSnapshotStore>();
        snapshots = store.get();
        if (persisted) {
            snapshots->setStored(*persisted);
        }
        gateway = std::make_unique<tp::PersistenceGateway>(std::move(store), fastPolicy());

        tp::RecommendationEngine::Collaborators collaborators;
        collaborators.persistence = gateway.get();
        collaborators.activityLogger = &logger;
        collaborators.roomCategories = &rooms;
        engine = std::make_unique<tp::RecommendationEngine>(settings, timers, collaborators, 17u);
        engine->setResolutionListener([this](const tp::WindowResolution& resolution) {
            resolutions.push_back(resolution);
        });
        engine->initialize();
    }

    ~Harness()
    {
        engine.reset();
        gateway->shutdown();
    }
};

double qValueOf(const tp::RecommendationEngine& engine, const tp::Recommendation& rec)
{
    const auto state = engine.learningState().find(rec.entityId);
    if (!state || !state->qTable.contains(rec.context)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return state->qTable.value(rec.context)[tp::actionIndex(rec.action)];
}

} // namespace

class TestRecommendationEngine : public QObject {
    Q_OBJECT

private slots:
    void testNewEntityRecommendation();
    void testSustainedRecommendationLearnsAndPersists();
    void testOverrideLearnsNegatively();
    void testApplyWithoutPendingFails();
    void testPendingConsumedOnApply();
    void testFallbackNeverPending();
    void testApplyMismatchStillCreditsPending();
    void testManualChangeOutsideWindowIgnored();
    void testResetEntityCancelsWindow();
    void testResetEntityTwiceIsIdempotent();
    void testResetAllIsIdempotent();
    void testInitializeRestoresSnapshot();
    void testRoomCategoryProviderUsed();
    void testStatisticsShape();
    void testSystemStatus();
};

void TestRecommendationEngine::testNewEntityRecommendation()
{
    Harness h;
    const tp::Recommendation rec = h.engine->getRecommendation(kLiving, 32.0, 22.0);

    QVERIFY(!rec.fallback);
    QCOMPARE(rec.entityId, kLiving);
    QCOMPARE(rec.action, tp::Action::Decrease2);
    QCOMPARE(rec.recommendedTemp, 20.0);
    QCOMPARE(rec.confidence, 0.1);
    QVERIFY(rec.context == tp::ContextDiscretizer::discretize(32.0, 22.0, tp::RoomCategory::Medium));
    QVERIFY(h.engine->pendingRecommendation(kLiving).has_value());
}

void TestRecommendationEngine::testSustainedRecommendationLearnsAndPersists()
{
    Harness h;
    const tp::Recommendation rec = h.engine->getRecommendation(kLiving, 32.0, 22.0);
    QVERIFY(h.engine->onRecommendationApplied(kLiving, rec.recommendedTemp, QStringLiteral("dashboard")));

    // Applying only arms the window; nothing is learned yet.
    QVERIFY(!h.engine->learningState().find(kLiving)->visitCounts.contains(rec.context));
    QCOMPARE(h.logger.applications().size(), 1);
    QCOMPARE(h.logger.applications().front().appliedBy, QStringLiteral("dashboard"));

    QCOMPARE(h.timers.advance(kHour), 1);

    QCOMPARE(qValueOf(*h.engine, rec), 0.5);
    const auto state = h.engine->learningState().find(kLiving);
    QCOMPARE(state->successfulRecommendations, 1);
    QCOMPARE(h.resolutions.size(), size_t(1));
    QCOMPARE(h.resolutions.front().outcome, tp::WindowState::ResolvedAccepted);

    QVERIFY(h.gateway->flush(2s));
    QVERIFY(!h.snapshots->saved().isEmpty());
    const tp::LearningSnapshot persisted = h.snapshots->saved().last();
    QCOMPARE(persisted.entities.value(kLiving).successfulRecommendations, 1);
}

void TestRecommendationEngine::testOverrideLearnsNegatively()
{
    Harness h;
    const tp::Recommendation rec = h.engine->getRecommendation(kLiving, 32.0, 22.0);
    QVERIFY(h.engine->onRecommendationApplied(kLiving, rec.recommendedTemp, QString()));

    h.timers.advance(15min);
    QVERIFY(h.engine->onTemperatureManuallyChanged(kLiving, 23.0, 20.0, QStringLiteral("remote")));
    QVERIFY(std::abs(qValueOf(*h.engine, rec) - 0.4) < 1e-9);

    // The next greedy choice moves away from the punished action.
    const tp::Recommendation next = h.engine->getRecommendation(kLiving, 32.0, 22.0);
    QCOMPARE(next.action, tp::Action::Decrease1);

    QVERIFY(h.gateway->flush(2s));
    const tp::LearningSnapshot persisted = h.snapshots->saved().last();
    QCOMPARE(persisted.entities.value(kLiving).totalRecommendations, 1);
    QCOMPARE(persisted.entities.value(kLiving).successfulRecommendations, 0);
    QCOMPARE(h.logger.adjustments().size(), 1);
}

void TestRecommendationEngine::testApplyWithoutPendingFails()
{
    Harness h;
    QString error;
    QVERIFY(!h.engine->onRecommendationApplied(kLiving, 22.0, QString(), &error));
    QVERIFY(!error.isEmpty());
    QVERIFY(!h.engine->rewardScheduler().hasActiveWindow(kLiving));
    QVERIFY(h.logger.applications().isEmpty());
}

void TestRecommendationEngine::testPendingConsumedOnApply()
{
    Harness h;
    const tp::Recommendation rec = h.engine->getRecommendation(kLiving, 32.0, 22.0);
    QVERIFY(h.engine->onRecommendationApplied(kLiving, rec.recommendedTemp, QString()));
    QVERIFY(!h.engine->pendingRecommendation(kLiving).has_value());
    QVERIFY(!h.engine->onRecommendationApplied(kLiving, rec.recommendedTemp, QString()));
    QCOMPARE(h.engine->rewardScheduler().counters().armed, uint64_t(1));
}

void TestRecommendationEngine::testFallbackNeverPending()
{
    Harness h;
    const tp::Recommendation rec = h.engine->getRecommendation(
        kLiving, std::numeric_limits<double>::quiet_NaN(), 22.0);
    QVERIFY(rec.fallback);
    QVERIFY(!h.engine->pendingRecommendation(kLiving).has_value());
    QVERIFY(!h.engine->onRecommendationApplied(kLiving, rec.recommendedTemp, QString()));
    QCOMPARE(h.engine->systemStatus().value(QStringLiteral("fallbacksIssued")).toInt(), 1);
}

void TestRecommendationEngine::testApplyMismatchStillCreditsPending()
{
    Harness h;
    const tp::Recommendation rec = h.engine->getRecommendation(kLiving, 32.0, 22.0);
    QVERIFY(h.engine->onRecommendationApplied(kLiving, rec.recommendedTemp + 1.0, QString()));

    const auto window = h.engine->rewardScheduler().activeWindow(kLiving);
    QVERIFY(window);
    QCOMPARE(window->recommendation().action, rec.action);
    QCOMPARE(window->recommendation().recommendedTemp, rec.recommendedTemp);
}

void TestRecommendationEngine::testManualChangeOutsideWindowIgnored()
{
    Harness h;
    QVERIFY(!h.engine->onTemperatureManuallyChanged(kLiving, 25.0, 22.0, QString()));
    QVERIFY(!h.engine->learningState().find(kLiving).has_value());
    QVERIFY(h.resolutions.empty());
}

void TestRecommendationEngine::testResetEntityCancelsWindow()
{
    Harness h;
    const tp::Recommendation rec = h.engine->getRecommendation(kLiving, 32.0, 22.0);
    QVERIFY(h.engine->onRecommendationApplied(kLiving, rec.recommendedTemp, QString()));

    h.engine->resetLearningData(kLiving);
    QVERIFY(!h.engine->rewardScheduler().hasActiveWindow(kLiving));
    QVERIFY(!h.engine->learningState().find(kLiving).has_value());

    // The countdown was cancelled; no reward lands after the reset.
    h.timers.advance(2 * kHour);
    QVERIFY(!h.engine->learningState().find(kLiving).has_value());
    QCOMPARE(h.resolutions.size(), size_t(1));
    QCOMPARE(h.resolutions.front().outcome, tp::WindowState::Cancelled);
    QVERIFY(!h.resolutions.front().rewardApplied);

    QVERIFY(h.gateway->flush(2s));
    QVERIFY(!h.snapshots->saved().last().entities.contains(kLiving));
}

void TestRecommendationEngine::testResetEntityTwiceIsIdempotent()
{
    Harness h;
    const QString bedroom = QStringLiteral("climate.bedroom");
    for (const QString& entity : {kLiving, bedroom}) {
        const tp::Recommendation rec = h.engine->getRecommendation(entity, 32.0, 22.0);
        QVERIFY(h.engine->onRecommendationApplied(entity, rec.recommendedTemp, QString()));
    }
    h.timers.advance(kHour);
    QCOMPARE(h.engine->getStatistics().value(QStringLiteral("totalEntities")).toInt(), 2);

    h.engine->resetLearningData(kLiving);
    const QJsonObject first = h.engine->getStatistics(kLiving);
    h.engine->resetLearningData(kLiving);
    const QJsonObject second = h.engine->getStatistics(kLiving);

    QCOMPARE(first.value(QStringLiteral("totalRecommendations")).toInt(), 0);
    QCOMPARE(second.value(QStringLiteral("totalRecommendations")).toInt(), 0);
    QVERIFY(!h.engine->learningState().find(kLiving).has_value());

    const auto kept = h.engine->learningState().find(bedroom);
    QVERIFY(kept.has_value());
    QCOMPARE(kept->totalRecommendations, 1);
    QCOMPARE(h.engine->getStatistics().value(QStringLiteral("totalEntities")).toInt(), 1);
}

void TestRecommendationEngine::testResetAllIsIdempotent()
{
    Harness h;
    const tp::Recommendation rec = h.engine->getRecommendation(kLiving, 32.0, 22.0);
    h.engine->onRecommendationApplied(kLiving, rec.recommendedTemp, QString());
    h.timers.advance(kHour);
    h.engine->getRecommendation(QStringLiteral("climate.bedroom"), 28.0, 21.0);

    h.engine->resetLearningData();
    const QJsonObject first = h.engine->getStatistics();
    h.engine->resetLearningData();
    const QJsonObject second = h.engine->getStatistics();

    QCOMPARE(first.value(QStringLiteral("totalEntities")).toInt(), 0);
    QCOMPARE(second.value(QStringLiteral("totalEntities")).toInt(), 0);
    QCOMPARE(second.value(QStringLiteral("currentEpsilon")).toDouble(),
             first.value(QStringLiteral("currentEpsilon")).toDouble());
    QVERIFY(h.engine->systemStatus().value(QStringLiteral("pendingRecommendations")).toArray().isEmpty());
}

void TestRecommendationEngine::testInitializeRestoresSnapshot()
{
    tp::LearningSnapshot snapshot;
    snapshot.epsilon = 0.05;
    tp::LearningState state;
    const tp::ContextKey key = tp::ContextDiscretizer::discretize(32.0, 22.0, tp::RoomCategory::Medium);
    tp::ActionValues q;
    q.fill(0.5);
    q[tp::actionIndex(tp::Action::Increase1)] = 0.9;
    state.qTable.insert(key, q);
    tp::ActionCounts visits;
    visits.fill(0);
    visits[tp::actionIndex(tp::Action::Increase1)] = 5;
    state.visitCounts.insert(key, visits);
    state.totalRecommendations = 5;
    state.successfulRecommendations = 5;
    snapshot.entities.insert(kLiving, state);

    tp::EngineSettings settings = greedySettings();
    settings.minEpsilon = 0.0;
    Harness h(settings, &snapshot);
    QVERIFY(h.engine->isInitialized());
    QCOMPARE(h.engine->learningState().entityCount(), 1);
    QCOMPARE(h.engine->learningState().epsilon(), 0.05);

    // Learned preference wins once exploration is out of the picture.
    int increase = 0;
    for (int i = 0; i < 50; ++i) {
        if (h.engine->getRecommendation(kLiving, 32.0, 22.0).action == tp::Action::Increase1) {
            ++increase;
        }
    }
    QVERIFY(increase >= 40);

    const tp::Recommendation rec = h.engine->getRecommendation(kLiving, 32.0, 22.0);
    if (rec.action == tp::Action::Increase1) {
        // min(0.9, 0.5) * (0.5 + 1.0)
        QCOMPARE(rec.confidence, 0.75);
    }
}

void TestRecommendationEngine::testRoomCategoryProviderUsed()
{
    Harness h;
    h.rooms.setRoomCategory(kLiving, QStringLiteral("large"));
    const tp::Recommendation rec = h.engine->getRecommendation(kLiving, 32.0, 22.0);
    QCOMPARE(rec.context.room, tp::RoomCategory::Large);

    const tp::Recommendation other = h.engine->getRecommendation(QStringLiteral("climate.hall"), 32.0, 22.0);
    QCOMPARE(other.context.room, tp::RoomCategory::Medium);
}

void TestRecommendationEngine::testStatisticsShape()
{
    Harness h;
    const tp::Recommendation rec = h.engine->getRecommendation(kLiving, 32.0, 22.0);
    h.engine->onRecommendationApplied(kLiving, rec.recommendedTemp, QString());
    h.timers.advance(kHour);

    const QJsonObject entity = h.engine->getStatistics(kLiving);
    QCOMPARE(entity.value(QStringLiteral("entityId")).toString(), kLiving);
    QCOMPARE(entity.value(QStringLiteral("totalRecommendations")).toInt(), 1);
    QCOMPARE(entity.value(QStringLiteral("successfulRecommendations")).toInt(), 1);
    QCOMPARE(entity.value(QStringLiteral("successRate")).toDouble(), 1.0);
    QCOMPARE(entity.value(QStringLiteral("exploredStates")).toInt(), 1);
    QVERIFY(entity.value(QStringLiteral("lastUpdate")).isString());

    const QJsonObject unknown = h.engine->getStatistics(QStringLiteral("climate.none"));
    QCOMPARE(unknown.value(QStringLiteral("totalRecommendations")).toInt(), 0);
    QCOMPARE(unknown.value(QStringLiteral("successRate")).toDouble(), 0.0);

    const QJsonObject aggregate = h.engine->getStatistics();
    QCOMPARE(aggregate.value(QStringLiteral("totalEntities")).toInt(), 1);
    QCOMPARE(aggregate.value(QStringLiteral("overallSuccessRate")).toDouble(), 1.0);
    QVERIFY(aggregate.contains(QStringLiteral("systemUptimeMs")));
}

void TestRecommendationEngine::testSystemStatus()
{
    Harness h;
    h.engine->onEntitySelected(QStringLiteral("climate.office"));
    h.engine->getRecommendation(kLiving, 32.0, 22.0);

    const QJsonObject status = h.engine->systemStatus();
    QVERIFY(status.value(QStringLiteral("initialized")).toBool());
    QVERIFY(status.value(QStringLiteral("activityLoggerAvailable")).toBool());
    QVERIFY(status.value(QStringLiteral("persistenceAvailable")).toBool());
    QCOMPARE(status.value(QStringLiteral("lastSelectedEntity")).toString(), QStringLiteral("climate.office"));
    QCOMPARE(status.value(QStringLiteral("recommendationsIssued")).toInt(), 1);
    QCOMPARE(status.value(QStringLiteral("pendingRecommendations")).toArray().size(), 1);
    QVERIFY(status.value(QStringLiteral("monitoringWindows")).isObject());
    QVERIFY(status.value(QStringLiteral("persistence")).isObject());
}

QTEST_MAIN(TestRecommendationEngine)
#include "test_recommendation_engine.moc"
