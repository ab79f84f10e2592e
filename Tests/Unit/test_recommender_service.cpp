#include <QtTest/QtTest>

#include "core/ipc/message.h"
#include "manual_timer_service.h"
#include "ipc_test_utils.h"
#include "services/recommender/recommender_service.h"

#include <QDateTime>
#include <QJsonArray>
#include <QLocalSocket>
#include <QSet>
#include <QTemporaryDir>

#include <chrono>
#include <memory>

using namespace std::chrono_literals;

namespace {

const QString kLiving = QStringLiteral("climate.living_room");

class ScopedEnvVar {
public:
    ScopedEnvVar(const char* key, const QByteArray& value)
        : m_key(key)
        , m_hadOriginal(qEnvironmentVariableIsSet(key))
        , m_original(qgetenv(key))
    {
        qputenv(m_key, value);
    }

    ~ScopedEnvVar()
    {
        if (m_hadOriginal) {
            qputenv(m_key, m_original);
        } else {
            qunsetenv(m_key);
        }
    }

private:
    const char* m_key;
    bool m_hadOriginal = false;
    QByteArray m_original;
};

class InspectableRecommenderService final : public tp::RecommenderService {
public:
    using tp::RecommenderService::RecommenderService;

    QJsonObject dispatch(const QString& method, const QJsonObject& params = {})
    {
        QJsonObject request;
        request[QStringLiteral("type")] = QStringLiteral("request");
        request[QStringLiteral("id")] = static_cast<qint64>(++m_nextId);
        request[QStringLiteral("method")] = method;
        if (!params.isEmpty()) {
            request[QStringLiteral("params")] = params;
        }
        return handleRequest(request);
    }

private:
    uint64_t m_nextId = 0;
};

tp::EngineSettings greedySettings(const QString& dbPath)
{
    tp::EngineSettings settings;
    settings.dbPath = dbPath;
    settings.initialEpsilon = 0.0;
    settings.minEpsilon = 0.0;
    return settings;
}

QJsonObject recommendationParams(double outdoor, double target)
{
    QJsonObject params;
    params[QStringLiteral("entityId")] = kLiving;
    params[QStringLiteral("outdoorTemp")] = outdoor;
    params[QStringLiteral("currentTarget")] = target;
    return params;
}

QJsonObject appliedParams(double recommendedTemp)
{
    QJsonObject params;
    params[QStringLiteral("entityId")] = kLiving;
    params[QStringLiteral("recommendedTemp")] = recommendedTemp;
    params[QStringLiteral("appliedBy")] = QStringLiteral("automation");
    return params;
}

} // namespace

class TestRecommenderService : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testRequestsBeforeInitializeAreUnavailable();
    void testInitializeTwiceFails();
    void testMissingParamsAreRejected();
    void testApplyWithoutRecommendationFailsPrecondition();
    void testSustainedRecommendationFlow();
    void testManualChangeDuringWindow();
    void testDailyStatsValidation();
    void testEntitySelectedAndSystemStatus();
    void testResetLearningDataScopes();
    void testLearningStateSurvivesRestart();
    void testResolutionNotificationOverSocket();

private:
    std::unique_ptr<InspectableRecommenderService> makeService(tp::test::ManualTimerService** timersOut);

    std::unique_ptr<QTemporaryDir> m_dir;
};

void TestRecommenderService::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
}

void TestRecommenderService::cleanup()
{
    m_dir.reset();
}

std::unique_ptr<InspectableRecommenderService> TestRecommenderService::makeService(
    tp::test::ManualTimerService** timersOut)
{
    auto timers = std::make_unique<tp::test::ManualTimerService>();
    *timersOut = timers.get();

    tp::RecommenderService::Components components;
    components.timers = std::move(timers);
    return std::make_unique<InspectableRecommenderService>(
        greedySettings(m_dir->filePath(QStringLiteral("learning.db"))), std::move(components));
}

void TestRecommenderService::testRequestsBeforeInitializeAreUnavailable()
{
    tp::test::ManualTimerService* timers = nullptr;
    auto service = makeService(&timers);

    const QJsonObject reply = service->dispatch(QStringLiteral("getRecommendation"),
                                                recommendationParams(30.0, 22.0));
    QVERIFY(tp::test::isError(reply));
    QCOMPARE(tp::test::errorCodeString(reply), QStringLiteral("SERVICE_UNAVAILABLE"));

    const QJsonObject pong = service->dispatch(QStringLiteral("ping"));
    QVERIFY(tp::test::isResponse(pong));
    QCOMPARE(tp::test::resultPayload(pong).value(QStringLiteral("pong")).toBool(), true);
}

void TestRecommenderService::testInitializeTwiceFails()
{
    tp::test::ManualTimerService* timers = nullptr;
    auto service = makeService(&timers);
    QVERIFY(service->initialize());
    QVERIFY(!service->initialize());
    QVERIFY(service->engine() != nullptr);
}

void TestRecommenderService::testMissingParamsAreRejected()
{
    tp::test::ManualTimerService* timers = nullptr;
    auto service = makeService(&timers);
    QVERIFY(service->initialize());

    QJsonObject noEntity = recommendationParams(30.0, 22.0);
    noEntity.remove(QStringLiteral("entityId"));
    QJsonObject reply = service->dispatch(QStringLiteral("getRecommendation"), noEntity);
    QCOMPARE(tp::test::errorCodeString(reply), QStringLiteral("INVALID_PARAMS"));

    QJsonObject badOutdoor = recommendationParams(30.0, 22.0);
    badOutdoor[QStringLiteral("outdoorTemp")] = QStringLiteral("hot");
    reply = service->dispatch(QStringLiteral("getRecommendation"), badOutdoor);
    QCOMPARE(tp::test::errorCodeString(reply), QStringLiteral("INVALID_PARAMS"));

    QJsonObject noTarget = recommendationParams(30.0, 22.0);
    noTarget.remove(QStringLiteral("currentTarget"));
    reply = service->dispatch(QStringLiteral("getRecommendation"), noTarget);
    QCOMPARE(tp::test::errorCodeString(reply), QStringLiteral("INVALID_PARAMS"));

    QJsonObject manual;
    manual[QStringLiteral("entityId")] = kLiving;
    manual[QStringLiteral("newTemp")] = 21.0;
    reply = service->dispatch(QStringLiteral("temperatureManuallyChanged"), manual);
    QCOMPARE(tp::test::errorCodeString(reply), QStringLiteral("INVALID_PARAMS"));

    reply = service->dispatch(QStringLiteral("entitySelected"));
    QCOMPARE(tp::test::errorCodeString(reply), QStringLiteral("INVALID_PARAMS"));

    reply = service->dispatch(QStringLiteral("noSuchMethod"));
    QCOMPARE(tp::test::errorCodeString(reply), QStringLiteral("NOT_FOUND"));
}

void TestRecommenderService::testApplyWithoutRecommendationFailsPrecondition()
{
    tp::test::ManualTimerService* timers = nullptr;
    auto service = makeService(&timers);
    QVERIFY(service->initialize());

    const QJsonObject reply = service->dispatch(QStringLiteral("recommendationApplied"),
                                                appliedParams(21.0));
    QVERIFY(tp::test::isError(reply));
    QCOMPARE(tp::test::errorCodeString(reply), QStringLiteral("PRECONDITION_FAILED"));
    QCOMPARE(timers->pendingCount(), size_t(0));
}

void TestRecommenderService::testSustainedRecommendationFlow()
{
    tp::test::ManualTimerService* timers = nullptr;
    auto service = makeService(&timers);
    QVERIFY(service->initialize());

    const QJsonObject recReply = service->dispatch(QStringLiteral("getRecommendation"),
                                                   recommendationParams(32.0, 22.0));
    QVERIFY(tp::test::isResponse(recReply));
    const QJsonObject rec = tp::test::resultPayload(recReply);
    QCOMPARE(rec.value(QStringLiteral("entityId")).toString(), kLiving);
    QCOMPARE(rec.value(QStringLiteral("action")).toString(), QStringLiteral("decrease_2"));
    QCOMPARE(rec.value(QStringLiteral("recommendedTemp")).toDouble(), 20.0);
    QCOMPARE(rec.value(QStringLiteral("fallback")).toBool(), false);
    QCOMPARE(rec.value(QStringLiteral("context")).toObject()
                 .value(QStringLiteral("stateKey")).toString(),
             QStringLiteral("hot_comfortable_medium"));

    const QJsonObject applied = service->dispatch(QStringLiteral("recommendationApplied"),
                                                  appliedParams(20.0));
    QVERIFY(tp::test::isResponse(applied));
    QCOMPARE(tp::test::resultPayload(applied).value(QStringLiteral("monitoring")).toBool(), true);
    QCOMPARE(tp::test::resultPayload(applied).value(QStringLiteral("windowMs")).toInteger(),
             qint64(3600000));

    QCOMPARE(timers->advance(1h), 1);

    QJsonObject statsParams;
    statsParams[QStringLiteral("entityId")] = kLiving;
    const QJsonObject stats = tp::test::resultPayload(
        service->dispatch(QStringLiteral("getStatistics"), statsParams));
    QCOMPARE(stats.value(QStringLiteral("totalRecommendations")).toInt(), 1);
    QCOMPARE(stats.value(QStringLiteral("successfulRecommendations")).toInt(), 1);
    QCOMPARE(stats.value(QStringLiteral("successRate")).toDouble(), 1.0);

    const QJsonObject aggregate = tp::test::resultPayload(
        service->dispatch(QStringLiteral("getStatistics")));
    QCOMPARE(aggregate.value(QStringLiteral("totalEntities")).toInt(), 1);
    QVERIFY(aggregate.contains(QStringLiteral("systemUptimeMs")));

    QJsonObject dayParams;
    dayParams[QStringLiteral("entityId")] = kLiving;
    const QJsonObject daily = tp::test::resultPayload(
        service->dispatch(QStringLiteral("getDailyStats"), dayParams));
    QCOMPARE(daily.value(QStringLiteral("date")).toString(),
             QDateTime::currentDateTimeUtc().date().toString(Qt::ISODate));
    QCOMPARE(daily.value(QStringLiteral("recommendationsApplied")).toInt(), 1);
    QCOMPARE(daily.value(QStringLiteral("successfulRecommendations")).toInt(), 1);

    const QJsonArray activity = tp::test::resultPayload(
        service->dispatch(QStringLiteral("getRecentActivity"), dayParams))
        .value(QStringLiteral("activity")).toArray();
    QCOMPARE(activity.size(), 2);
    QSet<QString> types;
    for (const QJsonValue& row : activity) {
        types.insert(row.toObject().value(QStringLiteral("type")).toString());
    }
    QVERIFY(types.contains(QStringLiteral("recommendation_applied")));
    QVERIFY(types.contains(QStringLiteral("successful_recommendation")));
}

void TestRecommenderService::testManualChangeDuringWindow()
{
    tp::test::ManualTimerService* timers = nullptr;
    auto service = makeService(&timers);
    QVERIFY(service->initialize());

    QVERIFY(tp::test::isResponse(service->dispatch(QStringLiteral("getRecommendation"),
                                                   recommendationParams(32.0, 22.0))));
    QVERIFY(tp::test::isResponse(service->dispatch(QStringLiteral("recommendationApplied"),
                                                   appliedParams(20.0))));
    QCOMPARE(timers->advance(10min), 0);

    QJsonObject manual;
    manual[QStringLiteral("entityId")] = kLiving;
    manual[QStringLiteral("newTemp")] = 23.0;
    manual[QStringLiteral("previousTemp")] = 20.0;
    QJsonObject reply = service->dispatch(QStringLiteral("temperatureManuallyChanged"), manual);
    QVERIFY(tp::test::isResponse(reply));
    QCOMPARE(tp::test::resultPayload(reply).value(QStringLiteral("resolvedWindow")).toBool(), true);

    // The window is gone; a second change is only observed.
    reply = service->dispatch(QStringLiteral("temperatureManuallyChanged"), manual);
    QCOMPARE(tp::test::resultPayload(reply).value(QStringLiteral("resolvedWindow")).toBool(), false);
    QCOMPARE(timers->advance(1h), 0);

    QJsonObject statsParams;
    statsParams[QStringLiteral("entityId")] = kLiving;
    const QJsonObject stats = tp::test::resultPayload(
        service->dispatch(QStringLiteral("getStatistics"), statsParams));
    QCOMPARE(stats.value(QStringLiteral("totalRecommendations")).toInt(), 1);
    QCOMPARE(stats.value(QStringLiteral("successfulRecommendations")).toInt(), 0);

    const QJsonObject daily = tp::test::resultPayload(
        service->dispatch(QStringLiteral("getDailyStats"), statsParams));
    QCOMPARE(daily.value(QStringLiteral("adjustmentsMade")).toInt(), 1);

    // The override taught the engine to prefer a smaller step next time.
    const QJsonObject next = tp::test::resultPayload(
        service->dispatch(QStringLiteral("getRecommendation"), recommendationParams(32.0, 22.0)));
    QCOMPARE(next.value(QStringLiteral("action")).toString(), QStringLiteral("decrease_1"));
}

void TestRecommenderService::testDailyStatsValidation()
{
    tp::test::ManualTimerService* timers = nullptr;
    auto service = makeService(&timers);
    QVERIFY(service->initialize());

    QJsonObject params;
    QJsonObject reply = service->dispatch(QStringLiteral("getDailyStats"), params);
    QCOMPARE(tp::test::errorCodeString(reply), QStringLiteral("INVALID_PARAMS"));

    params[QStringLiteral("entityId")] = kLiving;
    params[QStringLiteral("date")] = QStringLiteral("31/12/2025");
    reply = service->dispatch(QStringLiteral("getDailyStats"), params);
    QCOMPARE(tp::test::errorCodeString(reply), QStringLiteral("INVALID_PARAMS"));

    params[QStringLiteral("date")] = QStringLiteral("2025-12-31");
    reply = service->dispatch(QStringLiteral("getDailyStats"), params);
    QCOMPARE(tp::test::errorCodeString(reply), QStringLiteral("NOT_FOUND"));

    QJsonObject limitParams;
    limitParams[QStringLiteral("limit")] = 0;
    reply = service->dispatch(QStringLiteral("getRecentActivity"), limitParams);
    QVERIFY(tp::test::isResponse(reply));
    QVERIFY(tp::test::resultPayload(reply).value(QStringLiteral("activity")).toArray().isEmpty());
}

void TestRecommenderService::testEntitySelectedAndSystemStatus()
{
    tp::test::ManualTimerService* timers = nullptr;
    auto service = makeService(&timers);
    QVERIFY(service->initialize());

    QJsonObject selected;
    selected[QStringLiteral("entityId")] = kLiving;
    QVERIFY(tp::test::isResponse(service->dispatch(QStringLiteral("entitySelected"), selected)));

    QVERIFY(tp::test::isResponse(service->dispatch(QStringLiteral("getRecommendation"),
                                                   recommendationParams(32.0, 22.0))));
    QVERIFY(tp::test::isResponse(service->dispatch(QStringLiteral("recommendationApplied"),
                                                   appliedParams(20.0))));

    const QJsonObject status = tp::test::resultPayload(
        service->dispatch(QStringLiteral("getSystemStatus")));
    QCOMPARE(status.value(QStringLiteral("service")).toString(), QStringLiteral("recommender"));
    QCOMPARE(status.value(QStringLiteral("initialized")).toBool(), true);
    QCOMPARE(status.value(QStringLiteral("clients")).toInt(), 0);
    QCOMPARE(status.value(QStringLiteral("lastSelectedEntity")).toString(), kLiving);
    QCOMPARE(status.value(QStringLiteral("activeMonitoringWindows")).toInt(), 1);
    QCOMPARE(status.value(QStringLiteral("persistenceAvailable")).toBool(), true);
    QCOMPARE(status.value(QStringLiteral("activityLoggerAvailable")).toBool(), true);
    QCOMPARE(status.value(QStringLiteral("monitoringWindows")).toObject()
                 .value(QStringLiteral("armed")).toInt(), 1);
}

void TestRecommenderService::testResetLearningDataScopes()
{
    tp::test::ManualTimerService* timers = nullptr;
    auto service = makeService(&timers);
    QVERIFY(service->initialize());

    QVERIFY(tp::test::isResponse(service->dispatch(QStringLiteral("getRecommendation"),
                                                   recommendationParams(32.0, 22.0))));
    QVERIFY(tp::test::isResponse(service->dispatch(QStringLiteral("recommendationApplied"),
                                                   appliedParams(20.0))));
    QCOMPARE(timers->pendingCount(), size_t(1));

    QJsonObject scoped;
    scoped[QStringLiteral("entityId")] = kLiving;
    QJsonObject reply = service->dispatch(QStringLiteral("resetLearningData"), scoped);
    QCOMPARE(tp::test::resultPayload(reply).value(QStringLiteral("scope")).toString(), kLiving);
    QCOMPARE(timers->pendingCount(), size_t(0));

    reply = service->dispatch(QStringLiteral("resetLearningData"));
    QCOMPARE(tp::test::resultPayload(reply).value(QStringLiteral("reset")).toBool(), true);
    QCOMPARE(tp::test::resultPayload(reply).value(QStringLiteral("scope")).toString(),
             QStringLiteral("all"));

    const QJsonObject aggregate = tp::test::resultPayload(
        service->dispatch(QStringLiteral("getStatistics")));
    QCOMPARE(aggregate.value(QStringLiteral("totalEntities")).toInt(), 0);
}

void TestRecommenderService::testLearningStateSurvivesRestart()
{
    {
        tp::test::ManualTimerService* timers = nullptr;
        auto service = makeService(&timers);
        QVERIFY(service->initialize());
        QVERIFY(tp::test::isResponse(service->dispatch(QStringLiteral("getRecommendation"),
                                                       recommendationParams(32.0, 22.0))));
        QVERIFY(tp::test::isResponse(service->dispatch(QStringLiteral("recommendationApplied"),
                                                       appliedParams(20.0))));
        QCOMPARE(timers->advance(1h), 1);
        // Destruction drains the persistence queue.
    }

    tp::test::ManualTimerService* timers = nullptr;
    auto restarted = makeService(&timers);
    QVERIFY(restarted->initialize());

    QJsonObject statsParams;
    statsParams[QStringLiteral("entityId")] = kLiving;
    const QJsonObject stats = tp::test::resultPayload(
        restarted->dispatch(QStringLiteral("getStatistics"), statsParams));
    QCOMPARE(stats.value(QStringLiteral("successfulRecommendations")).toInt(), 1);
}

void TestRecommenderService::testResolutionNotificationOverSocket()
{
    ScopedEnvVar socketDir("THERMOPILOT_SOCKET_DIR", m_dir->path().toUtf8());

    tp::test::ManualTimerService* timers = nullptr;
    auto service = makeService(&timers);
    QVERIFY(service->initialize());
    QVERIFY(service->start());

    QLocalSocket client;
    QVERIFY(tp::test::connectWithRetry(client, tp::ServiceBase::socketPath(QStringLiteral("recommender")), 2000));
    QByteArray buffer;

    QJsonObject reply = tp::test::requestOrEmpty(client, buffer, 1,
                                                 QStringLiteral("getRecommendation"),
                                                 recommendationParams(32.0, 22.0));
    QVERIFY(tp::test::isResponse(reply));
    const double recommended =
        tp::test::resultPayload(reply).value(QStringLiteral("recommendedTemp")).toDouble();

    reply = tp::test::requestOrEmpty(client, buffer, 2,
                                     QStringLiteral("recommendationApplied"),
                                     appliedParams(recommended));
    QVERIFY(tp::test::isResponse(reply));

    QCOMPARE(timers->advance(1h), 1);

    const auto frame = tp::test::readFrame(client, buffer, 3000);
    QVERIFY(frame.has_value());
    QVERIFY(tp::test::isNotification(*frame));
    QCOMPARE(frame->value(QStringLiteral("method")).toString(),
             QStringLiteral("monitoringWindowResolved"));

    const QJsonObject params = frame->value(QStringLiteral("params")).toObject();
    QCOMPARE(params.value(QStringLiteral("entityId")).toString(), kLiving);
    QCOMPARE(params.value(QStringLiteral("outcome")).toString(), QStringLiteral("accepted"));
    QCOMPARE(params.value(QStringLiteral("superseded")).toBool(), false);
    QCOMPARE(params.value(QStringLiteral("rewardApplied")).toBool(), true);
    QCOMPARE(params.value(QStringLiteral("reward")).toDouble(), 0.5);
    QCOMPARE(params.value(QStringLiteral("elapsedMs")).toInteger(), qint64(3600000));

    client.disconnectFromServer();
}

QTEST_MAIN(TestRecommenderService)
#include "test_recommender_service.moc"
