#include "core/ipc/service_base.h"
#include "core/shared/logging.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>

#include <unistd.h>

namespace tp {

namespace {

QString envDirectory(const char* name)
{
    const QString value = qEnvironmentVariable(name).trimmed();
    return value.isEmpty() ? QString() : QDir::cleanPath(value);
}

} // namespace

ServiceBase::ServiceBase(const QString& serviceName, QObject* parent)
    : QObject(parent)
    , m_serviceName(serviceName)
    , m_server(std::make_unique<SocketServer>(this))
{
    m_uptime.start();
    m_server->setRequestHandler([this](const QJsonObject& request) {
        return handleRequest(request);
    });
}

ServiceBase::~ServiceBase() = default;

bool ServiceBase::start(QString* errorOut)
{
    const QString path = socketPath(m_serviceName);
    const QString dir = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(dir)) {
        if (errorOut) {
            *errorOut = QStringLiteral("Cannot create socket directory %1").arg(dir);
        }
        LOG_ERROR(tpIpc, "Cannot create socket directory %s", qUtf8Printable(dir));
        return false;
    }
    return m_server->listen(path, errorOut);
}

int ServiceBase::run()
{
    QString error;
    if (!start(&error)) {
        LOG_ERROR(tpIpc, "Service '%s' not started: %s",
                  qUtf8Printable(m_serviceName), qUtf8Printable(error));
        return 1;
    }
    return QCoreApplication::exec();
}

QString ServiceBase::socketPath(const QString& serviceName)
{
    return QDir(socketDirectory()).filePath(serviceName + QStringLiteral(".sock"));
}

QString ServiceBase::runtimeDirectory()
{
    const QString dir = envDirectory("THERMOPILOT_RUNTIME_DIR");
    return dir.isEmpty() ? QStringLiteral("/tmp/thermopilot-%1").arg(getuid()) : dir;
}

QString ServiceBase::socketDirectory()
{
    const QString dir = envDirectory("THERMOPILOT_SOCKET_DIR");
    return dir.isEmpty() ? runtimeDirectory() : dir;
}

QJsonObject ServiceBase::handleRequest(const QJsonObject& request)
{
    const uint64_t id = IpcMessage::requestId(request);
    const QString method = request.value(QStringLiteral("method")).toString();

    if (method == QLatin1String(ipc_method::kPing)) {
        return handlePing(id);
    }
    if (method == QLatin1String(ipc_method::kShutdown)) {
        return handleShutdown(id);
    }

    LOG_WARN(tpIpc, "'%s' has no method '%s'", qUtf8Printable(m_serviceName), qUtf8Printable(method));
    return IpcMessage::makeError(id, IpcErrorCode::NotFound,
                                 QStringLiteral("Unknown method: %1").arg(method));
}

QJsonObject ServiceBase::handlePing(uint64_t id) const
{
    QJsonObject result;
    result[QStringLiteral("pong")] = true;
    result[QStringLiteral("service")] = m_serviceName;
    result[QStringLiteral("timestamp")] = QDateTime::currentMSecsSinceEpoch();
    result[QStringLiteral("uptimeMs")] = m_uptime.elapsed();
    return IpcMessage::makeResponse(id, result);
}

QJsonObject ServiceBase::handleShutdown(uint64_t id)
{
    LOG_INFO(tpIpc, "'%s' shutting down on request", qUtf8Printable(m_serviceName));
    onShutdownRequested();

    // Queued so the reply is written before the loop exits.
    if (QCoreApplication* app = QCoreApplication::instance()) {
        QMetaObject::invokeMethod(app, &QCoreApplication::quit, Qt::QueuedConnection);
    }

    QJsonObject result;
    result[QStringLiteral("shutting_down")] = true;
    return IpcMessage::makeResponse(id, result);
}

int ServiceBase::sendNotification(const QString& method, const QJsonObject& params)
{
    const int reached = m_server->broadcast(IpcMessage::makeNotification(method, params));
    LOG_DEBUG(tpIpc, "'%s' sent to %d client(s)", qUtf8Printable(method), reached);
    return reached;
}

} // namespace tp
