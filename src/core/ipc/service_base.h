#pragma once

#include "core/ipc/socket_server.h"

#include <QElapsedTimer>
#include <QJsonObject>
#include <QString>

#include <memory>

namespace tp {

// ServiceBase -- a named local-socket service. Answers "ping" and "shutdown";
// subclasses handle their own methods in handleRequest() and defer to the
// base for the rest.
class ServiceBase : public QObject {
    Q_OBJECT
public:
    explicit ServiceBase(const QString& serviceName, QObject* parent = nullptr);
    ~ServiceBase() override;

    // Binds the socket without entering the event loop.
    bool start(QString* errorOut = nullptr);

    // start() followed by the event loop. Returns the process exit code.
    int run();

    const QString& serviceName() const { return m_serviceName; }

    // $THERMOPILOT_SOCKET_DIR, else $THERMOPILOT_RUNTIME_DIR, else
    // /tmp/thermopilot-<uid>.
    static QString socketPath(const QString& serviceName);
    static QString runtimeDirectory();
    static QString socketDirectory();

protected:
    virtual QJsonObject handleRequest(const QJsonObject& request);

    // Runs before the shutdown reply is sent; the event loop quits after.
    virtual void onShutdownRequested() {}

    // Returns the number of clients reached.
    int sendNotification(const QString& method, const QJsonObject& params = {});

    QString m_serviceName;
    std::unique_ptr<SocketServer> m_server;

private:
    QJsonObject handlePing(uint64_t id) const;
    QJsonObject handleShutdown(uint64_t id);

    QElapsedTimer m_uptime;
};

} // namespace tp
