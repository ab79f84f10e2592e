#pragma once

#include "core/ipc/message.h"

#include <QByteArray>
#include <QHash>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>

#include <functional>
#include <memory>

namespace tp {

// SocketServer -- request/response endpoint for IpcMessage frames on a
// QLocalServer. Requests are answered in order on the event-loop thread.
// Clients only ever send requests; anything else they send is dropped.
// Notifications flow server to client through broadcast().
class SocketServer : public QObject {
    Q_OBJECT
public:
    using RequestHandler = std::function<QJsonObject(const QJsonObject& request)>;

    explicit SocketServer(QObject* parent = nullptr);
    ~SocketServer() override;

    // Takes over a stale socket file left by a crashed instance, but never
    // one with a live server behind it.
    bool listen(const QString& socketPath, QString* errorOut = nullptr);
    void close();

    void setRequestHandler(RequestHandler handler);

    // Returns the number of clients the notification was written to.
    int broadcast(const QJsonObject& notification);

    int clientCount() const { return static_cast<int>(m_clients.size()); }

    static constexpr int kMaxReadBufferSize = 2 * IpcMessage::kMaxMessageSize;

private slots:
    void onNewConnection();
    void onClientReadyRead();
    void onClientDisconnected();

private:
    struct ClientState {
        QByteArray pending;
        quint64 requestsServed = 0;
    };

    bool reclaimStaleSocket(const QString& socketPath, QString* errorOut);
    void consumeFrames(QLocalSocket* client);
    void respond(QLocalSocket* client, const QJsonObject& request);
    void dropClient(QLocalSocket* client, const char* reason);

    std::unique_ptr<QLocalServer> m_server;
    QHash<QLocalSocket*, ClientState> m_clients;
    RequestHandler m_handler;
};

} // namespace tp
