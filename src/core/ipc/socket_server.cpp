#include "core/ipc/socket_server.h"
#include "core/shared/logging.h"

#include <QJsonObject>
#include <QList>

namespace tp {

namespace {

constexpr int kLivePeerConnectMs = 150;

void setError(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
}

} // namespace

SocketServer::SocketServer(QObject* parent)
    : QObject(parent)
    , m_server(std::make_unique<QLocalServer>(this))
{
    m_server->setSocketOptions(QLocalServer::UserAccessOption);
    connect(m_server.get(), &QLocalServer::newConnection,
            this, &SocketServer::onNewConnection);
}

SocketServer::~SocketServer()
{
    close();
}

bool SocketServer::listen(const QString& socketPath, QString* errorOut)
{
    QString error;
    bool listening = m_server->listen(socketPath);
    if (!listening && m_server->serverError() == QAbstractSocket::AddressInUseError) {
        listening = reclaimStaleSocket(socketPath, &error);
    }
    if (!listening) {
        if (error.isEmpty()) {
            error = m_server->errorString();
        }
        LOG_ERROR(tpIpc, "Cannot listen on %s: %s", qUtf8Printable(socketPath), qUtf8Printable(error));
        setError(errorOut, error);
        return false;
    }

    LOG_INFO(tpIpc, "Listening on %s", qUtf8Printable(m_server->fullServerName()));
    return true;
}

bool SocketServer::reclaimStaleSocket(const QString& socketPath, QString* errorOut)
{
    QLocalSocket peer;
    peer.connectToServer(socketPath);
    if (peer.waitForConnected(kLivePeerConnectMs)) {
        peer.abort();
        setError(errorOut, QStringLiteral("Another recommender is already serving %1").arg(socketPath));
        return false;
    }

    LOG_WARN(tpIpc, "Replacing stale socket %s", qUtf8Printable(socketPath));
    QLocalServer::removeServer(socketPath);
    return m_server->listen(socketPath);
}

void SocketServer::close()
{
    // Take the table first so disconnect callbacks find nothing to do.
    const QList<QLocalSocket*> clients = m_clients.keys();
    m_clients.clear();

    for (QLocalSocket* client : clients) {
        client->disconnect(this);
        client->disconnectFromServer();
        client->deleteLater();
    }

    if (m_server->isListening()) {
        LOG_INFO(tpIpc, "Closing %s (%d client(s))",
                 qUtf8Printable(m_server->fullServerName()), static_cast<int>(clients.size()));
        m_server->close();
    }
}

void SocketServer::setRequestHandler(RequestHandler handler)
{
    m_handler = std::move(handler);
}

int SocketServer::broadcast(const QJsonObject& notification)
{
    const QByteArray frame = IpcMessage::encode(notification);
    if (frame.isEmpty()) {
        LOG_WARN(tpIpc, "Dropping notification that cannot be framed");
        return 0;
    }

    int reached = 0;
    for (auto it = m_clients.cbegin(); it != m_clients.cend(); ++it) {
        if (it.key()->write(frame) == frame.size()) {
            ++reached;
        }
        it.key()->flush();
    }
    return reached;
}

void SocketServer::onNewConnection()
{
    while (QLocalSocket* client = m_server->nextPendingConnection()) {
        m_clients.insert(client, ClientState());
        connect(client, &QLocalSocket::readyRead, this, &SocketServer::onClientReadyRead);
        connect(client, &QLocalSocket::disconnected, this, &SocketServer::onClientDisconnected);
        LOG_DEBUG(tpIpc, "Client connected (%d total)", clientCount());
    }
}

void SocketServer::onClientReadyRead()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    auto it = m_clients.find(client);
    if (it == m_clients.end()) {
        return;
    }

    it->pending.append(client->readAll());
    if (it->pending.size() > kMaxReadBufferSize) {
        dropClient(client, "read buffer limit exceeded");
        return;
    }
    if (IpcMessage::isFrameOversized(it->pending)) {
        dropClient(client, "frame exceeds message size limit");
        return;
    }
    consumeFrames(client);
}

void SocketServer::onClientDisconnected()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    auto it = m_clients.find(client);
    if (it == m_clients.end()) {
        return;
    }
    LOG_DEBUG(tpIpc, "Client disconnected after %llu request(s)",
              static_cast<unsigned long long>(it->requestsServed));
    m_clients.erase(it);
    client->deleteLater();
}

void SocketServer::dropClient(QLocalSocket* client, const char* reason)
{
    LOG_WARN(tpIpc, "Dropping client: %s", reason);
    m_clients.remove(client);
    client->disconnect(this);
    client->abort();
    client->deleteLater();
}

void SocketServer::consumeFrames(QLocalSocket* client)
{
    // The handler may close the server, so look the client up on every pass.
    for (auto it = m_clients.find(client); it != m_clients.end(); it = m_clients.find(client)) {
        const auto decoded = IpcMessage::decode(it->pending);
        if (!decoded) {
            const int skip = IpcMessage::completeFrameSize(it->pending);
            if (skip == 0) {
                return;  // frame still incomplete
            }
            LOG_WARN(tpIpc, "Skipping malformed frame (%d bytes)", skip);
            it->pending.remove(0, skip);
            continue;
        }
        it->pending.remove(0, decoded->bytesConsumed);

        const QString type = decoded->json.value(QStringLiteral("type")).toString();
        if (type != QLatin1String("request")) {
            LOG_DEBUG(tpIpc, "Ignoring client frame of type '%s'", qUtf8Printable(type));
            continue;
        }
        ++it->requestsServed;
        respond(client, decoded->json);
    }
}

void SocketServer::respond(QLocalSocket* client, const QJsonObject& request)
{
    const uint64_t id = IpcMessage::requestId(request);
    const QJsonObject reply = m_handler
        ? m_handler(request)
        : IpcMessage::makeError(id, IpcErrorCode::ServiceUnavailable,
                                QStringLiteral("Service is not accepting requests"));

    const QByteArray frame = IpcMessage::encode(reply);
    if (frame.isEmpty()) {
        LOG_ERROR(tpIpc, "Reply to request %llu cannot be framed",
                  static_cast<unsigned long long>(id));
        return;
    }
    if (m_clients.contains(client)) {
        client->write(frame);
        client->flush();
    }
}

} // namespace tp
