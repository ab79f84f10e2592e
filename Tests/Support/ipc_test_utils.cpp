#include "ipc_test_utils.h"

#include "core/ipc/message.h"

#include <QElapsedTimer>
#include <QTest>

namespace tp::test {

bool connectWithRetry(QLocalSocket& socket, const QString& socketPath, int timeoutMs)
{
    if (socketPath.trimmed().isEmpty() || timeoutMs <= 0) {
        return false;
    }

    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < timeoutMs) {
        socket.connectToServer(socketPath);
        for (int i = 0; i < 10 && socket.state() == QLocalSocket::ConnectingState; ++i) {
            QTest::qWait(10);
        }
        if (socket.state() == QLocalSocket::ConnectedState) {
            // Let the server accept the pending connection.
            QTest::qWait(10);
            return true;
        }
        socket.abort();
        QTest::qWait(25);
    }
    return false;
}

bool writeFrame(QLocalSocket& socket, const QJsonObject& message)
{
    const QByteArray frame = IpcMessage::encode(message);
    if (frame.isEmpty()) {
        return false;
    }
    if (socket.write(frame) != frame.size()) {
        return false;
    }
    socket.flush();
    return true;
}

std::optional<QJsonObject> readFrame(QLocalSocket& socket, QByteArray& buffer, int timeoutMs)
{
    QElapsedTimer timer;
    timer.start();
    while (true) {
        buffer.append(socket.readAll());
        if (auto decoded = IpcMessage::decode(buffer)) {
            buffer.remove(0, decoded->bytesConsumed);
            return decoded->json;
        }
        if (timer.elapsed() >= timeoutMs) {
            return std::nullopt;
        }
        QTest::qWait(5);
    }
}

QJsonObject requestOrEmpty(QLocalSocket& socket,
                           QByteArray& buffer,
                           uint64_t id,
                           const QString& method,
                           const QJsonObject& params,
                           int timeoutMs)
{
    if (!writeFrame(socket, IpcMessage::makeRequest(id, method, params))) {
        return {};
    }

    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < timeoutMs) {
        const int remaining = timeoutMs - static_cast<int>(timer.elapsed());
        const auto message = readFrame(socket, buffer, remaining);
        if (!message) {
            break;
        }
        if (!isNotification(*message) && IpcMessage::requestId(*message) == id) {
            return *message;
        }
    }
    qWarning("No reply to '%s' (id %llu) within %d ms",
             qUtf8Printable(method), static_cast<unsigned long long>(id), timeoutMs);
    return {};
}

bool isResponse(const QJsonObject& message)
{
    return message.value(QStringLiteral("type")).toString() == QLatin1String("response");
}

bool isError(const QJsonObject& message)
{
    return message.value(QStringLiteral("type")).toString() == QLatin1String("error");
}

bool isNotification(const QJsonObject& message)
{
    return message.value(QStringLiteral("type")).toString() == QLatin1String("notification");
}

QJsonObject resultPayload(const QJsonObject& message)
{
    return message.value(QStringLiteral("result")).toObject();
}

QJsonObject errorPayload(const QJsonObject& message)
{
    return message.value(QStringLiteral("error")).toObject();
}

QString errorCodeString(const QJsonObject& message)
{
    return errorPayload(message).value(QStringLiteral("codeString")).toString();
}

} // namespace tp::test
