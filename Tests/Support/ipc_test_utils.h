#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QLocalSocket>
#include <QString>

#include <cstdint>
#include <optional>

namespace tp::test {

// Blocking helpers for talking to an in-process service. Every wait spins
// the event loop, so the server side runs on the same thread.
bool connectWithRetry(QLocalSocket& socket, const QString& socketPath, int timeoutMs);
bool writeFrame(QLocalSocket& socket, const QJsonObject& message);

// Next complete frame from the socket. `buffer` holds bytes carried between
// calls.
std::optional<QJsonObject> readFrame(QLocalSocket& socket, QByteArray& buffer, int timeoutMs);

// Sends a request and waits for the response or error with the same id,
// skipping notifications. Returns an empty object on timeout.
QJsonObject requestOrEmpty(QLocalSocket& socket,
                           QByteArray& buffer,
                           uint64_t id,
                           const QString& method,
                           const QJsonObject& params = {},
                           int timeoutMs = 3000);

bool isResponse(const QJsonObject& message);
bool isError(const QJsonObject& message);
bool isNotification(const QJsonObject& message);
QJsonObject resultPayload(const QJsonObject& message);
QJsonObject errorPayload(const QJsonObject& message);
QString errorCodeString(const QJsonObject& message);

} // namespace tp::test
