#include "core/ipc/message.h"
#include "core/shared/logging.h"

#include <QJsonDocument>
#include <QtEndian>

#include <cstring>

namespace tp {

namespace {

constexpr int kHeaderSize = 4;

quint32 readLength(const QByteArray& buffer)
{
    quint32 rawLen = 0;
    std::memcpy(&rawLen, buffer.constData(), kHeaderSize);
    return qFromBigEndian(rawLen);
}

} // namespace

QByteArray IpcMessage::encode(const QJsonObject& json)
{
    const QByteArray payload = QJsonDocument(json).toJson(QJsonDocument::Compact);

    if (payload.size() > kMaxMessageSize) {
        LOG_WARN(tpIpc, "Message exceeds max size: %d > %d",
                 static_cast<int>(payload.size()), kMaxMessageSize);
        return {};
    }

    QByteArray msg;
    msg.reserve(kHeaderSize + payload.size());
    const quint32 len = qToBigEndian(static_cast<quint32>(payload.size()));
    msg.append(reinterpret_cast<const char*>(&len), kHeaderSize);
    msg.append(payload);
    return msg;
}

bool IpcMessage::isFrameOversized(const QByteArray& buffer)
{
    return buffer.size() >= kHeaderSize && readLength(buffer) > static_cast<quint32>(kMaxMessageSize);
}

int IpcMessage::completeFrameSize(const QByteArray& buffer)
{
    if (buffer.size() < kHeaderSize || isFrameOversized(buffer)) {
        return 0;
    }
    const int total = kHeaderSize + static_cast<int>(readLength(buffer));
    return buffer.size() >= total ? total : 0;
}

std::optional<IpcMessage::DecodeResult> IpcMessage::decode(const QByteArray& buffer)
{
    if (buffer.size() < kHeaderSize) {
        return std::nullopt;
    }

    const quint32 payloadLen = readLength(buffer);
    if (payloadLen > static_cast<quint32>(kMaxMessageSize)) {
        LOG_WARN(tpIpc, "Received message length exceeds max: %u > %d", payloadLen, kMaxMessageSize);
        return std::nullopt;
    }

    const int totalLen = kHeaderSize + static_cast<int>(payloadLen);
    if (buffer.size() < totalLen) {
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(buffer.mid(kHeaderSize, static_cast<int>(payloadLen)),
                                                      &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        LOG_WARN(tpIpc, "JSON parse error: %s", qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }
    if (!doc.isObject()) {
        LOG_WARN(tpIpc, "Expected JSON object payload");
        return std::nullopt;
    }

    DecodeResult result;
    result.json = doc.object();
    result.bytesConsumed = totalLen;
    return result;
}

QJsonObject IpcMessage::makeRequest(uint64_t id, const QString& method, const QJsonObject& params)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("request");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("method")] = method;
    if (!params.isEmpty()) {
        json[QStringLiteral("params")] = params;
    }
    return json;
}

QJsonObject IpcMessage::makeResponse(uint64_t id, const QJsonObject& result)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("response");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("result")] = result;
    return json;
}

QJsonObject IpcMessage::makeError(uint64_t id, IpcErrorCode code, const QString& message)
{
    QJsonObject errorObj;
    errorObj[QStringLiteral("code")] = static_cast<int>(code);
    errorObj[QStringLiteral("codeString")] = ipcErrorCodeToString(code);
    errorObj[QStringLiteral("message")] = message;

    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("error");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("error")] = errorObj;
    return json;
}

QJsonObject IpcMessage::makeNotification(const QString& method, const QJsonObject& params)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("notification");
    json[QStringLiteral("method")] = method;
    if (!params.isEmpty()) {
        json[QStringLiteral("params")] = params;
    }
    return json;
}

uint64_t IpcMessage::requestId(const QJsonObject& request)
{
    return static_cast<uint64_t>(request.value(QStringLiteral("id")).toInteger());
}

} // namespace tp
