#pragma once

#include "core/shared/ipc_messages.h"

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include <cstdint>
#include <optional>

namespace tp {

// Wire format: 4-byte big-endian payload length followed by a compact UTF-8
// JSON object. Envelopes carry "type" (request, response, error,
// notification), "id" for request/response pairs, "method" and "params".
class IpcMessage {
public:
    static QByteArray encode(const QJsonObject& json);

    // Returns nullopt while the buffer holds no complete frame, or when the
    // frame is malformed (oversized length, invalid JSON, non-object).
    // Callers tell the cases apart with completeFrameSize() and
    // isFrameOversized().
    struct DecodeResult {
        QJsonObject json;
        int bytesConsumed = 0;
    };
    static std::optional<DecodeResult> decode(const QByteArray& buffer);
    static bool isFrameOversized(const QByteArray& buffer);
    // Header plus payload size once the whole frame is buffered, else 0.
    static int completeFrameSize(const QByteArray& buffer);

    static QJsonObject makeRequest(uint64_t id, const QString& method, const QJsonObject& params = {});
    static QJsonObject makeResponse(uint64_t id, const QJsonObject& result);
    static QJsonObject makeError(uint64_t id, IpcErrorCode code, const QString& message);
    static QJsonObject makeNotification(const QString& method, const QJsonObject& params = {});

    static uint64_t requestId(const QJsonObject& request);

    // Max payload size: 1MB. Recommender traffic is a few hundred bytes.
    static constexpr int kMaxMessageSize = 1024 * 1024;
};

} // namespace tp
