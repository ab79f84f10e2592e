#pragma once

#include <QString>

namespace tp {

// IPC error codes carried in error responses as both number and string.
enum class IpcErrorCode : int {
    InvalidParams      = 1,
    NotFound           = 4,
    InternalError      = 6,
    Unsupported        = 7,
    ServiceUnavailable = 9,
    PreconditionFailed = 10,
};

inline QString ipcErrorCodeToString(IpcErrorCode code)
{
    switch (code) {
    case IpcErrorCode::InvalidParams:      return QStringLiteral("INVALID_PARAMS");
    case IpcErrorCode::NotFound:           return QStringLiteral("NOT_FOUND");
    case IpcErrorCode::InternalError:      return QStringLiteral("INTERNAL_ERROR");
    case IpcErrorCode::Unsupported:        return QStringLiteral("UNSUPPORTED");
    case IpcErrorCode::ServiceUnavailable: return QStringLiteral("SERVICE_UNAVAILABLE");
    case IpcErrorCode::PreconditionFailed: return QStringLiteral("PRECONDITION_FAILED");
    }
    return QStringLiteral("UNKNOWN");
}

// Method and notification names understood by the recommender service.
namespace ipc_method {
constexpr const char* kPing = "ping";
constexpr const char* kShutdown = "shutdown";
constexpr const char* kGetRecommendation = "getRecommendation";
constexpr const char* kRecommendationApplied = "recommendationApplied";
constexpr const char* kTemperatureManuallyChanged = "temperatureManuallyChanged";
constexpr const char* kEntitySelected = "entitySelected";
constexpr const char* kGetStatistics = "getStatistics";
constexpr const char* kResetLearningData = "resetLearningData";
constexpr const char* kGetSystemStatus = "getSystemStatus";
constexpr const char* kGetRecentActivity = "getRecentActivity";
constexpr const char* kGetDailyStats = "getDailyStats";

constexpr const char* kMonitoringWindowResolved = "monitoringWindowResolved";
} // namespace ipc_method

} // namespace tp
