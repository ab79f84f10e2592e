#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(tpCore, "thermopilot.core")
Q_LOGGING_CATEGORY(tpLearning, "thermopilot.learning")
Q_LOGGING_CATEGORY(tpFeedback, "thermopilot.feedback")
Q_LOGGING_CATEGORY(tpStore, "thermopilot.store")
Q_LOGGING_CATEGORY(tpIpc, "thermopilot.ipc")
