#pragma once

#include <QString>

namespace crl {

// Learning error codes. Validation codes are surfaced to callers;
// NoActionsRecorded is recovered inside the engine.
enum class LearningErrorCode : int {
    InvalidReward          = 1,
    InvalidContext         = 2,
    InvalidAction          = 3,
    NoActionsRecorded      = 4,
    PersistenceUnavailable = 5,
    InvalidEvent           = 6,
    QueueFull              = 7,
};

struct LearningError {
    LearningErrorCode code = LearningErrorCode::InvalidEvent;
    QString message;
};

inline QString learningErrorCodeToString(LearningErrorCode code)
{
    switch (code) {
    case LearningErrorCode::InvalidReward:          return QStringLiteral("INVALID_REWARD");
    case LearningErrorCode::InvalidContext:         return QStringLiteral("INVALID_CONTEXT");
    case LearningErrorCode::InvalidAction:          return QStringLiteral("INVALID_ACTION");
    case LearningErrorCode::NoActionsRecorded:      return QStringLiteral("NO_ACTIONS_RECORDED");
    case LearningErrorCode::PersistenceUnavailable: return QStringLiteral("PERSISTENCE_UNAVAILABLE");
    case LearningErrorCode::InvalidEvent:           return QStringLiteral("INVALID_EVENT");
    case LearningErrorCode::QueueFull:              return QStringLiteral("QUEUE_FULL");
    }
    return QStringLiteral("UNKNOWN");
}

inline void setLearningError(LearningError* errorOut, LearningErrorCode code, const QString& message)
{
    if (errorOut) {
        errorOut->code = code;
        errorOut->message = message;
    }
}

} // namespace crl
