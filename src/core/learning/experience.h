#pragma once

#include "core/shared/types.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>

namespace crl {

enum class ExperienceState {
    Unprocessed,
    Processed,
    Dropped,
};

inline QString experienceStateToString(ExperienceState state)
{
    switch (state) {
    case ExperienceState::Unprocessed: return QStringLiteral("unprocessed");
    case ExperienceState::Processed:   return QStringLiteral("processed");
    case ExperienceState::Dropped:     return QStringLiteral("dropped");
    }
    return QStringLiteral("unprocessed");
}

inline ExperienceState experienceStateFromString(const QString& str)
{
    const QString normalized = str.trimmed().toLower();
    if (normalized == QLatin1String("processed")) {
        return ExperienceState::Processed;
    }
    if (normalized == QLatin1String("dropped")) {
        return ExperienceState::Dropped;
    }
    return ExperienceState::Unprocessed;
}

inline const QString kDropReasonOverflow = QStringLiteral("dropped: overflow");
inline const QString kDropReasonValidation = QStringLiteral("dropped: validation");

// One observed (context, action, reward) outcome. Once the state leaves
// Unprocessed the record is frozen.
struct Experience {
    QString id;
    QString context;                 // normalized
    QString action;                  // wire name; validated before the Q-update
    double reward = 0.0;             // [-1, 1]
    QDateTime timestamp;             // UTC
    ExperienceState state = ExperienceState::Unprocessed;
    QDateTime processedAt;
    QString dropReason;
    QJsonObject metadata;

    bool isUnprocessed() const { return state == ExperienceState::Unprocessed; }
    bool isPositiveReward() const { return reward > 0.0; }
};

} // namespace crl
