#pragma once

#include "core/learning/experience.h"

#include <QDateTime>
#include <QVector>

#include <deque>
#include <optional>

namespace crl {

struct DualBufferConfig {
    int maxActive = 25;
    int maxHistory = 1000;
    int autoProcessThreshold = 15;   // <= 0 disables auto processing
    int historyRetentionHours = 72;
};

// DualBuffer -- bounded active queue of unprocessed experiences plus a
// bounded, time-retained history of processed and dropped ones.
//
// Invariants:
//   active.size() <= maxActive, every active entry is Unprocessed
//   history.size() <= maxHistory, no history entry is Unprocessed
// Not thread-safe; owned by the engine.
class DualBuffer {
public:
    explicit DualBuffer(const DualBufferConfig& config = {});

    // Appends to active. At capacity the oldest unprocessed entry is moved
    // to history as Dropped ("dropped: overflow") and returned.
    std::optional<Experience> add(Experience experience,
                                  const QDateTime& now = QDateTime::currentDateTimeUtc());

    bool shouldAutoProcess() const;

    // Removes and returns all unprocessed entries from active, oldest first.
    QVector<Experience> drainUnprocessed();

    // Stamps the given entries with `state`, appends them to history and
    // then evicts expired and over-capacity history entries, oldest first.
    void moveToHistory(QVector<Experience> experiences,
                       ExperienceState state = ExperienceState::Processed,
                       const QString& reason = QString(),
                       const QDateTime& now = QDateTime::currentDateTimeUtc());

    // Retention and capacity eviction. Returns the number of evicted entries.
    int evictHistory(const QDateTime& now = QDateTime::currentDateTimeUtc());

    // Hydration. Non-unprocessed active entries go to history; overflow
    // beyond capacity is dropped oldest first.
    void restore(const QVector<Experience>& active,
                 const QVector<Experience>& history,
                 const QDateTime& now = QDateTime::currentDateTimeUtc());

    // Entries archived since the last call, for persistence.
    QVector<Experience> takeArchived();

    QVector<Experience> activeSnapshot() const;
    QVector<Experience> historySnapshot() const;

    int activeSize() const { return static_cast<int>(m_active.size()); }
    int historySize() const { return static_cast<int>(m_history.size()); }
    int maxActive() const { return m_config.maxActive; }
    int maxHistory() const { return m_config.maxHistory; }
    double activeUtilizationPct() const;
    double historyUtilizationPct() const;

    const DualBufferConfig& config() const { return m_config; }

private:
    void archive(Experience experience, ExperienceState state, const QString& reason,
                 const QDateTime& now);

    DualBufferConfig m_config;
    std::deque<Experience> m_active;
    std::deque<Experience> m_history;
    QVector<Experience> m_archivedSinceTake;
};

} // namespace crl
