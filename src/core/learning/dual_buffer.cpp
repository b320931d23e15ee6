#include "core/learning/dual_buffer.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace crl {

DualBuffer::DualBuffer(const DualBufferConfig& config)
    : m_config(config)
{
    m_config.maxActive = std::max(1, m_config.maxActive);
    m_config.maxHistory = std::max(1, m_config.maxHistory);
    m_config.historyRetentionHours = std::max(1, m_config.historyRetentionHours);
}

std::optional<Experience> DualBuffer::add(Experience experience, const QDateTime& now)
{
    std::optional<Experience> dropped;
    if (static_cast<int>(m_active.size()) >= m_config.maxActive) {
        // Every active entry is unprocessed, so the front is the oldest one.
        Experience oldest = std::move(m_active.front());
        m_active.pop_front();
        LOG_WARN(crlLearning, "Active buffer full (%d), dropping experience %s without learning",
                 m_config.maxActive, qUtf8Printable(oldest.id));
        archive(oldest, ExperienceState::Dropped, kDropReasonOverflow, now);
        dropped = m_history.back();
        evictHistory(now);
    }

    experience.state = ExperienceState::Unprocessed;
    experience.processedAt = QDateTime();
    experience.dropReason.clear();
    m_active.push_back(std::move(experience));
    return dropped;
}

bool DualBuffer::shouldAutoProcess() const
{
    return m_config.autoProcessThreshold > 0
        && static_cast<int>(m_active.size()) >= m_config.autoProcessThreshold;
}

QVector<Experience> DualBuffer::drainUnprocessed()
{
    QVector<Experience> drained;
    drained.reserve(static_cast<int>(m_active.size()));
    std::deque<Experience> remaining;
    for (Experience& experience : m_active) {
        if (experience.isUnprocessed()) {
            drained.push_back(std::move(experience));
        } else {
            remaining.push_back(std::move(experience));
        }
    }
    m_active.swap(remaining);
    return drained;
}

void DualBuffer::moveToHistory(QVector<Experience> experiences,
                               ExperienceState state,
                               const QString& reason,
                               const QDateTime& now)
{
    if (state == ExperienceState::Unprocessed) {
        state = ExperienceState::Processed;
    }
    for (Experience& experience : experiences) {
        archive(std::move(experience), state, reason, now);
    }
    evictHistory(now);
}

int DualBuffer::evictHistory(const QDateTime& now)
{
    const size_t before = m_history.size();
    // Retention counts from when the outcome was observed, not from when it
    // was archived, so an entry that waited long in active expires early.
    const QDateTime cutoff = now.addSecs(-static_cast<qint64>(m_config.historyRetentionHours) * 3600);

    m_history.erase(std::remove_if(m_history.begin(), m_history.end(),
                                   [&cutoff](const Experience& experience) {
                                       return experience.timestamp.isValid()
                                           && experience.timestamp < cutoff;
                                   }),
                    m_history.end());

    while (static_cast<int>(m_history.size()) > m_config.maxHistory) {
        m_history.pop_front();
    }

    const int evicted = static_cast<int>(before - m_history.size());
    if (evicted > 0) {
        LOG_DEBUG(crlLearning, "History eviction removed %d entries (size=%d)",
                  evicted, static_cast<int>(m_history.size()));
    }
    return evicted;
}

void DualBuffer::restore(const QVector<Experience>& active,
                         const QVector<Experience>& history,
                         const QDateTime& now)
{
    m_active.clear();
    m_history.clear();
    m_archivedSinceTake.clear();

    for (const Experience& experience : history) {
        if (experience.isUnprocessed()) {
            archive(experience, ExperienceState::Dropped, kDropReasonValidation, now);
        } else {
            m_history.push_back(experience);
        }
    }

    for (const Experience& experience : active) {
        if (!experience.isUnprocessed()) {
            m_history.push_back(experience);
            m_archivedSinceTake.push_back(experience);
            continue;
        }
        add(experience, now);
    }

    evictHistory(now);
}

QVector<Experience> DualBuffer::takeArchived()
{
    QVector<Experience> out;
    out.swap(m_archivedSinceTake);
    return out;
}

QVector<Experience> DualBuffer::activeSnapshot() const
{
    return QVector<Experience>(m_active.begin(), m_active.end());
}

QVector<Experience> DualBuffer::historySnapshot() const
{
    return QVector<Experience>(m_history.begin(), m_history.end());
}

double DualBuffer::activeUtilizationPct() const
{
    return 100.0 * static_cast<double>(m_active.size()) / static_cast<double>(m_config.maxActive);
}

double DualBuffer::historyUtilizationPct() const
{
    return 100.0 * static_cast<double>(m_history.size()) / static_cast<double>(m_config.maxHistory);
}

void DualBuffer::archive(Experience experience, ExperienceState state, const QString& reason,
                         const QDateTime& now)
{
    experience.state = state;
    experience.processedAt = now;
    experience.dropReason = state == ExperienceState::Dropped ? reason : QString();
    m_history.push_back(experience);

    m_archivedSinceTake.push_back(std::move(experience));
    // Unclaimed archive records are only a persistence backlog.
    const int backlogCap = m_config.maxHistory;
    if (m_archivedSinceTake.size() > backlogCap) {
        m_archivedSinceTake.remove(0, m_archivedSinceTake.size() - backlogCap);
    }
}

} // namespace crl
