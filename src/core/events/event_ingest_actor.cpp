#include "core/events/event_ingest_actor.h"
#include "core/shared/logging.h"

#include <chrono>

namespace crl {

EventIngestActor::EventIngestActor(const EventIngestConfig& config, Handler handler)
    : m_config(config)
    , m_handler(std::move(handler))
{
    if (m_config.capacity == 0) {
        m_config.capacity = 1;
    }
    if (m_config.submitTimeoutMs < 0) {
        m_config.submitTimeoutMs = 0;
    }
}

EventIngestActor::~EventIngestActor()
{
    stop();
}

void EventIngestActor::start()
{
    if (m_running.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = false;
    }
    m_workerThread = std::thread([this] { workerLoop(); });
    LOG_INFO(crlEvents, "Event ingest started (capacity=%d, policy=%s)",
             static_cast<int>(m_config.capacity),
             m_config.overflowPolicy == QueueOverflowPolicy::Block ? "block" : "drop");
}

void EventIngestActor::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    m_notEmpty.notify_all();
    m_notFull.notify_all();

    if (m_workerThread.joinable()) {
        m_workerThread.join();
    }
    if (m_running.exchange(false)) {
        LOG_INFO(crlEvents, "Event ingest stopped (handled=%d, failed=%d, dropped=%d)",
                 static_cast<int>(m_handled), static_cast<int>(m_failed),
                 static_cast<int>(m_droppedQueueFull));
    }
}

bool EventIngestActor::submit(const OutcomeEvent& event, LearningError* errorOut)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_stopping) {
        setLearningError(errorOut, LearningErrorCode::QueueFull,
                         QStringLiteral("event queue is shut down"));
        return false;
    }

    if (m_queue.size() >= m_config.capacity) {
        if (m_config.overflowPolicy == QueueOverflowPolicy::Drop) {
            ++m_droppedQueueFull;
            LOG_WARN(crlEvents, "Event queue full (%d), dropping %s event %s",
                     static_cast<int>(m_config.capacity),
                     qUtf8Printable(outcomeEventTypeToString(event.type)),
                     qUtf8Printable(event.eventId));
            setLearningError(errorOut, LearningErrorCode::QueueFull,
                             QStringLiteral("event queue full"));
            return false;
        }

        const bool hasSpace = m_notFull.wait_for(
            lock, std::chrono::milliseconds(m_config.submitTimeoutMs), [this] {
                return m_stopping || m_queue.size() < m_config.capacity;
            });
        if (!hasSpace || m_stopping) {
            ++m_blockedTimeouts;
            LOG_WARN(crlEvents, "Event queue still full after %d ms, refusing event %s",
                     m_config.submitTimeoutMs, qUtf8Printable(event.eventId));
            setLearningError(errorOut, LearningErrorCode::QueueFull,
                             QStringLiteral("event queue full after %1 ms")
                                 .arg(m_config.submitTimeoutMs));
            return false;
        }
    }

    m_queue.push_back(event);
    ++m_accepted;
    m_notEmpty.notify_one();
    return true;
}

bool EventIngestActor::waitForIdle(int timeoutMs)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idle.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this] {
        return m_queue.empty() && !m_inFlight;
    });
}

EventIngestStats EventIngestActor::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    EventIngestStats out;
    out.depth = m_queue.size();
    out.accepted = m_accepted;
    out.droppedQueueFull = m_droppedQueueFull;
    out.blockedTimeouts = m_blockedTimeouts;
    out.handled = m_handled;
    out.failed = m_failed;
    return out;
}

size_t EventIngestActor::depth() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

void EventIngestActor::workerLoop()
{
    while (true) {
        OutcomeEvent event;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_notEmpty.wait(lock, [this] { return m_stopping || !m_queue.empty(); });
            if (m_queue.empty()) {
                // Stopping and fully drained.
                break;
            }
            event = std::move(m_queue.front());
            m_queue.pop_front();
            m_inFlight = true;
        }
        m_notFull.notify_one();

        LearningError error;
        const bool ok = m_handler ? m_handler(event, &error) : false;
        if (!ok) {
            LOG_WARN(crlEvents, "Event %s (%s) rejected: %s %s",
                     qUtf8Printable(event.eventId),
                     qUtf8Printable(outcomeEventTypeToString(event.type)),
                     qUtf8Printable(learningErrorCodeToString(error.code)),
                     qUtf8Printable(error.message));
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_inFlight = false;
            if (ok) {
                ++m_handled;
            } else {
                ++m_failed;
            }
        }
        m_idle.notify_all();
    }
    m_idle.notify_all();
}

} // namespace crl
