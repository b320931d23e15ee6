#pragma once

#include "core/events/outcome_event.h"
#include "core/shared/learning_error.h"
#include "core/shared/settings.h"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace crl {

struct EventIngestConfig {
    size_t capacity = 256;
    QueueOverflowPolicy overflowPolicy = QueueOverflowPolicy::Drop;
    int submitTimeoutMs = 2000;   // Block policy only
};

struct EventIngestStats {
    size_t depth = 0;
    size_t accepted = 0;
    size_t droppedQueueFull = 0;
    size_t blockedTimeouts = 0;
    size_t handled = 0;
    size_t failed = 0;
};

// EventIngestActor -- bounded inbound queue between event producers and
// the learning orchestrator.
//
// Producers call submit() from any thread. A single worker thread started
// by start() hands events to the handler in FIFO order. When the queue is
// full, Drop refuses the event immediately and Block waits up to
// submitTimeoutMs for space. stop() lets the worker drain what is queued.
class EventIngestActor {
public:
    using Handler = std::function<bool(const OutcomeEvent&, LearningError*)>;

    EventIngestActor(const EventIngestConfig& config, Handler handler);
    ~EventIngestActor();

    EventIngestActor(const EventIngestActor&) = delete;
    EventIngestActor& operator=(const EventIngestActor&) = delete;

    void start();
    void stop();
    bool isRunning() const { return m_running.load(); }

    bool submit(const OutcomeEvent& event, LearningError* errorOut = nullptr);

    // Blocks until the queue is empty and no event is in flight.
    // Returns false on timeout.
    bool waitForIdle(int timeoutMs);

    EventIngestStats stats() const;
    size_t depth() const;

private:
    void workerLoop();

    EventIngestConfig m_config;
    Handler m_handler;

    mutable std::mutex m_mutex;
    std::condition_variable m_notEmpty;
    std::condition_variable m_notFull;
    std::condition_variable m_idle;
    std::deque<OutcomeEvent> m_queue;
    bool m_inFlight = false;
    bool m_stopping = false;

    std::atomic<bool> m_running{false};
    std::thread m_workerThread;

    size_t m_accepted = 0;
    size_t m_droppedQueueFull = 0;
    size_t m_blockedTimeouts = 0;
    size_t m_handled = 0;
    size_t m_failed = 0;
};

} // namespace crl
