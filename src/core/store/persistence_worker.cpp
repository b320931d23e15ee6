#include "core/store/persistence_worker.h"
#include "core/shared/logging.h"

#include <chrono>

namespace crl {

PersistenceWorker::PersistenceWorker(PersistenceGateway* gateway)
    : m_gateway(gateway)
{
}

PersistenceWorker::~PersistenceWorker()
{
    stop();
}

void PersistenceWorker::start()
{
    if (isRunning() || m_gateway == nullptr) {
        return;
    }

    m_stopRequested.store(false);
    m_workerThread.reset(QThread::create([this]() {
        run();
    }));
    m_workerThread->start(QThread::LowPriority);
}

void PersistenceWorker::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopRequested.store(true);
    }
    m_wake.notify_all();

    if (m_workerThread && m_workerThread->isRunning()) {
        m_workerThread->wait();
    }
    m_workerThread.reset();
    m_idle.notify_all();
}

bool PersistenceWorker::isRunning() const
{
    return m_workerThread && m_workerThread->isRunning();
}

void PersistenceWorker::request(const PersistenceDelta& delta)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_requests;
        if (m_hasPending) {
            ++m_coalesced;
        }

        if (m_hasParked) {
            // Retry what failed last time together with the new changes.
            m_pending.merge(m_parked);
            m_parked = PersistenceDelta();
            m_hasParked = false;
        }
        m_pending.merge(delta);

        if (m_pending.isEmpty() && !m_pending.historyCutoff.isValid()) {
            return;
        }
        m_hasPending = true;
    }
    m_wake.notify_one();
}

bool PersistenceWorker::flush(int timeoutMs)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!isRunning()) {
        return !m_hasPending && !m_saving;
    }
    return m_idle.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this] {
        return !m_hasPending && !m_saving;
    });
}

PersistenceWorkerStats PersistenceWorker::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    PersistenceWorkerStats out;
    out.requests = m_requests;
    out.coalesced = m_coalesced;
    out.saves = m_saves;
    out.failures = m_failures;
    out.hasUnsavedChanges = m_hasPending || m_hasParked || m_saving;
    out.lastError = m_lastError;
    return out;
}

void PersistenceWorker::run()
{
    LOG_INFO(crlStore, "Persistence worker started");

    while (true) {
        PersistenceDelta delta;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_wake.wait(lock, [this] { return m_stopRequested.load() || m_hasPending; });
            if (!m_hasPending) {
                break;
            }
            delta = m_pending;
            m_pending = PersistenceDelta();
            m_hasPending = false;
            m_saving = true;
        }

        QString error;
        const bool ok = m_gateway->saveDelta(delta, &error);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_saving = false;
            if (ok) {
                ++m_saves;
                LOG_DEBUG(crlStore, "Saved %d strategies, %d Q-values, %d archived experiences",
                          static_cast<int>(delta.strategies.size()),
                          static_cast<int>(delta.qEntries.size()),
                          static_cast<int>(delta.archived.size()));
            } else {
                ++m_failures;
                m_lastError = error;
                LOG_WARN(crlStore, "Persistence unavailable, keeping delta for retry: %s",
                         qUtf8Printable(error));
                if (m_hasPending) {
                    // Newer changes arrived during the save; the retry rides
                    // along with them so it can never land after them.
                    m_pending.merge(delta);
                } else {
                    m_parked.merge(delta);
                    m_hasParked = true;
                }
            }
        }
        m_idle.notify_all();
    }

    LOG_INFO(crlStore, "Persistence worker stopped");
}

} // namespace crl
