#pragma once

#include "core/store/persistence_gateway.h"

#include <QString>
#include <QThread>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

namespace crl {

struct PersistenceWorkerStats {
    uint64_t requests = 0;
    uint64_t coalesced = 0;
    uint64_t saves = 0;
    uint64_t failures = 0;
    bool hasUnsavedChanges = false;
    QString lastError;
};

// PersistenceWorker -- saves engine deltas on a background thread.
//
// request() never blocks on I/O. Requests that arrive while a save is
// pending are merged into one delta. A failed save keeps its delta and
// folds it into the next request, so it is retried at the next batch
// boundary instead of in a loop. Merges follow PersistenceDelta::sequence,
// so an older delta never overwrites a newer one whatever order requests
// arrive in. The gateway must outlive the worker.
class PersistenceWorker {
public:
    explicit PersistenceWorker(PersistenceGateway* gateway);
    ~PersistenceWorker();

    PersistenceWorker(const PersistenceWorker&) = delete;
    PersistenceWorker& operator=(const PersistenceWorker&) = delete;

    void start();
    void stop();
    bool isRunning() const;

    void request(const PersistenceDelta& delta);

    // Blocks until nothing is queued or being saved. A delta parked after a
    // failure does not count as queued. Returns false on timeout.
    bool flush(int timeoutMs = 10000);

    PersistenceWorkerStats stats() const;

private:
    void run();

    PersistenceGateway* m_gateway = nullptr;

    mutable std::mutex m_mutex;
    std::condition_variable m_wake;
    std::condition_variable m_idle;
    PersistenceDelta m_pending;
    PersistenceDelta m_parked;
    bool m_hasPending = false;
    bool m_hasParked = false;
    bool m_saving = false;

    std::atomic<bool> m_stopRequested{false};
    std::unique_ptr<QThread> m_workerThread;

    uint64_t m_requests = 0;
    uint64_t m_coalesced = 0;
    uint64_t m_saves = 0;
    uint64_t m_failures = 0;
    QString m_lastError;
};

} // namespace crl
