#pragma once

#include <QString>

#include <cstdint>

namespace crl {

// Q-learning hyperparameters and buffer sizing. Passed by value into the
// engine at construction and never changed afterwards.
struct EngineConfig {
    double learningRate = 0.1;       // alpha
    double discountFactor = 0.95;    // gamma
    double explorationRate = 0.15;   // epsilon

    int maxActiveBuffer = 25;
    int maxHistoryBuffer = 1000;
    int autoProcessThreshold = 15;   // <= 0 disables auto processing
    int historyRetentionHours = 72;

    // 0 seeds from QRandomGenerator::global().
    uint32_t randomSeed = 0;
};

enum class QueueOverflowPolicy {
    Drop,
    Block,
};

struct Settings {
    // Database
    QString dbPath;
    bool persistenceEnabled = true;

    // Learning
    EngineConfig engine;

    // Inbound outcome events
    int eventQueueDepth = 256;
    QueueOverflowPolicy eventOverflowPolicy = QueueOverflowPolicy::Drop;
    int eventSubmitTimeoutMs = 2000;
};

} // namespace crl
