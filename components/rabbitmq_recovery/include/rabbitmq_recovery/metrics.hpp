// components/rabbitmq_recovery/include/rabbitmq_recovery/metrics.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace prometheus {
class Counter;
class Gauge;
class Histogram;
class Registry;
}

namespace rabbitmq_recovery {

enum class EntityKind {
    Exchange,
    Queue
};

/**
 * @class RecoveryMetrics
 * @brief Prometheus instrumentation of channel recovery
 *
 * One instance may be shared by every channel of a connection; counters and
 * gauges aggregate across them.
 */
class RecoveryMetrics {
public:
    explicit RecoveryMetrics(std::shared_ptr<prometheus::Registry> registry);

    RecoveryMetrics(const RecoveryMetrics&) = delete;
    RecoveryMetrics& operator=(const RecoveryMetrics&) = delete;

    void recordReconnect(bool success, std::chrono::milliseconds duration);
    void recordOperationsRejected(size_t count);
    void recordEntityRecovered(EntityKind kind);

    // Gauge of entities currently remembered for recovery
    void recordEntityRemembered(EntityKind kind);
    void recordEntitiesForgotten(EntityKind kind, size_t count = 1);

    std::shared_ptr<prometheus::Registry> getRegistry() const;

private:
    std::shared_ptr<prometheus::Registry> registry_;

    prometheus::Counter* reconnectSuccesses_;
    prometheus::Counter* reconnectFailures_;
    prometheus::Histogram* reconnectDuration_;
    prometheus::Counter* operationsRejected_;
    prometheus::Counter* exchangesRecovered_;
    prometheus::Counter* queuesRecovered_;
    prometheus::Gauge* exchangesRemembered_;
    prometheus::Gauge* queuesRemembered_;
};

const char* entityKindToString(EntityKind kind);

} // namespace rabbitmq_recovery
