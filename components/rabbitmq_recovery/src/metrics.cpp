#include "rabbitmq_recovery/metrics.hpp"
#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace rabbitmq_recovery {

RecoveryMetrics::RecoveryMetrics(std::shared_ptr<prometheus::Registry> registry)
    : registry_(std::move(registry)) {
    auto& reconnectFamily = prometheus::BuildCounter()
        .Name("rabbitmq_recovery_channel_reconnects_total")
        .Help("Total number of channel reconnect attempts")
        .Register(*registry_);

    reconnectSuccesses_ = &reconnectFamily.Add({{"status", "success"}});
    reconnectFailures_ = &reconnectFamily.Add({{"status", "failure"}});

    reconnectDuration_ = &prometheus::BuildHistogram()
        .Name("rabbitmq_recovery_reconnect_duration_seconds")
        .Help("Time taken to reopen a channel and replay its declarations")
        .Buckets({0.001, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0})
        .Register(*registry_)
        .Add({});

    operationsRejected_ = &prometheus::BuildCounter()
        .Name("rabbitmq_recovery_operations_rejected_total")
        .Help("Pending operations failed with connection lost by a reconnect")
        .Register(*registry_)
        .Add({});

    auto& recoveredFamily = prometheus::BuildCounter()
        .Name("rabbitmq_recovery_entities_recovered_total")
        .Help("Entities re-declared during reconnects")
        .Register(*registry_);

    exchangesRecovered_ = &recoveredFamily.Add({{"kind", "exchange"}});
    queuesRecovered_ = &recoveredFamily.Add({{"kind", "queue"}});

    auto& rememberedFamily = prometheus::BuildGauge()
        .Name("rabbitmq_recovery_entities_remembered")
        .Help("Entities currently remembered for recovery")
        .Register(*registry_);

    exchangesRemembered_ = &rememberedFamily.Add({{"kind", "exchange"}});
    queuesRemembered_ = &rememberedFamily.Add({{"kind", "queue"}});
}

void RecoveryMetrics::recordReconnect(bool success, std::chrono::milliseconds duration) {
    if (success) {
        reconnectSuccesses_->Increment();
    } else {
        reconnectFailures_->Increment();
    }
    reconnectDuration_->Observe(duration.count() / 1000.0);
}

void RecoveryMetrics::recordOperationsRejected(size_t count) {
    if (count > 0) {
        operationsRejected_->Increment(static_cast<double>(count));
    }
}

void RecoveryMetrics::recordEntityRecovered(EntityKind kind) {
    (kind == EntityKind::Exchange ? exchangesRecovered_ : queuesRecovered_)->Increment();
}

void RecoveryMetrics::recordEntityRemembered(EntityKind kind) {
    (kind == EntityKind::Exchange ? exchangesRemembered_ : queuesRemembered_)->Increment();
}

void RecoveryMetrics::recordEntitiesForgotten(EntityKind kind, size_t count) {
    if (count > 0) {
        (kind == EntityKind::Exchange ? exchangesRemembered_ : queuesRemembered_)
            ->Decrement(static_cast<double>(count));
    }
}

std::shared_ptr<prometheus::Registry> RecoveryMetrics::getRegistry() const {
    return registry_;
}

const char* entityKindToString(EntityKind kind) {
    switch (kind) {
        case EntityKind::Exchange: return "exchange";
        case EntityKind::Queue: return "queue";
        default: return "unknown";
    }
}

} // namespace rabbitmq_recovery
