// components/rabbitmq_recovery/include/rabbitmq_recovery/robust_channel.hpp
#pragma once

#include "channel_session.hpp"
#include "completion_slot.hpp"
#include "entity_factory.hpp"
#include "entity_map.hpp"
#include "future_store.hpp"
#include "metrics.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace rabbitmq_recovery {

/**
 * @class RobustChannel
 * @brief Channel whose declared state survives the loss of its connection
 *
 * Remembers its QoS pair and every exchange and queue declared as
 * recoverable. When the connection manager hands it a replacement
 * connection through onReconnect(), it fails whatever was in flight,
 * reopens the session, reapplies QoS and replays the remembered
 * declarations, exchanges first.
 */
class RobustChannel {
public:
    /**
     * @param session Underlying channel primitives
     * @param connection Connection to open the session on
     * @param channelId Channel number assigned by the connection
     * @param futures Registry for this channel's broker requests, normally
     *        a child of the connection's root registry
     * @param factory Chooses which Exchange and Queue variants are created
     * @param metrics Optional prometheus instrumentation
     */
    RobustChannel(std::shared_ptr<ChannelSession> session,
                  std::shared_ptr<Connection> connection,
                  int channelId,
                  std::shared_ptr<FutureStore> futures,
                  std::shared_ptr<EntityFactory> factory = std::make_shared<RobustEntityFactory>(),
                  std::shared_ptr<RecoveryMetrics> metrics = nullptr);
    ~RobustChannel();

    RobustChannel(const RobustChannel&) = delete;
    RobustChannel& operator=(const RobustChannel&) = delete;

    /**
     * @brief Move the channel onto a replacement connection
     *
     * Rejects a pending closing signal and every pending operation with
     * ConnectionLost, then reopens on the new connection, reapplies QoS and
     * replays exchanges then queues. The first failure aborts the attempt
     * and is returned; a later call is the only retry.
     */
    Result<void> onReconnect(std::shared_ptr<Connection> connection, int channelId);

    // Open the session and apply the remembered QoS pair
    Result<std::shared_ptr<ChannelSession>> initialize(Timeout timeout = std::nullopt);

    /**
     * @brief Set per-channel prefetch limits
     *
     * The pair is remembered before the broker is asked, so a reconnect
     * replays the latest request even if this call fails. allChannels is
     * rejected with UnsupportedOperation and leaves the pair untouched.
     */
    Result<void> setQos(uint16_t prefetchCount, uint32_t prefetchSize = 0,
                        bool allChannels = false, Timeout timeout = std::nullopt);

    /**
     * @brief Close the channel; idempotent
     *
     * Returns ConnectionLost if a reconnect interrupted the wait for the
     * session to finish closing. The channel is closed either way.
     */
    Result<void> close();

    // Declares the exchange; remembered if recoverable and not internal
    Result<std::shared_ptr<Exchange>> declareExchange(const ExchangeConfig& config,
                                                      Timeout timeout = std::nullopt,
                                                      bool recoverable = true);
    Result<void> deleteExchange(const std::string& name, Timeout timeout = std::nullopt,
                                bool ifUnused = false, bool nowait = false);

    // Declares the queue; remembered under its resulting name if recoverable
    Result<std::shared_ptr<Queue>> declareQueue(const QueueConfig& config,
                                                Timeout timeout = std::nullopt,
                                                bool recoverable = true);
    Result<uint32_t> deleteQueue(const std::string& name, Timeout timeout = std::nullopt,
                                 bool ifUnused = false, bool ifEmpty = false, bool nowait = false);

    bool isClosed() const;
    QosSettings getQos() const;
    int getChannelId() const;
    std::shared_ptr<Connection> getConnection() const;
    std::shared_ptr<ChannelSession> getSession() const;
    std::shared_ptr<FutureStore> futures() const;

    // Resolves when the current session lifetime finishes closing
    std::shared_future<void> closing() const;

    std::vector<std::string> getRecoverableExchangeNames() const;
    std::vector<std::string> getRecoverableQueueNames() const;
    std::shared_ptr<Exchange> findExchange(const std::string& name) const;
    std::shared_ptr<Queue> findQueue(const std::string& name) const;

    RecoveryStats getStats() const;

private:
    Result<std::shared_ptr<ChannelSession>> doInitialize(Timeout timeout);
    Result<void> replay();
    Result<void> failReconnect(const Result<void>& error, std::chrono::steady_clock::time_point started);
    Result<void> checkOpen(const std::string& operation) const;

    std::shared_ptr<ChannelSession> session_;
    std::shared_ptr<FutureStore> futures_;
    std::shared_ptr<EntityFactory> factory_;
    std::shared_ptr<RecoveryMetrics> metrics_;
    std::shared_ptr<CompletionSlot> closing_;

    std::atomic<bool> closed_{false};

    // Serializes the close sequence
    std::mutex writeMutex_;

    // Held exclusively while a reconnect replays, shared by application calls
    mutable std::shared_mutex recoveryMutex_;

    // Guards connection_, channelId_, qos_, the entity maps and stats_
    mutable std::mutex stateMutex_;
    std::shared_ptr<Connection> connection_;
    int channelId_;
    QosSettings qos_;
    EntityMap<Exchange> exchanges_;
    EntityMap<Queue> queues_;
    RecoveryStats stats_;
};

} // namespace rabbitmq_recovery
