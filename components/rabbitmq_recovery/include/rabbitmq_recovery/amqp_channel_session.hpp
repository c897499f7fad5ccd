// components/rabbitmq_recovery/include/rabbitmq_recovery/amqp_channel_session.hpp
#pragma once

#include "channel_session.hpp"
#include "connection.hpp"
#include "future_store.hpp"
#include <atomic>
#include <mutex>
#include <vector>

namespace rabbitmq_recovery {

// amqp_table_t view over an Arguments map; the map must outlive the table
class AmqpTable {
public:
    explicit AmqpTable(const Arguments& arguments);

    AmqpTable(const AmqpTable&) = delete;
    AmqpTable& operator=(const AmqpTable&) = delete;

    const amqp_table_t& get() const { return table_; }

private:
    std::vector<amqp_table_entry_t> entries_;
    amqp_table_t table_;
};

// ChannelSession speaking AMQP 0-9-1 through rabbitmq-c
class AmqpChannelSession : public ChannelSession {
public:
    AmqpChannelSession();
    ~AmqpChannelSession() override;

    // Non-copyable, non-movable
    AmqpChannelSession(const AmqpChannelSession&) = delete;
    AmqpChannelSession& operator=(const AmqpChannelSession&) = delete;
    AmqpChannelSession(AmqpChannelSession&&) = delete;
    AmqpChannelSession& operator=(AmqpChannelSession&&) = delete;

    // Channel management
    Result<void> open(std::shared_ptr<Connection> connection, int channelId, Timeout timeout) override;
    Result<void> close() override;
    void release() override;
    void interrupt() override;
    bool isOpen() const override;
    int getChannelId() const override;
    ChannelState getState() const;

    void setFutureStore(std::shared_ptr<FutureStore> futures) override;
    void setCloseListener(CloseListener listener) override;

    // Exchange operations
    Result<void> declareExchange(const ExchangeConfig& config, Timeout timeout) override;
    Result<void> deleteExchange(const std::string& name, bool ifUnused, bool nowait, Timeout timeout) override;
    Result<void> bindExchange(const ExchangeBindingConfig& binding, Timeout timeout) override;
    Result<void> unbindExchange(const ExchangeBindingConfig& binding, Timeout timeout) override;

    // Queue operations
    Result<QueueInfo> declareQueue(const QueueConfig& config, Timeout timeout) override;
    Result<uint32_t> deleteQueue(const std::string& name, bool ifUnused, bool ifEmpty,
                                 bool nowait, Timeout timeout) override;
    Result<void> bindQueue(const BindingConfig& binding, Timeout timeout) override;
    Result<void> unbindQueue(const BindingConfig& binding, Timeout timeout) override;

    // Consuming
    Result<std::string> basicConsume(const std::string& queue, const ConsumeOptions& options,
                                     ConsumerCallback callback, Timeout timeout) override;
    Result<void> basicCancel(const std::string& consumerTag, Timeout timeout) override;

    // Quality of Service
    Result<void> basicQos(uint16_t prefetchCount, uint32_t prefetchSize, bool global, Timeout timeout) override;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<Connection> connection_;
    int channelId_{0};
    std::atomic<ChannelState> state_{ChannelState::Closed};

    std::shared_ptr<FutureStore> futures_;
    CloseListener closeListener_;

    // Internal methods
    template<typename T, typename Operation>
    Result<T> call(const std::string& context, Timeout timeout, Operation&& operation);

    Result<void> checkReply(amqp_connection_state_t state, int channelId, const std::string& context);
    void handleBrokerClose(const Result<void>& reason);
    void notifyClosed(const Result<void>& reason);
};

} // namespace rabbitmq_recovery
