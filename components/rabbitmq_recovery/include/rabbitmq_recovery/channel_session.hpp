// components/rabbitmq_recovery/include/rabbitmq_recovery/channel_session.hpp
#pragma once

#include "types.hpp"
#include <functional>
#include <memory>
#include <string>

namespace rabbitmq_recovery {

class FutureStore;

/**
 * @class ChannelSession
 * @brief Primitive operations of one AMQP channel on one connection
 *
 * A session speaks directly to the broker over whatever connection it was
 * last opened on. It remembers nothing across connections; RobustChannel
 * layers recovery on top of it.
 */
class ChannelSession {
public:
    using CloseListener = std::function<void(const Result<void>& reason)>;

    virtual ~ChannelSession() = default;

    /**
     * @brief Open the channel on a connection
     *
     * @param connection Connection to open on, replacing any previous one
     * @param channelId Channel number assigned by the connection
     * @param timeout Optional limit on the wait for channel.open-ok
     */
    virtual Result<void> open(std::shared_ptr<Connection> connection, int channelId, Timeout timeout) = 0;

    /**
     * @brief Request the channel to close
     *
     * The close listener fires once the channel has finished closing,
     * whether the close was requested here or initiated by the broker.
     */
    virtual Result<void> close() = 0;

    // Drop the reference to the current connection
    virtual void release() = 0;

    /**
     * @brief Unblock requests waiting on the current connection
     *
     * Called when the connection is being replaced. A request blocked on
     * the old transport returns with an error instead of waiting for the
     * socket to time out. The session is reopened afterwards.
     */
    virtual void interrupt() = 0;

    virtual bool isOpen() const = 0;
    virtual int getChannelId() const = 0;

    /**
     * @brief Registry in which every broker request of this session is tracked
     *
     * Requests still in flight when the registry is bulk-rejected report the
     * rejection error to their caller.
     */
    virtual void setFutureStore(std::shared_ptr<FutureStore> futures) = 0;

    virtual void setCloseListener(CloseListener listener) = 0;

    // Exchange operations
    virtual Result<void> declareExchange(const ExchangeConfig& config, Timeout timeout) = 0;
    virtual Result<void> deleteExchange(const std::string& name, bool ifUnused, bool nowait, Timeout timeout) = 0;
    virtual Result<void> bindExchange(const ExchangeBindingConfig& binding, Timeout timeout) = 0;
    virtual Result<void> unbindExchange(const ExchangeBindingConfig& binding, Timeout timeout) = 0;

    // Queue operations
    virtual Result<QueueInfo> declareQueue(const QueueConfig& config, Timeout timeout) = 0;

    /**
     * @brief Delete a queue
     * @return Number of messages deleted with the queue (0 when nowait)
     */
    virtual Result<uint32_t> deleteQueue(const std::string& name, bool ifUnused, bool ifEmpty,
                                         bool nowait, Timeout timeout) = 0;

    virtual Result<void> bindQueue(const BindingConfig& binding, Timeout timeout) = 0;
    virtual Result<void> unbindQueue(const BindingConfig& binding, Timeout timeout) = 0;

    // Consuming
    virtual Result<std::string> basicConsume(const std::string& queue, const ConsumeOptions& options,
                                             ConsumerCallback callback, Timeout timeout) = 0;
    virtual Result<void> basicCancel(const std::string& consumerTag, Timeout timeout) = 0;

    // Quality of Service
    virtual Result<void> basicQos(uint16_t prefetchCount, uint32_t prefetchSize, bool global, Timeout timeout) = 0;
};

} // namespace rabbitmq_recovery
