// components/rabbitmq_recovery/include/rabbitmq_recovery/queue.hpp
#pragma once

#include "recoverable.hpp"
#include "channel_session.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace rabbitmq_recovery {

// Queue declared through a channel. On reconnect it only re-declares itself.
class Queue : public Recoverable {
public:
    Queue(std::shared_ptr<ChannelSession> session, QueueConfig config);
    ~Queue() override = default;

    Queue(const Queue&) = delete;
    Queue& operator=(const Queue&) = delete;

    // Name as known to the broker; empty until a server-named queue is declared
    std::string getName() const override;

    // Configuration as requested; name stays empty for a server-named queue
    const QueueConfig& getConfig() const;

    /**
     * @brief Declare the queue
     *
     * A queue requested without a name adopts the one generated by the
     * broker. It is re-declared without a name on reconnect, because the
     * broker refuses client declarations of amq.* names, and then adopts
     * the newly generated one.
     */
    Result<QueueInfo> declare(Timeout timeout = std::nullopt);

    virtual Result<void> bind(const std::string& exchange, const std::string& routingKey,
                              const Arguments& arguments = {}, Timeout timeout = std::nullopt);
    virtual Result<void> unbind(const std::string& exchange, const std::string& routingKey,
                                const Arguments& arguments = {}, Timeout timeout = std::nullopt);

    /**
     * @brief Start a consumer on this queue
     * @return The consumer tag, generated by the broker if options.consumerTag is empty
     */
    virtual Result<std::string> consume(ConsumerCallback callback, const ConsumeOptions& options = {},
                                        Timeout timeout = std::nullopt);
    virtual Result<void> cancel(const std::string& consumerTag, Timeout timeout = std::nullopt);

    Result<void> onReconnect(const std::shared_ptr<ChannelSession>& session) override;

protected:
    std::shared_ptr<ChannelSession> getSession() const;
    BindingConfig makeBinding(const std::string& exchange, const std::string& routingKey,
                              const Arguments& arguments) const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<ChannelSession> session_;
    const QueueConfig config_;
    std::string name_;
};

// Queue that also restores its bindings and consumers on reconnect
class RobustQueue : public Queue {
public:
    RobustQueue(std::shared_ptr<ChannelSession> session, QueueConfig config);

    Result<void> bind(const std::string& exchange, const std::string& routingKey,
                      const Arguments& arguments = {}, Timeout timeout = std::nullopt) override;
    Result<void> unbind(const std::string& exchange, const std::string& routingKey,
                        const Arguments& arguments = {}, Timeout timeout = std::nullopt) override;
    Result<std::string> consume(ConsumerCallback callback, const ConsumeOptions& options = {},
                                Timeout timeout = std::nullopt) override;
    Result<void> cancel(const std::string& consumerTag, Timeout timeout = std::nullopt) override;

    Result<void> onReconnect(const std::shared_ptr<ChannelSession>& session) override;

    std::vector<BindingConfig> getBindings() const;
    std::vector<std::string> getConsumerTags() const;

private:
    struct ConsumerEntry {
        ConsumerCallback callback;
        ConsumeOptions options;
    };

    mutable std::mutex stateMutex_;
    std::vector<BindingConfig> bindings_;
    std::map<std::string, ConsumerEntry> consumers_;
};

} // namespace rabbitmq_recovery
