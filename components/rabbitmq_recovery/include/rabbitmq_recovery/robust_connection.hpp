// components/rabbitmq_recovery/include/rabbitmq_recovery/robust_connection.hpp
#pragma once

#include "robust_channel.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace rabbitmq_recovery {

/**
 * @class RobustConnection
 * @brief Owns the channels living on one logical broker connection
 *
 * Holds the root pending-operation registry. Every channel it creates gets
 * a child registry and a sequential channel number that it keeps across
 * reconnects. reconnect() moves all live channels onto a replacement
 * connection in creation order.
 */
class RobustConnection {
public:
    using SessionFactory = std::function<std::shared_ptr<ChannelSession>()>;

    RobustConnection(std::shared_ptr<Connection> connection,
                     ChannelConfig channelConfig = {},
                     SessionFactory sessionFactory = nullptr,
                     std::shared_ptr<EntityFactory> entityFactory = std::make_shared<RobustEntityFactory>(),
                     std::shared_ptr<RecoveryMetrics> metrics = nullptr);
    ~RobustConnection();

    RobustConnection(const RobustConnection&) = delete;
    RobustConnection& operator=(const RobustConnection&) = delete;

    // Create and open a channel, applying the configured prefetch limits
    Result<std::shared_ptr<RobustChannel>> channel();

    /**
     * @brief Move every live channel onto a replacement connection
     *
     * Channels closed by the application are forgotten. Every remaining
     * channel is reconnected, in creation order; the error of the first one
     * that fails to recover is returned.
     */
    Result<void> reconnect(std::shared_ptr<Connection> connection);

    // Close every channel, then fail whatever is still pending
    Result<void> close();

    bool isClosed() const;
    std::shared_ptr<Connection> getConnection() const;
    std::shared_ptr<FutureStore> futures() const;
    size_t getChannelCount() const;

private:
    int allocateChannelId();

    std::shared_ptr<FutureStore> futures_;
    ChannelConfig channelConfig_;
    SessionFactory sessionFactory_;
    std::shared_ptr<EntityFactory> entityFactory_;
    std::shared_ptr<RecoveryMetrics> metrics_;

    std::atomic<bool> closed_{false};

    mutable std::mutex mutex_;
    std::shared_ptr<Connection> connection_;
    std::map<int, std::shared_ptr<RobustChannel>> channels_;
    int nextChannelId_{1};
};

} // namespace rabbitmq_recovery
