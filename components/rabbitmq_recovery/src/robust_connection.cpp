#include "rabbitmq_recovery/robust_connection.hpp"
#include "rabbitmq_recovery/amqp_channel_session.hpp"
#include "rabbitmq_recovery/connection.hpp"
#include <spdlog/spdlog.h>
#include <vector>

namespace rabbitmq_recovery {

RobustConnection::RobustConnection(std::shared_ptr<Connection> connection,
                                   ChannelConfig channelConfig,
                                   SessionFactory sessionFactory,
                                   std::shared_ptr<EntityFactory> entityFactory,
                                   std::shared_ptr<RecoveryMetrics> metrics)
    : futures_(FutureStore::createRoot())
    , channelConfig_(std::move(channelConfig))
    , sessionFactory_(std::move(sessionFactory))
    , entityFactory_(std::move(entityFactory))
    , metrics_(std::move(metrics))
    , connection_(std::move(connection)) {

    if (!sessionFactory_) {
        sessionFactory_ = [] { return std::make_shared<AmqpChannelSession>(); };
    }
}

RobustConnection::~RobustConnection() {
    auto result = close();
    if (!result) {
        spdlog::warn("Error closing connection channels: {}", result.message);
    }
}

Result<std::shared_ptr<RobustChannel>> RobustConnection::channel() {
    if (closed_.load()) {
        return Result<std::shared_ptr<RobustChannel>>(ErrorType::ConnectionError, "Connection is closed");
    }

    int channelId = allocateChannelId();
    if (channelId == 0) {
        return Result<std::shared_ptr<RobustChannel>>(ErrorType::ResourceError, "No free channel numbers");
    }

    auto channel = std::make_shared<RobustChannel>(sessionFactory_(), getConnection(), channelId,
                                                   futures_->getChild(), entityFactory_, metrics_);

    auto opened = channel->initialize(channelConfig_.openTimeout);
    if (!opened) {
        return Result<std::shared_ptr<RobustChannel>>(opened.error, opened.message);
    }

    if (channelConfig_.prefetchCount != 0 || channelConfig_.prefetchSize != 0) {
        auto qos = channel->setQos(channelConfig_.prefetchCount, channelConfig_.prefetchSize,
                                   false, channelConfig_.openTimeout);
        if (!qos) {
            auto closed = channel->close();
            if (!closed) {
                spdlog::warn("Channel {} close after QoS failure: {}", channelId, closed.message);
            }
            return Result<std::shared_ptr<RobustChannel>>(qos.error, qos.message);
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        channels_[channelId] = channel;
    }

    spdlog::debug("Opened channel {}", channelId);
    return Result<std::shared_ptr<RobustChannel>>(channel);
}

Result<void> RobustConnection::reconnect(std::shared_ptr<Connection> connection) {
    if (closed_.load()) {
        return Result<void>(ErrorType::ConnectionError, "Connection is closed");
    }

    std::vector<std::pair<int, std::shared_ptr<RobustChannel>>> channels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_ = connection;

        for (auto it = channels_.begin(); it != channels_.end();) {
            if (it->second->isClosed()) {
                it = channels_.erase(it);
            } else {
                channels.emplace_back(it->first, it->second);
                ++it;
            }
        }
    }

    spdlog::info("Reconnecting {} channels", channels.size());

    // Every channel moves to the new connection even if a sibling fails
    Result<void> firstError;
    for (const auto& [channelId, channel] : channels) {
        auto result = channel->onReconnect(connection, channelId);
        if (!result) {
            spdlog::error("Channel {} failed to recover: {}", channelId, result.message);
            if (firstError) {
                firstError = result;
            }
        }
    }

    return firstError;
}

Result<void> RobustConnection::close() {
    if (closed_.exchange(true)) {
        return Result<void>();
    }

    std::map<int, std::shared_ptr<RobustChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channels.swap(channels_);
    }

    Result<void> firstError;
    for (const auto& [channelId, channel] : channels) {
        auto result = channel->close();
        if (!result) {
            spdlog::warn("Channel {} close failed: {}", channelId, result.message);
            if (firstError) {
                firstError = result;
            }
        }
    }

    size_t rejected = futures_->rejectAll(makeException(ErrorType::ConnectionError, "Connection closed"));
    if (rejected > 0) {
        spdlog::warn("{} pending operations failed by connection close", rejected);
    }

    spdlog::info("Connection closed with {} channels", channels.size());
    return firstError;
}

bool RobustConnection::isClosed() const {
    return closed_.load();
}

std::shared_ptr<Connection> RobustConnection::getConnection() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_;
}

std::shared_ptr<FutureStore> RobustConnection::futures() const {
    return futures_;
}

size_t RobustConnection::getChannelCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_.size();
}

int RobustConnection::allocateChannelId() {
    std::lock_guard<std::mutex> lock(mutex_);

    int channelMax = connection_ ? connection_->getConfig().channelMax : ConnectionConfig{}.channelMax;
    // channel-max 0 means no limit
    if (channelMax != 0 && nextChannelId_ > channelMax) {
        return 0;
    }
    return nextChannelId_++;
}

} // namespace rabbitmq_recovery
