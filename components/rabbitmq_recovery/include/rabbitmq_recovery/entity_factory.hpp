// components/rabbitmq_recovery/include/rabbitmq_recovery/entity_factory.hpp
#pragma once

#include "exchange.hpp"
#include "queue.hpp"
#include <memory>

namespace rabbitmq_recovery {

/**
 * @class EntityFactory
 * @brief Chooses the Exchange and Queue variants a channel hands out
 */
class EntityFactory {
public:
    virtual ~EntityFactory() = default;

    virtual std::shared_ptr<Exchange> createExchange(std::shared_ptr<ChannelSession> session,
                                                     const ExchangeConfig& config) = 0;
    virtual std::shared_ptr<Queue> createQueue(std::shared_ptr<ChannelSession> session,
                                               const QueueConfig& config) = 0;
};

// Creates RobustExchange and RobustQueue, which restore bindings and consumers
class RobustEntityFactory : public EntityFactory {
public:
    std::shared_ptr<Exchange> createExchange(std::shared_ptr<ChannelSession> session,
                                             const ExchangeConfig& config) override;
    std::shared_ptr<Queue> createQueue(std::shared_ptr<ChannelSession> session,
                                       const QueueConfig& config) override;
};

// Creates plain Exchange and Queue, which only re-declare themselves
class PlainEntityFactory : public EntityFactory {
public:
    std::shared_ptr<Exchange> createExchange(std::shared_ptr<ChannelSession> session,
                                             const ExchangeConfig& config) override;
    std::shared_ptr<Queue> createQueue(std::shared_ptr<ChannelSession> session,
                                       const QueueConfig& config) override;
};

} // namespace rabbitmq_recovery
