#include "rabbitmq_recovery/entity_factory.hpp"

namespace rabbitmq_recovery {

std::shared_ptr<Exchange> RobustEntityFactory::createExchange(std::shared_ptr<ChannelSession> session,
                                                              const ExchangeConfig& config) {
    return std::make_shared<RobustExchange>(std::move(session), config);
}

std::shared_ptr<Queue> RobustEntityFactory::createQueue(std::shared_ptr<ChannelSession> session,
                                                        const QueueConfig& config) {
    return std::make_shared<RobustQueue>(std::move(session), config);
}

std::shared_ptr<Exchange> PlainEntityFactory::createExchange(std::shared_ptr<ChannelSession> session,
                                                             const ExchangeConfig& config) {
    return std::make_shared<Exchange>(std::move(session), config);
}

std::shared_ptr<Queue> PlainEntityFactory::createQueue(std::shared_ptr<ChannelSession> session,
                                                       const QueueConfig& config) {
    return std::make_shared<Queue>(std::move(session), config);
}

} // namespace rabbitmq_recovery
