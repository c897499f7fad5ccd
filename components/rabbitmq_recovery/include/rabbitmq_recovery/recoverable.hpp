// components/rabbitmq_recovery/include/rabbitmq_recovery/recoverable.hpp
#pragma once

#include "types.hpp"
#include <memory>
#include <string>

namespace rabbitmq_recovery {

/**
 * @class Recoverable
 * @brief An entity able to re-assert itself on a freshly opened channel
 *
 * RobustChannel calls onReconnect() exactly once per reconnect, after the
 * channel is open and its QoS reapplied. An error aborts the reconnect.
 */
class Recoverable {
public:
    virtual ~Recoverable() = default;

    virtual std::string getName() const = 0;

    /**
     * @brief Re-declare the entity and restore its dependent state
     * @param session The reopened channel; the entity adopts it for later calls
     */
    virtual Result<void> onReconnect(const std::shared_ptr<ChannelSession>& session) = 0;
};

} // namespace rabbitmq_recovery
