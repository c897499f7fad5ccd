// components/rabbitmq_recovery/include/rabbitmq_recovery/exchange.hpp
#pragma once

#include "recoverable.hpp"
#include "channel_session.hpp"
#include <memory>
#include <mutex>
#include <vector>

namespace rabbitmq_recovery {

// Exchange declared through a channel. On reconnect it only re-declares itself.
class Exchange : public Recoverable {
public:
    Exchange(std::shared_ptr<ChannelSession> session, ExchangeConfig config);
    ~Exchange() override = default;

    Exchange(const Exchange&) = delete;
    Exchange& operator=(const Exchange&) = delete;

    std::string getName() const override;
    const ExchangeConfig& getConfig() const;

    Result<void> declare(Timeout timeout = std::nullopt);

    // Bind this exchange (as destination) to a source exchange
    virtual Result<void> bind(const std::string& source, const std::string& routingKey,
                              const Arguments& arguments = {}, Timeout timeout = std::nullopt);
    virtual Result<void> unbind(const std::string& source, const std::string& routingKey,
                                const Arguments& arguments = {}, Timeout timeout = std::nullopt);

    Result<void> onReconnect(const std::shared_ptr<ChannelSession>& session) override;

protected:
    std::shared_ptr<ChannelSession> getSession() const;
    ExchangeBindingConfig makeBinding(const std::string& source, const std::string& routingKey,
                                      const Arguments& arguments) const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<ChannelSession> session_;
    ExchangeConfig config_;
};

// Exchange that also restores its exchange-to-exchange bindings on reconnect
class RobustExchange : public Exchange {
public:
    RobustExchange(std::shared_ptr<ChannelSession> session, ExchangeConfig config);

    Result<void> bind(const std::string& source, const std::string& routingKey,
                      const Arguments& arguments = {}, Timeout timeout = std::nullopt) override;
    Result<void> unbind(const std::string& source, const std::string& routingKey,
                        const Arguments& arguments = {}, Timeout timeout = std::nullopt) override;

    Result<void> onReconnect(const std::shared_ptr<ChannelSession>& session) override;

    std::vector<ExchangeBindingConfig> getBindings() const;

private:
    mutable std::mutex bindingsMutex_;
    std::vector<ExchangeBindingConfig> bindings_;
};

} // namespace rabbitmq_recovery
