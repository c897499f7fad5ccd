#include "rabbitmq_recovery/exchange.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace rabbitmq_recovery {

namespace {

bool sameBinding(const ExchangeBindingConfig& a, const ExchangeBindingConfig& b) {
    return a.source == b.source && a.routingKey == b.routingKey && a.arguments == b.arguments;
}

} // namespace

Exchange::Exchange(std::shared_ptr<ChannelSession> session, ExchangeConfig config)
    : session_(std::move(session)), config_(std::move(config)) {
}

std::string Exchange::getName() const {
    return config_.name;
}

const ExchangeConfig& Exchange::getConfig() const {
    return config_;
}

Result<void> Exchange::declare(Timeout timeout) {
    auto session = getSession();
    if (!session) {
        return Result<void>(ErrorType::ChannelError, "Exchange " + config_.name + " has no channel");
    }
    return session->declareExchange(config_, timeout);
}

Result<void> Exchange::bind(const std::string& source, const std::string& routingKey,
                            const Arguments& arguments, Timeout timeout) {
    auto session = getSession();
    if (!session) {
        return Result<void>(ErrorType::ChannelError, "Exchange " + config_.name + " has no channel");
    }
    return session->bindExchange(makeBinding(source, routingKey, arguments), timeout);
}

Result<void> Exchange::unbind(const std::string& source, const std::string& routingKey,
                              const Arguments& arguments, Timeout timeout) {
    auto session = getSession();
    if (!session) {
        return Result<void>(ErrorType::ChannelError, "Exchange " + config_.name + " has no channel");
    }
    return session->unbindExchange(makeBinding(source, routingKey, arguments), timeout);
}

Result<void> Exchange::onReconnect(const std::shared_ptr<ChannelSession>& session) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_ = session;
    }

    auto result = declare();
    if (!result) {
        spdlog::error("Failed to re-declare exchange {}: {}", config_.name, result.message);
    }
    return result;
}

std::shared_ptr<ChannelSession> Exchange::getSession() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

ExchangeBindingConfig Exchange::makeBinding(const std::string& source, const std::string& routingKey,
                                            const Arguments& arguments) const {
    ExchangeBindingConfig binding;
    binding.destination = config_.name;
    binding.source = source;
    binding.routingKey = routingKey;
    binding.arguments = arguments;
    return binding;
}

RobustExchange::RobustExchange(std::shared_ptr<ChannelSession> session, ExchangeConfig config)
    : Exchange(std::move(session), std::move(config)) {
}

Result<void> RobustExchange::bind(const std::string& source, const std::string& routingKey,
                                  const Arguments& arguments, Timeout timeout) {
    auto result = Exchange::bind(source, routingKey, arguments, timeout);
    if (!result) {
        return result;
    }

    auto binding = makeBinding(source, routingKey, arguments);
    std::lock_guard<std::mutex> lock(bindingsMutex_);
    auto it = std::find_if(bindings_.begin(), bindings_.end(),
                           [&binding](const ExchangeBindingConfig& b) { return sameBinding(b, binding); });
    if (it == bindings_.end()) {
        bindings_.push_back(std::move(binding));
    }
    return result;
}

Result<void> RobustExchange::unbind(const std::string& source, const std::string& routingKey,
                                    const Arguments& arguments, Timeout timeout) {
    auto result = Exchange::unbind(source, routingKey, arguments, timeout);
    if (!result) {
        return result;
    }

    auto binding = makeBinding(source, routingKey, arguments);
    std::lock_guard<std::mutex> lock(bindingsMutex_);
    bindings_.erase(std::remove_if(bindings_.begin(), bindings_.end(),
                                   [&binding](const ExchangeBindingConfig& b) { return sameBinding(b, binding); }),
                    bindings_.end());
    return result;
}

Result<void> RobustExchange::onReconnect(const std::shared_ptr<ChannelSession>& session) {
    auto result = Exchange::onReconnect(session);
    if (!result) {
        return result;
    }

    for (const auto& binding : getBindings()) {
        result = session->bindExchange(binding, std::nullopt);
        if (!result) {
            spdlog::error("Failed to restore binding {} -> {} ({}): {}",
                          binding.source, binding.destination, binding.routingKey, result.message);
            return result;
        }
    }

    spdlog::debug("Exchange {} recovered with {} bindings", getName(), getBindings().size());
    return result;
}

std::vector<ExchangeBindingConfig> RobustExchange::getBindings() const {
    std::lock_guard<std::mutex> lock(bindingsMutex_);
    return bindings_;
}

} // namespace rabbitmq_recovery
