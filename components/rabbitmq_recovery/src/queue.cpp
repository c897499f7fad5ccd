#include "rabbitmq_recovery/queue.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace rabbitmq_recovery {

namespace {

bool sameBinding(const BindingConfig& a, const BindingConfig& b) {
    return a.exchange == b.exchange && a.routingKey == b.routingKey && a.arguments == b.arguments;
}

} // namespace

Queue::Queue(std::shared_ptr<ChannelSession> session, QueueConfig config)
    : session_(std::move(session)), config_(std::move(config)), name_(config_.name) {
}

std::string Queue::getName() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return name_;
}

const QueueConfig& Queue::getConfig() const {
    return config_;
}

Result<QueueInfo> Queue::declare(Timeout timeout) {
    auto session = getSession();
    if (!session) {
        return Result<QueueInfo>(ErrorType::ChannelError, "Queue " + getName() + " has no channel");
    }

    auto result = session->declareQueue(config_, timeout);
    if (!result) {
        return result;
    }

    if (result->name.empty()) {
        result->name = config_.name;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.name.empty()) {
        spdlog::debug("Broker named queue {}", result->name);
    }
    name_ = result->name;
    return result;
}

Result<void> Queue::bind(const std::string& exchange, const std::string& routingKey,
                         const Arguments& arguments, Timeout timeout) {
    auto session = getSession();
    if (!session) {
        return Result<void>(ErrorType::ChannelError, "Queue " + getName() + " has no channel");
    }
    return session->bindQueue(makeBinding(exchange, routingKey, arguments), timeout);
}

Result<void> Queue::unbind(const std::string& exchange, const std::string& routingKey,
                           const Arguments& arguments, Timeout timeout) {
    auto session = getSession();
    if (!session) {
        return Result<void>(ErrorType::ChannelError, "Queue " + getName() + " has no channel");
    }
    return session->unbindQueue(makeBinding(exchange, routingKey, arguments), timeout);
}

Result<std::string> Queue::consume(ConsumerCallback callback, const ConsumeOptions& options, Timeout timeout) {
    auto session = getSession();
    if (!session) {
        return Result<std::string>(ErrorType::ChannelError, "Queue " + getName() + " has no channel");
    }
    return session->basicConsume(getName(), options, std::move(callback), timeout);
}

Result<void> Queue::cancel(const std::string& consumerTag, Timeout timeout) {
    auto session = getSession();
    if (!session) {
        return Result<void>(ErrorType::ChannelError, "Queue " + getName() + " has no channel");
    }
    return session->basicCancel(consumerTag, timeout);
}

Result<void> Queue::onReconnect(const std::shared_ptr<ChannelSession>& session) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_ = session;
    }

    auto result = declare();
    if (!result) {
        spdlog::error("Failed to re-declare queue {}: {}", getName(), result.message);
        return Result<void>(result.error, result.message);
    }
    return Result<void>();
}

std::shared_ptr<ChannelSession> Queue::getSession() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

BindingConfig Queue::makeBinding(const std::string& exchange, const std::string& routingKey,
                                 const Arguments& arguments) const {
    BindingConfig binding;
    binding.queue = getName();
    binding.exchange = exchange;
    binding.routingKey = routingKey;
    binding.arguments = arguments;
    return binding;
}

RobustQueue::RobustQueue(std::shared_ptr<ChannelSession> session, QueueConfig config)
    : Queue(std::move(session), std::move(config)) {
}

Result<void> RobustQueue::bind(const std::string& exchange, const std::string& routingKey,
                               const Arguments& arguments, Timeout timeout) {
    auto result = Queue::bind(exchange, routingKey, arguments, timeout);
    if (!result) {
        return result;
    }

    auto binding = makeBinding(exchange, routingKey, arguments);
    std::lock_guard<std::mutex> lock(stateMutex_);
    auto it = std::find_if(bindings_.begin(), bindings_.end(),
                           [&binding](const BindingConfig& b) { return sameBinding(b, binding); });
    if (it == bindings_.end()) {
        bindings_.push_back(std::move(binding));
    }
    return result;
}

Result<void> RobustQueue::unbind(const std::string& exchange, const std::string& routingKey,
                                 const Arguments& arguments, Timeout timeout) {
    auto result = Queue::unbind(exchange, routingKey, arguments, timeout);
    if (!result) {
        return result;
    }

    auto binding = makeBinding(exchange, routingKey, arguments);
    std::lock_guard<std::mutex> lock(stateMutex_);
    bindings_.erase(std::remove_if(bindings_.begin(), bindings_.end(),
                                   [&binding](const BindingConfig& b) { return sameBinding(b, binding); }),
                    bindings_.end());
    return result;
}

Result<std::string> RobustQueue::consume(ConsumerCallback callback, const ConsumeOptions& options, Timeout timeout) {
    auto result = Queue::consume(callback, options, timeout);
    if (!result) {
        return result;
    }

    // Re-consume under the same tag so the application keeps a stable handle
    ConsumerEntry entry{std::move(callback), options};
    entry.options.consumerTag = result.value;

    std::lock_guard<std::mutex> lock(stateMutex_);
    consumers_[result.value] = std::move(entry);
    return result;
}

Result<void> RobustQueue::cancel(const std::string& consumerTag, Timeout timeout) {
    auto result = Queue::cancel(consumerTag, timeout);
    if (!result) {
        return result;
    }

    std::lock_guard<std::mutex> lock(stateMutex_);
    consumers_.erase(consumerTag);
    return result;
}

Result<void> RobustQueue::onReconnect(const std::shared_ptr<ChannelSession>& session) {
    auto result = Queue::onReconnect(session);
    if (!result) {
        return result;
    }

    // A server-named queue comes back under a new name
    const std::string name = getName();
    std::vector<BindingConfig> bindings;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        for (auto& binding : bindings_) {
            binding.queue = name;
        }
        bindings = bindings_;
    }

    for (const auto& binding : bindings) {
        result = session->bindQueue(binding, std::nullopt);
        if (!result) {
            spdlog::error("Failed to restore binding {} -> {} ({}): {}",
                          binding.queue, binding.exchange, binding.routingKey, result.message);
            return result;
        }
    }

    std::map<std::string, ConsumerEntry> consumers;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        consumers = consumers_;
    }

    for (const auto& [tag, entry] : consumers) {
        auto consumed = session->basicConsume(name, entry.options, entry.callback, std::nullopt);
        if (!consumed) {
            spdlog::error("Failed to restore consumer {} on queue {}: {}", tag, name, consumed.message);
            return Result<void>(consumed.error, consumed.message);
        }
    }

    spdlog::debug("Queue {} recovered with {} bindings and {} consumers",
                  name, bindings.size(), consumers.size());
    return Result<void>();
}

std::vector<BindingConfig> RobustQueue::getBindings() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return bindings_;
}

std::vector<std::string> RobustQueue::getConsumerTags() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    std::vector<std::string> tags;
    tags.reserve(consumers_.size());
    for (const auto& [tag, entry] : consumers_) {
        tags.push_back(tag);
    }
    return tags;
}

} // namespace rabbitmq_recovery
