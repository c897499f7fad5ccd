#include "rabbitmq_recovery/robust_channel.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace rabbitmq_recovery {

RobustChannel::RobustChannel(std::shared_ptr<ChannelSession> session,
                             std::shared_ptr<Connection> connection,
                             int channelId,
                             std::shared_ptr<FutureStore> futures,
                             std::shared_ptr<EntityFactory> factory,
                             std::shared_ptr<RecoveryMetrics> metrics)
    : session_(std::move(session))
    , futures_(std::move(futures))
    , factory_(std::move(factory))
    , metrics_(std::move(metrics))
    , closing_(std::make_shared<CompletionSlot>())
    , connection_(std::move(connection))
    , channelId_(channelId) {

    if (!session_) {
        throw std::invalid_argument("RobustChannel requires a channel session");
    }
    if (!futures_) {
        futures_ = FutureStore::createRoot()->getChild();
    }
    if (!factory_) {
        factory_ = std::make_shared<RobustEntityFactory>();
    }

    session_->setFutureStore(futures_);

    // The session may outlive this channel, so the listener holds the slot weakly
    std::weak_ptr<CompletionSlot> weakClosing = closing_;
    session_->setCloseListener([weakClosing](const Result<void>& reason) {
        auto slot = weakClosing.lock();
        if (!slot) {
            return;
        }
        if (reason) {
            slot->complete();
        } else {
            slot->fail(makeException(reason.error, reason.message));
        }
    });
}

RobustChannel::~RobustChannel() {
    session_->setCloseListener(nullptr);
}

Result<void> RobustChannel::onReconnect(std::shared_ptr<Connection> connection, int channelId) {
    auto started = std::chrono::steady_clock::now();

    if (closing_->replace(std::make_exception_ptr(
            ConnectionLostException("Channel closing interrupted by reconnect")))) {
        spdlog::debug("Rejected pending closing signal of channel {}", getChannelId());
    }

    size_t rejected = futures_->rejectAll(std::make_exception_ptr(
        ConnectionLostException("Connection lost while the operation was pending")));
    if (rejected > 0) {
        spdlog::warn("Channel {}: {} pending operations failed by reconnect", getChannelId(), rejected);
    }
    if (metrics_) {
        metrics_->recordOperationsRejected(rejected);
    }

    // Calls waiting on a registry future were woken by the rejection; calls
    // still blocked inside the old transport are released by interrupting it
    if (getConnection() != connection) {
        session_->interrupt();
    }

    std::unique_lock<std::shared_mutex> recoveryLock(recoveryMutex_);

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        stats_.operationsRejected += rejected;

        if (closed_.load()) {
            spdlog::debug("Channel {} is closed, not reopening", channelId_);
            return Result<void>();
        }

        connection_ = std::move(connection);
        channelId_ = channelId;
        stats_.reconnects++;
        stats_.lastReconnect = std::chrono::system_clock::now();
    }

    spdlog::info("Reconnecting channel {}", channelId);

    auto initialized = doInitialize(std::nullopt);
    if (!initialized) {
        return failReconnect(Result<void>(initialized.error, initialized.message), started);
    }

    auto replayed = replay();
    if (!replayed) {
        return failReconnect(replayed, started);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (metrics_) {
        metrics_->recordReconnect(true, elapsed);
    }
    spdlog::info("Channel {} recovered in {}ms", channelId, elapsed.count());
    return Result<void>();
}

Result<std::shared_ptr<ChannelSession>> RobustChannel::initialize(Timeout timeout) {
    auto check = checkOpen("initialize");
    if (!check) {
        return Result<std::shared_ptr<ChannelSession>>(check.error, check.message);
    }

    std::shared_lock<std::shared_mutex> recoveryLock(recoveryMutex_);
    if (session_->isOpen()) {
        // A second channel.open on a live channel is a connection error
        return Result<std::shared_ptr<ChannelSession>>(session_);
    }
    return doInitialize(timeout);
}

Result<void> RobustChannel::setQos(uint16_t prefetchCount, uint32_t prefetchSize,
                                   bool allChannels, Timeout timeout) {
    if (allChannels) {
        return Result<void>(ErrorType::UnsupportedOperation,
                            "QoS for all channels cannot be restored after a reconnect");
    }

    auto check = checkOpen("setQos");
    if (!check) {
        return check;
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        qos_.prefetchCount = prefetchCount;
        qos_.prefetchSize = prefetchSize;
    }

    std::shared_lock<std::shared_mutex> recoveryLock(recoveryMutex_);
    auto result = session_->basicQos(prefetchCount, prefetchSize, false, timeout);
    if (!result) {
        spdlog::error("Failed to set QoS on channel {}: {}", getChannelId(), result.message);
    }
    return result;
}

Result<void> RobustChannel::close() {
    if (closed_.load()) {
        return Result<void>();
    }

    std::lock_guard<std::mutex> writeLock(writeMutex_);
    if (closed_.exchange(true)) {
        return Result<void>();
    }

    Result<void> result;
    {
        std::shared_lock<std::shared_mutex> recoveryLock(recoveryMutex_);

        auto signal = closing_->current();
        if (session_->isOpen()) {
            auto requested = session_->close();
            if (!requested) {
                spdlog::warn("Channel {} did not close cleanly: {}", getChannelId(), requested.message);
                result = requested;
            } else {
                try {
                    signal.get();
                } catch (const RabbitMQException& e) {
                    spdlog::warn("Channel {} close interrupted: {}", getChannelId(), e.what());
                    result = Result<void>(e.getErrorType(), e.what());
                }
            }
        }

        session_->release();
    }

    size_t exchanges = 0;
    size_t queues = 0;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        exchanges = exchanges_.size();
        queues = queues_.size();
        exchanges_.clear();
        queues_.clear();
        connection_.reset();
    }
    if (metrics_) {
        metrics_->recordEntitiesForgotten(EntityKind::Exchange, exchanges);
        metrics_->recordEntitiesForgotten(EntityKind::Queue, queues);
    }

    spdlog::info("Channel {} closed", getChannelId());
    return result;
}

Result<std::shared_ptr<Exchange>> RobustChannel::declareExchange(const ExchangeConfig& config,
                                                                 Timeout timeout, bool recoverable) {
    auto check = checkOpen("declareExchange");
    if (!check) {
        return Result<std::shared_ptr<Exchange>>(check.error, check.message);
    }

    std::shared_lock<std::shared_mutex> recoveryLock(recoveryMutex_);

    auto exchange = factory_->createExchange(session_, config);
    auto declared = exchange->declare(timeout);
    if (!declared) {
        return Result<std::shared_ptr<Exchange>>(declared.error, declared.message);
    }

    if (!config.internal && recoverable) {
        bool added = false;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            added = !exchanges_.contains(config.name);
            exchanges_.insert(config.name, exchange);
        }
        if (added && metrics_) {
            metrics_->recordEntityRemembered(EntityKind::Exchange);
        }
        spdlog::debug("Exchange {} remembered for recovery", config.name);
    }

    return Result<std::shared_ptr<Exchange>>(exchange);
}

Result<void> RobustChannel::deleteExchange(const std::string& name, Timeout timeout,
                                           bool ifUnused, bool nowait) {
    auto check = checkOpen("deleteExchange");
    if (!check) {
        return check;
    }

    std::shared_lock<std::shared_mutex> recoveryLock(recoveryMutex_);

    auto result = session_->deleteExchange(name, ifUnused, nowait, timeout);
    if (!result) {
        return result;
    }

    bool erased = false;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        erased = exchanges_.erase(name);
    }
    if (erased && metrics_) {
        metrics_->recordEntitiesForgotten(EntityKind::Exchange);
    }
    return result;
}

Result<std::shared_ptr<Queue>> RobustChannel::declareQueue(const QueueConfig& config,
                                                           Timeout timeout, bool recoverable) {
    auto check = checkOpen("declareQueue");
    if (!check) {
        return Result<std::shared_ptr<Queue>>(check.error, check.message);
    }

    std::shared_lock<std::shared_mutex> recoveryLock(recoveryMutex_);

    auto queue = factory_->createQueue(session_, config);
    auto declared = queue->declare(timeout);
    if (!declared) {
        return Result<std::shared_ptr<Queue>>(declared.error, declared.message);
    }

    if (recoverable) {
        const std::string name = queue->getName();
        bool added = false;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            added = !queues_.contains(name);
            queues_.insert(name, queue);
        }
        if (added && metrics_) {
            metrics_->recordEntityRemembered(EntityKind::Queue);
        }
        spdlog::debug("Queue {} remembered for recovery", name);
    }

    return Result<std::shared_ptr<Queue>>(queue);
}

Result<uint32_t> RobustChannel::deleteQueue(const std::string& name, Timeout timeout,
                                            bool ifUnused, bool ifEmpty, bool nowait) {
    auto check = checkOpen("deleteQueue");
    if (!check) {
        return Result<uint32_t>(check.error, check.message);
    }

    std::shared_lock<std::shared_mutex> recoveryLock(recoveryMutex_);

    auto result = session_->deleteQueue(name, ifUnused, ifEmpty, nowait, timeout);
    if (!result) {
        return result;
    }

    bool erased = false;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        erased = queues_.erase(name);
    }
    if (erased && metrics_) {
        metrics_->recordEntitiesForgotten(EntityKind::Queue);
    }
    return result;
}

bool RobustChannel::isClosed() const {
    return closed_.load();
}

QosSettings RobustChannel::getQos() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return qos_;
}

int RobustChannel::getChannelId() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return channelId_;
}

std::shared_ptr<Connection> RobustChannel::getConnection() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return connection_;
}

std::shared_ptr<ChannelSession> RobustChannel::getSession() const {
    return session_;
}

std::shared_ptr<FutureStore> RobustChannel::futures() const {
    return futures_;
}

std::shared_future<void> RobustChannel::closing() const {
    return closing_->current();
}

std::vector<std::string> RobustChannel::getRecoverableExchangeNames() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return exchanges_.names();
}

std::vector<std::string> RobustChannel::getRecoverableQueueNames() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return queues_.names();
}

std::shared_ptr<Exchange> RobustChannel::findExchange(const std::string& name) const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return exchanges_.find(name);
}

std::shared_ptr<Queue> RobustChannel::findQueue(const std::string& name) const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return queues_.find(name);
}

RecoveryStats RobustChannel::getStats() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return stats_;
}

Result<std::shared_ptr<ChannelSession>> RobustChannel::doInitialize(Timeout timeout) {
    std::shared_ptr<Connection> connection;
    int channelId = 0;
    QosSettings qos;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        connection = connection_;
        channelId = channelId_;
        qos = qos_;
    }

    auto opened = session_->open(connection, channelId, timeout);
    if (!opened) {
        spdlog::error("Failed to open channel {}: {}", channelId, opened.message);
        return Result<std::shared_ptr<ChannelSession>>(opened.error, opened.message);
    }

    // Applied even when it is (0, 0) so the broker matches the remembered pair
    auto qosApplied = session_->basicQos(qos.prefetchCount, qos.prefetchSize, false, timeout);
    if (!qosApplied) {
        spdlog::error("Failed to apply QoS on channel {}: {}", channelId, qosApplied.message);
        return Result<std::shared_ptr<ChannelSession>>(qosApplied.error, qosApplied.message);
    }

    spdlog::debug("Channel {} open with prefetch {}/{}", channelId, qos.prefetchCount, qos.prefetchSize);
    return Result<std::shared_ptr<ChannelSession>>(session_);
}

Result<void> RobustChannel::replay() {
    std::vector<std::shared_ptr<Exchange>> exchanges;
    std::vector<std::string> queueNames;
    std::vector<std::shared_ptr<Queue>> queues;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        exchanges = exchanges_.values();
        queueNames = queues_.names();
        queues = queues_.values();
    }

    for (const auto& exchange : exchanges) {
        auto result = exchange->onReconnect(session_);
        if (!result) {
            spdlog::error("Failed to recover exchange {}: {}", exchange->getName(), result.message);
            return result;
        }
        spdlog::debug("Recovered exchange {}", exchange->getName());
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            stats_.exchangesRecovered++;
        }
        if (metrics_) {
            metrics_->recordEntityRecovered(EntityKind::Exchange);
        }
    }

    for (size_t i = 0; i < queues.size(); ++i) {
        const auto& queue = queues[i];
        auto result = queue->onReconnect(session_);
        if (!result) {
            spdlog::error("Failed to recover queue {}: {}", queueNames[i], result.message);
            return result;
        }

        const std::string name = queue->getName();
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (name != queueNames[i]) {
                queues_.rename(queueNames[i], name);
                spdlog::debug("Queue {} recovered as {}", queueNames[i], name);
            }
            stats_.queuesRecovered++;
        }
        spdlog::debug("Recovered queue {}", name);
        if (metrics_) {
            metrics_->recordEntityRecovered(EntityKind::Queue);
        }
    }

    return Result<void>();
}

Result<void> RobustChannel::failReconnect(const Result<void>& error,
                                          std::chrono::steady_clock::time_point started) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        stats_.failedReconnects++;
    }
    if (metrics_) {
        metrics_->recordReconnect(false, elapsed);
    }
    spdlog::error("Reconnect of channel {} failed: {}", getChannelId(), error.message);
    return error;
}

Result<void> RobustChannel::checkOpen(const std::string& operation) const {
    if (closed_.load()) {
        return Result<void>(ErrorType::ChannelError,
                            operation + " on closed channel " + std::to_string(getChannelId()));
    }
    return Result<void>();
}

} // namespace rabbitmq_recovery
