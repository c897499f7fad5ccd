// src/amqp_channel_session.cpp
#include "rabbitmq_recovery/amqp_channel_session.hpp"
#include <spdlog/spdlog.h>
#include <amqp_framing.h>
#include <sys/time.h>
#include <type_traits>
#include <variant>

namespace rabbitmq_recovery {

namespace {

// Applies an operation timeout to the rabbitmq-c RPC layer for one call
class RpcTimeoutGuard {
public:
    RpcTimeoutGuard(amqp_connection_state_t state, Timeout timeout)
        : state_(state), active_(timeout.has_value()) {
        if (active_) {
            struct timeval tv;
            tv.tv_sec = static_cast<time_t>(timeout->count() / 1000);
            tv.tv_usec = static_cast<suseconds_t>((timeout->count() % 1000) * 1000);
            int status = amqp_set_rpc_timeout(state_, &tv);
            if (status != AMQP_STATUS_OK) {
                spdlog::warn("Failed to set RPC timeout: {}", amqpErrorToString(status));
            }
        }
    }

    ~RpcTimeoutGuard() {
        if (active_) {
            amqp_set_rpc_timeout(state_, nullptr);
        }
    }

    RpcTimeoutGuard(const RpcTimeoutGuard&) = delete;
    RpcTimeoutGuard& operator=(const RpcTimeoutGuard&) = delete;

private:
    amqp_connection_state_t state_;
    bool active_;
};

template<typename T>
void settle(PendingOperation<T>& operation, Result<T>& result) {
    if (result) {
        operation.resolve(std::move(result.value));
    } else {
        operation.reject(makeException(result.error, result.message));
    }
}

void settle(PendingOperation<void>& operation, Result<void>& result) {
    if (result) {
        operation.resolve();
    } else {
        operation.reject(makeException(result.error, result.message));
    }
}

amqp_bytes_t toBytes(const std::string& value) {
    return amqp_cstring_bytes(value.c_str());
}

std::string fromBytes(const amqp_bytes_t& bytes) {
    return std::string(static_cast<const char*>(bytes.bytes), bytes.len);
}

} // namespace

AmqpTable::AmqpTable(const Arguments& arguments) {
    entries_.reserve(arguments.size());

    for (const auto& [key, value] : arguments) {
        amqp_table_entry_t entry;
        entry.key = amqp_cstring_bytes(key.c_str());

        std::visit([&entry](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                entry.value.kind = AMQP_FIELD_KIND_UTF8;
                entry.value.value.bytes = amqp_cstring_bytes(v.c_str());
            } else if constexpr (std::is_same_v<T, int64_t>) {
                entry.value.kind = AMQP_FIELD_KIND_I64;
                entry.value.value.i64 = v;
            } else if constexpr (std::is_same_v<T, bool>) {
                entry.value.kind = AMQP_FIELD_KIND_BOOLEAN;
                entry.value.value.boolean = v ? 1 : 0;
            } else {
                entry.value.kind = AMQP_FIELD_KIND_F64;
                entry.value.value.f64 = v;
            }
        }, value);

        entries_.push_back(entry);
    }

    table_.num_entries = static_cast<int>(entries_.size());
    table_.entries = entries_.empty() ? nullptr : entries_.data();
}

AmqpChannelSession::AmqpChannelSession()
    : futures_(FutureStore::createRoot()) {
}

AmqpChannelSession::~AmqpChannelSession() {
    if (isOpen()) {
        auto result = close();
        if (!result) {
            spdlog::warn("Channel {} did not close cleanly: {}", channelId_, result.message);
        }
    }
}

template<typename T, typename Operation>
Result<T> AmqpChannelSession::call(const std::string& context, Timeout timeout, Operation&& operation) {
    std::shared_ptr<Connection> connection;
    std::shared_ptr<FutureStore> futures;
    int channelId;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection = connection_;
        futures = futures_;
        channelId = channelId_;
    }

    if (!connection) {
        return Result<T>(ErrorType::ChannelError, context + ": channel has no connection");
    }

    auto pending = futures->template create<T>();
    {
        std::lock_guard<std::mutex> lock(connection->getMutex());
        if (!connection->isOpen() || !connection->getNativeHandle()) {
            auto result = Result<T>(ErrorType::ConnectionError, context + ": connection is not open");
            settle(*pending, result);
        } else {
            auto state = connection->getNativeHandle();
            RpcTimeoutGuard guard(state, timeout);
            Result<T> result = operation(state, static_cast<amqp_channel_t>(channelId));
            settle(*pending, result);
        }
    }

    auto result = awaitOperation(*pending, timeout, context);
    if (!result) {
        pending->reject(makeException(result.error, result.message));
        spdlog::debug("Channel {} {} failed: {}", channelId, context, result.message);
    }
    return result;
}

Result<void> AmqpChannelSession::checkReply(amqp_connection_state_t state, int channelId, const std::string& context) {
    amqp_rpc_reply_t reply = amqp_get_rpc_reply(state);
    auto result = rpcReplyToResult(reply, context);

    if (reply.reply_type == AMQP_RESPONSE_SERVER_EXCEPTION && reply.reply.id == AMQP_CHANNEL_CLOSE_METHOD) {
        amqp_channel_close_ok_t closeOk{};
        int status = amqp_send_method(state, static_cast<amqp_channel_t>(channelId),
                                      AMQP_CHANNEL_CLOSE_OK_METHOD, &closeOk);
        if (status != AMQP_STATUS_OK) {
            spdlog::warn("Channel {} failed to acknowledge broker close: {}", channelId, amqpErrorToString(status));
        }
        handleBrokerClose(result);
    }

    return result;
}

Result<void> AmqpChannelSession::open(std::shared_ptr<Connection> connection, int channelId, Timeout timeout) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_ = std::move(connection);
        channelId_ = channelId;
    }

    state_ = ChannelState::Opening;
    spdlog::debug("Opening channel {}", channelId);

    auto result = call<void>("channel.open", timeout,
        [this](amqp_connection_state_t state, amqp_channel_t channel) {
            amqp_channel_open(state, channel);
            return checkReply(state, channel, "channel.open");
        });

    state_ = result ? ChannelState::Open : ChannelState::Failed;
    if (!result) {
        spdlog::error("Failed to open channel {}: {}", channelId, result.message);
    }
    return result;
}

Result<void> AmqpChannelSession::close() {
    ChannelState expected = ChannelState::Open;
    if (!state_.compare_exchange_strong(expected, ChannelState::Closing)) {
        return Result<void>();
    }

    spdlog::debug("Closing channel {}", getChannelId());
    auto result = call<void>("channel.close", std::nullopt,
        [](amqp_connection_state_t state, amqp_channel_t channel) {
            return rpcReplyToResult(amqp_channel_close(state, channel, AMQP_REPLY_SUCCESS), "channel.close");
        });

    state_ = ChannelState::Closed;
    notifyClosed(result);
    return result;
}

void AmqpChannelSession::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    connection_.reset();
}

void AmqpChannelSession::interrupt() {
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection = connection_;
    }

    if (connection) {
        connection->abort();
    }
}

bool AmqpChannelSession::isOpen() const {
    return state_ == ChannelState::Open;
}

int AmqpChannelSession::getChannelId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channelId_;
}

ChannelState AmqpChannelSession::getState() const {
    return state_;
}

void AmqpChannelSession::setFutureStore(std::shared_ptr<FutureStore> futures) {
    std::lock_guard<std::mutex> lock(mutex_);
    futures_ = futures ? std::move(futures) : FutureStore::createRoot();
}

void AmqpChannelSession::setCloseListener(CloseListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    closeListener_ = std::move(listener);
}

Result<void> AmqpChannelSession::declareExchange(const ExchangeConfig& config, Timeout timeout) {
    return call<void>("exchange.declare " + config.name, timeout,
        [this, &config](amqp_connection_state_t state, amqp_channel_t channel) {
            AmqpTable arguments(config.arguments);
            amqp_exchange_declare(state, channel, toBytes(config.name), toBytes(config.type),
                                  config.passive, config.durable, config.autoDelete, config.internal,
                                  arguments.get());
            return checkReply(state, channel, "exchange.declare " + config.name);
        });
}

Result<void> AmqpChannelSession::deleteExchange(const std::string& name, bool ifUnused, bool nowait, Timeout timeout) {
    return call<void>("exchange.delete " + name, timeout,
        [this, &name, ifUnused, nowait](amqp_connection_state_t state, amqp_channel_t channel) {
            if (nowait) {
                amqp_exchange_delete_t request{};
                request.exchange = toBytes(name);
                request.if_unused = ifUnused;
                request.nowait = 1;
                int status = amqp_send_method(state, channel, AMQP_EXCHANGE_DELETE_METHOD, &request);
                if (status != AMQP_STATUS_OK) {
                    return Result<void>(amqpErrorToErrorType(status), "exchange.delete " + name + ": " + amqpErrorToString(status));
                }
                return Result<void>();
            }

            amqp_exchange_delete(state, channel, toBytes(name), ifUnused);
            return checkReply(state, channel, "exchange.delete " + name);
        });
}

Result<void> AmqpChannelSession::bindExchange(const ExchangeBindingConfig& binding, Timeout timeout) {
    return call<void>("exchange.bind " + binding.destination, timeout,
        [this, &binding](amqp_connection_state_t state, amqp_channel_t channel) {
            AmqpTable arguments(binding.arguments);
            amqp_exchange_bind(state, channel, toBytes(binding.destination), toBytes(binding.source),
                               toBytes(binding.routingKey), arguments.get());
            return checkReply(state, channel, "exchange.bind " + binding.destination);
        });
}

Result<void> AmqpChannelSession::unbindExchange(const ExchangeBindingConfig& binding, Timeout timeout) {
    return call<void>("exchange.unbind " + binding.destination, timeout,
        [this, &binding](amqp_connection_state_t state, amqp_channel_t channel) {
            AmqpTable arguments(binding.arguments);
            amqp_exchange_unbind(state, channel, toBytes(binding.destination), toBytes(binding.source),
                                 toBytes(binding.routingKey), arguments.get());
            return checkReply(state, channel, "exchange.unbind " + binding.destination);
        });
}

Result<QueueInfo> AmqpChannelSession::declareQueue(const QueueConfig& config, Timeout timeout) {
    return call<QueueInfo>("queue.declare " + config.name, timeout,
        [this, &config](amqp_connection_state_t state, amqp_channel_t channel) {
            AmqpTable arguments(config.arguments);
            amqp_queue_declare_ok_t* ok = amqp_queue_declare(state, channel, toBytes(config.name),
                                                             config.passive, config.durable, config.exclusive,
                                                             config.autoDelete, arguments.get());
            auto reply = checkReply(state, channel, "queue.declare " + config.name);
            if (!reply) {
                return Result<QueueInfo>(reply.error, reply.message);
            }
            if (!ok) {
                return Result<QueueInfo>(ErrorType::ProtocolError, "queue.declare " + config.name + ": empty reply");
            }

            QueueInfo info;
            info.name = fromBytes(ok->queue);
            info.messageCount = ok->message_count;
            info.consumerCount = ok->consumer_count;
            return Result<QueueInfo>(std::move(info));
        });
}

Result<uint32_t> AmqpChannelSession::deleteQueue(const std::string& name, bool ifUnused, bool ifEmpty,
                                                 bool nowait, Timeout timeout) {
    return call<uint32_t>("queue.delete " + name, timeout,
        [this, &name, ifUnused, ifEmpty, nowait](amqp_connection_state_t state, amqp_channel_t channel) {
            if (nowait) {
                amqp_queue_delete_t request{};
                request.queue = toBytes(name);
                request.if_unused = ifUnused;
                request.if_empty = ifEmpty;
                request.nowait = 1;
                int status = amqp_send_method(state, channel, AMQP_QUEUE_DELETE_METHOD, &request);
                if (status != AMQP_STATUS_OK) {
                    return Result<uint32_t>(amqpErrorToErrorType(status), "queue.delete " + name + ": " + amqpErrorToString(status));
                }
                return Result<uint32_t>(0u);
            }

            amqp_queue_delete_ok_t* ok = amqp_queue_delete(state, channel, toBytes(name), ifUnused, ifEmpty);
            auto reply = checkReply(state, channel, "queue.delete " + name);
            if (!reply) {
                return Result<uint32_t>(reply.error, reply.message);
            }
            return Result<uint32_t>(ok ? ok->message_count : 0u);
        });
}

Result<void> AmqpChannelSession::bindQueue(const BindingConfig& binding, Timeout timeout) {
    return call<void>("queue.bind " + binding.queue, timeout,
        [this, &binding](amqp_connection_state_t state, amqp_channel_t channel) {
            AmqpTable arguments(binding.arguments);
            amqp_queue_bind(state, channel, toBytes(binding.queue), toBytes(binding.exchange),
                            toBytes(binding.routingKey), arguments.get());
            return checkReply(state, channel, "queue.bind " + binding.queue);
        });
}

Result<void> AmqpChannelSession::unbindQueue(const BindingConfig& binding, Timeout timeout) {
    return call<void>("queue.unbind " + binding.queue, timeout,
        [this, &binding](amqp_connection_state_t state, amqp_channel_t channel) {
            AmqpTable arguments(binding.arguments);
            amqp_queue_unbind(state, channel, toBytes(binding.queue), toBytes(binding.exchange),
                              toBytes(binding.routingKey), arguments.get());
            return checkReply(state, channel, "queue.unbind " + binding.queue);
        });
}

// Deliveries are read by the application's consume loop; the callback is
// kept by the queue for re-registration
Result<std::string> AmqpChannelSession::basicConsume(const std::string& queue, const ConsumeOptions& options,
                                                     ConsumerCallback, Timeout timeout) {
    return call<std::string>("basic.consume " + queue, timeout,
        [this, &queue, &options](amqp_connection_state_t state, amqp_channel_t channel) {
            AmqpTable arguments(options.arguments);
            amqp_basic_consume_ok_t* ok = amqp_basic_consume(state, channel, toBytes(queue),
                                                             toBytes(options.consumerTag), options.noLocal,
                                                             options.noAck, options.exclusive, arguments.get());
            auto reply = checkReply(state, channel, "basic.consume " + queue);
            if (!reply) {
                return Result<std::string>(reply.error, reply.message);
            }
            return Result<std::string>(ok ? fromBytes(ok->consumer_tag) : options.consumerTag);
        });
}

Result<void> AmqpChannelSession::basicCancel(const std::string& consumerTag, Timeout timeout) {
    return call<void>("basic.cancel " + consumerTag, timeout,
        [this, &consumerTag](amqp_connection_state_t state, amqp_channel_t channel) {
            amqp_basic_cancel(state, channel, toBytes(consumerTag));
            return checkReply(state, channel, "basic.cancel " + consumerTag);
        });
}

Result<void> AmqpChannelSession::basicQos(uint16_t prefetchCount, uint32_t prefetchSize, bool global, Timeout timeout) {
    return call<void>("basic.qos", timeout,
        [this, prefetchCount, prefetchSize, global](amqp_connection_state_t state, amqp_channel_t channel) {
            amqp_basic_qos(state, channel, prefetchSize, prefetchCount, global);
            return checkReply(state, channel, "basic.qos");
        });
}

void AmqpChannelSession::handleBrokerClose(const Result<void>& reason) {
    ChannelState previous = state_.exchange(ChannelState::Closed);
    if (previous == ChannelState::Closed) {
        return;
    }

    spdlog::warn("Channel {} closed by broker while {}: {}", getChannelId(),
                 channelStateToString(previous), reason.message);
    notifyClosed(reason);
}

void AmqpChannelSession::notifyClosed(const Result<void>& reason) {
    CloseListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = closeListener_;
    }

    if (listener) {
        listener(reason);
    }
}

} // namespace rabbitmq_recovery
