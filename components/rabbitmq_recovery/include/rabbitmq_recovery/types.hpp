// components/rabbitmq_recovery/include/rabbitmq_recovery/types.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <amqp.h>

namespace rabbitmq_recovery {

// Forward declarations
class Connection;
class ChannelSession;
class RobustChannel;

// Connection states
enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Disconnecting,
    Failed
};

// Channel states
enum class ChannelState {
    Closed,
    Opening,
    Open,
    Closing,
    Failed
};

// Error types
enum class ErrorType {
    None,
    ConnectionError,
    ChannelError,
    AuthenticationError,
    NetworkError,
    ProtocolError,
    TimeoutError,
    ResourceError,
    ConnectionLost,
    UnsupportedOperation
};

// Result template for operations that can succeed or fail
template<typename T>
class Result {
public:
    // Success constructor
    explicit Result(T value) : success(true), value(std::move(value)), error(ErrorType::None) {}

    // Failure constructor
    explicit Result(ErrorType errorType, const std::string& errorMessage = "")
        : success(false), error(errorType), message(errorMessage) {}

    // Default constructor (success with a default value)
    Result() : success(true), error(ErrorType::None) {}

    // Check if result is successful
    operator bool() const { return success; }

    // Access value (only if successful)
    T& operator*() { return value; }
    const T& operator*() const { return value; }

    T* operator->() { return &value; }
    const T* operator->() const { return &value; }

    bool success;
    T value{};
    ErrorType error{ErrorType::None};
    std::string message;
};

// Specialization for void
template<>
class Result<void> {
public:
    // Success constructor
    Result() : success(true), error(ErrorType::None) {}

    // Failure constructor
    explicit Result(ErrorType errorType, const std::string& errorMessage = "")
        : success(false), error(errorType), message(errorMessage) {}

    // Check if result is successful
    operator bool() const { return success; }

    bool success;
    ErrorType error{ErrorType::None};
    std::string message;
};

// Declaration argument value, encoded with the matching AMQP field type
using ArgumentValue = std::variant<
    std::string,
    int64_t,
    bool,
    double
>;

// Declaration arguments (x-message-ttl, alternate-exchange, ...)
using Arguments = std::map<std::string, ArgumentValue>;

// Per-operation timeout; std::nullopt waits for the broker indefinitely
using Timeout = std::optional<std::chrono::milliseconds>;

// Connection configuration
struct ConnectionConfig {
    std::string host{"localhost"};
    int port{5672};
    std::string vhost{"/"};
    std::string username{"guest"};
    std::string password{"guest"};

    std::chrono::seconds heartbeat{60};
    uint32_t frameMax{131072};
    uint16_t channelMax{2047};
    std::chrono::milliseconds connectionTimeout{std::chrono::seconds(30)};
};

// Channel configuration applied by RobustConnection to every channel it opens
struct ChannelConfig {
    uint16_t prefetchCount{0};
    uint32_t prefetchSize{0};
    Timeout openTimeout;
};

// Quality of service pair remembered by a channel
struct QosSettings {
    uint16_t prefetchCount{0};
    uint32_t prefetchSize{0};

    bool operator==(const QosSettings& other) const {
        return prefetchCount == other.prefetchCount && prefetchSize == other.prefetchSize;
    }
    bool operator!=(const QosSettings& other) const { return !(*this == other); }
};

// Exchange configuration
struct ExchangeConfig {
    std::string name;
    std::string type{"direct"};
    bool durable{true};
    bool autoDelete{false};
    bool internal{false};
    bool passive{false};
    Arguments arguments;
};

// Queue configuration; an empty name asks the broker to generate one
struct QueueConfig {
    std::string name;
    bool durable{true};
    bool exclusive{false};
    bool passive{false};
    bool autoDelete{false};
    Arguments arguments;
};

// Queue information returned by queue.declare-ok
struct QueueInfo {
    std::string name;
    uint32_t messageCount{0};
    uint32_t consumerCount{0};
};

// Queue to exchange binding
struct BindingConfig {
    std::string queue;
    std::string exchange;
    std::string routingKey;
    Arguments arguments;
};

// Exchange to exchange binding
struct ExchangeBindingConfig {
    std::string destination;
    std::string source;
    std::string routingKey;
    Arguments arguments;
};

// Consumer registration options; an empty tag asks the broker to generate one
struct ConsumeOptions {
    std::string consumerTag;
    bool noLocal{false};
    bool noAck{false};
    bool exclusive{false};
    Arguments arguments;
};

// Message handed to a consumer callback
struct Delivery {
    std::string consumerTag;
    uint64_t deliveryTag{0};
    std::string exchange;
    std::string routingKey;
    bool redelivered{false};
    std::vector<uint8_t> body;
};

using ConsumerCallback = std::function<void(const Delivery& delivery)>;

// Per-channel recovery statistics
struct RecoveryStats {
    uint64_t reconnects{0};
    uint64_t failedReconnects{0};
    uint64_t operationsRejected{0};
    uint64_t exchangesRecovered{0};
    uint64_t queuesRecovered{0};
    std::chrono::system_clock::time_point lastReconnect;
};

// Exchange type string constants
namespace ExchangeTypeStrings {
    constexpr const char* DIRECT = "direct";
    constexpr const char* TOPIC = "topic";
    constexpr const char* FANOUT = "fanout";
    constexpr const char* HEADERS = "headers";
}

// Exception classes
class RabbitMQException : public std::exception {
public:
    explicit RabbitMQException(const std::string& message, ErrorType type = ErrorType::None);
    const char* what() const noexcept override;
    ErrorType getErrorType() const noexcept;

private:
    std::string message_;
    ErrorType errorType_;
};

class ConnectionException : public RabbitMQException {
public:
    explicit ConnectionException(const std::string& message);
};

class ChannelException : public RabbitMQException {
public:
    explicit ChannelException(const std::string& message);
};

class AuthenticationException : public RabbitMQException {
public:
    explicit AuthenticationException(const std::string& message);
};

class NetworkException : public RabbitMQException {
public:
    explicit NetworkException(const std::string& message);
};

class TimeoutException : public RabbitMQException {
public:
    explicit TimeoutException(const std::string& message);
};

// Raised into pending operations and stale closing signals when the
// connection underneath a channel is replaced
class ConnectionLostException : public RabbitMQException {
public:
    explicit ConnectionLostException(const std::string& message);
};

class UnsupportedOperationException : public RabbitMQException {
public:
    explicit UnsupportedOperationException(const std::string& message);
};

// Utility function declarations
std::string connectionStateToString(ConnectionState state);
std::string channelStateToString(ChannelState state);
std::string errorTypeToString(ErrorType type);
std::string amqpErrorToString(int amqpStatus);
ErrorType amqpErrorToErrorType(int amqpStatus);

// Builds the exception matching an error type, for futures that must carry it
std::exception_ptr makeException(ErrorType type, const std::string& message);

// Translates a rabbitmq-c RPC reply into a Result
Result<void> rpcReplyToResult(const amqp_rpc_reply_t& reply, const std::string& context);

} // namespace rabbitmq_recovery
