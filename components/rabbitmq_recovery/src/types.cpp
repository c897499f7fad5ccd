// src/types.cpp
#include "rabbitmq_recovery/types.hpp"
#include <amqp_framing.h>

namespace rabbitmq_recovery {

std::string connectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Connected: return "Connected";
        case ConnectionState::Disconnecting: return "Disconnecting";
        case ConnectionState::Failed: return "Failed";
        default: return "Unknown";
    }
}

std::string channelStateToString(ChannelState state) {
    switch (state) {
        case ChannelState::Closed: return "Closed";
        case ChannelState::Opening: return "Opening";
        case ChannelState::Open: return "Open";
        case ChannelState::Closing: return "Closing";
        case ChannelState::Failed: return "Failed";
        default: return "Unknown";
    }
}

std::string errorTypeToString(ErrorType error) {
    switch (error) {
        case ErrorType::None: return "None";
        case ErrorType::ConnectionError: return "ConnectionError";
        case ErrorType::ChannelError: return "ChannelError";
        case ErrorType::AuthenticationError: return "AuthenticationError";
        case ErrorType::NetworkError: return "NetworkError";
        case ErrorType::ProtocolError: return "ProtocolError";
        case ErrorType::TimeoutError: return "TimeoutError";
        case ErrorType::ResourceError: return "ResourceError";
        case ErrorType::ConnectionLost: return "ConnectionLost";
        case ErrorType::UnsupportedOperation: return "UnsupportedOperation";
        default: return "Unknown";
    }
}

std::string amqpErrorToString(int error) {
    switch (error) {
        case AMQP_STATUS_OK: return "OK";
        case AMQP_STATUS_NO_MEMORY: return "No memory";
        case AMQP_STATUS_BAD_AMQP_DATA: return "Bad AMQP data";
        case AMQP_STATUS_UNKNOWN_CLASS: return "Unknown class";
        case AMQP_STATUS_UNKNOWN_METHOD: return "Unknown method";
        case AMQP_STATUS_HOSTNAME_RESOLUTION_FAILED: return "Hostname resolution failed";
        case AMQP_STATUS_INCOMPATIBLE_AMQP_VERSION: return "Incompatible AMQP version";
        case AMQP_STATUS_CONNECTION_CLOSED: return "Connection closed";
        case AMQP_STATUS_BAD_URL: return "Bad URL";
        case AMQP_STATUS_SOCKET_ERROR: return "Socket error";
        case AMQP_STATUS_INVALID_PARAMETER: return "Invalid parameter";
        case AMQP_STATUS_TABLE_TOO_BIG: return "Table too big";
        case AMQP_STATUS_WRONG_METHOD: return "Wrong method";
        case AMQP_STATUS_TIMEOUT: return "Timeout";
        case AMQP_STATUS_TIMER_FAILURE: return "Timer failure";
        case AMQP_STATUS_HEARTBEAT_TIMEOUT: return "Heartbeat timeout";
        case AMQP_STATUS_UNEXPECTED_STATE: return "Unexpected state";
        case AMQP_STATUS_SOCKET_CLOSED: return "Socket closed";
        case AMQP_STATUS_SOCKET_INUSE: return "Socket in use";
        case AMQP_STATUS_BROKER_UNSUPPORTED_SASL_METHOD: return "Broker unsupported SASL method";
        case AMQP_STATUS_UNSUPPORTED: return "Unsupported";
        default:
            return "Unknown error (" + std::to_string(error) + ")";
    }
}

ErrorType amqpErrorToErrorType(int error) {
    switch (error) {
        case AMQP_STATUS_OK:
            return ErrorType::None;
        case AMQP_STATUS_NO_MEMORY:
        case AMQP_STATUS_TABLE_TOO_BIG:
            return ErrorType::ResourceError;
        case AMQP_STATUS_BAD_AMQP_DATA:
        case AMQP_STATUS_UNKNOWN_CLASS:
        case AMQP_STATUS_UNKNOWN_METHOD:
        case AMQP_STATUS_INCOMPATIBLE_AMQP_VERSION:
        case AMQP_STATUS_WRONG_METHOD:
        case AMQP_STATUS_UNEXPECTED_STATE:
            return ErrorType::ProtocolError;
        case AMQP_STATUS_HOSTNAME_RESOLUTION_FAILED:
        case AMQP_STATUS_SOCKET_ERROR:
        case AMQP_STATUS_SOCKET_CLOSED:
        case AMQP_STATUS_SOCKET_INUSE:
            return ErrorType::NetworkError;
        case AMQP_STATUS_CONNECTION_CLOSED:
            return ErrorType::ConnectionError;
        case AMQP_STATUS_TIMEOUT:
        case AMQP_STATUS_HEARTBEAT_TIMEOUT:
        case AMQP_STATUS_TIMER_FAILURE:
            return ErrorType::TimeoutError;
        case AMQP_STATUS_BROKER_UNSUPPORTED_SASL_METHOD:
            return ErrorType::AuthenticationError;
        case AMQP_STATUS_BAD_URL:
        case AMQP_STATUS_INVALID_PARAMETER:
        case AMQP_STATUS_UNSUPPORTED:
        default:
            return ErrorType::ProtocolError;
    }
}

std::exception_ptr makeException(ErrorType type, const std::string& message) {
    switch (type) {
        case ErrorType::ConnectionError:
            return std::make_exception_ptr(ConnectionException(message));
        case ErrorType::ChannelError:
            return std::make_exception_ptr(ChannelException(message));
        case ErrorType::AuthenticationError:
            return std::make_exception_ptr(AuthenticationException(message));
        case ErrorType::NetworkError:
            return std::make_exception_ptr(NetworkException(message));
        case ErrorType::TimeoutError:
            return std::make_exception_ptr(TimeoutException(message));
        case ErrorType::ConnectionLost:
            return std::make_exception_ptr(ConnectionLostException(message));
        case ErrorType::UnsupportedOperation:
            return std::make_exception_ptr(UnsupportedOperationException(message));
        default:
            return std::make_exception_ptr(RabbitMQException(message, type));
    }
}

Result<void> rpcReplyToResult(const amqp_rpc_reply_t& reply, const std::string& context) {
    switch (reply.reply_type) {
        case AMQP_RESPONSE_NORMAL:
            return Result<void>();

        case AMQP_RESPONSE_NONE:
            return Result<void>(ErrorType::ProtocolError, context + ": missing RPC reply");

        case AMQP_RESPONSE_LIBRARY_EXCEPTION:
            return Result<void>(amqpErrorToErrorType(reply.library_error),
                                context + ": " + amqpErrorToString(reply.library_error));

        case AMQP_RESPONSE_SERVER_EXCEPTION:
            if (reply.reply.id == AMQP_CHANNEL_CLOSE_METHOD && reply.reply.decoded) {
                const auto* close = static_cast<const amqp_channel_close_t*>(reply.reply.decoded);
                return Result<void>(ErrorType::ChannelError,
                    context + ": channel closed by broker (" + std::to_string(close->reply_code) + " " +
                    std::string(static_cast<const char*>(close->reply_text.bytes), close->reply_text.len) + ")");
            }
            if (reply.reply.id == AMQP_CONNECTION_CLOSE_METHOD && reply.reply.decoded) {
                const auto* close = static_cast<const amqp_connection_close_t*>(reply.reply.decoded);
                return Result<void>(ErrorType::ConnectionError,
                    context + ": connection closed by broker (" + std::to_string(close->reply_code) + " " +
                    std::string(static_cast<const char*>(close->reply_text.bytes), close->reply_text.len) + ")");
            }
            return Result<void>(ErrorType::ProtocolError,
                                context + ": unexpected server method " + std::to_string(reply.reply.id));
    }

    return Result<void>(ErrorType::ProtocolError, context + ": unknown reply type");
}

// Exception implementations
RabbitMQException::RabbitMQException(const std::string& message, ErrorType type)
    : message_(message), errorType_(type) {
}

const char* RabbitMQException::what() const noexcept {
    return message_.c_str();
}

ErrorType RabbitMQException::getErrorType() const noexcept {
    return errorType_;
}

ConnectionException::ConnectionException(const std::string& message)
    : RabbitMQException(message, ErrorType::ConnectionError) {
}

ChannelException::ChannelException(const std::string& message)
    : RabbitMQException(message, ErrorType::ChannelError) {
}

AuthenticationException::AuthenticationException(const std::string& message)
    : RabbitMQException(message, ErrorType::AuthenticationError) {
}

NetworkException::NetworkException(const std::string& message)
    : RabbitMQException(message, ErrorType::NetworkError) {
}

TimeoutException::TimeoutException(const std::string& message)
    : RabbitMQException(message, ErrorType::TimeoutError) {
}

ConnectionLostException::ConnectionLostException(const std::string& message)
    : RabbitMQException(message, ErrorType::ConnectionLost) {
}

UnsupportedOperationException::UnsupportedOperationException(const std::string& message)
    : RabbitMQException(message, ErrorType::UnsupportedOperation) {
}

} // namespace rabbitmq_recovery
