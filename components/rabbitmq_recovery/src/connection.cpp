#include "rabbitmq_recovery/connection.hpp"
#include <spdlog/spdlog.h>
#include <amqp_tcp_socket.h>
#include <cerrno>
#include <sys/socket.h>
#include <sys/time.h>

namespace rabbitmq_recovery {

Connection::Connection(const ConnectionConfig& config)
    : config_(config) {
    connectionId_ = "conn_" + std::to_string(reinterpret_cast<uintptr_t>(this));
    spdlog::debug("Creating Connection {} to {}:{}", connectionId_, config_.host, config_.port);
}

Connection::~Connection() {
    spdlog::debug("Destroying Connection {}", connectionId_);
    close();
}

Result<void> Connection::open() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == ConnectionState::Connected) {
        return Result<void>();
    }

    spdlog::info("Opening connection to {}:{}{}", config_.host, config_.port, config_.vhost);
    state_ = ConnectionState::Connecting;

    connection_ = amqp_new_connection();
    if (!connection_) {
        state_ = ConnectionState::Failed;
        return Result<void>(ErrorType::ResourceError, "Failed to create AMQP connection");
    }

    auto result = setupSocket();
    if (result) {
        result = authenticate();
    }

    if (!result) {
        spdlog::error("Connection to {}:{} failed: {}", config_.host, config_.port, result.message);
        sockfd_ = -1;
        int status = amqp_destroy_connection(connection_);
        if (status != AMQP_STATUS_OK) {
            spdlog::warn("Failed to destroy connection {}: {}", connectionId_, amqpErrorToString(status));
        }
        connection_ = nullptr;
        socket_ = nullptr;
        state_ = ConnectionState::Failed;
        return result;
    }

    state_ = ConnectionState::Connected;
    spdlog::info("Connection established to {}:{}", config_.host, config_.port);
    return Result<void>();
}

void Connection::close() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == ConnectionState::Disconnected) {
        return;
    }

    spdlog::info("Closing connection {} ({})", connectionId_, connectionStateToString(state_));
    state_ = ConnectionState::Disconnecting;
    teardownConnection();
    state_ = ConnectionState::Disconnected;
}

void Connection::abort() {
    int fd = sockfd_.exchange(-1);
    if (fd < 0) {
        return;
    }

    spdlog::warn("Aborting connection {}", connectionId_);
    state_ = ConnectionState::Failed;
    if (::shutdown(fd, SHUT_RDWR) != 0) {
        spdlog::warn("Socket shutdown of connection {} failed: errno {}", connectionId_, errno);
    }
}

bool Connection::isOpen() const {
    return state_ == ConnectionState::Connected;
}

ConnectionState Connection::getState() const {
    return state_;
}

const ConnectionConfig& Connection::getConfig() const {
    return config_;
}

const std::string& Connection::getConnectionId() const {
    return connectionId_;
}

amqp_connection_state_t Connection::getNativeHandle() const {
    return connection_;
}

std::mutex& Connection::getMutex() const {
    return mutex_;
}

Result<void> Connection::setupSocket() {
    socket_ = amqp_tcp_socket_new(connection_);
    if (!socket_) {
        return Result<void>(ErrorType::ResourceError, "Failed to create TCP socket");
    }

    auto timeoutMs = config_.connectionTimeout.count();
    struct timeval timeout;
    timeout.tv_sec = static_cast<time_t>(timeoutMs / 1000);
    timeout.tv_usec = static_cast<suseconds_t>((timeoutMs % 1000) * 1000);

    int status = amqp_socket_open_noblock(socket_, config_.host.c_str(), config_.port, &timeout);
    if (status != AMQP_STATUS_OK) {
        return Result<void>(amqpErrorToErrorType(status), "Failed to open socket: " + amqpErrorToString(status));
    }

    sockfd_ = amqp_socket_get_sockfd(socket_);
    return Result<void>();
}

Result<void> Connection::authenticate() {
    amqp_rpc_reply_t reply = amqp_login(connection_,
                                        config_.vhost.c_str(),
                                        config_.channelMax,
                                        static_cast<int>(config_.frameMax),
                                        static_cast<int>(config_.heartbeat.count()),
                                        AMQP_SASL_METHOD_PLAIN,
                                        config_.username.c_str(),
                                        config_.password.c_str());

    auto result = rpcReplyToResult(reply, "Authentication");
    if (!result && result.error == ErrorType::ConnectionError) {
        // The broker answers bad credentials with connection.close
        return Result<void>(ErrorType::AuthenticationError, result.message);
    }
    return result;
}

void Connection::teardownConnection() {
    // Retired before the socket is closed so abort() never hits a reused fd
    sockfd_ = -1;

    if (connection_) {
        amqp_rpc_reply_t reply = amqp_connection_close(connection_, AMQP_REPLY_SUCCESS);
        auto result = rpcReplyToResult(reply, "Connection close");
        if (!result) {
            spdlog::warn("Connection {} did not close cleanly: {}", connectionId_, result.message);
        }

        int status = amqp_destroy_connection(connection_);
        if (status != AMQP_STATUS_OK) {
            spdlog::warn("Failed to destroy connection {}: {}", connectionId_, amqpErrorToString(status));
        }
        connection_ = nullptr;
    }

    socket_ = nullptr; // Socket is owned by connection
}

} // namespace rabbitmq_recovery
