// components/rabbitmq_recovery/include/rabbitmq_recovery/connection.hpp
#pragma once

#include "types.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <amqp.h>

namespace rabbitmq_recovery {

// One AMQP connection to a broker. Replaced wholesale when it drops; the
// channels living on it are then moved to the replacement by RobustConnection.
class Connection {
public:
    explicit Connection(const ConnectionConfig& config);
    ~Connection();

    // Non-copyable, non-movable
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&&) = delete;
    Connection& operator=(Connection&&) = delete;

    // Connection management
    Result<void> open();
    void close();
    bool isOpen() const;
    ConnectionState getState() const;

    /**
     * @brief Shut the socket down without taking the connection mutex
     *
     * A thread blocked in rabbitmq-c on this connection returns with a
     * socket error. The connection is unusable afterwards and must be
     * replaced; close() still releases it.
     */
    void abort();

    // Connection properties
    const ConnectionConfig& getConfig() const;
    const std::string& getConnectionId() const;

    // Low-level access (use with caution); hold getMutex() while using it
    amqp_connection_state_t getNativeHandle() const;
    std::mutex& getMutex() const;

private:
    ConnectionConfig config_;
    std::string connectionId_;

    // AMQP connection state
    amqp_connection_state_t connection_ = nullptr;
    amqp_socket_t* socket_ = nullptr;
    std::atomic<int> sockfd_{-1};

    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};

    // rabbitmq-c is not thread-safe; every frame goes through this mutex
    mutable std::mutex mutex_;

    // Internal methods
    Result<void> setupSocket();
    Result<void> authenticate();
    void teardownConnection();
};

} // namespace rabbitmq_recovery
