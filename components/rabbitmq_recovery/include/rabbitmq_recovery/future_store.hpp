// components/rabbitmq_recovery/include/rabbitmq_recovery/future_store.hpp
#pragma once

#include "types.hpp"
#include <atomic>
#include <cstdint>
#include <exception>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>
#include <vector>

namespace rabbitmq_recovery {

class FutureStore;

/**
 * @brief Type-erased view of an in-flight broker request
 */
class PendingOperationBase {
public:
    virtual ~PendingOperationBase() = default;

    /**
     * @brief Fail the operation
     * @return false if the operation was already settled
     */
    virtual bool reject(std::exception_ptr error) = 0;

    virtual bool isDone() const = 0;
};

/**
 * @brief An in-flight broker request registered in a FutureStore
 *
 * The first resolve() or reject() settles the operation; every later call is
 * a no-op that returns false. Settling removes the operation from its store.
 */
template<typename T>
class PendingOperation : public PendingOperationBase {
public:
    PendingOperation(uint64_t id, std::weak_ptr<FutureStore> store)
        : id_(id), store_(std::move(store)), future_(promise_.get_future().share()) {}

    PendingOperation(const PendingOperation&) = delete;
    PendingOperation& operator=(const PendingOperation&) = delete;

    template<typename... Args>
    bool resolve(Args&&... args) {
        if (!claim()) {
            return false;
        }
        promise_.set_value(std::forward<Args>(args)...);
        detach();
        return true;
    }

    bool reject(std::exception_ptr error) override {
        if (!claim()) {
            return false;
        }
        promise_.set_exception(error);
        detach();
        return true;
    }

    bool isDone() const override {
        return done_.load();
    }

    uint64_t getId() const {
        return id_;
    }

    std::shared_future<T> getFuture() const {
        return future_;
    }

private:
    bool claim() {
        bool expected = false;
        return done_.compare_exchange_strong(expected, true);
    }

    void detach();

    uint64_t id_;
    std::weak_ptr<FutureStore> store_;
    std::promise<T> promise_;
    std::shared_future<T> future_;
    std::atomic<bool> done_{false};
};

/**
 * @brief Registry of pending operations, scoped as a tree
 *
 * A connection owns the root store and every channel takes a child of it.
 * rejectAll() on a node fails the operations of that node and of its
 * descendants only, never those of its siblings.
 */
class FutureStore : public std::enable_shared_from_this<FutureStore> {
public:
    static std::shared_ptr<FutureStore> createRoot();

    FutureStore(const FutureStore&) = delete;
    FutureStore& operator=(const FutureStore&) = delete;

    // Creates a child store reached by this store's rejectAll()
    std::shared_ptr<FutureStore> getChild();

    // Registers a new pending operation
    template<typename T>
    std::shared_ptr<PendingOperation<T>> create() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto operation = std::make_shared<PendingOperation<T>>(nextId_++, weak_from_this());
        operations_.emplace(operation->getId(), operation);
        return operation;
    }

    /**
     * @brief Fail every unsettled operation of this store and its descendants
     * @param error Exception delivered to every waiter
     * @return Number of operations this call settled
     */
    size_t rejectAll(std::exception_ptr error);

    // Operations tracked by this store alone
    size_t size() const;
    bool empty() const;

    // Live child stores
    size_t getChildCount() const;

    std::shared_ptr<FutureStore> getParent() const;

private:
    explicit FutureStore(std::shared_ptr<FutureStore> parent);

    void remove(uint64_t id);

    template<typename T>
    friend class PendingOperation;

    mutable std::mutex mutex_;
    std::shared_ptr<FutureStore> parent_;
    std::vector<std::weak_ptr<FutureStore>> children_;
    std::map<uint64_t, std::shared_ptr<PendingOperationBase>> operations_;
    uint64_t nextId_{1};
};

template<typename T>
void PendingOperation<T>::detach() {
    if (auto store = store_.lock()) {
        store->remove(id_);
    }
}

/**
 * @brief Block until a pending operation settles and convert it into a Result
 *
 * A rejection carrying a RabbitMQException keeps its error type, so an
 * operation failed by a reconnect reports ErrorType::ConnectionLost.
 */
template<typename T>
Result<T> awaitOperation(const PendingOperation<T>& operation, Timeout timeout,
                         const std::string& context) {
    auto future = operation.getFuture();

    if (timeout && future.wait_for(*timeout) != std::future_status::ready) {
        return Result<T>(ErrorType::TimeoutError,
                         context + ": no reply within " + std::to_string(timeout->count()) + "ms");
    }

    try {
        if constexpr (std::is_void_v<T>) {
            future.get();
            return Result<T>();
        } else {
            return Result<T>(future.get());
        }
    } catch (const RabbitMQException& e) {
        return Result<T>(e.getErrorType(), e.what());
    } catch (const std::exception& e) {
        return Result<T>(ErrorType::ProtocolError, context + ": " + e.what());
    }
}

} // namespace rabbitmq_recovery
