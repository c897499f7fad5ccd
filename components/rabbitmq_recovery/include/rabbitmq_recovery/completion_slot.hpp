// components/rabbitmq_recovery/include/rabbitmq_recovery/completion_slot.hpp
#pragma once

#include <exception>
#include <future>
#include <memory>
#include <mutex>

namespace rabbitmq_recovery {

/**
 * @brief Single-slot completion signal
 *
 * Holds at most one live signal. replace() settles the current signal with
 * an error if it is still pending and installs a fresh one, so a waiter on
 * an older lifetime is always woken.
 */
class CompletionSlot {
public:
    CompletionSlot();

    CompletionSlot(const CompletionSlot&) = delete;
    CompletionSlot& operator=(const CompletionSlot&) = delete;

    // Future of the live signal
    std::shared_future<void> current() const;

    // Settle the live signal; false if it was already settled
    bool complete();
    bool fail(std::exception_ptr error);

    /**
     * @brief Reject the live signal if pending, then install a new one
     * @return true if a pending signal was rejected
     */
    bool replace(std::exception_ptr error);

    bool isDone() const;

private:
    struct Signal {
        std::promise<void> promise;
        std::shared_future<void> future;
        bool done{false};

        Signal() : future(promise.get_future().share()) {}
    };

    mutable std::mutex mutex_;
    std::shared_ptr<Signal> signal_;
};

} // namespace rabbitmq_recovery
