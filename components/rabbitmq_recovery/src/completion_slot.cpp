#include "rabbitmq_recovery/completion_slot.hpp"

namespace rabbitmq_recovery {

CompletionSlot::CompletionSlot()
    : signal_(std::make_shared<Signal>()) {
}

std::shared_future<void> CompletionSlot::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return signal_->future;
}

bool CompletionSlot::complete() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (signal_->done) {
        return false;
    }
    signal_->done = true;
    signal_->promise.set_value();
    return true;
}

bool CompletionSlot::fail(std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (signal_->done) {
        return false;
    }
    signal_->done = true;
    signal_->promise.set_exception(error);
    return true;
}

bool CompletionSlot::replace(std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(mutex_);

    bool rejected = false;
    if (!signal_->done) {
        signal_->done = true;
        signal_->promise.set_exception(error);
        rejected = true;
    }

    signal_ = std::make_shared<Signal>();
    return rejected;
}

bool CompletionSlot::isDone() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return signal_->done;
}

} // namespace rabbitmq_recovery
