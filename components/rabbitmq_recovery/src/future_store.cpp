#include "rabbitmq_recovery/future_store.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace rabbitmq_recovery {

std::shared_ptr<FutureStore> FutureStore::createRoot() {
    return std::shared_ptr<FutureStore>(new FutureStore(nullptr));
}

FutureStore::FutureStore(std::shared_ptr<FutureStore> parent)
    : parent_(std::move(parent)) {
}

std::shared_ptr<FutureStore> FutureStore::getChild() {
    std::shared_ptr<FutureStore> child(new FutureStore(shared_from_this()));

    std::lock_guard<std::mutex> lock(mutex_);
    children_.erase(std::remove_if(children_.begin(), children_.end(),
                                   [](const std::weak_ptr<FutureStore>& c) { return c.expired(); }),
                    children_.end());
    children_.push_back(child);
    return child;
}

size_t FutureStore::rejectAll(std::exception_ptr error) {
    std::map<uint64_t, std::shared_ptr<PendingOperationBase>> operations;
    std::vector<std::shared_ptr<FutureStore>> children;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        operations.swap(operations_);
        for (const auto& weakChild : children_) {
            if (auto child = weakChild.lock()) {
                children.push_back(std::move(child));
            }
        }
    }

    size_t rejected = 0;
    for (auto& [id, operation] : operations) {
        if (operation->reject(error)) {
            ++rejected;
        }
    }

    for (auto& child : children) {
        rejected += child->rejectAll(error);
    }

    if (rejected > 0) {
        spdlog::debug("Rejected {} pending operations", rejected);
    }
    return rejected;
}

size_t FutureStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return operations_.size();
}

bool FutureStore::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return operations_.empty();
}

size_t FutureStore::getChildCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(children_.begin(), children_.end(),
                               [](const std::weak_ptr<FutureStore>& c) { return !c.expired(); }));
}

std::shared_ptr<FutureStore> FutureStore::getParent() const {
    return parent_;
}

void FutureStore::remove(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    operations_.erase(id);
}

} // namespace rabbitmq_recovery
