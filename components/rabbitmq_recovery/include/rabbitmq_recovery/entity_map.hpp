// components/rabbitmq_recovery/include/rabbitmq_recovery/entity_map.hpp
#pragma once

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace rabbitmq_recovery {

// Name -> entity map iterating in first-declaration order. Re-inserting a
// name replaces the entity but keeps its position. Not synchronized.
template<typename T>
class EntityMap {
public:
    void insert(const std::string& name, std::shared_ptr<T> entity) {
        auto it = findEntry(name);
        if (it != entries_.end()) {
            it->second = std::move(entity);
        } else {
            entries_.emplace_back(name, std::move(entity));
        }
    }

    bool erase(const std::string& name) {
        auto it = findEntry(name);
        if (it == entries_.end()) {
            return false;
        }
        entries_.erase(it);
        return true;
    }

    // Moves the entry under a new name in place; an entry already holding
    // newName is dropped
    bool rename(const std::string& oldName, const std::string& newName) {
        if (oldName == newName) {
            return contains(oldName);
        }
        if (findEntry(oldName) == entries_.end()) {
            return false;
        }
        erase(newName);
        findEntry(oldName)->first = newName;
        return true;
    }

    std::shared_ptr<T> find(const std::string& name) const {
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&name](const Entry& entry) { return entry.first == name; });
        return it != entries_.end() ? it->second : nullptr;
    }

    bool contains(const std::string& name) const {
        return find(name) != nullptr;
    }

    std::vector<std::string> names() const {
        std::vector<std::string> result;
        result.reserve(entries_.size());
        for (const auto& entry : entries_) {
            result.push_back(entry.first);
        }
        return result;
    }

    std::vector<std::shared_ptr<T>> values() const {
        std::vector<std::shared_ptr<T>> result;
        result.reserve(entries_.size());
        for (const auto& entry : entries_) {
            result.push_back(entry.second);
        }
        return result;
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear() { entries_.clear(); }

private:
    using Entry = std::pair<std::string, std::shared_ptr<T>>;

    typename std::vector<Entry>::iterator findEntry(const std::string& name) {
        return std::find_if(entries_.begin(), entries_.end(),
                            [&name](const Entry& entry) { return entry.first == name; });
    }

    std::vector<Entry> entries_;
};

} // namespace rabbitmq_recovery
