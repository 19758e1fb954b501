#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace mcplex::proxy {

/*
 * Keyed ownership table for live connections. The component that opens a connection
 * inserts it and removes it on the same path that closes it.
 */
template <typename Key, typename Value> class ConnectionTable {
public:
    // False when the key is already present; the existing entry is kept.
    bool insert(const Key& key, Value value) {
        std::lock_guard<std::mutex> lk(mu_);
        return entries_.emplace(key, std::move(value)).second;
    }

    std::optional<Value> remove(const Key& key) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = entries_.find(key);
        if (it == entries_.end())
            return std::nullopt;
        Value v = std::move(it->second);
        entries_.erase(it);
        return v;
    }

    std::optional<Value> find(const Key& key) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = entries_.find(key);
        if (it == entries_.end())
            return std::nullopt;
        return it->second;
    }

    bool contains(const Key& key) const {
        std::lock_guard<std::mutex> lk(mu_);
        return entries_.count(key) > 0;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return entries_.size();
    }

    std::vector<Key> keys() const {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<Key> out;
        out.reserve(entries_.size());
        for (const auto& [k, v] : entries_)
            out.push_back(k);
        return out;
    }

    // Empties the table and hands the entries to the caller for closing.
    std::map<Key, Value> drain() {
        std::lock_guard<std::mutex> lk(mu_);
        std::map<Key, Value> out;
        out.swap(entries_);
        return out;
    }

private:
    mutable std::mutex mu_;
    std::map<Key, Value> entries_;
};

} // namespace mcplex::proxy
