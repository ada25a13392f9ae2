#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <list>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace freestyle::cache {

enum class CacheEvent {
    Add,
    Remove,
};

inline const char* cache_event_name(CacheEvent event) {
    switch (event) {
        case CacheEvent::Add:    return "add";
        case CacheEvent::Remove: return "remove";
    }
    return "unknown";
}

using ListenerId = uint64_t;

// Content-addressed store with reference counting. Items are keyed by
// cache_key(const T&), found by argument-dependent lookup, so equal content
// always lands in the same slot.
//
// The first add() of a key stores the item and emits CacheEvent::Add; later
// adds only bump the count and hand back the stored instance. The remove()
// that takes the count to zero erases the entry and emits
// CacheEvent::Remove. Listeners run synchronously, in the order they were
// added, and exceptions they throw reach the caller.
template <typename T>
class RefCountedCache {
public:
    using Listener = std::function<void(CacheEvent, const T&)>;

    RefCountedCache() = default;

    // Entries hold iterators into order_, so copies would alias the source.
    RefCountedCache(const RefCountedCache&) = delete;
    RefCountedCache& operator=(const RefCountedCache&) = delete;
    RefCountedCache(RefCountedCache&&) = default;
    RefCountedCache& operator=(RefCountedCache&&) = default;

    // Returns the canonical instance for `item`'s key. Callers must keep
    // working with the returned pointer, not the one they passed in.
    std::shared_ptr<T> add(std::shared_ptr<T> item);

    // Removing an item that is not present is a no-op.
    void remove(const T& item);

    size_t count(const T& item) const;
    bool has(const T& item) const { return count(item) > 0; }

    std::shared_ptr<T> find(std::string_view key) const;

    // Present entries in insertion order.
    std::vector<std::shared_ptr<T>> values() const;

    // Drops every entry by removing it as many times as it was added, so
    // each entry produces exactly one CacheEvent::Remove.
    void clear();

    size_t size() const { return entries_.size(); }
    bool is_empty() const { return entries_.empty(); }

    ListenerId add_change_listener(Listener listener);
    bool remove_change_listener(ListenerId id);

private:
    struct Entry {
        std::shared_ptr<T> item;
        size_t count = 0;
        std::list<std::string>::iterator order;
    };

    void emit_change(CacheEvent event, const T& item);

    std::unordered_map<std::string, Entry> entries_;
    std::list<std::string> order_;
    std::vector<std::pair<ListenerId, Listener>> listeners_;
    ListenerId next_listener_id_ = 0;
};

// Template implementation
template <typename T>
std::shared_ptr<T> RefCountedCache<T>::add(std::shared_ptr<T> item) {
    std::string key(cache_key(*item));

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        ++it->second.count;
        return it->second.item;
    }

    order_.push_back(key);
    Entry entry;
    entry.item = std::move(item);
    entry.count = 1;
    entry.order = std::prev(order_.end());
    auto stored = entry.item;
    entries_.emplace(std::move(key), std::move(entry));

    emit_change(CacheEvent::Add, *stored);
    return stored;
}

template <typename T>
void RefCountedCache<T>::remove(const T& item) {
    auto it = entries_.find(std::string(cache_key(item)));
    if (it == entries_.end()) return;

    if (--it->second.count > 0) return;

    // Keep the stored instance alive for listeners after the erase.
    auto stored = std::move(it->second.item);
    order_.erase(it->second.order);
    entries_.erase(it);

    emit_change(CacheEvent::Remove, *stored);
}

template <typename T>
size_t RefCountedCache<T>::count(const T& item) const {
    auto it = entries_.find(std::string(cache_key(item)));
    return it != entries_.end() ? it->second.count : 0;
}

template <typename T>
std::shared_ptr<T> RefCountedCache<T>::find(std::string_view key) const {
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) return nullptr;
    return it->second.item;
}

template <typename T>
std::vector<std::shared_ptr<T>> RefCountedCache<T>::values() const {
    std::vector<std::shared_ptr<T>> result;
    result.reserve(entries_.size());
    for (const auto& key : order_) {
        result.push_back(entries_.at(key).item);
    }
    return result;
}

template <typename T>
void RefCountedCache<T>::clear() {
    for (const auto& item : values()) {
        size_t remaining = count(*item);
        while (remaining-- > 0) {
            remove(*item);
        }
    }
}

template <typename T>
ListenerId RefCountedCache<T>::add_change_listener(Listener listener) {
    ListenerId id = ++next_listener_id_;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

template <typename T>
bool RefCountedCache<T>::remove_change_listener(ListenerId id) {
    for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
        if (it->first == id) {
            listeners_.erase(it);
            return true;
        }
    }
    return false;
}

template <typename T>
void RefCountedCache<T>::emit_change(CacheEvent event, const T& item) {
    // Index loop with a copy: a listener may add or remove listeners.
    for (size_t i = 0; i < listeners_.size(); ++i) {
        Listener listener = listeners_[i].second;
        listener(event, item);
    }
}

} // namespace freestyle::cache
