/** \file lru_cache.hpp
 *  \brief Thread-safe byte-bounded LRU cache, sharded for reduced contention
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace quiver::cache {

/**
 * \brief Snapshot of cache counters
 */
struct CacheStats {
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t evictions{0};
    std::uint64_t inserts{0};
    std::uint64_t updates{0};
    std::uint64_t bytes_used{0};

    [[nodiscard]] auto hit_rate() const -> double {
        const auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
    }
};

/**
 * \brief One LRU shard; every operation takes the shard mutex
 */
template<typename K, typename V, typename Hash = std::hash<K>>
class LruCacheShard {
public:
    struct Entry {
        K key;
        V value;
        std::size_t size_bytes;
    };

    using ListIterator = typename std::list<Entry>::iterator;

    explicit LruCacheShard(std::size_t max_bytes) : max_bytes_(max_bytes) {}

    LruCacheShard(const LruCacheShard&) = delete;
    LruCacheShard& operator=(const LruCacheShard&) = delete;

    [[nodiscard]] auto get(const K& key) -> std::optional<V> {
        std::lock_guard lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }
        auto list_it = it->second;
        if (list_it != lru_list_.begin()) {
            lru_list_.splice(lru_list_.begin(), lru_list_, list_it);
        }
        hits_.fetch_add(1, std::memory_order_relaxed);
        return list_it->value;
    }

    /**
     * \brief Insert or replace; entries larger than the shard budget are not cached
     */
    auto put(const K& key, V value, std::size_t size_bytes) -> void {
        std::lock_guard lock(mutex_);
        auto it = index_.find(key);
        const bool existed = it != index_.end();
        if (existed) evict_entry(it, false);
        if (size_bytes > max_bytes_) return;

        make_space(size_bytes);
        lru_list_.push_front(Entry{key, std::move(value), size_bytes});
        index_[key] = lru_list_.begin();
        bytes_used_ += size_bytes;
        (existed ? updates_ : inserts_).fetch_add(1, std::memory_order_relaxed);
    }

    auto remove(const K& key) -> bool {
        std::lock_guard lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) return false;
        evict_entry(it, false);
        return true;
    }

    auto clear() -> void {
        std::lock_guard lock(mutex_);
        lru_list_.clear();
        index_.clear();
        bytes_used_ = 0;
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return index_.size();
    }

    [[nodiscard]] auto bytes_used() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return bytes_used_;
    }

    auto accumulate(CacheStats& into) const -> void {
        into.hits += hits_.load(std::memory_order_relaxed);
        into.misses += misses_.load(std::memory_order_relaxed);
        into.evictions += evictions_.load(std::memory_order_relaxed);
        into.inserts += inserts_.load(std::memory_order_relaxed);
        into.updates += updates_.load(std::memory_order_relaxed);
        into.bytes_used += bytes_used();
    }

private:
    auto make_space(std::size_t required_bytes) -> void {
        while (bytes_used_ + required_bytes > max_bytes_ && !lru_list_.empty()) {
            evict_entry(index_.find(lru_list_.back().key), true);
        }
    }

    auto evict_entry(typename std::unordered_map<K, ListIterator, Hash>::iterator it, bool count)
        -> void {
        bytes_used_ -= it->second->size_bytes;
        lru_list_.erase(it->second);
        index_.erase(it);
        if (count) evictions_.fetch_add(1, std::memory_order_relaxed);
    }

    mutable std::mutex mutex_;
    std::list<Entry> lru_list_;
    std::unordered_map<K, ListIterator, Hash> index_;
    std::size_t max_bytes_;
    std::size_t bytes_used_{0};

    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> evictions_{0};
    std::atomic<std::uint64_t> inserts_{0};
    std::atomic<std::uint64_t> updates_{0};
};

/**
 * \brief Sharded LRU cache for high concurrency; the byte budget is split evenly across shards
 */
template<typename K, typename V, typename Hash = std::hash<K>>
class ShardedLruCache {
public:
    static constexpr std::size_t DEFAULT_NUM_SHARDS = 16;

    explicit ShardedLruCache(std::size_t max_bytes, std::size_t num_shards = DEFAULT_NUM_SHARDS)
        : num_shards_(num_shards == 0 ? 1 : num_shards) {
        const auto bytes_per_shard = max_bytes / num_shards_;
        shards_.reserve(num_shards_);
        for (std::size_t i = 0; i < num_shards_; ++i) {
            shards_.emplace_back(std::make_unique<LruCacheShard<K, V, Hash>>(bytes_per_shard));
        }
    }

    [[nodiscard]] auto get(const K& key) -> std::optional<V> { return shard(key).get(key); }

    auto put(const K& key, V value, std::size_t size_bytes) -> void {
        shard(key).put(key, std::move(value), size_bytes);
    }

    auto remove(const K& key) -> bool { return shard(key).remove(key); }

    auto clear() -> void {
        for (auto& s : shards_) s->clear();
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::size_t total = 0;
        for (const auto& s : shards_) total += s->size();
        return total;
    }

    [[nodiscard]] auto bytes_used() const -> std::size_t {
        std::size_t total = 0;
        for (const auto& s : shards_) total += s->bytes_used();
        return total;
    }

    [[nodiscard]] auto stats() const -> CacheStats {
        CacheStats total;
        for (const auto& s : shards_) s->accumulate(total);
        return total;
    }

private:
    auto shard(const K& key) -> LruCacheShard<K, V, Hash>& {
        return *shards_[hasher_(key) % num_shards_];
    }

    std::size_t num_shards_;
    std::vector<std::unique_ptr<LruCacheShard<K, V, Hash>>> shards_;
    Hash hasher_;
};

} // namespace quiver::cache
