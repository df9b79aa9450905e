#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include "errors.hpp"
#include "logger.hpp"
#include "metrics.hpp"
#include "node_chain.hpp"
#include "options.hpp"
#include "search_result.hpp"
#include "strategy.hpp"

namespace selforg {

/**
 * @brief Bounded, thread-safe list that reorders itself after every hit.
 *
 * New keys enter at the head. A successful Search() hands the matched node to
 * the active strategy, which moves it toward the head by its own rule. When
 * the list is full, Insert() first evicts the node with the oldest access
 * time, scanning the whole chain.
 *
 * A key→handle index answers presence checks in O(1) and locates nodes for
 * eviction; it never owns nodes and always holds exactly the keys reachable
 * from the head.
 *
 * All mutating calls, Search() included, take one exclusive lock for the
 * whole traversal; snapshots take it shared. Lock hold time therefore grows
 * with the chain length. Metrics are recorded under the recorder's own lock.
 *
 * @tparam Key Key type: equality comparable, hashable, default constructible.
 *             ToString()/ToDetailedString() also need operator<<.
 * @tparam Hash Hash functor for the index
 */
template <typename Key, typename Hash = std::hash<Key>>
class SelfOrganizingList {
public:
    using Chain = NodeChain<Key>;
    using Handle = typename Chain::Handle;
    using Result = SearchResult<Key>;

    SelfOrganizingList(int64_t capacity, StrategyKind strategy)
        : SelfOrganizingList(MakeOptions(capacity, strategy)) {}

    explicit SelfOrganizingList(const ListOptions& options)
        : capacity_(static_cast<size_t>(Checked(options).capacity)),
          strategy_(options.strategy),
          metrics_(options.recent_operations_limit) {
        index_.reserve(std::min<size_t>(capacity_, kMaxReserve));
        SELFORG_LOG_INFO("created list: capacity=%zu strategy=%s",
                         capacity_, StrategyName(strategy_));
    }

    SelfOrganizingList(const SelfOrganizingList&) = delete;
    SelfOrganizingList& operator=(const SelfOrganizingList&) = delete;
    SelfOrganizingList(SelfOrganizingList&&) = delete;
    SelfOrganizingList& operator=(SelfOrganizingList&&) = delete;

    /**
     * @brief Adds `key` at the head, evicting the least recently accessed
     * node first when the list is full.
     *
     * @return false if the key is already present; nothing changes then.
     */
    bool Insert(const Key& key) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return InsertLocked(key);
    }

    /**
     * @brief Looks `key` up from the head and lets the strategy reorganize
     * on a hit.
     *
     * The head probe is step 1. When the head does not match, the walk
     * restarts at the head and counts every node it visits, so a match at
     * position p > 1 costs p + 1 and a miss on n nodes costs n + 1. An empty
     * list costs 0.
     */
    Result Search(const Key& key) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        const auto start = std::chrono::steady_clock::now();

        if (chain_.IsEmpty()) {
            metrics_.RecordMiss();
            return Finish(std::nullopt, 0, start, "Empty list");
        }

        size_t cost = 1;
        const Handle head = chain_.Head();
        if (chain_.At(head).key == key) {
            return Hit(Chain::kNil, head, cost, start);
        }

        Handle prev = Chain::kNil;
        for (Handle current = head; current != Chain::kNil; current = chain_.Next(current)) {
            ++cost;
            if (chain_.At(current).key == key) {
                return Hit(prev, current, cost, start);
            }
            prev = current;
        }

        metrics_.RecordMiss();
        return Finish(std::nullopt, cost, start, "Element not found");
    }

    /**
     * @brief Inserts every key in order under one exclusive section.
     *
     * Duplicates are skipped and evictions may happen part way through. The
     * bulk-load event counts all offered keys, not only the ones added.
     */
    void LoadAll(const std::vector<Key>& keys) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        size_t added = 0;
        for (const auto& key : keys) {
            if (InsertLocked(key)) {
                ++added;
            }
        }
        metrics_.RecordBulkLoad(keys.size());
        SELFORG_LOG_DEBUG("bulk load: offered=%zu added=%zu size=%zu",
                          keys.size(), added, size_);
    }

    /**
     * @brief Switches the strategy used by subsequent searches.
     *
     * The current order is kept as is.
     */
    void SetStrategy(StrategyKind strategy) {
        if (strategy == StrategyKind::kUnset) {
            SELFORG_LOG_WARNING("rejected strategy change to unset strategy");
            throw InvalidConfiguration("strategy cannot be unset");
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        const StrategyKind previous = strategy_;
        strategy_ = strategy;
        metrics_.RecordStrategyChange(StrategyName(strategy));
        SELFORG_LOG_INFO("strategy changed: %s -> %s",
                         StrategyName(previous), StrategyName(strategy));
    }

    // Drops every key and resets the metrics.
    void Clear() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        const size_t dropped = size_;
        chain_.Clear();
        index_.clear();
        size_ = 0;
        clock_ = 0;
        metrics_.Reset();
        SELFORG_LOG_INFO("cleared list: dropped=%zu", dropped);
    }

    size_t Size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return size_;
    }

    size_t Capacity() const { return capacity_; }

    bool IsEmpty() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return size_ == 0;
    }

    StrategyKind CurrentStrategy() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return strategy_;
    }

    std::string CurrentStrategyName() const {
        return StrategyName(CurrentStrategy());
    }

    // Presence check through the index. Does not count as an access.
    bool Contains(const Key& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return index_.count(key) > 0;
    }

    // Number of keys in the index; equals Size() whenever no call is in flight.
    size_t IndexedKeyCount() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return index_.size();
    }

    // Keys from head to tail.
    std::vector<Key> ToVector() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<Key> keys;
        keys.reserve(size_);
        chain_.ForEach([&keys](Handle, const typename Chain::Node& node) {
            keys.push_back(node.key);
        });
        return keys;
    }

    // "[3 → 2 → 1]"
    std::string ToString() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::ostringstream oss;
        oss << "[";
        bool first = true;
        chain_.ForEach([&](Handle, const typename Chain::Node& node) {
            if (!first) oss << " → ";
            oss << node.key;
            first = false;
        });
        oss << "]";
        return oss.str();
    }

    /**
     * @brief Chain order with per-node access counts and age, plus the
     * current hit rate.
     */
    std::string ToDetailedString() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        const auto now = std::chrono::steady_clock::now();

        std::ostringstream oss;
        oss << "SelfOrganizingList {\n";
        oss << "  Strategy: " << StrategyName(strategy_) << "\n";
        oss << "  Size: " << size_ << "/" << capacity_ << "\n";
        oss << "  Elements: \n";

        size_t position = 0;
        chain_.ForEach([&](Handle, const typename Chain::Node& node) {
            auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(
                now - node.last_accessed_at);
            oss << "    [" << position++ << "] " << node.key
                << " (accesses: " << node.access_count
                << ", last: " << idle.count() << "ms)\n";
        });

        char rate[32];
        std::snprintf(rate, sizeof(rate), "%.2f", metrics_.HitRate());
        oss << "  Performance: " << rate << "% hit rate\n";
        oss << "}";
        return oss.str();
    }

    // Taken without the list lock; see MetricsRecorder.
    PerformanceReport GetPerformanceReport() const {
        return metrics_.GenerateReport();
    }

    std::vector<std::string> RecentOperations(size_t count) const {
        return metrics_.RecentOperations(count);
    }

private:
    // Upper bound on the index buckets reserved up front.
    static constexpr size_t kMaxReserve = 4096;

    static ListOptions MakeOptions(int64_t capacity, StrategyKind strategy) {
        ListOptions options;
        options.capacity = capacity;
        options.strategy = strategy;
        return options;
    }

    static const ListOptions& Checked(const ListOptions& options) {
        try {
            options.Validate();
        } catch (const InvalidConfiguration& e) {
            SELFORG_LOG_WARNING("refusing to create list: %s", e.what());
            throw;
        }
        return options;
    }

    // Caller holds mutex_ exclusively.
    bool InsertLocked(const Key& key) {
        if (index_.count(key) > 0) {
            return false;
        }
        if (size_ >= capacity_) {
            EvictLeastRecentlyUsed();
        }

        // The node is linked only once the index holds it.
        const Handle handle = chain_.Allocate(key, ++clock_);
        try {
            index_.emplace(key, handle);
        } catch (...) {
            chain_.Release(handle);
            throw;
        }
        chain_.PushFront(handle);
        ++size_;
        metrics_.RecordInsertion();
        return true;
    }

    // Caller holds mutex_ exclusively. The head is the first candidate and a
    // later node replaces it only with a strictly older tick, so the earliest
    // node in chain order wins ties.
    void EvictLeastRecentlyUsed() {
        const Handle head = chain_.Head();
        if (head == Chain::kNil) {
            return;
        }

        Handle victim = head;
        Handle victim_prev = Chain::kNil;
        uint64_t oldest = chain_.At(head).last_access_tick;

        Handle prev = head;
        for (Handle current = chain_.Next(head); current != Chain::kNil;
             prev = current, current = chain_.Next(current)) {
            if (chain_.At(current).last_access_tick < oldest) {
                oldest = chain_.At(current).last_access_tick;
                victim = current;
                victim_prev = prev;
            }
        }

        if (victim_prev == Chain::kNil) {
            chain_.SetHead(chain_.Next(victim));
        } else {
            chain_.SetNext(victim_prev, chain_.Next(victim));
        }

        const auto& node = chain_.At(victim);
        SELFORG_LOG_DEBUG("evicting node: accesses=%llu tick=%llu size=%zu",
                          static_cast<unsigned long long>(node.access_count),
                          static_cast<unsigned long long>(node.last_access_tick), size_);
        index_.erase(node.key);
        chain_.Release(victim);
        --size_;
        metrics_.RecordEviction();
    }

    // Caller holds mutex_ exclusively.
    Result Hit(Handle prev, Handle match, size_t cost,
               std::chrono::steady_clock::time_point start) {
        auto& node = chain_.At(match);
        ++node.access_count;
        node.last_access_tick = ++clock_;
        node.last_accessed_at = std::chrono::steady_clock::now();
        Key found = node.key;

        std::string operation = Reorganize(strategy_, chain_, prev, match);
        metrics_.RecordHit(cost);
        return Finish(std::move(found), cost, start, std::move(operation));
    }

    Result Finish(std::optional<Key> key, size_t cost,
                  std::chrono::steady_clock::time_point start, std::string operation) {
        auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - start);
        metrics_.RecordSearchTime(elapsed);
        return Result(std::move(key), cost, elapsed, std::move(operation));
    }

    const size_t capacity_;
    StrategyKind strategy_;

    Chain chain_;
    std::unordered_map<Key, Handle, Hash> index_;
    size_t size_ = 0;
    // Logical access clock; every insertion and hit takes the next tick.
    uint64_t clock_ = 0;

    MetricsRecorder metrics_;
    mutable std::shared_mutex mutex_;
};

} // namespace selforg
