#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace selforg {

/**
 * @brief Point-in-time view of a MetricsRecorder.
 */
struct PerformanceReport {
    uint64_t total_searches = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    // hits * 100 / total_searches, 0 when nothing was searched.
    double hit_rate = 0.0;
    // Mean steps per hit. Misses are excluded.
    double avg_access_cost = 0.0;
    double avg_search_time_ms = 0.0;
    // Searches per second since creation or the last reset.
    double operations_per_second = 0.0;
    uint64_t insertions = 0;
    uint64_t evictions = 0;
    uint64_t strategy_changes = 0;
    std::unordered_map<std::string, uint64_t> operation_counts;
    uint64_t uptime_ms = 0;

    std::string ToString() const;
};

/**
 * @brief Thread-safe accumulator for list events.
 *
 * Each event is recorded under the recorder's own mutex, independent of the
 * list lock, so reports can be taken while the list is busy. A report is
 * consistent with itself but may fall between two events of one list call.
 *
 * Besides the counters, the recorder keeps the labels of the most recent
 * events (bounded FIFO) and a cumulative per-label count that is only cleared
 * by Reset().
 */
class MetricsRecorder {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr size_t kDefaultRecentLimit = 100;

    explicit MetricsRecorder(size_t recent_limit = kDefaultRecentLimit);

    MetricsRecorder(const MetricsRecorder&) = delete;
    MetricsRecorder& operator=(const MetricsRecorder&) = delete;

    void RecordHit(uint64_t access_cost);
    void RecordMiss();
    void RecordInsertion();
    void RecordEviction();

    // Counts `count` offered keys as insertions, whatever was actually added.
    void RecordBulkLoad(uint64_t count);

    void RecordStrategyChange(const std::string& strategy_name);
    void RecordSearchTime(std::chrono::nanoseconds elapsed);

    // Zeroes every counter, empties the log and table, restarts the uptime clock.
    void Reset();

    PerformanceReport GenerateReport() const;

    double HitRate() const;

    // Searches + insertions + evictions + strategy changes.
    uint64_t TotalOperations() const;

    /**
     * @brief Returns up to `count` of the newest labels, oldest first.
     */
    std::vector<std::string> RecentOperations(size_t count) const;

    size_t RecentLimit() const { return recent_limit_; }

private:
    // Caller holds mu_.
    void RecordOperation(std::string label);
    double HitRateLocked() const;

    const size_t recent_limit_;

    mutable std::mutex mu_;
    uint64_t total_searches_ = 0;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t total_access_cost_ = 0;
    uint64_t total_search_time_ns_ = 0;
    uint64_t insertions_ = 0;
    uint64_t evictions_ = 0;
    uint64_t strategy_changes_ = 0;
    std::deque<std::string> recent_operations_;
    std::unordered_map<std::string, uint64_t> operation_counts_;
    Clock::time_point start_time_;
};

} // namespace selforg
