#include "../include/metrics.hpp"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace selforg {

namespace {

constexpr char kHit[] = "HIT";
constexpr char kMiss[] = "MISS";
constexpr char kInsert[] = "INSERT";
constexpr char kEvict[] = "EVICT";
constexpr char kBulkLoad[] = "BULK_LOAD";
constexpr char kStrategyChangePrefix[] = "STRATEGY_CHANGE to ";

std::string Format(const char* fmt, double a, double b = 0, double c = 0) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), fmt, a, b, c);
    return buf;
}

} // namespace

std::string PerformanceReport::ToString() const {
    std::string out = "=== PERFORMANCE REPORT ===\n";
    out += Format("Uptime: %.1f seconds\n", uptime_ms / 1000.0);
    out += "Total Operations: " + std::to_string(total_searches + insertions + evictions) + "\n";
    out += Format("Hit Rate: %.2f%%", hit_rate) +
           " (" + std::to_string(hits) + "/" + std::to_string(total_searches) + ")\n";
    out += Format("Avg Access Cost: %.2f steps\n", avg_access_cost);
    out += Format("Avg Search Time: %.3f ms\n", avg_search_time_ms);
    out += Format("Operations/sec: %.1f\n", operations_per_second);
    out += "Insertions: " + std::to_string(insertions) +
           ", Evictions: " + std::to_string(evictions) + "\n";
    out += "Strategy Changes: " + std::to_string(strategy_changes) + "\n";

    if (!operation_counts.empty()) {
        std::vector<std::pair<std::string, uint64_t>> sorted(operation_counts.begin(),
                                                             operation_counts.end());
        // Highest count first; equal counts by label so output is stable.
        std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
            if (a.second != b.second) return a.second > b.second;
            return a.first < b.first;
        });

        out += "\nOperation Counts:\n";
        for (const auto& [label, count] : sorted) {
            char line[128];
            std::snprintf(line, sizeof(line), "  %-20s: %llu\n", label.c_str(),
                          static_cast<unsigned long long>(count));
            out += line;
        }
    }
    return out;
}

MetricsRecorder::MetricsRecorder(size_t recent_limit)
    : recent_limit_(recent_limit == 0 ? kDefaultRecentLimit : recent_limit),
      start_time_(Clock::now()) {}

void MetricsRecorder::RecordHit(uint64_t access_cost) {
    std::lock_guard<std::mutex> lock(mu_);
    ++total_searches_;
    ++hits_;
    total_access_cost_ += access_cost;
    RecordOperation(kHit);
}

void MetricsRecorder::RecordMiss() {
    std::lock_guard<std::mutex> lock(mu_);
    ++total_searches_;
    ++misses_;
    RecordOperation(kMiss);
}

void MetricsRecorder::RecordInsertion() {
    std::lock_guard<std::mutex> lock(mu_);
    ++insertions_;
    RecordOperation(kInsert);
}

void MetricsRecorder::RecordEviction() {
    std::lock_guard<std::mutex> lock(mu_);
    ++evictions_;
    RecordOperation(kEvict);
}

void MetricsRecorder::RecordBulkLoad(uint64_t count) {
    std::lock_guard<std::mutex> lock(mu_);
    insertions_ += count;
    RecordOperation(kBulkLoad);
}

void MetricsRecorder::RecordStrategyChange(const std::string& strategy_name) {
    std::lock_guard<std::mutex> lock(mu_);
    ++strategy_changes_;
    RecordOperation(kStrategyChangePrefix + strategy_name);
}

void MetricsRecorder::RecordSearchTime(std::chrono::nanoseconds elapsed) {
    std::lock_guard<std::mutex> lock(mu_);
    if (elapsed.count() > 0) {
        total_search_time_ns_ += static_cast<uint64_t>(elapsed.count());
    }
}

void MetricsRecorder::RecordOperation(std::string label) {
    ++operation_counts_[label];
    recent_operations_.push_back(std::move(label));
    while (recent_operations_.size() > recent_limit_) {
        recent_operations_.pop_front();
    }
}

void MetricsRecorder::Reset() {
    std::lock_guard<std::mutex> lock(mu_);
    total_searches_ = 0;
    hits_ = 0;
    misses_ = 0;
    total_access_cost_ = 0;
    total_search_time_ns_ = 0;
    insertions_ = 0;
    evictions_ = 0;
    strategy_changes_ = 0;
    recent_operations_.clear();
    operation_counts_.clear();
    start_time_ = Clock::now();
}

double MetricsRecorder::HitRateLocked() const {
    return total_searches_ > 0 ? (hits_ * 100.0) / total_searches_ : 0.0;
}

PerformanceReport MetricsRecorder::GenerateReport() const {
    std::lock_guard<std::mutex> lock(mu_);

    auto elapsed = Clock::now() - start_time_;
    double elapsed_seconds = std::chrono::duration<double>(elapsed).count();

    PerformanceReport report;
    report.total_searches = total_searches_;
    report.hits = hits_;
    report.misses = misses_;
    report.hit_rate = HitRateLocked();
    report.avg_access_cost =
        hits_ > 0 ? static_cast<double>(total_access_cost_) / hits_ : 0.0;
    report.avg_search_time_ms =
        total_searches_ > 0 ? (total_search_time_ns_ / 1e6) / total_searches_ : 0.0;
    report.operations_per_second =
        (total_searches_ > 0 && elapsed_seconds > 0) ? total_searches_ / elapsed_seconds : 0.0;
    report.insertions = insertions_;
    report.evictions = evictions_;
    report.strategy_changes = strategy_changes_;
    report.operation_counts = operation_counts_;
    report.uptime_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
    return report;
}

double MetricsRecorder::HitRate() const {
    std::lock_guard<std::mutex> lock(mu_);
    return HitRateLocked();
}

uint64_t MetricsRecorder::TotalOperations() const {
    std::lock_guard<std::mutex> lock(mu_);
    return total_searches_ + insertions_ + evictions_ + strategy_changes_;
}

std::vector<std::string> MetricsRecorder::RecentOperations(size_t count) const {
    std::lock_guard<std::mutex> lock(mu_);
    size_t take = std::min(count, recent_operations_.size());
    return std::vector<std::string>(recent_operations_.end() - static_cast<std::ptrdiff_t>(take),
                                    recent_operations_.end());
}

} // namespace selforg
