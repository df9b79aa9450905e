#pragma once

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <optional>
#include <string>
#include <utility>

namespace selforg {

/**
 * @brief Outcome of one SelfOrganizingList::Search call.
 */
template <typename K>
class SearchResult {
public:
    SearchResult(std::optional<K> key,
                 size_t access_cost,
                 std::chrono::nanoseconds elapsed,
                 std::string operation)
        : key_(std::move(key)),
          access_cost_(access_cost),
          elapsed_(elapsed),
          operation_(std::move(operation)) {}

    bool Found() const { return key_.has_value(); }

    // The matched key, std::nullopt on a miss.
    const std::optional<K>& Key() const { return key_; }

    // Traversal steps spent, including the initial head probe.
    size_t AccessCost() const { return access_cost_; }

    std::chrono::nanoseconds Elapsed() const { return elapsed_; }
    double ElapsedMs() const { return elapsed_.count() / 1e6; }

    // What the strategy did, or why nothing was found.
    const std::string& Operation() const { return operation_; }

    std::string ToString() const {
        char buf[96];
        std::snprintf(buf, sizeof(buf), "SearchResult{found=%s, cost=%zu, time=%.3fms, op=",
                      Found() ? "true" : "false", access_cost_, ElapsedMs());
        return buf + operation_ + "}";
    }

private:
    std::optional<K> key_;
    size_t access_cost_;
    std::chrono::nanoseconds elapsed_;
    std::string operation_;
};

} // namespace selforg
