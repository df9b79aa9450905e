#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "metrics.hpp"
#include "strategy_kind.hpp"

namespace selforg {

std::string GetEnv(const char* name, const std::string& default_value);

// "1", "true", "yes", "on" (any case) are true; anything else set is false.
bool GetEnvBool(const char* name, bool default_value);

/**
 * @brief Settings for one SelfOrganizingList.
 */
struct ListOptions {
    // Maximum number of keys; must be positive. Signed so that a negative
    // request is rejected instead of wrapping to a huge bound.
    int64_t capacity = 100;

    // Strategy applied after each hit; must not be kUnset.
    StrategyKind strategy = StrategyKind::kMoveToFront;

    // Length of the recent-operation log kept by the metrics recorder.
    size_t recent_operations_limit = MetricsRecorder::kDefaultRecentLimit;

    /**
     * @brief Throws InvalidConfiguration when the list could not run with
     * these settings.
     */
    void Validate() const;

    /**
     * @brief Overlays SELFORG_CAPACITY, SELFORG_STRATEGY and
     * SELFORG_RECENT_OPERATIONS on `defaults`. Values that do not parse are
     * ignored and logged.
     */
    static ListOptions FromEnv(const ListOptions& defaults);

    // FromEnv() over default-constructed options.
    static ListOptions FromEnv();
};

} // namespace selforg
