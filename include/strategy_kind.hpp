#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace selforg {

// Reorganization policy applied after every successful lookup.
enum class StrategyKind {
    kUnset,
    kMoveToFront,
    kTranspose,
    kFrequencyCount,
    kLru,
};

// Display name, e.g. "Move-to-Front (MTF)". "Unset" for kUnset.
const char* StrategyName(StrategyKind kind);

// One-sentence summary of the policy and the access pattern it suits.
const char* StrategyDescription(StrategyKind kind);

// Nominal cost of one reorganization.
const char* StrategyTimeComplexity(StrategyKind kind);

// The four usable strategies, in declaration order.
const std::vector<StrategyKind>& AllStrategies();

/**
 * @brief Parses a strategy from a short token or its display name.
 *
 * Accepts "mtf", "move-to-front", "transpose", "frequency",
 * "frequency-count", "fc", "lru" (any case, '_' read as '-') and the exact
 * display names.
 *
 * @return std::nullopt when the text names no strategy.
 */
std::optional<StrategyKind> ParseStrategy(std::string_view text);

} // namespace selforg
