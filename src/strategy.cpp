#include "../include/strategy_kind.hpp"

#include <algorithm>
#include <cctype>

namespace selforg {

const char* StrategyName(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::kMoveToFront:
            return "Move-to-Front (MTF)";
        case StrategyKind::kTranspose:
            return "Transpose";
        case StrategyKind::kFrequencyCount:
            return "Frequency Count";
        case StrategyKind::kLru:
            return "LRU (Least Recently Used)";
        case StrategyKind::kUnset:
            break;
    }
    return "Unset";
}

const char* StrategyDescription(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::kMoveToFront:
            return "Moves accessed element to list head. Excellent for temporal locality.";
        case StrategyKind::kTranspose:
            return "Swaps accessed element with its predecessor. Good for sequential access.";
        case StrategyKind::kFrequencyCount:
            return "Orders elements by access frequency. Best for skewed distributions.";
        case StrategyKind::kLru:
            return "Moves accessed element to head. Simple LRU implementation.";
        case StrategyKind::kUnset:
            break;
    }
    return "No strategy selected.";
}

const char* StrategyTimeComplexity(StrategyKind kind) {
    // Frequency Count walks the chain to find its insertion point.
    return kind == StrategyKind::kFrequencyCount ? "O(n)" : "O(1)";
}

const std::vector<StrategyKind>& AllStrategies() {
    static const std::vector<StrategyKind> kAll = {
        StrategyKind::kMoveToFront,
        StrategyKind::kTranspose,
        StrategyKind::kFrequencyCount,
        StrategyKind::kLru,
    };
    return kAll;
}

std::optional<StrategyKind> ParseStrategy(std::string_view text) {
    for (StrategyKind kind : AllStrategies()) {
        if (text == StrategyName(kind)) {
            return kind;
        }
    }

    std::string token(text);
    std::transform(token.begin(), token.end(), token.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(token.begin(), token.end(), '_', '-');

    if (token == "mtf" || token == "move-to-front") {
        return StrategyKind::kMoveToFront;
    }
    if (token == "transpose") {
        return StrategyKind::kTranspose;
    }
    if (token == "frequency" || token == "frequency-count" || token == "fc") {
        return StrategyKind::kFrequencyCount;
    }
    if (token == "lru") {
        return StrategyKind::kLru;
    }
    return std::nullopt;
}

} // namespace selforg
