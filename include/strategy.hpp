#pragma once

#include <string>

#include "node_chain.hpp"
#include "strategy_kind.hpp"

namespace selforg {

namespace strategy_detail {

template <typename Key>
using Handle = typename NodeChain<Key>::Handle;

// Unlinks `match` (whose predecessor is `prev`) and makes it the head.
template <typename Key>
void MoveToHead(NodeChain<Key>& chain, Handle<Key> prev, Handle<Key> match) {
    chain.SetNext(prev, chain.Next(match));
    chain.PushFront(match);
}

template <typename Key>
std::string MoveToFront(NodeChain<Key>& chain, Handle<Key> prev, Handle<Key> match) {
    if (prev == NodeChain<Key>::kNil) {
        return "Already at front";
    }
    MoveToHead(chain, prev, match);
    return "Moved to front";
}

template <typename Key>
std::string Transpose(NodeChain<Key>& chain, Handle<Key> prev, Handle<Key> match) {
    constexpr auto kNil = NodeChain<Key>::kNil;
    if (prev == kNil) {
        return "Already at head (no transpose)";
    }

    if (chain.Head() == prev) {
        chain.SetNext(prev, chain.Next(match));
        chain.SetNext(match, prev);
        chain.SetHead(match);
        return "Transposed with head";
    }

    // Singly linked: find the node in front of prev with a second scan.
    auto prev_prev = chain.Head();
    while (prev_prev != kNil && chain.Next(prev_prev) != prev) {
        prev_prev = chain.Next(prev_prev);
    }
    if (prev_prev == kNil) {
        return "No transposition performed";
    }

    chain.SetNext(prev, chain.Next(match));
    chain.SetNext(match, prev);
    chain.SetNext(prev_prev, match);
    return "Transposed with predecessor";
}

// Assumes the chain is ordered by descending access count, which only this
// strategy maintains. After a runtime swap from another strategy the order
// may be arbitrary and the placement below is approximate; nothing re-sorts.
template <typename Key>
std::string FrequencyCount(NodeChain<Key>& chain, Handle<Key> prev, Handle<Key> match) {
    constexpr auto kNil = NodeChain<Key>::kNil;
    if (prev == kNil) {
        return "Already at head (frequency unchanged)";
    }

    chain.SetNext(prev, chain.Next(match));

    const uint64_t count = chain.At(match).access_count;
    const auto head = chain.Head();
    if (chain.At(head).access_count <= count) {
        // Ties favor promotion.
        chain.PushFront(match);
        return "Moved to head (higher frequency)";
    }

    auto search_prev = head;
    auto search = chain.Next(head);
    while (search != kNil && chain.At(search).access_count > count) {
        search_prev = search;
        search = chain.Next(search);
    }
    chain.SetNext(match, search);
    chain.SetNext(search_prev, match);
    return "Moved to position (frequency: " + std::to_string(count) + ")";
}

// Same mechanics as move-to-front; only the label differs.
template <typename Key>
std::string Lru(NodeChain<Key>& chain, Handle<Key> prev, Handle<Key> match) {
    if (prev == NodeChain<Key>::kNil) {
        return "Already at head (LRU)";
    }
    MoveToHead(chain, prev, match);
    return "Moved to head (LRU)";
}

} // namespace strategy_detail

/**
 * @brief Applies a strategy's reorganization after a successful lookup.
 *
 * Only link structure changes; the caller's key index stays valid because
 * handles are stable. Never fails: a no-op is reported in the returned text.
 *
 * @param kind Active strategy
 * @param chain Chain that holds both nodes
 * @param prev Handle of the node right before `match`, or kNil when `match`
 *             is the head
 * @param match Handle of the node that was just found
 * @return Short description of what was done
 */
template <typename Key>
std::string Reorganize(StrategyKind kind,
                       NodeChain<Key>& chain,
                       typename NodeChain<Key>::Handle prev,
                       typename NodeChain<Key>::Handle match) {
    switch (kind) {
        case StrategyKind::kMoveToFront:
            return strategy_detail::MoveToFront(chain, prev, match);
        case StrategyKind::kTranspose:
            return strategy_detail::Transpose(chain, prev, match);
        case StrategyKind::kFrequencyCount:
            return strategy_detail::FrequencyCount(chain, prev, match);
        case StrategyKind::kLru:
            return strategy_detail::Lru(chain, prev, match);
        case StrategyKind::kUnset:
            break;
    }
    return "No strategy";
}

} // namespace selforg
