#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

namespace selforg {

/**
 * @brief Singly-linked chain of keyed nodes stored in an arena.
 *
 * Nodes are addressed by stable handles (slot indices into the arena), so a
 * handle stays valid until the node is released, regardless of how links are
 * rewired. Released slots go to a free list and are reused by the next
 * allocation. The chain owns every node; the head handle and each node's
 * `next` are the only links, and each live node is reachable through exactly
 * one of them.
 *
 * Not thread-safe. The owning list serializes access.
 *
 * @tparam Key Key type stored in each node
 */
template <typename Key>
class NodeChain {
public:
    using Handle = size_t;
    using Clock = std::chrono::steady_clock;

    static constexpr Handle kNil = std::numeric_limits<Handle>::max();

    struct Node {
        Key key;
        // Successful lookups of this node since it was inserted.
        uint64_t access_count = 0;
        // Logical timestamp of the last insertion or hit; orders eviction.
        uint64_t last_access_tick = 0;
        Clock::time_point inserted_at;
        Clock::time_point last_accessed_at;
        Handle next = kNil;
    };

    NodeChain() = default;

    NodeChain(const NodeChain&) = delete;
    NodeChain& operator=(const NodeChain&) = delete;
    NodeChain(NodeChain&&) = default;
    NodeChain& operator=(NodeChain&&) = default;

    /**
     * @brief Creates an unlinked node and returns its handle.
     *
     * The node is not reachable from the head until the caller links it.
     */
    Handle Allocate(Key key, uint64_t tick) {
        Handle handle;
        if (!free_slots_.empty()) {
            handle = free_slots_.back();
            free_slots_.pop_back();
        } else {
            handle = slots_.size();
            slots_.emplace_back();
        }

        auto now = Clock::now();
        Node& node = slots_[handle];
        node.key = std::move(key);
        node.access_count = 0;
        node.last_access_tick = tick;
        node.inserted_at = now;
        node.last_accessed_at = now;
        node.next = kNil;
        ++live_;
        return handle;
    }

    /**
     * @brief Returns a slot to the free list. The node must already be unlinked.
     */
    void Release(Handle handle) {
        slots_[handle].next = kNil;
        free_slots_.push_back(handle);
        --live_;
    }

    void PushFront(Handle handle) {
        slots_[handle].next = head_;
        head_ = handle;
    }

    Handle Head() const { return head_; }
    void SetHead(Handle handle) { head_ = handle; }

    Handle Next(Handle handle) const { return slots_[handle].next; }
    void SetNext(Handle handle, Handle next) { slots_[handle].next = next; }

    Node& At(Handle handle) { return slots_[handle]; }
    const Node& At(Handle handle) const { return slots_[handle]; }

    bool IsEmpty() const { return head_ == kNil; }

    // Nodes allocated and not yet released.
    size_t LiveCount() const { return live_; }

    // Slots ever created, including recycled ones.
    size_t SlotCount() const { return slots_.size(); }

    void Clear() {
        slots_.clear();
        free_slots_.clear();
        head_ = kNil;
        live_ = 0;
    }

    /**
     * @brief Visits nodes from head to tail.
     */
    template <typename Fn>
    void ForEach(Fn&& fn) const {
        for (Handle h = head_; h != kNil; h = slots_[h].next) {
            fn(h, slots_[h]);
        }
    }

private:
    std::vector<Node> slots_;
    std::vector<Handle> free_slots_;
    Handle head_ = kNil;
    size_t live_ = 0;
};

} // namespace selforg
