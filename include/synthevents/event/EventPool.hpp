#pragma once
#include <synthevents/event/SyntheticEvent.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace SE {

inline constexpr std::size_t kDefaultPoolCapacity = 10;
// Upper bound accepted from configuration.
inline constexpr std::size_t kMaxPoolCapacity = 4096;

struct EventPoolStats {
    std::uint64_t allocated = 0; // instances created because the pool was empty
    std::uint64_t reused    = 0; // instances handed out from the free list
    std::uint64_t released  = 0; // successful releases, pooled or dropped
    std::uint64_t dropped   = 0; // releases that found the pool full
};

/**
 * Bounded LIFO free list of recyclable events owned by one event class.
 * An instance is either held by a caller or sitting in the pool, never both.
 */
class EventPool {
public:
    explicit EventPool(std::size_t capacity = kDefaultPoolCapacity)
        : capacity_(capacity) {
        // Larger pools grow on demand.
        free_.reserve(std::min(capacity, kDefaultPoolCapacity));
    }

    EventPool(EventPool const&)            = delete;
    EventPool& operator=(EventPool const&) = delete;

    // Most recently released instance, or null when the pool is empty.
    [[nodiscard]] auto take() -> std::unique_ptr<SyntheticEvent> {
        if (free_.empty()) {
            return nullptr;
        }
        auto instance = std::move(free_.back());
        free_.pop_back();
        ++stats_.reused;
        return instance;
    }

    // Returns false when the pool is full and the instance was discarded.
    auto give(std::unique_ptr<SyntheticEvent> instance) -> bool {
        ++stats_.released;
        if (free_.size() >= capacity_) {
            ++stats_.dropped;
            return false;
        }
        free_.push_back(std::move(instance));
        return true;
    }

    auto noteAllocation() -> void { ++stats_.allocated; }

    [[nodiscard]] auto size() const -> std::size_t { return free_.size(); }
    [[nodiscard]] auto capacity() const -> std::size_t { return capacity_; }
    [[nodiscard]] auto empty() const -> bool { return free_.empty(); }
    [[nodiscard]] auto stats() const -> EventPoolStats const& { return stats_; }

    // Peek at the slot that the next take() would hand out.
    [[nodiscard]] auto top() const -> SyntheticEvent const* {
        return free_.empty() ? nullptr : free_.back().get();
    }

    auto clear() -> void { free_.clear(); }

private:
    std::size_t                                  capacity_;
    std::vector<std::unique_ptr<SyntheticEvent>> free_;
    EventPoolStats                               stats_;
};

} // namespace SE
