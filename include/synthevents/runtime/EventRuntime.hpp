#pragma once

#include <synthevents/batching/BatchingCoordinator.hpp>
#include <synthevents/batching/ControlledComponents.hpp>
#include <synthevents/event/EventPropagation.hpp>
#include <synthevents/event/StandardEvents.hpp>
#include <synthevents/runtime/RuntimeOptions.hpp>

#include <memory>
#include <vector>

namespace SE {

/**
 * One event system instance: the standard event classes with their pools, the
 * batching coordinator and the controlled-component queue it restores from.
 *
 * Independent runtimes share nothing, so tests can create as many as they
 * need. All members must be driven from a single thread.
 */
class EventRuntime {
public:
    explicit EventRuntime(RuntimeOptions options = {});

    EventRuntime(EventRuntime const&)            = delete;
    EventRuntime& operator=(EventRuntime const&) = delete;

    [[nodiscard]] auto options() const -> RuntimeOptions const& { return options_; }
    [[nodiscard]] auto batching() -> BatchingCoordinator& { return batching_; }
    [[nodiscard]] auto controlled() -> ControlledComponentQueue& { return controlled_; }
    [[nodiscard]] auto classes() const -> StandardEventClasses const& { return classes_; }

    // Runs and releases `events` inside one batch; persisted ones land in `persisted`.
    auto dispatchBatched(std::vector<std::unique_ptr<SyntheticEvent>>  events,
                         std::vector<std::unique_ptr<SyntheticEvent>>& persisted) -> void;

private:
    RuntimeOptions           options_;
    ControlledComponentQueue controlled_;
    BatchingCoordinator      batching_;
    StandardEventClasses     classes_;
};

// Process-wide runtime configured from the environment on first use.
[[nodiscard]] auto defaultRuntime() -> EventRuntime&;

} // namespace SE
