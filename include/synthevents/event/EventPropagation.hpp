#pragma once

#include <synthevents/event/SyntheticEvent.hpp>

#include <memory>
#include <vector>

namespace SE {

// Queue `listener` to run for `instance` when the event is executed.
auto accumulateDispatch(SyntheticEvent& event, TargetRef instance, EventListener listener) -> void;

/**
 * Run the queued listeners in order, stopping once propagation is stopped.
 * `currentTarget` is set to each listener's instance while it runs.
 *
 * A throwing listener does not prevent the rest from running; the first
 * exception is rethrown once every listener had its turn.
 */
auto executeDispatchesInOrder(SyntheticEvent& event) -> void;

/**
 * Execute each event, then release every event that was not persisted back
 * to the pool of its own class. Persisted events are appended to `persisted`
 * as soon as their listeners have run, so they reach the caller even when a
 * listener exception is rethrown at the end.
 */
auto runEventsInBatch(std::vector<std::unique_ptr<SyntheticEvent>>  events,
                      std::vector<std::unique_ptr<SyntheticEvent>>& persisted) -> void;

} // namespace SE
