#include <synthevents/runtime/EventRuntime.hpp>

#include "log/TaggedLogger.hpp"

namespace SE {

EventRuntime::EventRuntime(RuntimeOptions options)
    : options_(options),
      classes_(CreateStandardEventClasses(options.normalization())) {
    this->batching_.setStateRestoreSource(&this->controlled_);
    se_log("EventRuntime created, pool capacity " + std::to_string(options.pool_capacity), "Config");
}

auto EventRuntime::dispatchBatched(std::vector<std::unique_ptr<SyntheticEvent>>  events,
                                   std::vector<std::unique_ptr<SyntheticEvent>>& persisted) -> void {
    this->batching_.runBatched(
        [&persisted](std::vector<std::unique_ptr<SyntheticEvent>>& pending) {
            runEventsInBatch(std::move(pending), persisted);
        },
        events);
}

auto defaultRuntime() -> EventRuntime& {
    static EventRuntime runtime{LoadRuntimeOptionsFromEnv()};
    return runtime;
}

} // namespace SE
