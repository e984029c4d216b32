#include <synthevents/event/EventClass.hpp>
#include <synthevents/event/EventPropagation.hpp>

#include "log/TaggedLogger.hpp"

#include <exception>
#include <stdexcept>

namespace SE {

auto accumulateDispatch(SyntheticEvent& event, TargetRef instance, EventListener listener) -> void {
    event.dispatchListeners().push_back(std::move(listener));
    event.dispatchInstances().push_back(std::move(instance));
}

auto executeDispatchesInOrder(SyntheticEvent& event) -> void {
    auto listeners = std::move(event.dispatchListeners());
    auto instances = std::move(event.dispatchInstances());
    event.dispatchListeners().clear();
    event.dispatchInstances().clear();

    std::exception_ptr firstError;
    for (std::size_t i = 0; i < listeners.size(); ++i) {
        if (event.isPropagationStopped()) {
            break;
        }
        if (i < instances.size()) {
            event.setField("currentTarget", instances[i]);
        }
        try {
            listeners[i](event);
        } catch (...) {
            if (!firstError) {
                firstError = std::current_exception();
            }
        }
        event.setField("currentTarget", nullptr);
    }

    if (firstError) {
        std::rethrow_exception(firstError);
    }
}

auto runEventsInBatch(std::vector<std::unique_ptr<SyntheticEvent>>  events,
                      std::vector<std::unique_ptr<SyntheticEvent>>& persisted) -> void {
    std::exception_ptr firstError;

    for (auto& event : events) {
        if (!event) {
            continue;
        }
        try {
            executeDispatchesInOrder(*event);
        } catch (...) {
            if (!firstError) {
                firstError = std::current_exception();
            }
        }

        if (event->isPersistent()) {
            persisted.push_back(std::move(event));
            continue;
        }
        auto owner = event->eventClass();
        if (!owner) {
            se_log("runEventsInBatch: dropping an event whose class is gone", "Dispatch");
            continue;
        }
        if (auto released = owner->release(event); !released) {
            // The event belongs to `owner`, so this only fires on a broken class binding.
            se_log("runEventsInBatch: " + describeError(released.error()), "Dispatch", "ERROR");
            if (!firstError) {
                firstError = std::make_exception_ptr(std::logic_error(describeError(released.error())));
            }
        }
    }

    if (firstError) {
        std::rethrow_exception(firstError);
    }
}

} // namespace SE
