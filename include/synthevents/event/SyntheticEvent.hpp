#pragma once

#include <synthevents/event/DispatchConfig.hpp>
#include <synthevents/event/FieldValue.hpp>

#include <parallel_hashmap/phmap.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace SE {

class EventClass;
class NativeEvent;
class SyntheticEvent;

using EventListener = std::function<void(SyntheticEvent&)>;

/**
 * Normalized wrapper around a native event.
 *
 * Instances are created and recycled by their EventClass. After the host has
 * dispatched an event it hands it back with EventClass::release unless the
 * event was persisted; a released event must not be read again.
 *
 * `nativeEvent` and `dispatchConfig` are borrowed for the duration of one
 * dispatch and are dropped by reset(). The link to the owning class is weak:
 * a persisted event may outlive its class, after which eventClass() is null.
 */
class SyntheticEvent {
public:
    SyntheticEvent(SyntheticEvent const&)            = delete;
    SyntheticEvent& operator=(SyntheticEvent const&) = delete;

    [[nodiscard]] auto eventClass() const -> std::shared_ptr<EventClass> { return eventClass_.lock(); }
    [[nodiscard]] auto dispatchConfig() const -> DispatchConfig const* { return dispatchConfig_; }
    [[nodiscard]] auto targetInst() const -> std::optional<TargetRef> const& { return targetInst_; }
    [[nodiscard]] auto nativeEvent() const -> NativeEvent* { return nativeEvent_; }

    // Normalized field; Undefined when the field was never populated.
    [[nodiscard]] auto field(std::string_view name) const -> FieldValue const&;
    [[nodiscard]] auto hasField(std::string_view name) const -> bool;
    auto setField(std::string_view name, FieldValue value) -> void;

    template <typename T>
    [[nodiscard]] auto fieldAs(std::string_view name) const -> std::optional<T> {
        return SE::fieldAs<T>(this->field(name));
    }

    auto preventDefault() -> void;
    auto stopPropagation() -> void;
    auto persist() -> void;

    [[nodiscard]] auto isDefaultPrevented() const -> bool { return defaultPrevented_; }
    [[nodiscard]] auto isPropagationStopped() const -> bool { return propagationStopped_; }
    [[nodiscard]] auto isPersistent() const -> bool { return persistent_; }

    // Slots filled by the dispatch collaborator; index i of both vectors belong together.
    [[nodiscard]] auto dispatchListeners() -> std::vector<EventListener>& { return dispatchListeners_; }
    [[nodiscard]] auto dispatchListeners() const -> std::vector<EventListener> const& { return dispatchListeners_; }
    [[nodiscard]] auto dispatchInstances() -> std::vector<TargetRef>& { return dispatchInstances_; }
    [[nodiscard]] auto dispatchInstances() const -> std::vector<TargetRef> const& { return dispatchInstances_; }

    // Drops every borrowed reference and returns the record to its blank state.
    auto reset() -> void;

private:
    friend class EventClass;

    SyntheticEvent() = default;

    auto construct(EventClass&                     owner,
                   DispatchConfig const*           config,
                   std::optional<TargetRef>        targetInst,
                   NativeEvent*                    nativeEvent,
                   std::optional<TargetRef> const& nativeEventTarget) -> void;

    std::weak_ptr<EventClass>                     eventClass_;
    DispatchConfig const*                         dispatchConfig_ = nullptr;
    std::optional<TargetRef>                      targetInst_;
    NativeEvent*                                  nativeEvent_ = nullptr;
    phmap::flat_hash_map<std::string, FieldValue> fields_;
    bool                                          defaultPrevented_   = false;
    bool                                          propagationStopped_ = false;
    bool                                          persistent_         = false;
    std::vector<EventListener>                    dispatchListeners_;
    std::vector<TargetRef>                        dispatchInstances_;
};

} // namespace SE
