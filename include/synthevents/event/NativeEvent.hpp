#pragma once

#include <synthevents/event/FieldValue.hpp>

#include <parallel_hashmap/phmap.h>

#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

namespace SE {

/**
 * Platform event as delivered by the host. Implementations expose their data
 * through named fields; a field the event does not carry reads as Undefined.
 *
 * The prevent/stop mechanisms are optional. An event without them is treated
 * as a legacy event and is signalled through its `returnValue` and
 * `cancelBubble` fields instead.
 */
class NativeEvent {
public:
    virtual ~NativeEvent() = default;

    [[nodiscard]] virtual auto field(std::string_view name) const -> FieldValue = 0;
    virtual auto setField(std::string_view name, FieldValue value) -> void = 0;

    [[nodiscard]] virtual auto hasPreventDefault() const -> bool { return false; }
    virtual auto preventDefault() -> void {}

    [[nodiscard]] virtual auto hasStopPropagation() const -> bool { return false; }
    virtual auto stopPropagation() -> void {}
};

// Stand-in normalized against when the host has no native event at all.
class EmptyNativeEvent final : public NativeEvent {
public:
    [[nodiscard]] auto field(std::string_view) const -> FieldValue override { return Undefined{}; }
    auto setField(std::string_view, FieldValue) -> void override {}

    [[nodiscard]] static auto instance() -> EmptyNativeEvent const&;
};

/**
 * Native event backed by a plain field map. Hooks are optional; leaving them
 * empty models an environment that only knows the legacy fallback fields.
 */
class FieldBagEvent : public NativeEvent {
public:
    using Hook = std::function<void(FieldBagEvent&)>;

    FieldBagEvent() = default;
    FieldBagEvent(std::initializer_list<std::pair<std::string const, FieldValue>> fields);

    [[nodiscard]] auto field(std::string_view name) const -> FieldValue override;
    auto setField(std::string_view name, FieldValue value) -> void override;
    auto eraseField(std::string_view name) -> void;
    [[nodiscard]] auto contains(std::string_view name) const -> bool;
    [[nodiscard]] auto size() const -> std::size_t { return fields.size(); }

    auto onPreventDefault(Hook hook) -> FieldBagEvent&;
    auto onStopPropagation(Hook hook) -> FieldBagEvent&;

    [[nodiscard]] auto hasPreventDefault() const -> bool override { return static_cast<bool>(preventHook); }
    auto preventDefault() -> void override;

    [[nodiscard]] auto hasStopPropagation() const -> bool override { return static_cast<bool>(stopHook); }
    auto stopPropagation() -> void override;

private:
    phmap::flat_hash_map<std::string, FieldValue> fields;
    Hook                                          preventHook;
    Hook                                          stopHook;
};

} // namespace SE
