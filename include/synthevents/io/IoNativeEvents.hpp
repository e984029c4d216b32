#pragma once

#include <synthevents/event/NativeEvent.hpp>
#include <synthevents/io/IoEvents.hpp>

#include <parallel_hashmap/phmap.h>

#include <string>
#include <string_view>

namespace SE::IO {

/**
 * Presents a device event from the input layer as a NativeEvent.
 *
 * Field writes land in an overlay so the wrapped device event stays
 * untouched. preventDefault/stopPropagation are recorded for the host to act
 * on once dispatch finishes.
 */
class IoNativeEvent : public NativeEvent {
public:
    [[nodiscard]] auto field(std::string_view name) const -> FieldValue final;
    auto setField(std::string_view name, FieldValue value) -> void final;

    [[nodiscard]] auto hasPreventDefault() const -> bool final { return true; }
    auto preventDefault() -> void final { defaultPrevented_ = true; }

    [[nodiscard]] auto hasStopPropagation() const -> bool final { return true; }
    auto stopPropagation() -> void final { propagationStopped_ = true; }

    [[nodiscard]] auto defaultPrevented() const -> bool { return defaultPrevented_; }
    [[nodiscard]] auto propagationStopped() const -> bool { return propagationStopped_; }

protected:
    // Device-derived value of a field, Undefined when the device has none.
    [[nodiscard]] virtual auto deviceField(std::string_view name) const -> FieldValue = 0;

    [[nodiscard]] static auto modifierField(ButtonModifiers modifiers, std::string_view name) -> FieldValue;
    [[nodiscard]] static auto timeStampMs(std::chrono::nanoseconds timestamp) -> double;

private:
    phmap::flat_hash_map<std::string, FieldValue> overlay_;
    bool                                          defaultPrevented_   = false;
    bool                                          propagationStopped_ = false;
};

class PointerNativeEvent final : public IoNativeEvent {
public:
    explicit PointerNativeEvent(PointerEvent const& event) : event_(event) {}

    [[nodiscard]] auto event() const -> PointerEvent const& { return event_; }
    [[nodiscard]] static auto typeName(PointerPhase phase) -> std::string_view;

protected:
    [[nodiscard]] auto deviceField(std::string_view name) const -> FieldValue override;

private:
    PointerEvent const& event_;
};

class ButtonNativeEvent final : public IoNativeEvent {
public:
    explicit ButtonNativeEvent(ButtonEvent const& event) : event_(event) {}

    [[nodiscard]] auto event() const -> ButtonEvent const& { return event_; }

protected:
    [[nodiscard]] auto deviceField(std::string_view name) const -> FieldValue override;

private:
    ButtonEvent const& event_;
};

class TextNativeEvent final : public IoNativeEvent {
public:
    explicit TextNativeEvent(TextEvent const& event) : event_(event) {}

    [[nodiscard]] auto event() const -> TextEvent const& { return event_; }

protected:
    [[nodiscard]] auto deviceField(std::string_view name) const -> FieldValue override;

private:
    TextEvent const& event_;
};

} // namespace SE::IO
