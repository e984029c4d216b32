#include <synthevents/io/IoNativeEvents.hpp>

#include "event/Utf8.hpp"

#include <numbers>

namespace SE::IO {

namespace {

auto radiansToDegrees(float radians) -> double {
    return static_cast<double>(radians) * 180.0 / std::numbers::pi;
}

} // namespace

auto IoNativeEvent::field(std::string_view name) const -> FieldValue {
    if (auto it = this->overlay_.find(std::string{name}); it != this->overlay_.end()) {
        return it->second;
    }
    if (name == "defaultPrevented") {
        return this->defaultPrevented_;
    }
    if (name == "bubbles" || name == "cancelable" || name == "isTrusted") {
        return true;
    }
    return this->deviceField(name);
}

auto IoNativeEvent::setField(std::string_view name, FieldValue value) -> void {
    this->overlay_.insert_or_assign(std::string{name}, std::move(value));
}

auto IoNativeEvent::modifierField(ButtonModifiers modifiers, std::string_view name) -> FieldValue {
    if (name == "shiftKey") {
        return hasModifier(modifiers, ButtonModifiers::Shift);
    }
    if (name == "ctrlKey") {
        return hasModifier(modifiers, ButtonModifiers::Control);
    }
    if (name == "altKey") {
        return hasModifier(modifiers, ButtonModifiers::Alt);
    }
    if (name == "metaKey") {
        return hasModifier(modifiers, ButtonModifiers::Command);
    }
    return Undefined{};
}

auto IoNativeEvent::timeStampMs(std::chrono::nanoseconds timestamp) -> double {
    return std::chrono::duration<double, std::milli>(timestamp).count();
}

auto PointerNativeEvent::typeName(PointerPhase phase) -> std::string_view {
    switch (phase) {
    case PointerPhase::Move:
        return "pointermove";
    case PointerPhase::Down:
        return "pointerdown";
    case PointerPhase::Up:
        return "pointerup";
    case PointerPhase::Enter:
        return "pointerenter";
    case PointerPhase::Leave:
        return "pointerleave";
    case PointerPhase::Cancel:
        return "pointercancel";
    }
    return "pointermove";
}

auto PointerNativeEvent::deviceField(std::string_view name) const -> FieldValue {
    auto const& ev = this->event_;
    if (name == "type") {
        return std::string{typeName(ev.phase)};
    }
    if (name == "clientX" || name == "screenX") {
        return ev.absolute ? FieldValue{static_cast<double>(ev.absolute_x)} : FieldValue{Undefined{}};
    }
    if (name == "clientY" || name == "screenY") {
        return ev.absolute ? FieldValue{static_cast<double>(ev.absolute_y)} : FieldValue{Undefined{}};
    }
    if (name == "movementX") {
        return static_cast<double>(ev.delta_x);
    }
    if (name == "movementY") {
        return static_cast<double>(ev.delta_y);
    }
    if (name == "pointerId") {
        return static_cast<std::int64_t>(ev.pointer_id);
    }
    if (name == "pointerType") {
        return std::string{pointerTypeName(ev.type)};
    }
    if (name == "isPrimary") {
        return ev.primary;
    }
    if (name == "timeStamp") {
        return timeStampMs(ev.timestamp);
    }
    if (name == "devicePath") {
        return ev.device_path;
    }
    if (ev.stylus) {
        auto const& stylus = *ev.stylus;
        if (name == "pressure") {
            return static_cast<double>(stylus.pressure);
        }
        if (name == "tiltX") {
            return radiansToDegrees(stylus.tilt_x);
        }
        if (name == "tiltY") {
            return radiansToDegrees(stylus.tilt_y);
        }
        if (name == "twist") {
            return radiansToDegrees(stylus.twist);
        }
    }
    return modifierField(ev.modifiers, name);
}

auto ButtonNativeEvent::deviceField(std::string_view name) const -> FieldValue {
    auto const& ev       = this->event_;
    bool const  keyboard = ev.source == ButtonSource::Keyboard;
    if (name == "type") {
        if (keyboard) {
            return std::string{ev.pressed ? "keydown" : "keyup"};
        }
        return std::string{ev.pressed ? "mousedown" : "mouseup"};
    }
    if (name == "keyCode") {
        return keyboard ? FieldValue{static_cast<std::int64_t>(ev.button_code)} : FieldValue{Undefined{}};
    }
    if (name == "button") {
        return keyboard ? FieldValue{Undefined{}} : FieldValue{static_cast<std::int64_t>(ev.button_id)};
    }
    if (name == "buttons") {
        if (keyboard) {
            return Undefined{};
        }
        if (!ev.pressed || ev.button_id < 0 || ev.button_id >= 63) {
            return std::int64_t{0};
        }
        return std::int64_t{1} << ev.button_id;
    }
    if (name == "repeat") {
        return ev.repeat;
    }
    if (name == "pressure") {
        return static_cast<double>(ev.analog_value);
    }
    if (name == "timeStamp") {
        return timeStampMs(ev.timestamp);
    }
    if (name == "devicePath") {
        return ev.device_path;
    }
    return modifierField(ev.modifiers, name);
}

auto TextNativeEvent::deviceField(std::string_view name) const -> FieldValue {
    auto const& ev = this->event_;
    if (name == "type") {
        return std::string{"keypress"};
    }
    if (name == "charCode") {
        return static_cast<std::int64_t>(ev.codepoint);
    }
    if (name == "data") {
        return detail::encodeUtf8(static_cast<std::int64_t>(ev.codepoint));
    }
    // Control characters carry no printable key; keypress normalization derives one.
    if (name == "key") {
        if (ev.codepoint < 32) {
            return Undefined{};
        }
        return detail::encodeUtf8(static_cast<std::int64_t>(ev.codepoint));
    }
    if (name == "repeat") {
        return ev.repeat;
    }
    if (name == "timeStamp") {
        return timeStampMs(ev.timestamp);
    }
    if (name == "devicePath") {
        return ev.device_path;
    }
    return modifierField(ev.modifiers, name);
}

} // namespace SE::IO
