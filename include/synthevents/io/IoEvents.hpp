#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace SE::IO {

enum class PointerType : std::uint8_t {
    Mouse = 0,
    Stylus,
    Touch
};

enum class ButtonSource : std::uint8_t {
    Mouse = 0,
    Keyboard,
    Gamepad
};

enum class ButtonModifiers : std::uint32_t {
    None    = 0,
    Shift   = 1u << 0,
    Control = 1u << 1,
    Alt     = 1u << 2,
    Command = 1u << 3
};

[[nodiscard]] constexpr auto operator|(ButtonModifiers lhs, ButtonModifiers rhs) -> ButtonModifiers {
    return static_cast<ButtonModifiers>(static_cast<std::uint32_t>(lhs) |
                                        static_cast<std::uint32_t>(rhs));
}

[[nodiscard]] constexpr auto operator&(ButtonModifiers lhs, ButtonModifiers rhs) -> ButtonModifiers {
    return static_cast<ButtonModifiers>(static_cast<std::uint32_t>(lhs) &
                                        static_cast<std::uint32_t>(rhs));
}

[[nodiscard]] constexpr auto hasModifier(ButtonModifiers value, ButtonModifiers flag) -> bool {
    return (value & flag) != ButtonModifiers::None;
}

[[nodiscard]] constexpr auto pointerTypeName(PointerType type) -> std::string_view {
    switch (type) {
    case PointerType::Mouse:
        return "mouse";
    case PointerType::Stylus:
        return "pen";
    case PointerType::Touch:
        return "touch";
    }
    return "";
}

struct StylusInfo {
    float pressure = 0.0f; // 0..1
    float tilt_x   = 0.0f; // radians
    float tilt_y   = 0.0f; // radians
    float twist    = 0.0f; // radians around stylus axis
    bool  eraser   = false;
};

enum class PointerPhase : std::uint8_t {
    Move = 0,
    Down,
    Up,
    Enter,
    Leave,
    Cancel
};

struct PointerEvent {
    std::string device_path;
    std::uint64_t pointer_id = 0;
    PointerPhase phase = PointerPhase::Move;
    float delta_x = 0.0f;
    float delta_y = 0.0f;
    float absolute_x = 0.0f;
    float absolute_y = 0.0f;
    bool absolute = false;
    bool primary = true;
    PointerType type = PointerType::Mouse;
    std::optional<StylusInfo> stylus{};
    ButtonModifiers modifiers = ButtonModifiers::None;
    std::chrono::nanoseconds timestamp{};
};

struct ButtonEvent {
    ButtonSource source = ButtonSource::Mouse;
    std::string device_path;
    std::uint32_t button_code = 0;
    int button_id = 0;
    bool pressed = false;
    bool repeat = false;
    float analog_value = 0.0f;
    ButtonModifiers modifiers = ButtonModifiers::None;
    std::chrono::nanoseconds timestamp{};
};

struct TextEvent {
    std::string device_path;
    char32_t codepoint = 0;
    ButtonModifiers modifiers = ButtonModifiers::None;
    bool repeat = false;
    std::chrono::nanoseconds timestamp{};
};

} // namespace SE::IO
