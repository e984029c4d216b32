#pragma once

#include <synthevents/event/EventClass.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace SE {

class NativeEvent;

/**
 * The stock event hierarchy every runtime carries:
 *
 *   SyntheticEvent
 *   ├── UIEvent
 *   │   ├── MouseEvent
 *   │   │   ├── PointerEvent
 *   │   │   └── WheelEvent
 *   │   ├── KeyboardEvent
 *   │   └── FocusEvent
 *   ├── CompositionEvent
 *   ├── InputEvent
 *   └── ClipboardEvent
 */
struct StandardEventClasses {
    std::shared_ptr<EventClass> base;
    std::shared_ptr<EventClass> ui;
    std::shared_ptr<EventClass> mouse;
    std::shared_ptr<EventClass> pointer;
    std::shared_ptr<EventClass> wheel;
    std::shared_ptr<EventClass> keyboard;
    std::shared_ptr<EventClass> focus;
    std::shared_ptr<EventClass> composition;
    std::shared_ptr<EventClass> input;
    std::shared_ptr<EventClass> clipboard;
};

[[nodiscard]] auto CreateStandardEventClasses(NormalizationOptions const& options = {}) -> StandardEventClasses;

[[nodiscard]] auto UIEventInterface() -> DescriptorTable const&;
[[nodiscard]] auto MouseEventInterface() -> DescriptorTable const&;
[[nodiscard]] auto PointerEventInterface() -> DescriptorTable const&;
[[nodiscard]] auto WheelEventInterface() -> DescriptorTable const&;
[[nodiscard]] auto KeyboardEventInterface() -> DescriptorTable const&;
[[nodiscard]] auto FocusEventInterface() -> DescriptorTable const&;
[[nodiscard]] auto CompositionEventInterface() -> DescriptorTable const&;
[[nodiscard]] auto InputEventInterface() -> DescriptorTable const&;
[[nodiscard]] auto ClipboardEventInterface() -> DescriptorTable const&;

// Character code of a keypress, with Enter folded to 13 and control characters to 0.
[[nodiscard]] auto eventCharCode(NativeEvent const& event) -> std::int64_t;

// Normalized `key` value, falling back to char and key codes for hosts that lack it.
[[nodiscard]] auto eventKey(NativeEvent const& event) -> std::string;

} // namespace SE
