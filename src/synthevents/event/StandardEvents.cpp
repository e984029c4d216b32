#include <synthevents/event/NativeEvent.hpp>
#include <synthevents/event/StandardEvents.hpp>

#include "event/Utf8.hpp"

#include <array>
#include <cmath>
#include <string_view>
#include <utility>

namespace SE {

namespace {

auto integerField(NativeEvent const& event, std::string_view name) -> std::optional<std::int64_t> {
    auto value = event.field(name);
    if (auto const* i = std::get_if<std::int64_t>(&value)) {
        return *i;
    }
    if (auto const* d = std::get_if<double>(&value)) {
        // Doubles outside [-2^63, 2^63) have no int64 counterpart.
        constexpr double kLimit = 9223372036854775808.0;
        if (!std::isfinite(*d) || *d < -kLimit || *d >= kLimit) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(*d);
    }
    return std::nullopt;
}

auto stringField(NativeEvent const& event, std::string_view name) -> std::optional<std::string> {
    return fieldAs<std::string>(event.field(name));
}

// Legacy `key` spellings mapped to their standard names.
constexpr auto kNormalizedKeys = std::to_array<std::pair<std::string_view, std::string_view>>({
    {"Esc", "Escape"},
    {"Spacebar", " "},
    {"Left", "ArrowLeft"},
    {"Up", "ArrowUp"},
    {"Right", "ArrowRight"},
    {"Down", "ArrowDown"},
    {"Del", "Delete"},
    {"Win", "OS"},
    {"Menu", "ContextMenu"},
    {"Apps", "ContextMenu"},
    {"Scroll", "ScrollLock"},
    {"MozPrintableKey", "Unidentified"},
});

constexpr auto kKeyCodeNames = std::to_array<std::pair<std::int64_t, std::string_view>>({
    {8, "Backspace"},   {9, "Tab"},        {12, "Clear"},       {13, "Enter"},      {16, "Shift"},
    {17, "Control"},    {18, "Alt"},       {19, "Pause"},       {20, "CapsLock"},   {27, "Escape"},
    {32, " "},          {33, "PageUp"},    {34, "PageDown"},    {35, "End"},        {36, "Home"},
    {37, "ArrowLeft"},  {38, "ArrowUp"},   {39, "ArrowRight"},  {40, "ArrowDown"},  {45, "Insert"},
    {46, "Delete"},     {112, "F1"},       {113, "F2"},         {114, "F3"},        {115, "F4"},
    {116, "F5"},        {117, "F6"},       {118, "F7"},         {119, "F8"},        {120, "F9"},
    {121, "F10"},       {122, "F11"},      {123, "F12"},        {144, "NumLock"},   {145, "ScrollLock"},
    {224, "Meta"},
});

auto eventType(NativeEvent const& event) -> std::string {
    return stringField(event, "type").value_or(std::string{});
}

auto copyOr(std::string name, FieldValue fallback) -> DescriptorEntry {
    auto key = name;
    return DescriptorEntry{std::move(name), FieldRule{[key, fallback](NativeEvent const& event) -> FieldValue {
                               auto value = event.field(key);
                               return isUndefined(value) ? fallback : value;
                           }}};
}

} // namespace

auto eventCharCode(NativeEvent const& event) -> std::int64_t {
    auto keyCode  = integerField(event, "keyCode").value_or(0);
    std::int64_t charCode = 0;
    if (!isUndefined(event.field("charCode"))) {
        charCode = integerField(event, "charCode").value_or(0);
        if (charCode == 0 && keyCode == 13) {
            charCode = 13;
        }
    } else {
        charCode = keyCode;
    }
    // Some hosts report Ctrl+Enter as a line feed.
    if (charCode == 10) {
        charCode = 13;
    }
    if (charCode >= 32 || charCode == 13) {
        return charCode;
    }
    return 0;
}

auto eventKey(NativeEvent const& event) -> std::string {
    if (auto key = stringField(event, "key"); key && !key->empty()) {
        std::string normalized = *key;
        for (auto const& [legacy, standard] : kNormalizedKeys) {
            if (*key == legacy) {
                normalized = std::string{standard};
                break;
            }
        }
        if (normalized != "Unidentified") {
            return normalized;
        }
    }

    auto type = eventType(event);
    if (type == "keypress") {
        auto charCode = eventCharCode(event);
        if (charCode == 13) {
            return "Enter";
        }
        return detail::encodeUtf8(charCode);
    }
    if (type == "keydown" || type == "keyup") {
        auto keyCode = integerField(event, "keyCode").value_or(0);
        for (auto const& [code, name] : kKeyCodeNames) {
            if (code == keyCode) {
                return std::string{name};
            }
        }
        return "Unidentified";
    }
    return "";
}

auto UIEventInterface() -> DescriptorTable const& {
    static DescriptorTable const table{
        {"view", nullptr},
        {"detail", nullptr},
    };
    return table;
}

auto MouseEventInterface() -> DescriptorTable const& {
    static DescriptorTable const table{
        {"screenX", nullptr},
        {"screenY", nullptr},
        {"clientX", nullptr},
        {"clientY", nullptr},
        {"pageX",
         [](NativeEvent const& event) -> FieldValue {
             auto page = event.field("pageX");
             return isUndefined(page) ? event.field("clientX") : page;
         }},
        {"pageY",
         [](NativeEvent const& event) -> FieldValue {
             auto page = event.field("pageY");
             return isUndefined(page) ? event.field("clientY") : page;
         }},
        {"ctrlKey", nullptr},
        {"shiftKey", nullptr},
        {"altKey", nullptr},
        {"metaKey", nullptr},
        {"button", nullptr},
        {"buttons", nullptr},
        {"relatedTarget",
         [](NativeEvent const& event) -> FieldValue {
             auto related = event.field("relatedTarget");
             if (isTruthy(related)) {
                 return related;
             }
             auto from = event.field("fromElement");
             return from == event.field("srcElement") ? event.field("toElement") : from;
         }},
        copyOr("movementX", std::int64_t{0}),
        copyOr("movementY", std::int64_t{0}),
    };
    return table;
}

auto PointerEventInterface() -> DescriptorTable const& {
    static DescriptorTable const table{
        {"pointerId", nullptr},
        {"width", nullptr},
        {"height", nullptr},
        {"pressure", nullptr},
        {"tangentialPressure", nullptr},
        {"tiltX", nullptr},
        {"tiltY", nullptr},
        {"twist", nullptr},
        {"pointerType", nullptr},
        {"isPrimary", nullptr},
    };
    return table;
}

auto WheelEventInterface() -> DescriptorTable const& {
    static DescriptorTable const table{
        {"deltaX",
         [](NativeEvent const& event) -> FieldValue {
             auto delta = event.field("deltaX");
             if (!isUndefined(delta)) {
                 return delta;
             }
             if (auto legacy = asNumber(event.field("wheelDeltaX"))) {
                 return -*legacy;
             }
             return 0.0;
         }},
        {"deltaY",
         [](NativeEvent const& event) -> FieldValue {
             auto delta = event.field("deltaY");
             if (!isUndefined(delta)) {
                 return delta;
             }
             if (auto legacy = asNumber(event.field("wheelDeltaY"))) {
                 return -*legacy;
             }
             if (auto legacy = asNumber(event.field("wheelDelta"))) {
                 return -*legacy;
             }
             return 0.0;
         }},
        {"deltaZ", nullptr},
        {"deltaMode", nullptr},
    };
    return table;
}

auto KeyboardEventInterface() -> DescriptorTable const& {
    static DescriptorTable const table{
        {"key", [](NativeEvent const& event) -> FieldValue { return eventKey(event); }},
        {"code", nullptr},
        {"location", nullptr},
        {"ctrlKey", nullptr},
        {"shiftKey", nullptr},
        {"altKey", nullptr},
        {"metaKey", nullptr},
        {"repeat", nullptr},
        {"locale", nullptr},
        // charCode is only meaningful on keypress
        {"charCode",
         [](NativeEvent const& event) -> FieldValue {
             return eventType(event) == "keypress" ? eventCharCode(event) : std::int64_t{0};
         }},
        // keyCode is only meaningful on keydown and keyup
        {"keyCode",
         [](NativeEvent const& event) -> FieldValue {
             auto type = eventType(event);
             if (type == "keydown" || type == "keyup") {
                 return integerField(event, "keyCode").value_or(0);
             }
             return std::int64_t{0};
         }},
        {"which",
         [](NativeEvent const& event) -> FieldValue {
             auto type = eventType(event);
             if (type == "keypress") {
                 return eventCharCode(event);
             }
             if (type == "keydown" || type == "keyup") {
                 return integerField(event, "keyCode").value_or(0);
             }
             return std::int64_t{0};
         }},
    };
    return table;
}

auto FocusEventInterface() -> DescriptorTable const& {
    static DescriptorTable const table{
        {"relatedTarget", nullptr},
    };
    return table;
}

auto CompositionEventInterface() -> DescriptorTable const& {
    static DescriptorTable const table{
        {"data", nullptr},
    };
    return table;
}

auto InputEventInterface() -> DescriptorTable const& {
    static DescriptorTable const table{
        {"data", nullptr},
    };
    return table;
}

auto ClipboardEventInterface() -> DescriptorTable const& {
    static DescriptorTable const table{
        {"clipboardData", nullptr},
    };
    return table;
}

auto CreateStandardEventClasses(NormalizationOptions const& options) -> StandardEventClasses {
    StandardEventClasses classes;
    classes.base        = EventClass::Create("SyntheticEvent", StandardEventInterface(), options);
    classes.ui          = classes.base->extend("UIEvent", UIEventInterface());
    classes.mouse       = classes.ui->extend("MouseEvent", MouseEventInterface());
    classes.pointer     = classes.mouse->extend("PointerEvent", PointerEventInterface());
    classes.wheel       = classes.mouse->extend("WheelEvent", WheelEventInterface());
    classes.keyboard    = classes.ui->extend("KeyboardEvent", KeyboardEventInterface());
    classes.focus       = classes.ui->extend("FocusEvent", FocusEventInterface());
    classes.composition = classes.base->extend("CompositionEvent", CompositionEventInterface());
    classes.input       = classes.base->extend("InputEvent", InputEventInterface());
    classes.clipboard   = classes.base->extend("ClipboardEvent", ClipboardEventInterface());
    return classes;
}

} // namespace SE
