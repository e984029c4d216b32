#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace SE {

// A field the native event does not carry at all.
struct Undefined {
    auto operator==(Undefined const&) const -> bool = default;
};

// Host-defined identity of a logical or native target, usually a widget path.
struct TargetRef {
    std::string path;

    auto operator==(TargetRef const&) const -> bool = default;
};

using FieldValue = std::variant<Undefined, std::nullptr_t, bool, std::int64_t, double, std::string, TargetRef>;

enum class FieldKind : std::uint8_t {
    Undefined = 0,
    Null,
    Bool,
    Integer,
    Number,
    String,
    Target
};

[[nodiscard]] inline auto kindOf(FieldValue const& value) -> FieldKind {
    return static_cast<FieldKind>(value.index());
}

[[nodiscard]] inline auto fieldKindToString(FieldKind kind) -> std::string_view {
    switch (kind) {
    case FieldKind::Undefined:
        return "undefined";
    case FieldKind::Null:
        return "null";
    case FieldKind::Bool:
        return "bool";
    case FieldKind::Integer:
        return "integer";
    case FieldKind::Number:
        return "number";
    case FieldKind::String:
        return "string";
    case FieldKind::Target:
        return "target";
    }
    return "undefined";
}

[[nodiscard]] inline auto isUndefined(FieldValue const& value) -> bool {
    return std::holds_alternative<Undefined>(value);
}

// Both "absent" and "explicitly null" count as nullish.
[[nodiscard]] inline auto isNullish(FieldValue const& value) -> bool {
    return std::holds_alternative<Undefined>(value) || std::holds_alternative<std::nullptr_t>(value);
}

[[nodiscard]] inline auto isTruthy(FieldValue const& value) -> bool {
    return std::visit(
        [](auto const& v) -> bool {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Undefined> || std::is_same_v<T, std::nullptr_t>) {
                return false;
            } else if constexpr (std::is_same_v<T, bool>) {
                return v;
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return v != 0;
            } else if constexpr (std::is_same_v<T, double>) {
                return v != 0.0 && !std::isnan(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return !v.empty();
            } else {
                return true;
            }
        },
        value);
}

// Numeric view of a field; integers widen to double.
[[nodiscard]] inline auto asNumber(FieldValue const& value) -> std::optional<double> {
    if (auto const* i = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    if (auto const* d = std::get_if<double>(&value)) {
        return *d;
    }
    return std::nullopt;
}

template <typename T>
[[nodiscard]] auto fieldAs(FieldValue const& value) -> std::optional<T> {
    if (auto const* v = std::get_if<T>(&value)) {
        return *v;
    }
    return std::nullopt;
}

} // namespace SE
