#pragma once

#include <synthevents/event/FieldValue.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace SE {

class NativeEvent;

using Normalizer = std::function<FieldValue(NativeEvent const&)>;

enum class FieldRuleKind : std::uint8_t {
    Copy = 0, // copy the native field verbatim
    Target,   // bound to the explicit native event target
    Normalize // computed by a normalizer function
};

/**
 * How one synthetic field is derived from the native event.
 *
 * An empty rule copies the native field of the same name, except for the
 * field called "target" which is bound to the target passed at construction.
 */
struct FieldRule {
    FieldRule() = default;
    FieldRule(std::nullptr_t) {}
    FieldRule(Normalizer fn) : normalize(std::move(fn)) {}

    template <typename Fn>
        requires std::is_invocable_r_v<FieldValue, Fn, NativeEvent const&>
    FieldRule(Fn&& fn) : normalize(std::forward<Fn>(fn)) {}

    Normalizer normalize;
};

struct DescriptorEntry {
    std::string name;
    FieldRule   rule;
};

[[nodiscard]] inline auto ruleKind(DescriptorEntry const& entry) -> FieldRuleKind {
    if (entry.rule.normalize) {
        return FieldRuleKind::Normalize;
    }
    return entry.name == "target" ? FieldRuleKind::Target : FieldRuleKind::Copy;
}

[[nodiscard]] auto fieldRuleKindToString(FieldRuleKind kind) -> std::string_view;

/**
 * Ordered, immutable mapping from field name to normalization rule. Names are
 * unique; declaring a name twice keeps the first position and the last rule.
 */
class DescriptorTable {
public:
    DescriptorTable() = default;
    DescriptorTable(std::initializer_list<DescriptorEntry> entries);

    [[nodiscard]] auto entries() const -> std::vector<DescriptorEntry> const& { return entries_; }
    [[nodiscard]] auto size() const -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const -> bool { return entries_.empty(); }
    [[nodiscard]] auto contains(std::string_view name) const -> bool;
    [[nodiscard]] auto find(std::string_view name) const -> DescriptorEntry const*;
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    // Union of base and derived; derived rules shadow base rules of the same name.
    [[nodiscard]] static auto merge(DescriptorTable const& base, DescriptorTable const& derived) -> DescriptorTable;

private:
    auto put(DescriptorEntry entry) -> void;

    std::vector<DescriptorEntry> entries_;
};

// Fields shared by every synthetic event.
[[nodiscard]] auto StandardEventInterface() -> DescriptorTable const&;

} // namespace SE
