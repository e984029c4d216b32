#include <synthevents/event/DescriptorTable.hpp>
#include <synthevents/event/NativeEvent.hpp>

#include <algorithm>
#include <chrono>

namespace SE {

auto fieldRuleKindToString(FieldRuleKind kind) -> std::string_view {
    switch (kind) {
    case FieldRuleKind::Copy:
        return "copy";
    case FieldRuleKind::Target:
        return "target";
    case FieldRuleKind::Normalize:
        return "normalize";
    }
    return "copy";
}

DescriptorTable::DescriptorTable(std::initializer_list<DescriptorEntry> entries) {
    this->entries_.reserve(entries.size());
    for (auto const& entry : entries) {
        this->put(entry);
    }
}

auto DescriptorTable::put(DescriptorEntry entry) -> void {
    auto it = std::find_if(this->entries_.begin(), this->entries_.end(), [&](DescriptorEntry const& existing) {
        return existing.name == entry.name;
    });
    if (it != this->entries_.end()) {
        it->rule = std::move(entry.rule);
        return;
    }
    this->entries_.push_back(std::move(entry));
}

auto DescriptorTable::find(std::string_view name) const -> DescriptorEntry const* {
    for (auto const& entry : this->entries_) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

auto DescriptorTable::contains(std::string_view name) const -> bool {
    return this->find(name) != nullptr;
}

auto DescriptorTable::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(this->entries_.size());
    for (auto const& entry : this->entries_) {
        out.push_back(entry.name);
    }
    return out;
}

auto DescriptorTable::merge(DescriptorTable const& base, DescriptorTable const& derived) -> DescriptorTable {
    DescriptorTable merged = base;
    for (auto const& entry : derived.entries_) {
        merged.put(entry);
    }
    return merged;
}

auto StandardEventInterface() -> DescriptorTable const& {
    static DescriptorTable const table{
        {"type", nullptr},
        {"target", nullptr},
        // currentTarget is assigned while dispatching
        {"currentTarget", [](NativeEvent const&) -> FieldValue { return nullptr; }},
        {"eventPhase", nullptr},
        {"bubbles", nullptr},
        {"cancelable", nullptr},
        {"timeStamp",
         [](NativeEvent const& event) -> FieldValue {
             auto stamp = event.field("timeStamp");
             if (isTruthy(stamp)) {
                 return stamp;
             }
             auto now = std::chrono::system_clock::now().time_since_epoch();
             return static_cast<double>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
         }},
        {"defaultPrevented", nullptr},
        {"isTrusted", nullptr},
    };
    return table;
}

} // namespace SE
