#include <synthevents/event/NativeEvent.hpp>

namespace SE {

auto EmptyNativeEvent::instance() -> EmptyNativeEvent const& {
    static EmptyNativeEvent const empty;
    return empty;
}

FieldBagEvent::FieldBagEvent(std::initializer_list<std::pair<std::string const, FieldValue>> init)
    : fields(init.begin(), init.end()) {}

auto FieldBagEvent::field(std::string_view name) const -> FieldValue {
    auto it = this->fields.find(std::string{name});
    if (it == this->fields.end()) {
        return Undefined{};
    }
    return it->second;
}

auto FieldBagEvent::setField(std::string_view name, FieldValue value) -> void {
    this->fields.insert_or_assign(std::string{name}, std::move(value));
}

auto FieldBagEvent::eraseField(std::string_view name) -> void {
    this->fields.erase(std::string{name});
}

auto FieldBagEvent::contains(std::string_view name) const -> bool {
    return this->fields.find(std::string{name}) != this->fields.end();
}

auto FieldBagEvent::onPreventDefault(Hook hook) -> FieldBagEvent& {
    this->preventHook = std::move(hook);
    return *this;
}

auto FieldBagEvent::onStopPropagation(Hook hook) -> FieldBagEvent& {
    this->stopHook = std::move(hook);
    return *this;
}

auto FieldBagEvent::preventDefault() -> void {
    if (this->preventHook) {
        this->preventHook(*this);
    }
}

auto FieldBagEvent::stopPropagation() -> void {
    if (this->stopHook) {
        this->stopHook(*this);
    }
}

} // namespace SE
