#include <synthevents/event/EventClass.hpp>
#include <synthevents/event/NativeEvent.hpp>
#include <synthevents/event/SyntheticEvent.hpp>

namespace SE {

namespace {

auto undefinedField() -> FieldValue const& {
    static FieldValue const value{Undefined{}};
    return value;
}

auto nativeReportsPrevented(NativeEvent const& native, NormalizationOptions const& options) -> bool {
    auto prevented = native.field("defaultPrevented");
    if (!isNullish(prevented)) {
        return isTruthy(prevented);
    }
    if (!options.legacy_return_value_fallback) {
        return false;
    }
    auto returnValue = native.field("returnValue");
    auto const* flag = std::get_if<bool>(&returnValue);
    return flag != nullptr && !*flag;
}

} // namespace

auto SyntheticEvent::construct(EventClass&                     owner,
                               DispatchConfig const*           config,
                               std::optional<TargetRef>        targetInst,
                               NativeEvent*                    nativeEvent,
                               std::optional<TargetRef> const& nativeEventTarget) -> void {
    this->eventClass_     = owner.weak_from_this();
    this->dispatchConfig_ = config;
    this->targetInst_     = std::move(targetInst);
    this->nativeEvent_    = nativeEvent;

    NativeEvent const& source = nativeEvent != nullptr ? *nativeEvent
                                                       : static_cast<NativeEvent const&>(EmptyNativeEvent::instance());

    // A recycled record may still carry fields of the class it was built for.
    this->fields_.clear();
    for (auto const& entry : owner.interface().entries()) {
        switch (ruleKind(entry)) {
        case FieldRuleKind::Normalize:
            this->fields_.insert_or_assign(entry.name, entry.rule.normalize(source));
            break;
        case FieldRuleKind::Target:
            if (nativeEventTarget) {
                this->fields_.insert_or_assign(entry.name, *nativeEventTarget);
            } else {
                this->fields_.insert_or_assign(entry.name, nullptr);
            }
            break;
        case FieldRuleKind::Copy:
            this->fields_.insert_or_assign(entry.name, source.field(entry.name));
            break;
        }
    }

    this->defaultPrevented_   = nativeReportsPrevented(source, owner.options());
    this->propagationStopped_ = false;
    this->persistent_         = false;
    this->dispatchListeners_.clear();
    this->dispatchInstances_.clear();
}

auto SyntheticEvent::field(std::string_view name) const -> FieldValue const& {
    auto it = this->fields_.find(std::string{name});
    if (it == this->fields_.end()) {
        return undefinedField();
    }
    return it->second;
}

auto SyntheticEvent::hasField(std::string_view name) const -> bool {
    return this->fields_.find(std::string{name}) != this->fields_.end();
}

auto SyntheticEvent::setField(std::string_view name, FieldValue value) -> void {
    this->fields_.insert_or_assign(std::string{name}, std::move(value));
}

auto SyntheticEvent::preventDefault() -> void {
    this->fields_.insert_or_assign(std::string{"defaultPrevented"}, true);
    this->defaultPrevented_ = true;
    auto* native = this->nativeEvent_;
    if (native == nullptr) {
        return;
    }
    if (native->hasPreventDefault()) {
        native->preventDefault();
    } else {
        native->setField("returnValue", false);
    }
}

auto SyntheticEvent::stopPropagation() -> void {
    this->propagationStopped_ = true;
    auto* native = this->nativeEvent_;
    if (native == nullptr) {
        return;
    }
    if (native->hasStopPropagation()) {
        native->stopPropagation();
    } else {
        native->setField("cancelBubble", true);
    }
}

auto SyntheticEvent::persist() -> void {
    this->persistent_ = true;
}

auto SyntheticEvent::reset() -> void {
    for (auto& [name, value] : this->fields_) {
        value = nullptr;
    }
    this->dispatchConfig_     = nullptr;
    this->targetInst_.reset();
    this->nativeEvent_        = nullptr;
    this->defaultPrevented_   = false;
    this->propagationStopped_ = false;
    this->persistent_         = false;
    this->dispatchListeners_.clear();
    this->dispatchInstances_.clear();
}

} // namespace SE
