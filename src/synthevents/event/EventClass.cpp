#include <synthevents/event/EventClass.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace SE {

EventClass::EventClass(PrivateTag,
                       std::string                 name,
                       DescriptorTable             table,
                       NormalizationOptions        options,
                       std::shared_ptr<EventClass> parent)
    : name_(std::move(name)),
      interface_(std::move(table)),
      options_(options),
      parent_(std::move(parent)),
      pool_(options.pool_capacity) {}

auto EventClass::Create(std::string name, DescriptorTable table, NormalizationOptions options)
    -> std::shared_ptr<EventClass> {
    se_log("EventClass::Create " + name, "EventClass");
    return std::make_shared<EventClass>(PrivateTag{}, std::move(name), std::move(table), options, nullptr);
}

auto EventClass::extend(std::string name, DescriptorTable const& table) -> std::shared_ptr<EventClass> {
    se_log("EventClass::extend " + this->name_ + " -> " + name, "EventClass");
    return std::make_shared<EventClass>(PrivateTag{},
                                        std::move(name),
                                        DescriptorTable::merge(this->interface_, table),
                                        this->options_,
                                        this->shared_from_this());
}

auto EventClass::acquire(DispatchConfig const*           dispatchConfig,
                         std::optional<TargetRef>        targetInst,
                         NativeEvent*                    nativeEvent,
                         std::optional<TargetRef> const& nativeEventTarget) -> std::unique_ptr<SyntheticEvent> {
    auto instance = this->pool_.take();
    if (!instance) {
        return this->construct(dispatchConfig, std::move(targetInst), nativeEvent, nativeEventTarget);
    }
    if (this->options_.log_pool_activity) {
        se_log("EventPool reuse " + this->name_ + " remaining=" + std::to_string(this->pool_.size()), "EventPool");
    }
    instance->construct(*this, dispatchConfig, std::move(targetInst), nativeEvent, nativeEventTarget);
    return instance;
}

auto EventClass::construct(DispatchConfig const*           dispatchConfig,
                           std::optional<TargetRef>        targetInst,
                           NativeEvent*                    nativeEvent,
                           std::optional<TargetRef> const& nativeEventTarget) -> std::unique_ptr<SyntheticEvent> {
    std::unique_ptr<SyntheticEvent> instance{new SyntheticEvent()};
    instance->construct(*this, dispatchConfig, std::move(targetInst), nativeEvent, nativeEventTarget);
    this->pool_.noteAllocation();
    return instance;
}

auto EventClass::release(std::unique_ptr<SyntheticEvent>& event) -> Expected<void> {
    if (!event) {
        return std::unexpected(Error{Error::Code::InvalidType, "Cannot release a null event into " + this->name_});
    }
    if (!this->isInstance(*event)) {
        auto owner = event->eventClass();
        se_log("EventClass::release type mismatch for " + this->name_, "EventClass", "ERROR");
        return std::unexpected(Error{Error::Code::TypeMismatch,
                                     "Trying to release an event instance of " + (owner ? owner->name() : std::string{"<expired class>"})
                                         + " into a pool of a different type (" + this->name_ + ")"});
    }

    event->reset();
    auto pooled = this->pool_.give(std::move(event));
    if (this->options_.log_pool_activity) {
        se_log("EventPool " + std::string(pooled ? "pooled " : "dropped ") + this->name_
                   + " size=" + std::to_string(this->pool_.size()),
               "EventPool");
    }
    return {};
}

auto EventClass::isInstance(SyntheticEvent const& event) const -> bool {
    auto owner = event.eventClass();
    return owner && owner->isSameOrDerivedFrom(*this);
}

auto EventClass::isSameOrDerivedFrom(EventClass const& other) const -> bool {
    for (auto const* cls = this; cls != nullptr; cls = cls->parent_.get()) {
        if (cls == &other) {
            return true;
        }
    }
    return false;
}

auto EventClass::lineage() const -> std::vector<std::string> {
    std::vector<std::string> chain;
    for (auto const* cls = this; cls != nullptr; cls = cls->parent_.get()) {
        chain.push_back(cls->name_);
    }
    std::reverse(chain.begin(), chain.end());
    return chain;
}

} // namespace SE
