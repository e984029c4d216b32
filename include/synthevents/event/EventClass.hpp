#pragma once

#include <synthevents/core/Error.hpp>
#include <synthevents/event/DescriptorTable.hpp>
#include <synthevents/event/EventPool.hpp>
#include <synthevents/event/SyntheticEvent.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace SE {

struct NormalizationOptions {
    // Treat `returnValue == false` as "default prevented" when the native
    // event carries no `defaultPrevented` field.
    bool        legacy_return_value_fallback = true;
    std::size_t pool_capacity                = kDefaultPoolCapacity;
    bool        log_pool_activity            = false;
};

/**
 * A synthetic event variant: a named descriptor table plus the free list of
 * recyclable instances built from it.
 *
 * Classes form a single-inheritance chain through extend(). Every class owns
 * its own pool; siblings and ancestors never share instances.
 */
class EventClass : public std::enable_shared_from_this<EventClass> {
    struct PrivateTag {};

public:
    EventClass(PrivateTag,
               std::string                 name,
               DescriptorTable             table,
               NormalizationOptions        options,
               std::shared_ptr<EventClass> parent);

    EventClass(EventClass const&)            = delete;
    EventClass& operator=(EventClass const&) = delete;

    [[nodiscard]] static auto Create(std::string name, DescriptorTable table, NormalizationOptions options = {})
        -> std::shared_ptr<EventClass>;

    // Derived class with the merged table and an independent pool.
    [[nodiscard]] auto extend(std::string name, DescriptorTable const& table) -> std::shared_ptr<EventClass>;

    [[nodiscard]] auto acquire(DispatchConfig const*           dispatchConfig,
                               std::optional<TargetRef>        targetInst,
                               NativeEvent*                    nativeEvent,
                               std::optional<TargetRef> const& nativeEventTarget = std::nullopt)
        -> std::unique_ptr<SyntheticEvent>;

    // Fresh unpooled instance; same observable contract as acquire().
    [[nodiscard]] auto construct(DispatchConfig const*           dispatchConfig,
                                 std::optional<TargetRef>        targetInst,
                                 NativeEvent*                    nativeEvent,
                                 std::optional<TargetRef> const& nativeEventTarget = std::nullopt)
        -> std::unique_ptr<SyntheticEvent>;

    /**
     * Reset the event and return it to this class's pool.
     *
     * Fails with Error::Code::TypeMismatch when the event is not an instance
     * of this class or of a class derived from it; the caller then keeps
     * ownership. On success `event` is left empty.
     */
    [[nodiscard]] auto release(std::unique_ptr<SyntheticEvent>& event) -> Expected<void>;

    [[nodiscard]] auto isInstance(SyntheticEvent const& event) const -> bool;
    [[nodiscard]] auto isSameOrDerivedFrom(EventClass const& other) const -> bool;

    [[nodiscard]] auto name() const -> std::string const& { return name_; }
    [[nodiscard]] auto interface() const -> DescriptorTable const& { return interface_; }
    [[nodiscard]] auto options() const -> NormalizationOptions const& { return options_; }
    [[nodiscard]] auto parent() const -> std::shared_ptr<EventClass> const& { return parent_; }
    [[nodiscard]] auto pool() -> EventPool& { return pool_; }
    [[nodiscard]] auto pool() const -> EventPool const& { return pool_; }

    // Class names from the root down to this class.
    [[nodiscard]] auto lineage() const -> std::vector<std::string>;

private:
    std::string                 name_;
    DescriptorTable             interface_;
    NormalizationOptions        options_;
    std::shared_ptr<EventClass> parent_;
    EventPool                   pool_;
};

} // namespace SE
