#pragma once

#include <synthevents/core/Error.hpp>
#include <synthevents/event/EventClass.hpp>

#include <cstddef>
#include <string_view>

namespace SE {

struct RuntimeOptions {
    // Honour `returnValue == false` on native events lacking `defaultPrevented`.
    bool        legacy_return_value_fallback = true;
    std::size_t pool_capacity                = kDefaultPoolCapacity;
    bool        log_pool_activity            = false;

    [[nodiscard]] auto normalization() const -> NormalizationOptions {
        return NormalizationOptions{.legacy_return_value_fallback = legacy_return_value_fallback,
                                    .pool_capacity                = pool_capacity,
                                    .log_pool_activity            = log_pool_activity};
    }
};

/**
 * Apply environment overrides on top of `base`:
 *   SYNTHEVENTS_LEGACY_RETURN_VALUE  flag
 *   SYNTHEVENTS_POOL_CAPACITY        unsigned integer
 *   SYNTHEVENTS_DEBUG_POOLS          flag
 * Flags are true when set to anything but 0/false/off/no; an empty value is true.
 * Unparsable capacities and capacities above kMaxPoolCapacity are ignored.
 */
[[nodiscard]] auto LoadRuntimeOptionsFromEnv(RuntimeOptions base = {}) -> RuntimeOptions;

// Reads the same settings from a JSON object, e.g. {"pool_capacity": 4}.
[[nodiscard]] auto ParseRuntimeOptions(std::string_view jsonText, RuntimeOptions base = {}) -> Expected<RuntimeOptions>;

// CapacityExceeded when `capacity` is above kMaxPoolCapacity.
[[nodiscard]] auto checkPoolCapacity(std::size_t capacity) -> Expected<void>;

// Flag parsing shared by the environment loader.
[[nodiscard]] auto parseTruthyFlag(char const* value) -> bool;

} // namespace SE
