#include <synthevents/runtime/RuntimeOptions.hpp>

#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string>

namespace SE {

namespace {

using Json = nlohmann::json;

auto parseCapacity(char const* value) -> std::optional<std::size_t> {
    if (value == nullptr) {
        return std::nullopt;
    }
    std::string_view text{value};
    std::size_t      parsed = 0;
    auto [ptr, ec]          = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return parsed;
}

} // namespace

auto checkPoolCapacity(std::size_t capacity) -> Expected<void> {
    if (capacity > kMaxPoolCapacity) {
        return std::unexpected(Error{Error::Code::CapacityExceeded,
                                     "pool_capacity " + std::to_string(capacity) + " exceeds the limit of "
                                         + std::to_string(kMaxPoolCapacity)});
    }
    return {};
}

auto parseTruthyFlag(char const* value) -> bool {
    if (value == nullptr) {
        return false;
    }
    std::string_view text{value};
    auto is_space = [](char ch) {
        return ch == ' ' || ch == '\t' || ch == '\n';
    };
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return true;
    }
    std::string normalized;
    normalized.reserve(text.size());
    for (char ch : text) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return !(normalized == "0" || normalized == "false" || normalized == "off" || normalized == "no");
}

auto LoadRuntimeOptionsFromEnv(RuntimeOptions base) -> RuntimeOptions {
    if (char const* legacy = std::getenv("SYNTHEVENTS_LEGACY_RETURN_VALUE")) {
        base.legacy_return_value_fallback = parseTruthyFlag(legacy);
    }
    if (auto capacity = parseCapacity(std::getenv("SYNTHEVENTS_POOL_CAPACITY"))) {
        if (auto checked = checkPoolCapacity(*capacity); checked) {
            base.pool_capacity = *capacity;
        } else {
            se_log("SYNTHEVENTS_POOL_CAPACITY ignored: " + describeError(checked.error()), "Config", "ERROR");
        }
    }
    if (char const* debugPools = std::getenv("SYNTHEVENTS_DEBUG_POOLS")) {
        base.log_pool_activity = parseTruthyFlag(debugPools);
    }
    return base;
}

auto ParseRuntimeOptions(std::string_view jsonText, RuntimeOptions base) -> Expected<RuntimeOptions> {
    auto doc = Json::parse(jsonText, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Runtime options must be a JSON object"});
    }

    for (auto const& [key, value] : doc.items()) {
        if (key == "legacy_return_value_fallback" || key == "log_pool_activity") {
            if (!value.is_boolean()) {
                return std::unexpected(Error{Error::Code::InvalidType, key + " must be a boolean"});
            }
            (key == "log_pool_activity" ? base.log_pool_activity : base.legacy_return_value_fallback) = value.get<bool>();
        } else if (key == "pool_capacity") {
            if (!value.is_number_unsigned()) {
                return std::unexpected(Error{Error::Code::InvalidType, "pool_capacity must be an unsigned integer"});
            }
            auto capacity = value.get<std::size_t>();
            if (auto checked = checkPoolCapacity(capacity); !checked) {
                return std::unexpected(checked.error());
            }
            base.pool_capacity = capacity;
        } else {
            se_log("ParseRuntimeOptions: unknown key " + key, "Config", "ERROR");
            return std::unexpected(Error{Error::Code::InvalidType, "Unknown runtime option: " + key});
        }
    }
    return base;
}

} // namespace SE
