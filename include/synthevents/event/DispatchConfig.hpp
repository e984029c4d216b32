#pragma once

#include <optional>
#include <string>

namespace SE {

// Per-dispatch configuration; opaque to the event itself, read by dispatch plugins.
struct DispatchConfig {
    std::string                registration_name;
    std::optional<std::string> bubbled_name;
    std::optional<std::string> captured_name;
};

} // namespace SE
