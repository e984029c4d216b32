#pragma once

#include <synthevents/core/Error.hpp>
#include <synthevents/event/FieldValue.hpp>

#include <functional>
#include <optional>
#include <vector>

namespace SE {

// Collaborator consulted when the outermost batch exits.
class StateRestoreSource {
public:
    virtual ~StateRestoreSource() = default;

    [[nodiscard]] virtual auto needsStateRestore() const -> bool = 0;
    virtual auto restoreStateIfNeeded() -> void                   = 0;
};

/**
 * Tracks controlled components whose displayed value may have drifted from
 * the value the runtime owns. The restore algorithm itself is injected.
 */
class ControlledComponentQueue final : public StateRestoreSource {
public:
    using RestoreImpl = std::function<void(TargetRef const&)>;

    auto setRestoreImplementation(RestoreImpl impl) -> void;
    [[nodiscard]] auto hasRestoreImplementation() const -> bool { return static_cast<bool>(restoreImpl); }

    // Fails with NotSupported while no restore implementation is installed.
    [[nodiscard]] auto enqueueStateRestore(TargetRef target) -> Expected<void>;

    [[nodiscard]] auto needsStateRestore() const -> bool override;
    auto restoreStateIfNeeded() -> void override;

    [[nodiscard]] auto pendingCount() const -> std::size_t;

private:
    RestoreImpl              restoreImpl;
    std::optional<TargetRef> restoreTarget;
    std::vector<TargetRef>   restoreQueue;
};

} // namespace SE
