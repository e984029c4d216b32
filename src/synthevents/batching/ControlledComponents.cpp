#include <synthevents/batching/ControlledComponents.hpp>

#include "log/TaggedLogger.hpp"

namespace SE {

auto ControlledComponentQueue::setRestoreImplementation(RestoreImpl impl) -> void {
    this->restoreImpl = std::move(impl);
}

auto ControlledComponentQueue::enqueueStateRestore(TargetRef target) -> Expected<void> {
    if (!this->restoreImpl) {
        return std::unexpected(Error{Error::Code::NotSupported,
                                     "setRestoreImplementation() needs to be called to handle a target for controlled events"});
    }
    se_log("enqueueStateRestore " + target.path, "Controlled");
    if (this->restoreTarget) {
        this->restoreQueue.push_back(std::move(target));
    } else {
        this->restoreTarget = std::move(target);
    }
    return {};
}

auto ControlledComponentQueue::needsStateRestore() const -> bool {
    return this->restoreTarget.has_value() || !this->restoreQueue.empty();
}

auto ControlledComponentQueue::pendingCount() const -> std::size_t {
    return (this->restoreTarget ? 1u : 0u) + this->restoreQueue.size();
}

auto ControlledComponentQueue::restoreStateIfNeeded() -> void {
    if (!this->restoreTarget) {
        return;
    }
    // Detach before restoring; a restore may enqueue further targets.
    auto target  = std::move(*this->restoreTarget);
    auto targets = std::move(this->restoreQueue);
    this->restoreTarget.reset();
    this->restoreQueue.clear();

    se_log("restoreStateIfNeeded " + target.path + " (+" + std::to_string(targets.size()) + ")", "Controlled");
    this->restoreImpl(target);
    for (auto const& queued : targets) {
        this->restoreImpl(queued);
    }
}

} // namespace SE
