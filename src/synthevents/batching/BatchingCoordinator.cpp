#include <synthevents/batching/BatchingCoordinator.hpp>

#include "log/TaggedLogger.hpp"

namespace SE {

BatchingCoordinator::BatchingCoordinator()
    : strategy_(std::make_shared<DefaultBatchingStrategy>()) {}

auto BatchingCoordinator::configure(std::shared_ptr<BatchingStrategy> strategy) -> void {
    if (!strategy) {
        strategy = std::make_shared<DefaultBatchingStrategy>();
    }
    se_log("BatchingCoordinator::configure", "Batching");
    this->strategy_ = std::move(strategy);
}

auto BatchingCoordinator::configure(FunctionBatchingStrategy::Runner  batchedImpl,
                                    FunctionBatchingStrategy::Runner  interactiveImpl,
                                    FunctionBatchingStrategy::Flusher flushImpl) -> void {
    this->configure(std::make_shared<FunctionBatchingStrategy>(std::move(batchedImpl),
                                                               std::move(interactiveImpl),
                                                               std::move(flushImpl)));
}

auto BatchingCoordinator::flushInteractive() -> void {
    this->strategy_->flushInteractiveUpdates();
}

auto BatchingCoordinator::finishOutermostBatch() -> void {
    // Runs with the flag already cleared so restoration can start batches of its own.
    if (this->restoreSource == nullptr || !this->restoreSource->needsStateRestore()) {
        return;
    }
    se_log("Outermost batch exit: restoring controlled state", "Batching");
    this->strategy_->flushInteractiveUpdates();
    this->restoreSource->restoreStateIfNeeded();
}

} // namespace SE
