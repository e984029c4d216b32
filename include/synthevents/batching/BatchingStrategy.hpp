#pragma once

#include <functional>
#include <memory>

namespace SE {

/**
 * Host-provided policy deciding how batched and interactive work is executed.
 * Every operation must run `work` synchronously before returning and let its
 * exceptions propagate.
 */
class BatchingStrategy {
public:
    using Work = std::function<void()>;

    virtual ~BatchingStrategy() = default;

    virtual auto batchedUpdates(Work const& work) -> void     = 0;
    virtual auto interactiveUpdates(Work const& work) -> void = 0;
    virtual auto flushInteractiveUpdates() -> void            = 0;
};

// Runs work inline; flushing is a no-op.
class DefaultBatchingStrategy final : public BatchingStrategy {
public:
    auto batchedUpdates(Work const& work) -> void override { work(); }
    auto interactiveUpdates(Work const& work) -> void override { work(); }
    auto flushInteractiveUpdates() -> void override {}
};

// Adapts three callables; an empty callable falls back to the default behaviour.
class FunctionBatchingStrategy final : public BatchingStrategy {
public:
    using Runner  = std::function<void(Work const&)>;
    using Flusher = std::function<void()>;

    FunctionBatchingStrategy(Runner batched, Runner interactive, Flusher flush)
        : batched_(std::move(batched)), interactive_(std::move(interactive)), flush_(std::move(flush)) {}

    auto batchedUpdates(Work const& work) -> void override {
        if (batched_) {
            batched_(work);
        } else {
            work();
        }
    }

    auto interactiveUpdates(Work const& work) -> void override {
        if (interactive_) {
            interactive_(work);
        } else {
            work();
        }
    }

    auto flushInteractiveUpdates() -> void override {
        if (flush_) {
            flush_();
        }
    }

private:
    Runner  batched_;
    Runner  interactive_;
    Flusher flush_;
};

} // namespace SE
