#pragma once

#include <synthevents/batching/BatchingStrategy.hpp>
#include <synthevents/batching/ControlledComponents.hpp>

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace SE {

/**
 * Reentrancy guard around the host's batching strategy.
 *
 * Only the outermost runBatched call owns the batch: once its body has
 * finished, successfully or not, the batching flag is cleared and then the
 * state restore source is consulted. Nested calls run their body inline.
 *
 * Single-threaded; configure() must not be called while a batch is running.
 */
class BatchingCoordinator {
public:
    BatchingCoordinator();

    BatchingCoordinator(BatchingCoordinator const&)            = delete;
    BatchingCoordinator& operator=(BatchingCoordinator const&) = delete;

    auto configure(std::shared_ptr<BatchingStrategy> strategy) -> void;
    auto configure(FunctionBatchingStrategy::Runner  batchedImpl,
                   FunctionBatchingStrategy::Runner  interactiveImpl,
                   FunctionBatchingStrategy::Flusher flushImpl) -> void;

    // Borrowed; pass nullptr to detach.
    auto setStateRestoreSource(StateRestoreSource* source) -> void { restoreSource = source; }

    [[nodiscard]] auto isBatching() const -> bool { return batching; }
    [[nodiscard]] auto strategy() const -> BatchingStrategy& { return *strategy_; }

    template <typename Fn, typename Bookkeeping>
    auto runBatched(Fn&& fn, Bookkeeping&& bookkeeping) -> std::invoke_result_t<Fn, Bookkeeping> {
        using Result = std::invoke_result_t<Fn, Bookkeeping>;

        if (this->batching) {
            // The outer call restores state once everything has propagated.
            return std::invoke(std::forward<Fn>(fn), std::forward<Bookkeeping>(bookkeeping));
        }

        std::exception_ptr failure;
        if constexpr (std::is_void_v<Result>) {
            {
                BatchScope scope{*this};
                try {
                    this->strategy_->batchedUpdates(
                        [&] { std::invoke(std::forward<Fn>(fn), std::forward<Bookkeeping>(bookkeeping)); });
                } catch (...) {
                    failure = std::current_exception();
                }
            }
            this->finishOutermostBatch();
            if (failure) {
                std::rethrow_exception(failure);
            }
        } else {
            std::optional<Result> result;
            {
                BatchScope scope{*this};
                try {
                    this->strategy_->batchedUpdates(
                        [&] { result.emplace(std::invoke(std::forward<Fn>(fn), std::forward<Bookkeeping>(bookkeeping))); });
                } catch (...) {
                    failure = std::current_exception();
                }
            }
            this->finishOutermostBatch();
            if (failure) {
                std::rethrow_exception(failure);
            }
            if (!result) {
                throw std::logic_error("batching strategy returned without running the batch body");
            }
            return std::move(*result);
        }
    }

    template <typename Fn>
    auto runBatched(Fn&& fn) -> std::invoke_result_t<Fn> {
        return this->runBatched(
            [&fn](std::nullptr_t) -> std::invoke_result_t<Fn> { return std::invoke(std::forward<Fn>(fn)); }, nullptr);
    }

    template <typename Fn, typename A, typename B>
    auto runInteractive(Fn&& fn, A&& a, B&& b) -> std::invoke_result_t<Fn, A, B> {
        using Result = std::invoke_result_t<Fn, A, B>;
        if constexpr (std::is_void_v<Result>) {
            this->strategy_->interactiveUpdates(
                [&] { std::invoke(std::forward<Fn>(fn), std::forward<A>(a), std::forward<B>(b)); });
        } else {
            std::optional<Result> result;
            this->strategy_->interactiveUpdates(
                [&] { result.emplace(std::invoke(std::forward<Fn>(fn), std::forward<A>(a), std::forward<B>(b))); });
            if (!result) {
                throw std::logic_error("batching strategy returned without running the interactive update");
            }
            return std::move(*result);
        }
    }

    auto flushInteractive() -> void;

private:
    // Holds the batching flag for one outermost batch; cleared on every exit path.
    class BatchScope {
    public:
        explicit BatchScope(BatchingCoordinator& owner) : owner(owner) { owner.batching = true; }
        ~BatchScope() { owner.batching = false; }

        BatchScope(BatchScope const&)            = delete;
        BatchScope& operator=(BatchScope const&) = delete;

    private:
        BatchingCoordinator& owner;
    };

    auto finishOutermostBatch() -> void;

    std::shared_ptr<BatchingStrategy> strategy_;
    StateRestoreSource*               restoreSource = nullptr;
    bool                              batching      = false;
};

} // namespace SE
