#pragma once

#include <hostdispatch/AsyncTask.hpp>
#include <hostdispatch/Exceptions.hpp>

#include "backend/DispatcherBackend.hpp"
#include "core/DispatchContext.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

namespace HD {

namespace detail {

// Copies the callable and its arguments so the call can outlive the caller's
// frame (a timed-out blocking dispatch may still run later).
template <typename F, typename... Args>
auto bindCall(F&& fn, Args&&... args) {
    return [fn = std::forward<F>(fn), args = std::make_tuple(std::forward<Args>(args)...)]() mutable -> decltype(auto) {
        return std::apply(std::move(fn), std::move(args));
    };
}

template <typename Bound>
using BoundResult = decltype(std::declval<Bound&>()());

// What a blocking dispatch hands back for a callable returning R: lvalue
// references pass through, everything else arrives as a value.
template <typename R>
using Returned = std::conditional_t<std::is_lvalue_reference_v<R>, R, std::remove_cvref_t<R>>;

template <typename R>
class ResultSlot {
public:
    template <typename Bound>
    auto fill(Bound& bound) -> void {
        if constexpr (std::is_void_v<R>) {
            bound();
        } else if constexpr (std::is_lvalue_reference_v<R>) {
            this->value.emplace(std::addressof(bound()));
        } else {
            this->value.emplace(bound());
        }
    }

    auto take() -> Returned<R> {
        if constexpr (std::is_void_v<R>) {
            return;
        } else if constexpr (std::is_lvalue_reference_v<R>) {
            return **this->value;
        } else {
            return std::move(*this->value);
        }
    }

private:
    using Stored = std::conditional_t<std::is_lvalue_reference_v<R>, std::remove_reference_t<R>*, std::remove_cvref_t<R>>;
    std::optional<std::conditional_t<std::is_void_v<R>, bool, Stored>> value;
};

template <typename F, typename... Args>
using CallResult = Returned<BoundResult<decltype(bindCall(std::declval<F>(), std::declval<Args>()...))>>;

// Same result shape as a blocking dispatch, computed on the calling thread.
template <typename F, typename... Args>
auto invokeNow(F&& fn, Args&&... args) -> CallResult<F, Args...> {
    auto bound = bindCall(std::forward<F>(fn), std::forward<Args>(args)...);
    ResultSlot<BoundResult<decltype(bound)>> slot;
    slot.fill(bound);
    return slot.take();
}

} // namespace detail

/**
 * Dispatcher: the public call surface. Resolves the active backend through
 * its context's registry on every call (a cached atomic read in steady state)
 * and translates backend failures into the ThreadSafetyError family.
 *
 * Arguments are copied (decayed) into the marshaled call; pass std::ref to
 * share an object with the main thread.
 */
class Dispatcher {
public:
    Dispatcher()
        : Dispatcher(DispatchContext::Instance()) {}
    explicit Dispatcher(DispatchContext& context)
        : ctx(&context) {}

    // Fire-and-forget. Exceptions thrown by fn are logged on the main thread.
    template <typename F, typename... Args>
    auto post(F&& fn, Args&&... args) const -> void {
        auto backend = this->backendForDispatch();
        auto bound   = detail::bindCall(std::forward<F>(fn), std::forward<Args>(args)...);
        if (auto error = backend->runDeferred([bound = std::move(bound)]() mutable { (void)bound(); }))
            raise(*error);
    }

    // Blocks until fn ran on the main thread; fn's exceptions are rethrown here.
    template <typename F, typename... Args>
    auto call(F&& fn, Args&&... args) const -> detail::CallResult<F, Args...> {
        return this->dispatchSync(std::nullopt, detail::bindCall(std::forward<F>(fn), std::forward<Args>(args)...));
    }

    // As call(), but throws ThreadDispatchTimeoutError once `timeout` elapsed.
    template <typename F, typename... Args>
    auto callFor(std::chrono::milliseconds timeout, F&& fn, Args&&... args) const -> detail::CallResult<F, Args...> {
        return this->dispatchSync(timeout, detail::bindCall(std::forward<F>(fn), std::forward<Args>(args)...));
    }

    // fn returns an AsyncTask; it is driven to completion inside one marshaled call.
    template <typename F, typename... Args>
    auto callAsync(F&& fn, Args&&... args) const {
        auto bound = detail::bindCall(std::forward<F>(fn), std::forward<Args>(args)...);
        static_assert(AsyncTaskType<detail::BoundResult<decltype(bound)>>, "callAsync expects a callable returning AsyncTask");
        return this->call([bound = std::move(bound)]() mutable { return driveToCompletion(bound()); });
    }

    [[nodiscard]] auto isMainThread() const -> bool;

    // Active backend; throws DispatcherConfigurationError if none resolves.
    [[nodiscard]] auto backend() const -> std::shared_ptr<DispatcherBackend>;

    auto context() const -> DispatchContext& {
        return *this->ctx;
    }

private:
    template <typename Bound>
    auto dispatchSync(std::optional<std::chrono::milliseconds> timeout, Bound bound) const
            -> detail::Returned<detail::BoundResult<Bound>> {
        auto backend = this->backendForDispatch();
        checkReentrancy(*backend);
        auto slot = std::make_shared<detail::ResultSlot<detail::BoundResult<Bound>>>();
        if (auto error = backend->runSync([slot, bound = std::move(bound)]() mutable { slot->fill(bound); }, timeout))
            raise(*error);
        return slot->take();
    }

    // Refuses new work once teardown began.
    auto backendForDispatch() const -> std::shared_ptr<DispatcherBackend>;
    static auto checkReentrancy(DispatcherBackend const& backend) -> void;
    [[noreturn]] static auto raise(Error const& error) -> void;

    DispatchContext* ctx;
};

template <typename F, typename... Args>
auto runOnMainThread(F&& fn, Args&&... args) -> void {
    Dispatcher{}.post(std::forward<F>(fn), std::forward<Args>(args)...);
}

template <typename F, typename... Args>
auto runOnMainThreadSync(F&& fn, Args&&... args) -> detail::CallResult<F, Args...> {
    return Dispatcher{}.call(std::forward<F>(fn), std::forward<Args>(args)...);
}

template <typename F, typename... Args>
auto runOnMainThreadSyncWithTimeout(std::chrono::milliseconds timeout, F&& fn, Args&&... args)
        -> detail::CallResult<F, Args...> {
    return Dispatcher{}.callFor(timeout, std::forward<F>(fn), std::forward<Args>(args)...);
}

template <typename F, typename... Args>
auto runOnMainThreadAsync(F&& fn, Args&&... args) {
    return Dispatcher{}.callAsync(std::forward<F>(fn), std::forward<Args>(args)...);
}

inline auto isMainThread() -> bool {
    return Dispatcher{}.isMainThread();
}

} // namespace HD
