#pragma once

#include <hostdispatch/MainThread.hpp>

#include "log/TaggedLogger.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <utility>

namespace HD {

/*
 * Wrappers that bake a dispatch policy into a callable, so call sites do not
 * repeat it. Each takes the Dispatcher to use (process default if omitted)
 * and copies `fn` into the returned callable.
 */

// Blocking. Runs inline when already on the main thread.
template <typename F>
auto ensureMainThread(F fn, Dispatcher dispatcher = Dispatcher{}) {
    return [fn = std::move(fn), dispatcher]<typename... Args>(Args&&... args) {
        if (dispatcher.isMainThread())
            return detail::invokeNow(fn, std::forward<Args>(args)...);
        return dispatcher.call(fn, std::forward<Args>(args)...);
    };
}

// Always queued, even from the main thread; the result is discarded.
template <typename F>
auto deferToMainThread(F fn, Dispatcher dispatcher = Dispatcher{}) {
    return [fn = std::move(fn), dispatcher]<typename... Args>(Args&&... args) -> void {
        dispatcher.post(fn, std::forward<Args>(args)...);
    };
}

// Inline on the main thread, queued from anywhere else.
template <typename F>
auto hostThreadSafeAsync(F fn, Dispatcher dispatcher = Dispatcher{}) {
    return [fn = std::move(fn), dispatcher]<typename... Args>(Args&&... args) -> void {
        if (dispatcher.isMainThread()) {
            (void)std::invoke(fn, std::forward<Args>(args)...);
            return;
        }
        hd_log("Queueing callback for the main thread", "Dispatch", "Debug");
        dispatcher.post(fn, std::forward<Args>(args)...);
    };
}

template <typename F>
auto ensureMainThreadWithTimeout(std::chrono::milliseconds timeout, F fn, Dispatcher dispatcher = Dispatcher{}) {
    return [fn = std::move(fn), dispatcher, timeout]<typename... Args>(Args&&... args) {
        if (dispatcher.isMainThread())
            return detail::invokeNow(fn, std::forward<Args>(args)...);
        return dispatcher.callFor(timeout, fn, std::forward<Args>(args)...);
    };
}

/**
 * For callables returning AsyncTask<T>. The task is driven to completion in a
 * single main-thread call; the caller gets a std::future<T>. On the main
 * thread the task runs immediately and the future is already ready.
 */
template <typename F>
auto ensureMainThreadAsync(F fn, Dispatcher dispatcher = Dispatcher{}) {
    return [fn = std::move(fn), dispatcher]<typename... Args>(Args&&... args) {
        auto bound     = detail::bindCall(fn, std::forward<Args>(args)...);
        using TaskType = detail::BoundResult<decltype(bound)>;
        static_assert(AsyncTaskType<TaskType>, "ensureMainThreadAsync expects a callable returning AsyncTask");
        using T = typename std::remove_cvref_t<TaskType>::value_type;

        std::promise<T> promise;
        auto            future = promise.get_future();
        auto drive = [bound = std::move(bound), promise = std::move(promise)]() mutable {
            try {
                if constexpr (std::is_void_v<T>) {
                    driveToCompletion(bound());
                    promise.set_value();
                } else {
                    promise.set_value(driveToCompletion(bound()));
                }
            } catch (...) {
                promise.set_exception(std::current_exception());
            }
        };
        if (dispatcher.isMainThread())
            drive();
        else
            dispatcher.post(std::move(drive));
        return future;
    };
}

enum class CallbackMode {
    Blocking,
    FireAndForget
};

// Wraps a callback a host (or a bridge layer) will invoke from arbitrary threads.
template <CallbackMode Mode, typename F>
auto wrapCallbackForHost(F callback, Dispatcher dispatcher = Dispatcher{}) {
    if constexpr (Mode == CallbackMode::FireAndForget)
        return hostThreadSafeAsync(std::move(callback), dispatcher);
    else
        return ensureMainThread(std::move(callback), dispatcher);
}

} // namespace HD
