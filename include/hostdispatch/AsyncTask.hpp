#pragma once

#include <coroutine>
#include <deque>
#include <exception>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace HD {

/**
 * MainThreadRunner: ready queue that drives coroutines on the thread that
 * owns it. Host primitives cannot resume a suspended coroutine, so an
 * AsyncTask dispatched to the main thread runs to completion on one of these
 * inside the single marshaled call.
 */
class MainThreadRunner {
public:
    MainThreadRunner() = default;
    MainThreadRunner(MainThreadRunner const&)                    = delete;
    auto operator=(MainThreadRunner const&) -> MainThreadRunner& = delete;

    // Runner driving the calling thread, or nullptr.
    static auto current() -> MainThreadRunner* {
        return currentRunner();
    }

    auto schedule(std::coroutine_handle<> handle) -> void {
        this->ready.push_back(handle);
    }

    auto runUntilIdle() -> void {
        while (!this->ready.empty()) {
            auto handle = this->ready.front();
            this->ready.pop_front();
            handle.resume();
        }
    }

    class Scope {
    public:
        explicit Scope(MainThreadRunner& runner)
            : previous(std::exchange(currentRunner(), &runner)) {}
        ~Scope() {
            currentRunner() = this->previous;
        }
        Scope(Scope const&)            = delete;
        Scope& operator=(Scope const&) = delete;

    private:
        MainThreadRunner* previous;
    };

private:
    static auto currentRunner() -> MainThreadRunner*& {
        thread_local MainThreadRunner* runner = nullptr;
        return runner;
    }

    std::deque<std::coroutine_handle<>> ready;
};

// Gives other tasks queued on the current runner a turn. A no-op off a runner.
struct YieldToRunner {
    auto await_ready() const noexcept -> bool {
        return MainThreadRunner::current() == nullptr;
    }
    auto await_suspend(std::coroutine_handle<> handle) const -> void {
        MainThreadRunner::current()->schedule(handle);
    }
    auto await_resume() const noexcept -> void {}
};

inline auto yieldToRunner() -> YieldToRunner {
    return {};
}

template <typename T>
class AsyncTask;

namespace detail {

struct AsyncPromiseBase {
    struct FinalAwaiter {
        auto await_ready() const noexcept -> bool {
            return false;
        }
        template <typename Promise>
        auto await_suspend(std::coroutine_handle<Promise> handle) const noexcept -> std::coroutine_handle<> {
            if (auto continuation = handle.promise().continuation)
                return continuation;
            return std::noop_coroutine();
        }
        auto await_resume() const noexcept -> void {}
    };

    auto initial_suspend() const noexcept -> std::suspend_always {
        return {};
    }
    auto final_suspend() const noexcept -> FinalAwaiter {
        return {};
    }
    auto unhandled_exception() -> void {
        this->error = std::current_exception();
    }

    std::coroutine_handle<> continuation;
    std::exception_ptr      error;
};

template <typename T>
struct AsyncPromise : AsyncPromiseBase {
    auto get_return_object() -> AsyncTask<T>;

    template <typename U>
    auto return_value(U&& value) -> void {
        this->value.emplace(std::forward<U>(value));
    }

    auto result() -> T {
        if (this->error)
            std::rethrow_exception(this->error);
        return std::move(*this->value);
    }

    std::optional<T> value;
};

template <>
struct AsyncPromise<void> : AsyncPromiseBase {
    auto get_return_object() -> AsyncTask<void>;

    auto return_void() -> void {}

    auto result() -> void {
        if (this->error)
            std::rethrow_exception(this->error);
    }
};

} // namespace detail

/**
 * AsyncTask<T>: lazily started coroutine. Awaiting it from another AsyncTask
 * starts it and resumes the awaiter when it finishes; at the top level it is
 * started by driveToCompletion().
 */
template <typename T = void>
class AsyncTask {
public:
    using promise_type = detail::AsyncPromise<T>;
    using value_type   = T;

    AsyncTask(AsyncTask&& other) noexcept
        : handle(std::exchange(other.handle, {})) {}
    auto operator=(AsyncTask&& other) noexcept -> AsyncTask& {
        if (this != &other) {
            if (this->handle)
                this->handle.destroy();
            this->handle = std::exchange(other.handle, {});
        }
        return *this;
    }
    AsyncTask(AsyncTask const&)                    = delete;
    auto operator=(AsyncTask const&) -> AsyncTask& = delete;

    ~AsyncTask() {
        if (this->handle)
            this->handle.destroy();
    }

    auto await_ready() const noexcept -> bool {
        return false;
    }
    auto await_suspend(std::coroutine_handle<> awaiting) noexcept -> std::coroutine_handle<> {
        this->handle.promise().continuation = awaiting;
        return this->handle;
    }
    auto await_resume() -> T {
        return this->handle.promise().result();
    }

    [[nodiscard]] auto done() const -> bool {
        return this->handle && this->handle.done();
    }

private:
    template <typename U>
    friend auto driveToCompletion(AsyncTask<U> task) -> U;
    friend promise_type;

    explicit AsyncTask(std::coroutine_handle<promise_type> handle)
        : handle(handle) {}

    std::coroutine_handle<promise_type> handle;
};

namespace detail {

template <typename T>
auto AsyncPromise<T>::get_return_object() -> AsyncTask<T> {
    return AsyncTask<T>{std::coroutine_handle<AsyncPromise<T>>::from_promise(*this)};
}

inline auto AsyncPromise<void>::get_return_object() -> AsyncTask<void> {
    return AsyncTask<void>{std::coroutine_handle<AsyncPromise<void>>::from_promise(*this)};
}

template <typename>
inline constexpr bool kIsAsyncTask = false;
template <typename T>
inline constexpr bool kIsAsyncTask<AsyncTask<T>> = true;

} // namespace detail

template <typename T>
concept AsyncTaskType = detail::kIsAsyncTask<std::remove_cvref_t<T>>;

/**
 * Runs `task` on a fresh runner bound to the calling thread until it finishes
 * and returns its result (or rethrows what it threw). Throws std::logic_error
 * when the task is still suspended once the runner is idle, i.e. it awaited
 * something that only an outside event loop could resume.
 */
template <typename T>
auto driveToCompletion(AsyncTask<T> task) -> T {
    if (!task.handle)
        throw std::logic_error("driveToCompletion: empty AsyncTask");

    MainThreadRunner runner;
    {
        MainThreadRunner::Scope scope(runner);
        runner.schedule(task.handle);
        runner.runUntilIdle();
    }
    if (!task.handle.done())
        throw std::logic_error("AsyncTask suspended on something other than the main-thread runner");
    return task.handle.promise().result();
}

} // namespace HD
