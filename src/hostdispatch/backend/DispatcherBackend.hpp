#pragma once

#include "core/Config.hpp"
#include "core/Error.hpp"

#include <hostdispatch/HostHooks.hpp>

#include <chrono>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace HD {

class HostHooksTable;
class MainThreadIdentity;
class TeardownSignal;

using MainThreadTask = std::move_only_function<void()>;

// Process state a backend needs; owned by the DispatchContext that created it.
struct BackendServices {
    HostHooksTable const*     hooks    = nullptr;
    MainThreadIdentity const* identity = nullptr;
    TeardownSignal*           teardown = nullptr;
    std::chrono::milliseconds syncTimeout{kDefaultSyncTimeout};
};

/**
 * DispatcherBackend: adapter from the uniform dispatch contract to one host's
 * deferred and blocking primitives.
 *
 * Contract
 * --------
 * - isAvailable() probes the host handshake; it never throws and never blocks.
 * - runDeferred() schedules the task exactly once on the host main thread and
 *   returns immediately. Exceptions escaping the task are logged, never
 *   reported to the caller.
 * - runSync() runs the task on the main thread and blocks until it finished.
 *   On the main thread it runs inline. An exception escaping the task is
 *   rethrown unchanged in the caller. With a timeout (or when the host has no
 *   native blocking primitive) the wait is bounded and reported as
 *   Error::Code::Timeout.
 * - Dispatch failures (host refused, host gone, teardown) are returned as
 *   Error values; translating them into exceptions is the facade's job.
 */
class DispatcherBackend {
public:
    explicit DispatcherBackend(BackendServices services);
    virtual ~DispatcherBackend() = default;

    DispatcherBackend(DispatcherBackend const&)                    = delete;
    auto operator=(DispatcherBackend const&) -> DispatcherBackend& = delete;

    [[nodiscard]] virtual auto name() const -> std::string        = 0;
    [[nodiscard]] virtual auto isAvailable() const noexcept -> bool = 0;

    virtual auto runDeferred(MainThreadTask task) -> std::optional<Error> = 0;
    virtual auto runSync(MainThreadTask task, std::optional<std::chrono::milliseconds> timeout = std::nullopt)
            -> std::optional<Error> = 0;

    [[nodiscard]] virtual auto isMainThread() const -> bool;

    // False for backends that run work on the calling thread regardless of affinity.
    [[nodiscard]] virtual auto enforcesAffinity() const -> bool {
        return true;
    }

    [[nodiscard]] virtual auto hasNativeBlocking() const -> bool {
        return false;
    }

protected:
    // Hands a heap-owned task to a one-shot host primitive. `post` receives the
    // trampoline and its payload and returns whether the host accepted it.
    template <typename Post>
    auto postDeferred(Post&& post, MainThreadTask task) -> std::optional<Error>;

    // Blocking dispatch built from runDeferred() plus a completion slot.
    auto blockOnDeferred(MainThreadTask task, std::optional<std::chrono::milliseconds> timeout) -> std::optional<Error>;

    // Blocking dispatch through a host primitive that only returns once the callback ran.
    template <typename PostBlocking>
    auto blockOnNative(PostBlocking&& post, MainThreadTask task) -> std::optional<Error>;

    // Inline execution on the current thread; exceptions propagate.
    static auto runInline(MainThreadTask& task) -> std::optional<Error>;

    // Runs a task handed over by a deferred primitive, logging anything it throws.
    static auto runDetached(MainThreadTask& task, std::string_view origin) -> void;

    template <typename H>
    [[nodiscard]] auto hooks() const -> std::optional<H>;

    [[nodiscard]] auto unavailable() const -> Error;
    [[nodiscard]] auto refused(std::string_view primitive) const -> Error;

    // Host-facing entry points; `data` is a DeferredCall / NativeCall.
    static auto deferredTrampoline(void* data) -> void;
    static auto nativeTrampoline(void* data) -> void;

    BackendServices services;

private:
    struct DeferredCall {
        MainThreadTask task;
        std::string    origin;
    };

    struct NativeCall {
        MainThreadTask*    task;
        std::exception_ptr error;
    };
};

} // namespace HD

#include "backend/DispatcherBackend.inl"
