#pragma once

#include "backend/Reentrancy.hpp"
#include "host/HostHooksTable.hpp"

#include <memory>

namespace HD {

template <typename Post>
auto DispatcherBackend::postDeferred(Post&& post, MainThreadTask task) -> std::optional<Error> {
    auto call = std::make_unique<DeferredCall>(DeferredCall{std::move(task), this->name()});
    if (!std::forward<Post>(post)(&DispatcherBackend::deferredTrampoline, static_cast<void*>(call.get())))
        return this->refused("deferred call");
    // Ownership now belongs to the host queue; the trampoline deletes it.
    (void)call.release();
    return std::nullopt;
}

template <typename PostBlocking>
auto DispatcherBackend::blockOnNative(PostBlocking&& post, MainThreadTask task) -> std::optional<Error> {
    NativeCall call{&task, nullptr};
    {
        detail::WaitingScope waiting;
        if (!std::forward<PostBlocking>(post)(&DispatcherBackend::nativeTrampoline, static_cast<void*>(&call)))
            return this->refused("blocking call");
    }
    if (call.error)
        std::rethrow_exception(call.error);
    return std::nullopt;
}

template <typename H>
auto DispatcherBackend::hooks() const -> std::optional<H> {
    if (this->services.hooks == nullptr)
        return std::nullopt;
    return this->services.hooks->template lookup<H>();
}

} // namespace HD
