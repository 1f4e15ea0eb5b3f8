#pragma once

#include <hostdispatch/MainThread.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <utility>

namespace HD {

/**
 * ThreadSafeObject<T>: routes every use of a main-thread-only object through
 * a Dispatcher, so the object can be handed to worker threads.
 *
 *   ThreadSafeObject<Scene> scene{sceneOwner};
 *   auto count = scene.call(&Scene::nodeCount);     // blocking
 *   scene.post(&Scene::rename, node, "hero");       // fire-and-forget
 *
 * `member` is anything std::invoke accepts with a T& as first argument.
 * The wrapper shares ownership of the target, so a posted call keeps it alive
 * until it ran.
 */
template <typename T>
class ThreadSafeObject {
public:
    explicit ThreadSafeObject(std::shared_ptr<T> target, Dispatcher dispatcher = Dispatcher{})
        : object(std::move(target)), dispatcher(dispatcher) {}

    template <typename M, typename... Args>
    auto call(M member, Args&&... args) const -> decltype(auto) {
        return this->dispatcher.call(bindMember(this->object, member), std::forward<Args>(args)...);
    }

    template <typename M, typename... Args>
    auto callFor(std::chrono::milliseconds timeout, M member, Args&&... args) const -> decltype(auto) {
        return this->dispatcher.callFor(timeout, bindMember(this->object, member), std::forward<Args>(args)...);
    }

    template <typename M, typename... Args>
    auto post(M member, Args&&... args) const -> void {
        this->dispatcher.post(bindMember(this->object, member), std::forward<Args>(args)...);
    }

    // Blocking; fn receives T& on the main thread.
    template <typename F>
    auto with(F&& fn) const -> decltype(auto) {
        return this->dispatcher.call(
                [target = this->object, fn = std::forward<F>(fn)]() mutable -> decltype(auto) { return std::invoke(fn, *target); });
    }

    // Direct access for code already on the main thread.
    auto target() const -> std::shared_ptr<T> const& {
        return this->object;
    }

private:
    template <typename M>
    static auto bindMember(std::shared_ptr<T> target, M member) {
        return [target = std::move(target), member]<typename... Args>(Args&&... args) -> decltype(auto) {
            return std::invoke(member, *target, std::forward<Args>(args)...);
        };
    }

    std::shared_ptr<T> object;
    Dispatcher         dispatcher;
};

} // namespace HD
