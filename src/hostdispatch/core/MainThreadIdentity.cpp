#include "core/MainThreadIdentity.hpp"

#include <sys/syscall.h>
#include <unistd.h>

namespace HD {

auto isProcessInitialThread() -> bool {
    return static_cast<pid_t>(::syscall(SYS_gettid)) == ::getpid();
}

auto MainThreadIdentity::designate(std::thread::id id) -> void {
    this->designatedId.store(id, std::memory_order_release);
}

auto MainThreadIdentity::designateCurrent() -> void {
    this->designate(std::this_thread::get_id());
}

auto MainThreadIdentity::reset() -> void {
    this->designatedId.store(std::thread::id{}, std::memory_order_release);
}

auto MainThreadIdentity::designated() const -> std::optional<std::thread::id> {
    auto const id = this->designatedId.load(std::memory_order_acquire);
    if (id == std::thread::id{})
        return std::nullopt;
    return id;
}

auto MainThreadIdentity::isCurrentThreadMain() const -> bool {
    if (auto id = this->designated())
        return *id == std::this_thread::get_id();
    return isProcessInitialThread();
}

} // namespace HD
