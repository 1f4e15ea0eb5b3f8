#include <hostdispatch/MainThread.hpp>

#include "backend/Reentrancy.hpp"
#include "log/TaggedLogger.hpp"

namespace HD {

auto Dispatcher::isMainThread() const -> bool {
    return this->backend()->isMainThread();
}

auto Dispatcher::backend() const -> std::shared_ptr<DispatcherBackend> {
    auto resolved = this->ctx->resolveBackend();
    if (!resolved)
        raise(resolved.error());
    return std::move(resolved).value();
}

auto Dispatcher::backendForDispatch() const -> std::shared_ptr<DispatcherBackend> {
    if (this->ctx->isShuttingDown())
        throw ShutdownInProgressError("Host is shutting down; main thread dispatch refused");
    return this->backend();
}

auto Dispatcher::checkReentrancy(DispatcherBackend const& backend) -> void {
    if (!backend.enforcesAffinity() || backend.isMainThread())
        return;
    auto const servicing = detail::servicingDepth();
    auto const waiting   = detail::waitingDepth();
    if (servicing == 0 && waiting == 0)
        return;
    hd_log(backend.name() + ": blocking dispatch from a thread already inside one (servicing=" + std::to_string(servicing)
                   + ", waiting=" + std::to_string(waiting) + ")",
           "Dispatch", "Error");
    throw DeadlockDetectedError(backend.name()
                                + ": blocking dispatch issued from inside another blocking dispatch on the same thread");
}

auto Dispatcher::raise(Error const& error) -> void {
    auto const message = error.message.value_or(std::string{errorCodeToString(error.code)});
    switch (error.code) {
    case Error::Code::Timeout:
        throw ThreadDispatchTimeoutError(message);
    case Error::Code::ShuttingDown:
        throw ShutdownInProgressError(message);
    case Error::Code::NoBackend:
        throw DispatcherConfigurationError(message);
    default:
        throw ThreadSafetyError(describeError(error));
    }
}

} // namespace HD
