#include "backend/DispatcherBackend.hpp"

#include "backend/CompletionSlot.hpp"
#include "core/MainThreadIdentity.hpp"
#include "core/TeardownSignal.hpp"
#include "log/TaggedLogger.hpp"

namespace HD {

DispatcherBackend::DispatcherBackend(BackendServices services)
    : services(services) {}

auto DispatcherBackend::isMainThread() const -> bool {
    if (this->services.identity != nullptr)
        return this->services.identity->isCurrentThreadMain();
    return isProcessInitialThread();
}

auto DispatcherBackend::blockOnDeferred(MainThreadTask task, std::optional<std::chrono::milliseconds> timeout)
        -> std::optional<Error> {
    auto slot = std::make_shared<CompletionSlot>();
    if (this->services.teardown != nullptr && !this->services.teardown->attach(slot))
        return Error{Error::Code::ShuttingDown, this->name() + ": host teardown in progress"};

    auto detach = [this, raw = slot.get()] {
        if (this->services.teardown != nullptr)
            this->services.teardown->detach(raw);
    };

    auto posted = this->runDeferred([slot, task = std::move(task)]() mutable {
        try {
            task();
            slot->complete();
        } catch (...) {
            slot->complete(std::current_exception());
        }
    });
    if (posted) {
        detach();
        return posted;
    }

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (timeout)
        deadline = std::chrono::steady_clock::now() + *timeout;

    CompletionSlot::Outcome outcome;
    {
        detail::WaitingScope waiting;
        outcome = slot->waitUntil(deadline);
    }
    detach();

    switch (outcome) {
    case CompletionSlot::Outcome::Completed:
        if (auto error = slot->takeError())
            std::rethrow_exception(error);
        return std::nullopt;
    case CompletionSlot::Outcome::TimedOut:
        hd_log(this->name() + ": main thread did not run the call within " + std::to_string(timeout->count()) + "ms", "Backend", "Warning");
        return Error{Error::Code::Timeout,
                     this->name() + ": main thread execution timed out after " + std::to_string(timeout->count()) + "ms"};
    case CompletionSlot::Outcome::Abandoned:
        return Error{Error::Code::ShuttingDown, this->name() + ": host teardown released the waiting caller"};
    }
    return Error{Error::Code::UnknownError, this->name() + ": unexpected completion state"};
}

auto DispatcherBackend::runInline(MainThreadTask& task) -> std::optional<Error> {
    task();
    return std::nullopt;
}

auto DispatcherBackend::runDetached(MainThreadTask& task, std::string_view origin) -> void {
    try {
        task();
    } catch (std::exception const& e) {
        hd_log("Error in deferred main thread call (" + std::string{origin} + "): " + e.what(), "Backend", "Error");
    } catch (...) {
        hd_log("Error in deferred main thread call (" + std::string{origin} + "): non-standard exception", "Backend", "Error");
    }
}

auto DispatcherBackend::deferredTrampoline(void* data) -> void {
    std::unique_ptr<DeferredCall> call{static_cast<DeferredCall*>(data)};
    detail::ServicingScope        servicing;
    runDetached(call->task, call->origin);
}

auto DispatcherBackend::nativeTrampoline(void* data) -> void {
    auto*                  call = static_cast<NativeCall*>(data);
    detail::ServicingScope servicing;
    try {
        (*call->task)();
    } catch (...) {
        call->error = std::current_exception();
    }
}

auto DispatcherBackend::unavailable() const -> Error {
    return Error{Error::Code::HostUnavailable, this->name() + ": host primitives are not installed"};
}

auto DispatcherBackend::refused(std::string_view primitive) const -> Error {
    return Error{Error::Code::HostRefused, this->name() + ": host refused the " + std::string{primitive}};
}

} // namespace HD
