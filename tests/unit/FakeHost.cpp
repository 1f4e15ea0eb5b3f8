#include "FakeHost.hpp"

#include <chrono>
#include <future>

namespace HDTest {

FakeHost::FakeHost() {
    std::promise<std::thread::id> started;
    auto                          startedId = started.get_future();
    this->thread                            = std::thread([this, &started] {
        started.set_value(std::this_thread::get_id());
        this->loop();
    });
    this->loopId = startedId.get();
}

FakeHost::~FakeHost() {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->stopping = true;
        this->paused   = false;
    }
    this->cv.notify_all();
    if (this->thread.joinable())
        this->thread.join();
}

auto FakeHost::loopThreadId() const -> std::thread::id {
    return this->loopId;
}

auto FakeHost::onLoopThread() const -> bool {
    return std::this_thread::get_id() == this->loopId;
}

auto FakeHost::loop() -> void {
    std::unique_lock<std::mutex> lock(this->mutex);
    while (true) {
        this->cv.wait(lock, [this] { return this->stopping || (!this->paused && !this->queue.empty()); });
        if (this->queue.empty()) {
            // Stopping drains whatever is still queued first.
            return;
        }
        auto fn = std::move(this->queue.front());
        this->queue.pop_front();
        this->running = true;
        lock.unlock();
        fn();
        ++this->servicedCount;
        lock.lock();
        this->running = false;
        this->idleCv.notify_all();
    }
}

auto FakeHost::enqueue(std::function<void()> fn) -> bool {
    if (this->refusing)
        return false;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->stopping)
            return false;
        this->queue.push_back(std::move(fn));
    }
    this->cv.notify_all();
    return true;
}

auto FakeHost::post(std::function<void()> fn) -> void {
    (void)this->enqueue(std::move(fn));
}

auto FakeHost::postBlocking(std::function<void()> fn) -> bool {
    if (this->onLoopThread()) {
        fn();
        return true;
    }
    std::promise<void> done;
    auto               finished = done.get_future();
    if (!this->enqueue([&] {
            fn();
            done.set_value();
        }))
        return false;
    finished.wait();
    return true;
}

auto FakeHost::pause() -> void {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->paused = true;
}

auto FakeHost::resume() -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->paused = false;
    }
    this->cv.notify_all();
}

auto FakeHost::setRefusing(bool value) -> void {
    this->refusing = value;
}

auto FakeHost::drain() -> void {
    std::unique_lock<std::mutex> lock(this->mutex);
    this->idleCv.wait_for(lock, std::chrono::seconds(5), [this] { return this->queue.empty() && !this->running; });
}

auto FakeHost::serviced() const -> std::size_t {
    return this->servicedCount;
}

auto FakeHost::blockingCalls() const -> std::size_t {
    return this->blockingCount;
}

auto FakeHost::deferredCalls() const -> std::size_t {
    return this->deferredCount;
}

auto FakeHost::deferredEntry(void* host, HD::HostCallback callback, void* data) -> bool {
    auto* self = static_cast<FakeHost*>(host);
    ++self->deferredCount;
    return self->enqueue([callback, data] { callback(data); });
}

auto FakeHost::blockingEntry(void* host, HD::HostCallback callback, void* data) -> bool {
    auto* self = static_cast<FakeHost*>(host);
    if (self->refusing)
        return false;
    ++self->blockingCount;
    return self->postBlocking([callback, data] { callback(data); });
}

auto FakeHost::singleShotEntry(void* host, int, HD::HostCallback callback, void* data) -> bool {
    return deferredEntry(host, callback, data);
}

auto FakeHost::timerEntry(void* host, HD::HostTimerCallback callback, void* data, double) -> bool {
    auto* self = static_cast<FakeHost*>(host);
    ++self->deferredCount;
    // Re-arms while the callback asks for another interval, like bpy.app.timers.
    struct Timer {
        static auto fire(FakeHost* self, HD::HostTimerCallback callback, void* data) -> void {
            if (callback(data) >= 0.0)
                self->post([self, callback, data] { fire(self, callback, data); });
        }
    };
    return self->enqueue([self, callback, data] { Timer::fire(self, callback, data); });
}

auto FakeHost::tickEntry(void* host, HD::HostTickCallback callback, void* data) -> bool {
    auto* self = static_cast<FakeHost*>(host);
    ++self->deferredCount;
    struct Tick {
        static auto fire(FakeHost* self, HD::HostTickCallback callback, void* data) -> void {
            if (callback(data, 1.0f / 60.0f))
                self->post([self, callback, data] { fire(self, callback, data); });
        }
    };
    return self->enqueue([self, callback, data] { Tick::fire(self, callback, data); });
}

auto FakeHost::threadQuery(void* host) -> bool {
    return static_cast<FakeHost*>(host)->onLoopThread();
}

auto FakeHost::maya() -> HD::MayaHooks {
    return HD::MayaHooks{this, &FakeHost::deferredEntry, &FakeHost::blockingEntry};
}

auto FakeHost::houdini() -> HD::HoudiniHooks {
    return HD::HoudiniHooks{this, &FakeHost::deferredEntry, &FakeHost::blockingEntry};
}

auto FakeHost::nuke(bool withThreadQuery) -> HD::NukeHooks {
    return HD::NukeHooks{this, &FakeHost::deferredEntry, &FakeHost::blockingEntry,
                         withThreadQuery ? &FakeHost::threadQuery : nullptr};
}

auto FakeHost::blender() -> HD::BlenderHooks {
    return HD::BlenderHooks{this, &FakeHost::timerEntry};
}

auto FakeHost::max(bool withSingleShot, bool withThreadQuery) -> HD::MaxHooks {
    return HD::MaxHooks{this, withSingleShot ? &FakeHost::singleShotEntry : nullptr,
                        withThreadQuery ? &FakeHost::threadQuery : nullptr};
}

auto FakeHost::unreal(bool withThreadQuery) -> HD::UnrealHooks {
    return HD::UnrealHooks{this, &FakeHost::tickEntry, withThreadQuery ? &FakeHost::threadQuery : nullptr};
}

auto FakeHost::qt(bool withThreadQuery) -> HD::QtHooks {
    return HD::QtHooks{this, &FakeHost::singleShotEntry, withThreadQuery ? &FakeHost::threadQuery : nullptr};
}

} // namespace HDTest
