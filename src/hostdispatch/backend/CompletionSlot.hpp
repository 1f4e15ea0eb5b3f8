#pragma once

#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <utility>

namespace HD {

/**
 * One-shot rendezvous between a caller parked in a blocking dispatch and the
 * main-thread callback that services it.
 *
 * Always held through a shared_ptr by both sides: a caller may give up
 * (timeout, teardown) while the callback is still queued on the host, and the
 * late complete() must land on a live object. Whichever of complete() or
 * abandon() comes first settles the slot; later calls are ignored.
 */
class CompletionSlot {
public:
    enum class Outcome {
        Completed,
        TimedOut,
        Abandoned
    };

    // Returns false if the slot was already settled (the waiter is gone).
    auto complete(std::exception_ptr error = nullptr) -> bool {
        {
            std::lock_guard<std::mutex> lock(this->mutex);
            if (this->state != State::Pending)
                return false;
            this->state = State::Done;
            this->error = std::move(error);
        }
        this->cv.notify_all();
        return true;
    }

    auto abandon() -> void {
        {
            std::lock_guard<std::mutex> lock(this->mutex);
            if (this->state != State::Pending)
                return;
            this->state = State::Abandoned;
        }
        this->cv.notify_all();
    }

    // nullopt deadline waits until settled.
    auto waitUntil(std::optional<std::chrono::steady_clock::time_point> deadline) -> Outcome {
        std::unique_lock<std::mutex> lock(this->mutex);
        auto settled = [this] { return this->state != State::Pending; };
        if (deadline) {
            if (!this->cv.wait_until(lock, *deadline, settled)) {
                // Settle as timed out so a late complete() is recognised as such.
                this->state = State::TimedOut;
                return Outcome::TimedOut;
            }
        } else {
            this->cv.wait(lock, settled);
        }
        return this->state == State::Done ? Outcome::Completed : Outcome::Abandoned;
    }

    [[nodiscard]] auto takeError() -> std::exception_ptr {
        std::lock_guard<std::mutex> lock(this->mutex);
        return std::exchange(this->error, nullptr);
    }

    [[nodiscard]] auto settled() const -> bool {
        std::lock_guard<std::mutex> lock(this->mutex);
        return this->state != State::Pending;
    }

private:
    enum class State {
        Pending,
        Done,
        TimedOut,
        Abandoned
    };

    mutable std::mutex      mutex;
    std::condition_variable cv;
    State                   state = State::Pending;
    std::exception_ptr      error;
};

} // namespace HD
