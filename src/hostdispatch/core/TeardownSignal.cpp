#include "core/TeardownSignal.hpp"

#include "backend/CompletionSlot.hpp"
#include "log/TaggedLogger.hpp"

#include <vector>

namespace HD {

auto TeardownSignal::begin() -> void {
    std::vector<std::shared_ptr<CompletionSlot>> toAbandon;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->flag.exchange(true))
            return;
        for (auto const& [key, weak] : this->parked) {
            if (auto slot = weak.lock())
                toAbandon.push_back(std::move(slot));
        }
        this->parked.clear();
    }
    hd_log("TeardownSignal: teardown begun, releasing " + std::to_string(toAbandon.size()) + " parked caller(s)", "Dispatch", "Debug");
    for (auto const& slot : toAbandon)
        slot->abandon();
}

auto TeardownSignal::reset() -> void {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->flag = false;
}

auto TeardownSignal::requested() const -> bool {
    return this->flag.load(std::memory_order_acquire);
}

auto TeardownSignal::attach(std::shared_ptr<CompletionSlot> const& slot) -> bool {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->flag)
        return false;
    this->parked.emplace(slot.get(), slot);
    return true;
}

auto TeardownSignal::detach(CompletionSlot const* slot) -> void {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->parked.erase(slot);
}

auto TeardownSignal::parkedCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->parked.size();
}

} // namespace HD
