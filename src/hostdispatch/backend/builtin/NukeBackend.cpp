#include "backend/builtin/NukeBackend.hpp"

namespace HD {

auto NukeBackend::isMainThread() const -> bool {
    if (auto table = this->hooks<NukeHooks>(); table && table->isMainThread != nullptr)
        return table->isMainThread(table->host);
    return DispatcherBackend::isMainThread();
}

} // namespace HD
