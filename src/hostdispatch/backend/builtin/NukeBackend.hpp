#pragma once

#include "backend/builtin/NativeBlockingBackend.hpp"

namespace HD {

// Nuke: main-thread executor, with or without result. Nuke may report its own
// notion of the main thread; when it does, that answer wins.
class NukeBackend final
    : public NativeBlockingBackend<NukeHooks, &NukeHooks::executeInMainThread, &NukeHooks::executeInMainThreadWithResult> {
public:
    using NativeBlockingBackend::NativeBlockingBackend;

    [[nodiscard]] auto name() const -> std::string override {
        return "Nuke";
    }

    [[nodiscard]] auto isMainThread() const -> bool override;
};

} // namespace HD
