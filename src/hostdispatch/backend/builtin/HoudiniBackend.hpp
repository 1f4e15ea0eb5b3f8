#pragma once

#include "backend/builtin/NativeBlockingBackend.hpp"

namespace HD {

// Houdini: hdefereval's deferred queue and blocking main-thread eval.
class HoudiniBackend final
    : public NativeBlockingBackend<HoudiniHooks, &HoudiniHooks::evalDeferred, &HoudiniHooks::evalInMainThread> {
public:
    using NativeBlockingBackend::NativeBlockingBackend;

    [[nodiscard]] auto name() const -> std::string override {
        return "Houdini";
    }
};

} // namespace HD
