#pragma once

#include "backend/builtin/NativeBlockingBackend.hpp"

namespace HD {

// Maya: executeDeferred for fire-and-forget, executeInMainThreadWithResult for blocking calls.
class MayaBackend final
    : public NativeBlockingBackend<MayaHooks, &MayaHooks::executeDeferred, &MayaHooks::executeInMainThreadWithResult> {
public:
    using NativeBlockingBackend::NativeBlockingBackend;

    [[nodiscard]] auto name() const -> std::string override {
        return "Maya";
    }
};

} // namespace HD
