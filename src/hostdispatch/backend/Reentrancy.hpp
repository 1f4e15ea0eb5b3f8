#pragma once

namespace HD::detail {

/**
 * Thread-local dispatch depths.
 *
 * servicing: this thread is running a callback a host primitive delivered.
 * waiting:   this thread is parked inside a blocking dispatch.
 *
 * A blocking dispatch that has to marshal while either depth is non-zero would
 * wait on the very thread that must service it.
 */
[[nodiscard]] auto servicingDepth() -> int;
[[nodiscard]] auto waitingDepth() -> int;

class ServicingScope {
public:
    ServicingScope();
    ~ServicingScope();
    ServicingScope(ServicingScope const&)            = delete;
    ServicingScope& operator=(ServicingScope const&) = delete;
};

class WaitingScope {
public:
    WaitingScope();
    ~WaitingScope();
    WaitingScope(WaitingScope const&)            = delete;
    WaitingScope& operator=(WaitingScope const&) = delete;
};

} // namespace HD::detail
