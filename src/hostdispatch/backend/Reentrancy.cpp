#include "backend/Reentrancy.hpp"

namespace HD::detail {
namespace {

thread_local int tlsServicingDepth = 0;
thread_local int tlsWaitingDepth   = 0;

} // namespace

auto servicingDepth() -> int {
    return tlsServicingDepth;
}

auto waitingDepth() -> int {
    return tlsWaitingDepth;
}

ServicingScope::ServicingScope() {
    ++tlsServicingDepth;
}

ServicingScope::~ServicingScope() {
    --tlsServicingDepth;
}

WaitingScope::WaitingScope() {
    ++tlsWaitingDepth;
}

WaitingScope::~WaitingScope() {
    --tlsWaitingDepth;
}

} // namespace HD::detail
