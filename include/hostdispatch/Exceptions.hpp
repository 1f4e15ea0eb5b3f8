#pragma once

#include <stdexcept>
#include <string>

namespace HD {

// Base of every failure the dispatcher itself reports. Exceptions thrown by
// the dispatched callable are never wrapped in these.
class ThreadSafetyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A bounded blocking dispatch did not complete in time. The callable may
// still run later on the main thread.
class ThreadDispatchTimeoutError : public ThreadSafetyError {
public:
    using ThreadSafetyError::ThreadSafetyError;
};

// The calling thread is already inside a blocking dispatch (waiting on one, or
// servicing one) and would have to wait on itself.
class DeadlockDetectedError : public ThreadSafetyError {
public:
    using ThreadSafetyError::ThreadSafetyError;
};

// The host signalled teardown; its main thread no longer services work.
class ShutdownInProgressError : public ThreadSafetyError {
public:
    using ThreadSafetyError::ThreadSafetyError;
};

// No backend at all could be resolved, not even the fallback.
class DispatcherConfigurationError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace HD
