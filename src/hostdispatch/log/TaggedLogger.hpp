#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>

namespace HD {

/**
 * TaggedLogger: asynchronous, tag-filtered stderr logger.
 *
 * Messages are queued by the calling thread and written by a dedicated worker,
 * so logging from a host's main thread never blocks on stderr.
 *
 * Filtering is configured from the environment at construction:
 *  - HOSTDISPATCH_LOG_ENABLED / HOSTDISPATCH_LOG: falsy values ("0", "false",
 *    "off", "no") disable output entirely.
 *  - HOSTDISPATCH_LOG_CLEAR_DEFAULT_SKIPS: truthy drops the default skip list.
 *  - HOSTDISPATCH_LOG_ENABLE_TAGS: comma list; every tag of a message must be
 *    listed for it to be written.
 *  - HOSTDISPATCH_LOG_SKIP_TAGS: comma list appended to the skip list.
 */
class TaggedLogger {
public:
    struct LogMessage {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           threadName;
        std::source_location                  location;
    };

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;
    TaggedLogger(TaggedLogger&&)                 = delete;
    TaggedLogger& operator=(TaggedLogger&&)      = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    [[nodiscard]] auto loggingEnabled() const -> bool;

    // Blocks until every message queued before the call has been written.
    auto flush() -> void;

    static std::mutex coutMutex;

private:
    std::queue<LogMessage>  messageQueue;
    mutable std::mutex      queueMutex;
    std::condition_variable cv;
    std::condition_variable drainedCv;
    bool                    writing{false};
    std::thread             workerThread;
    std::atomic<bool>       running;
    std::atomic<bool>       enabled;
    std::set<std::string>   skipTags{"Debug"};
    std::set<std::string>   enabledTags{};

    std::unordered_map<std::thread::id, std::string> threadNames;
    mutable std::mutex                               threadNamesMutex;
    std::atomic<int>                                 nextThreadNumber;

    auto        configureFromEnvironment() -> void;
    auto        processQueue() -> void;
    auto        writeToStderr(const LogMessage& msg) const -> void;
    auto        getThreadName(const std::thread::id& id) -> std::string;
    static auto getShortPath(const char* filepath) -> std::string;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!this->enabled)
        return;

    auto logMessage = LogMessage{.timestamp = std::chrono::system_clock::now(), .tags = {std::forward<Tags>(tags)...}, .message = message, .threadName = getThreadName(std::this_thread::get_id()), .location = location};

    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->messageQueue.push(std::move(logMessage));
        this->cv.notify_one();
    }
}

#define hd_log(message, ...) ::HD::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace HD
