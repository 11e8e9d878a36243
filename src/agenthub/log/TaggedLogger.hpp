#pragma once
#include <mutex>
#include <string>

#ifdef AH_LOG_DEBUG
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <queue>
#include <set>
#include <source_location>
#include <thread>
#include <unordered_map>

namespace AH {

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
    // Drops the calling thread's name; short-lived threads call this before exiting.
    auto clearThreadName() -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    [[nodiscard]] auto loggingEnabled() const -> bool;
    [[nodiscard]] auto namedThreadCount() const -> std::size_t;

    // An empty enabled set lets every tag through; skip tags always win.
    auto setEnabledTags(std::set<std::string> tags) -> void;
    auto setSkipTags(std::set<std::string> tags) -> void;

    // Blocks until the worker has written everything queued so far.
    auto flush() -> void;

    static std::mutex coutMutex;

private:
    std::queue<LogMessage>  messageQueue;
    mutable std::mutex      queueMutex;
    std::condition_variable cv;
    std::condition_variable drained;
    std::thread             workerThread;
    std::atomic<bool>       running;
    std::atomic<bool>       enabled;
    bool                    writing = false;

    mutable std::mutex    filterMutex;
    std::set<std::string> skipTags{"Frame"};
    std::set<std::string> enabledTags{};

    std::unordered_map<std::thread::id, std::string> threadNames;
    mutable std::mutex                               threadNamesMutex;
    std::atomic<int>                                 nextThreadNumber;

    auto        processQueue() -> void;
    auto        writeToStderr(const LogMessage& msg) const -> void;
    auto        getThreadName(const std::thread::id& id) -> std::string;
    static auto getShortPath(const char* filepath) -> std::string;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!enabled)
        return;

    auto logMessage = LogMessage{.timestamp  = std::chrono::system_clock::now(),
                                 .tags       = {std::string(std::forward<Tags>(tags))...},
                                 .message    = message,
                                 .threadName = getThreadName(std::this_thread::get_id()),
                                 .location   = location};

    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->messageQueue.push(std::move(logMessage));
        this->cv.notify_one();
    }
}

#define ah_log(message, ...) ::AH::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void clear_thread_name();
void set_logging_enabled(bool enabled);
// Reads AGENTHUB_LOG ("0" or unset disables) and AGENTHUB_LOG_TAGS.
void configure_logging_from_env();
void flush_log();

} // namespace AH

#else
#define ah_log(message, ...) ((void)0)

namespace AH {
inline void set_thread_name(const std::string&) {}
inline void clear_thread_name() {}
inline void set_logging_enabled(bool) {}
inline void configure_logging_from_env() {}
inline void flush_log() {}
} // namespace AH
#endif // AH_LOG_DEBUG

namespace AH {
// Serialises console output between the log worker and tools/tests printing to stdout.
auto console_mutex() -> std::mutex&;
} // namespace AH
