#include "agenthub/log/TaggedLogger.hpp"

#ifdef AH_LOG_DEBUG
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

namespace AH {

namespace {

template <typename Range, typename Delimiter>
std::string join_with_impl(const Range& range, const Delimiter& delim) {
    std::ostringstream oss;
    bool               first = true;
    for (const auto& item : range) {
        if (!first)
            oss << delim;
        oss << item;
        first = false;
    }
    return oss.str();
}

auto split_tags(std::string_view text) -> std::set<std::string> {
    std::set<std::string> tags;
    while (!text.empty()) {
        auto const comma = text.find(',');
        auto       token = text.substr(0, comma);
        while (!token.empty() && token.front() == ' ')
            token.remove_prefix(1);
        while (!token.empty() && token.back() == ' ')
            token.remove_suffix(1);
        if (!token.empty())
            tags.emplace(token);
        if (comma == std::string_view::npos)
            break;
        text.remove_prefix(comma + 1);
    }
    return tags;
}

} // namespace

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() : running(true), enabled(false), nextThreadNumber(0) {
    this->workerThread = std::thread(&TaggedLogger::processQueue, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->running = false;
        this->cv.notify_one();
    }
    if (this->workerThread.joinable()) {
        this->workerThread.join();
    }
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    const auto                  threadId = std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    threadNames[threadId] = name;
}

auto TaggedLogger::clearThreadName() -> void {
    const auto                  threadId = std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    threadNames.erase(threadId);
}

auto TaggedLogger::namedThreadCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    return threadNames.size();
}

auto TaggedLogger::setLoggingEnabled(bool value) -> void {
    enabled.store(value, std::memory_order_relaxed);
}

auto TaggedLogger::loggingEnabled() const -> bool {
    return enabled.load(std::memory_order_relaxed);
}

auto TaggedLogger::setEnabledTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(filterMutex);
    enabledTags = std::move(tags);
}

auto TaggedLogger::setSkipTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(filterMutex);
    skipTags = std::move(tags);
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    this->drained.wait(lock, [this] { return this->messageQueue.empty() && !this->writing; });
}

auto TaggedLogger::processQueue() -> void {
    while (true) {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->cv.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });

        if (!this->running && this->messageQueue.empty()) {
            this->drained.notify_all();
            return;
        }

        while (!this->messageQueue.empty()) {
            const auto msg = std::move(this->messageQueue.front());
            this->messageQueue.pop();
            this->writing = true;
            lock.unlock();
            this->writeToStderr(msg);
            lock.lock();
            this->writing = false;
        }
        this->drained.notify_all();
    }
}

auto TaggedLogger::getShortPath(const char* filepath) -> std::string {
    namespace fs = std::filesystem;
    fs::path p{filepath};
    if (p.has_parent_path()) {
        auto parent = p.parent_path().filename();
        return (parent / p.filename()).string();
    }
    return p.filename().string();
}

auto TaggedLogger::writeToStderr(const LogMessage& msg) const -> void {
    {
        std::lock_guard<std::mutex> lock(filterMutex);
        if (!this->enabledTags.empty()) {
            bool any = false;
            for (auto const& tag : msg.tags)
                if (this->enabledTags.contains(tag))
                    any = true;
            if (!any)
                return;
        }
        for (auto const& skipTag : this->skipTags)
            if (msg.tags.contains(skipTag))
                return;
    }
    const auto  now      = msg.timestamp;
    const auto  nowMs    = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    const auto  nowTimeT = std::chrono::system_clock::to_time_t(now);
    std::tm     nowTm{};
    localtime_r(&nowTimeT, &nowTm);

    std::ostringstream oss;
    oss << std::put_time(&nowTm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << nowMs.count() << ' ';
    oss << '[' << join_with_impl(msg.tags, std::string("][")) << ']' << ' ';
    oss << "[" << msg.threadName << "] ";
    oss << "[" << getShortPath(msg.location.file_name()) << ":" << msg.location.line() << "] ";
    oss << msg.message << '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << oss.str() << std::flush;
}

auto TaggedLogger::getThreadName(const std::thread::id& id) -> std::string {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    auto                        it = threadNames.find(id);
    if (it != threadNames.end()) {
        return it->second;
    }
    std::string name = "Thread " + std::to_string(nextThreadNumber++);
    threadNames[id]  = name;
    return name;
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void clear_thread_name() {
    logger().clearThreadName();
}

void set_logging_enabled(bool value) {
    logger().setLoggingEnabled(value);
}

void configure_logging_from_env() {
    bool enableLog = false;
    if (const char* env = std::getenv("AGENTHUB_LOG")) {
        if (std::strcmp(env, "0") != 0)
            enableLog = true;
    }
    if (const char* env = std::getenv("AGENTHUB_LOG_TAGS")) {
        logger().setEnabledTags(split_tags(env));
    }
    logger().setLoggingEnabled(enableLog);
}

void flush_log() {
    logger().flush();
}

auto console_mutex() -> std::mutex& {
    return TaggedLogger::coutMutex;
}

} // namespace AH

#else

namespace AH {

auto console_mutex() -> std::mutex& {
    static std::mutex mutex;
    return mutex;
}

} // namespace AH

#endif // AH_LOG_DEBUG
