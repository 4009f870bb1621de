#ifdef WC_LOG_DEBUG
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <thread>

namespace WC {

// Asynchronous stderr logger. Messages carry a set of tags; filtering happens
// on the calling thread so rejected messages are never queued. The writer
// thread is the only thread WidgetCore starts.
class TaggedLogger {
public:
    struct LogMessage {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
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

    auto setLoggingEnabled(bool enabled) -> void;
    // Only messages whose tags are all enabled are written; empty means every tag.
    auto setEnabledTags(std::set<std::string> tags) -> void;
    // Messages carrying any skip tag are dropped. Defaults to per-widget chatter.
    auto setSkipTags(std::set<std::string> tags) -> void;

    // Blocks until every queued message has been written.
    auto flush() -> void;

    static std::mutex coutMutex;

private:
    std::queue<LogMessage>  messageQueue;
    std::size_t             inFlight = 0;
    std::mutex              queueMutex;
    std::condition_variable cv;
    std::condition_variable drained;
    std::thread             workerThread;
    bool                    running        = true;
    bool                    loggingEnabled = false;
    std::set<std::string>   skipTags{"WidgetTree", "Testcase"};
    std::set<std::string>   enabledTags{};

    auto        accepts(const std::set<std::string>& tags) const -> bool;
    auto        enqueue(LogMessage message) -> void;
    auto        processQueue() -> void;
    static auto writeToStderr(const LogMessage& msg) -> void;
    static auto getShortPath(const char* filepath) -> std::string;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    enqueue(LogMessage{.timestamp = std::chrono::system_clock::now(),
                       .tags      = {std::string(std::forward<Tags>(tags))...},
                       .message   = message,
                       .location  = location});
}

#define wc_log(message, ...) ::WC::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_logging_enabled(bool enabled);
void set_enabled_log_tags(std::set<std::string> tags);
void flush_log();

} // namespace WC

#else
#define wc_log(message, ...) ((void)0)
#endif // WC_LOG_DEBUG
