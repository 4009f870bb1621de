#ifdef WC_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace WC {

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() {
    workerThread = std::thread(&TaggedLogger::processQueue, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        running = false;
    }
    cv.notify_one();
    if (workerThread.joinable()) {
        workerThread.join();
    }
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    std::lock_guard<std::mutex> lock(queueMutex);
    loggingEnabled = enabled;
}

auto TaggedLogger::setEnabledTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(queueMutex);
    enabledTags = std::move(tags);
}

auto TaggedLogger::setSkipTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(queueMutex);
    skipTags = std::move(tags);
}

auto TaggedLogger::accepts(const std::set<std::string>& tags) const -> bool {
    if (!loggingEnabled) {
        return false;
    }
    if (!enabledTags.empty()) {
        for (auto const& tag : tags) {
            if (!enabledTags.contains(tag)) {
                return false;
            }
        }
    }
    for (auto const& tag : tags) {
        if (skipTags.contains(tag)) {
            return false;
        }
    }
    return true;
}

auto TaggedLogger::enqueue(LogMessage message) -> void {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        if (!accepts(message.tags)) {
            return;
        }
        messageQueue.push(std::move(message));
        ++inFlight;
    }
    cv.notify_one();
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(queueMutex);
    drained.wait(lock, [this] { return inFlight == 0; });
}

auto TaggedLogger::processQueue() -> void {
    std::unique_lock<std::mutex> lock(queueMutex);
    while (true) {
        cv.wait(lock, [this] { return !messageQueue.empty() || !running; });
        if (messageQueue.empty()) {
            return;
        }
        auto msg = std::move(messageQueue.front());
        messageQueue.pop();
        lock.unlock();
        writeToStderr(msg);
        lock.lock();
        if (--inFlight == 0) {
            drained.notify_all();
        }
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

auto TaggedLogger::writeToStderr(const LogMessage& msg) -> void {
    const auto  nowMs    = std::chrono::duration_cast<std::chrono::milliseconds>(msg.timestamp.time_since_epoch()) % 1000;
    const auto  nowTimeT = std::chrono::system_clock::to_time_t(msg.timestamp);
    const auto* nowTm    = std::localtime(&nowTimeT);

    std::ostringstream oss;
    oss << std::put_time(nowTm, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << nowMs.count() << ' ';
    for (auto const& tag : msg.tags) {
        oss << '[' << tag << ']';
    }
    oss << " [" << getShortPath(msg.location.file_name()) << ":" << msg.location.line() << "] ";
    oss << msg.message << '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << oss.str() << std::flush;
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

void set_enabled_log_tags(std::set<std::string> tags) {
    logger().setEnabledTags(std::move(tags));
}

void flush_log() {
    logger().flush();
}

} // namespace WC
#endif // WC_LOG_DEBUG
