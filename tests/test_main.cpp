#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <utility>

struct ShowTestStart : public doctest::IReporter {
    ShowTestStart(const doctest::ContextOptions& /* in */) {
    }
    void test_case_start(const doctest::TestCaseData& in) override {
#ifdef WC_LOG_DEBUG
        std::lock_guard<std::mutex> lock(WC::logger().coutMutex);
#endif
        std::cout << "Test: " << in.m_name << std::endl;
    }
    void report_query(const doctest::QueryData&) override {
    }
    void test_run_start() override {
    }
    void test_run_end(const doctest::TestRunStats&) override {
    }
    void test_case_reenter(const doctest::TestCaseData&) override {
    }
    void test_case_end(const doctest::CurrentTestCaseStats&) override {
    }
    void test_case_exception(const doctest::TestCaseException&) override {
    }
    void subcase_start(const doctest::SubcaseSignature& in) override {
#ifdef WC_LOG_DEBUG
        std::lock_guard<std::mutex> lock(WC::logger().coutMutex);
#endif
        std::cout << "\tSubcase: " << in.m_name << std::endl;
    }
    void subcase_end() override {
    }
    void log_assert(const doctest::AssertData&) override {
    }
    void log_message(const doctest::MessageData&) override {
    }
    void test_case_skipped(const doctest::TestCaseData&) override {
    }
};

REGISTER_LISTENER("test_start", 1, ShowTestStart);

int main(int argc, char** argv) {
#ifdef WC_LOG_DEBUG
    WC::set_logging_enabled(false);
#endif

    doctest::Context context;
    context.applyCommandLine(argc, argv);

#ifdef WC_LOG_DEBUG
    // WIDGETCORE_LOG set to anything but "0" turns the logger on;
    // WIDGETCORE_LOG_TAGS=Focus,EventManager narrows it to those tags.
    bool enableLog = false;
    if (const char* env_log = std::getenv("WIDGETCORE_LOG")) {
        if (std::strcmp(env_log, "0") != 0) enableLog = true;
    }
    if (const char* env_tags = std::getenv("WIDGETCORE_LOG_TAGS")) {
        std::set<std::string> tags;
        std::istringstream    stream{env_tags};
        for (std::string tag; std::getline(stream, tag, ',');) {
            if (!tag.empty()) tags.insert(tag);
        }
        WC::set_enabled_log_tags(std::move(tags));
    }
#endif

    if (context.shouldExit()) {
        return context.run();
    }

#ifdef WC_LOG_DEBUG
    if (enableLog) {
        WC::set_logging_enabled(true);
        wc_log("Starting test execution", "TEST", "INFO");
    }
#endif

    int res = context.run();

#ifdef WC_LOG_DEBUG
    if (enableLog) {
        if (res == 0) {
            wc_log("All tests passed successfully", "TEST", "SUCCESS");
        } else {
            wc_log("Some tests failed", "TEST", "FAILURE");
        }
        WC::flush_log();
    }
#endif

    return res;
}
