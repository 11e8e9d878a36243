#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"

#include <iostream>
#include <mutex>

struct ShowTestStart : public doctest::IReporter {
    ShowTestStart(const doctest::ContextOptions& /* in */) {
    }
    void test_case_start(const doctest::TestCaseData& in) override {
        std::lock_guard<std::mutex> lock(AH::console_mutex());
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
        std::lock_guard<std::mutex> lock(AH::console_mutex());
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
    // Start with logging disabled
    AH::set_logging_enabled(false);

    doctest::Context context;
    context.applyCommandLine(argc, argv);

    AH::set_thread_name("TestMain");

    if (context.shouldExit()) {
        return context.run();
    }

    // AGENTHUB_LOG / AGENTHUB_LOG_TAGS turn logging back on for normal runs.
    AH::configure_logging_from_env();
    ah_log("Starting test execution", "TEST", "INFO");

    int res = context.run();

    if (res == 0) {
        ah_log("All tests passed successfully", "TEST", "SUCCESS");
    } else {
        ah_log("Some tests failed", "TEST", "FAILURE");
    }
    AH::flush_log();
    return res;
}
