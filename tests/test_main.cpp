#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"
#include <iostream>
#include <mutex>

struct ShowTestStart : public doctest::IReporter {
    ShowTestStart(const doctest::ContextOptions& /* in */) {
    }
    void test_case_start(const doctest::TestCaseData& in) override {
#ifdef SD_LOG_DEBUG
        std::lock_guard<std::mutex> lock(SD::TaggedLogger::coutMutex);
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
#ifdef SD_LOG_DEBUG
        std::lock_guard<std::mutex> lock(SD::TaggedLogger::coutMutex);
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
    doctest::Context context;
    context.applyCommandLine(argc, argv);

    if (context.shouldExit()) {
        return context.run();
    }

#ifdef SD_LOG_DEBUG
    SD::set_thread_name("TestMain");
    bool const enableLog = SD::enable_logging_from_environment();
    if (enableLog)
        sd_log("Starting test execution", "TEST");
#endif

    int res = context.run();

#ifdef SD_LOG_DEBUG
    if (enableLog) {
        if (res == 0) {
            sd_log("All tests passed successfully", "TEST", "SUCCESS");
        } else {
            sd_log("Some tests failed", "TEST", "FAILURE");
        }
    }
#endif

    return res;
}
