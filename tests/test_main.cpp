#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include <score/log/TaggedLogger.hpp>

#include <string>

// Announces each test case and subcase under the "Testcase" tag, which the logger skips by default.
struct ShowTestStart : public doctest::IReporter {
    ShowTestStart(const doctest::ContextOptions& /* in */) {
    }
    void test_case_start(const doctest::TestCaseData& in) override {
        sc_log("Test: " + std::string{in.m_name}, "Testcase");
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
        sc_log("Subcase: " + std::string{in.m_name.c_str()}, "Testcase");
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

#ifdef SC_LOG_DEBUG
    // SCORE_LOG / SCORE_LOG_ENABLED are read by the logger itself.
    SC::set_thread_name("TestMain");
#endif

    if (context.shouldExit()) {
        return context.run();
    }

    sc_log("Starting test execution", "TEST", "INFO");
    int res = context.run();
    if (res == 0) {
        sc_log("All tests passed successfully", "TEST", "SUCCESS");
    } else {
        sc_log("Some tests failed", "TEST", "FAILURE");
    }
    return res;
}
