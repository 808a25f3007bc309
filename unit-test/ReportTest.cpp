#include "gtest/gtest.h"
#include "judge/report.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace codejudge;

static test_result make_result(size_t index, status verdict, double time) {
    test_result result;
    result.test_case_index = index;
    result.verdict = verdict;
    result.execution_time = time;
    result.output = "out" + to_string(index);
    result.expected = "exp" + to_string(index);
    return result;
}

TEST(ReportTest, AllAccepted) {
    judge_report report;
    report.results.push_back(make_result(0, status::ACCEPTED, 0.1));
    report.results.push_back(make_result(1, status::ACCEPTED, 0.3));
    summarize(report);

    EXPECT_EQ(report.passed, 2u);
    EXPECT_EQ(report.total, 2u);
    EXPECT_DOUBLE_EQ(report.correctness_score, 100);
    EXPECT_EQ(report.verdict, final_verdict::ACCEPTED);
    EXPECT_DOUBLE_EQ(report.performance.min_time, 0.1);
    EXPECT_DOUBLE_EQ(report.performance.max_time, 0.3);
    EXPECT_DOUBLE_EQ(report.performance.avg_time, 0.2);
    EXPECT_EQ(report.performance.measured_count, 2u);
}

TEST(ReportTest, PartialExcludesTimeoutFromPerformance) {
    judge_report report;
    report.results.push_back(make_result(0, status::ACCEPTED, 0.2));
    report.results.push_back(make_result(1, status::WRONG_ANSWER, 0.4));
    report.results.push_back(make_result(2, status::TIME_LIMIT_EXCEEDED, 2.0));
    summarize(report);

    EXPECT_EQ(report.passed, 1u);
    EXPECT_EQ(report.total, 3u);
    EXPECT_NEAR(report.correctness_score, 100.0 / 3, 1e-9);
    EXPECT_EQ(report.verdict, final_verdict::PARTIAL);
    EXPECT_EQ(report.performance.measured_count, 2u);
    EXPECT_DOUBLE_EQ(report.performance.max_time, 0.4);
    EXPECT_NEAR(report.performance.avg_time, 0.3, 1e-9);
}

TEST(ReportTest, NothingPassed) {
    judge_report report;
    report.results.push_back(make_result(0, status::COMPILATION_ERROR, 0));
    report.results.push_back(make_result(1, status::COMPILATION_ERROR, 0));
    summarize(report);

    EXPECT_EQ(report.passed, 0u);
    EXPECT_DOUBLE_EQ(report.correctness_score, 0);
    EXPECT_EQ(report.verdict, final_verdict::FAILED);
    EXPECT_EQ(report.performance.measured_count, 0u);
    EXPECT_DOUBLE_EQ(report.performance.min_time, 0);
    EXPECT_DOUBLE_EQ(report.performance.avg_time, 0);
}

TEST(ReportTest, EmptyReport) {
    judge_report report;
    summarize(report);
    EXPECT_EQ(report.total, 0u);
    EXPECT_DOUBLE_EQ(report.correctness_score, 0);
    EXPECT_EQ(report.verdict, final_verdict::FAILED);
}

TEST(ReportTest, HiddenTestCasesAreRedacted) {
    judge_report report;
    report.language = "python";
    report.problem_id = "add";
    report.results.push_back(make_result(0, status::ACCEPTED, 0.5));
    report.results.push_back(make_result(1, status::RUNTIME_ERROR, 0.5));
    report.results[1].is_hidden = true;
    report.results[1].error = "Traceback";
    report.results[1].exit_code = 1;
    summarize(report);

    nlohmann::json j = to_json(report, false);
    EXPECT_EQ(j["language"], "python");
    EXPECT_EQ(j["passed_tests"], 1);
    EXPECT_EQ(j["total_tests"], 2);
    EXPECT_EQ(j["final_verdict"], "PARTIAL");
    EXPECT_DOUBLE_EQ(j["correctness_score"].get<double>(), 50);

    nlohmann::json visible = {
        {"test_case", 1},
        {"description", ""},
        {"verdict", "ACCEPTED"},
        {"passed", true},
        {"execution_time", 0.5},
        {"is_hidden", false},
        {"output", "out0"},
        {"expected", "exp0"},
        {"exit_code", 0}};
    EXPECT_JSON_EQ(visible, j["test_results"][0]);

    nlohmann::json hidden = {
        {"test_case", 2},
        {"description", ""},
        {"verdict", "RUNTIME_ERROR"},
        {"passed", false},
        {"execution_time", 0.5},
        {"is_hidden", true}};
    EXPECT_JSON_EQ(hidden, j["test_results"][1]);

    nlohmann::json revealed = to_json(report, true);
    EXPECT_EQ(revealed["test_results"][1]["error"], "Traceback");
    EXPECT_EQ(revealed["test_results"][1]["exit_code"], 1);
}
