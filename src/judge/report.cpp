#include "judge/report.hpp"
#include <algorithm>

namespace codejudge {
using namespace std;
using namespace nlohmann;

bool test_result::measured() const {
    return verdict != status::TIME_LIMIT_EXCEEDED &&
           verdict != status::COMPILATION_ERROR &&
           verdict != status::SETUP_ERROR;
}

void summarize(judge_report &report) {
    report.total = report.results.size();
    report.passed = count_if(report.results.begin(), report.results.end(), [](const test_result &result) {
        return result.verdict == status::ACCEPTED;
    });
    report.correctness_score = report.total == 0 ? 0 : 100.0 * report.passed / report.total;
    report.correctness_score = clamp(report.correctness_score, 0.0, 100.0);

    performance_summary perf;
    double sum = 0;
    for (auto &result : report.results) {
        if (!result.measured()) continue;
        if (perf.measured_count == 0) {
            perf.min_time = perf.max_time = result.execution_time;
        } else {
            perf.min_time = min(perf.min_time, result.execution_time);
            perf.max_time = max(perf.max_time, result.execution_time);
        }
        sum += result.execution_time;
        ++perf.measured_count;
    }
    if (perf.measured_count > 0)
        perf.avg_time = sum / perf.measured_count;
    report.performance = perf;

    if (report.total > 0 && report.passed == report.total)
        report.verdict = final_verdict::ACCEPTED;
    else if (report.passed > 0)
        report.verdict = final_verdict::PARTIAL;
    else
        report.verdict = final_verdict::FAILED;
}

json to_json(const judge_report &report, bool reveal_hidden) {
    json results = json::array();
    for (auto &result : report.results) {
        json item = {
            {"test_case", result.test_case_index + 1},
            {"description", result.description},
            {"verdict", get_status_name(result.verdict)},
            {"passed", result.verdict == status::ACCEPTED},
            {"execution_time", result.execution_time},
            {"is_hidden", result.is_hidden}};
        if (!result.is_hidden || reveal_hidden) {
            item["output"] = result.output;
            item["expected"] = result.expected;
            item["exit_code"] = result.exit_code;
            if (!result.error.empty())
                item["error"] = result.error;
        }
        results.push_back(item);
    }

    return {
        {"language", report.language},
        {"problem_id", report.problem_id},
        {"passed_tests", report.passed},
        {"total_tests", report.total},
        {"correctness_score", report.correctness_score},
        {"final_verdict", get_final_verdict_name(report.verdict)},
        {"performance_summary", {
            {"min_time", report.performance.min_time},
            {"avg_time", report.performance.avg_time},
            {"max_time", report.performance.max_time},
            {"measured_count", report.performance.measured_count}}},
        {"compilation_log", report.compilation_log},
        {"judge_time", report.judge_time},
        {"test_results", results}};
}

}  // namespace codejudge
