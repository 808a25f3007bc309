#include "judge/programming.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/classifier.hpp"
#include "worker.hpp"

namespace codejudge {
using namespace std;

static const char *SETUP_ERROR_MESSAGE = "Internal error while judging this test case";

static void log_setup_fault(const std::exception &ex, const string &context) {
    if (auto *judge_ex = dynamic_cast<const judge_exception *>(&ex))
        LOG(ERROR) << context << ": " << ex.what() << endl << *judge_ex;
    else
        LOG(ERROR) << context << ": " << boost::diagnostic_information(ex);
}

// 给选手看的错误信息
static string describe_error(status verdict, const raw_execution_result &raw, const execution_limits &limits) {
    switch (verdict) {
        case status::COMPILATION_ERROR:
            return raw.compile_log;
        case status::TIME_LIMIT_EXCEEDED:
            return fmt::format("Execution timeout (>{}s)", limits.time_limit_seconds);
        case status::RUNTIME_ERROR: {
            string error = boost::algorithm::trim_copy(raw.stderr_text);
            if (!error.empty()) return error;
            if (raw.signal != 0) return fmt::format("Process killed by signal {}", raw.signal);
            if (raw.exit_code != 0) return fmt::format("Process exited with code {}", raw.exit_code);
            return "No output";
        }
        case status::WRONG_ANSWER:
            if (raw.output_truncated) return fmt::format("Output exceeded {} bytes and was truncated", OUTPUT_LIMIT);
            return "";
        default:
            return "";
    }
}

execution_limits resolve_limits(const submission &submit, const test_case &tc, const language_profile &profile) {
    execution_limits limits;
    limits.time_limit_seconds = submit.constraints.time_limit_seconds.value_or(
        tc.time_limit_seconds.value_or(profile.default_timeout_seconds));
    limits.memory_limit_mb = submit.constraints.memory_limit_mb.value_or(
        tc.memory_limit_mb.value_or(profile.default_memory_limit_mb));
    return limits;
}

programming_judger::programming_judger(language_registry languages, judge_options options)
    : registry(move(languages)), options(options) {}

const language_registry &programming_judger::languages() const {
    return registry;
}

judge_report programming_judger::judge(const submission &submit) const {
    elapsed_time timer;
    verify(submit);
    const language_profile &profile = registry.resolve(submit.language);

    LOG(INFO) << "Judging " << submit << " with " << options.workers << " workers";

    judge_report report;
    report.language = profile.id;
    report.problem_id = submit.problem_id;
    report.results.resize(submit.test_cases.size());

    shared_ptr<const compiled_program> program;
    bool setup_failed = false;
    if (profile.compiled() && options.share_compilation) {
        try {
            // 评测代码在运行时读取输入，所有测试点生成的源文件相同
            execution_unit unit = generator.build(submit.code, profile, submit.test_cases.front());
            program = runner.compile(unit, profile);
            report.compilation_log = program->compile_log;
        } catch (std::exception &ex) {
            log_setup_fault(ex, "Unable to compile " + profile.id + " submission of problem " + submit.problem_id);
            setup_failed = true;
        }
    }

    run_workers(submit.test_cases.size(), options.workers, [&](size_t index) {
        report.results[index] = judge_test_case(submit, profile, index, program.get(), setup_failed);
    });

    summarize(report);
    report.judge_time = timer.seconds();
    LOG(INFO) << "Judged " << submit << ": " << report.passed << "/" << report.total << " passed, "
              << get_final_verdict_name(report.verdict) << " in " << report.judge_time << "s";
    return report;
}

test_result programming_judger::judge_test_case(const submission &submit, const language_profile &profile, size_t index,
                                                const compiled_program *program, bool setup_failed) const {
    const test_case &tc = submit.test_cases[index];

    test_result result;
    result.test_case_index = index;
    result.description = tc.description;
    result.expected = boost::algorithm::trim_copy(tc.expected_output);
    result.is_hidden = tc.is_hidden;

    if (setup_failed) {
        result.verdict = status::SETUP_ERROR;
        result.error = SETUP_ERROR_MESSAGE;
        return result;
    }

    try {
        execution_limits limits = resolve_limits(submit, tc, profile);

        raw_execution_result raw;
        if (program && !program->success) {
            raw.compile_failed = true;
            raw.compile_log = program->compile_log;
        } else {
            execution_unit unit = generator.build(submit.code, profile, tc);
            raw = runner.run(unit, profile, limits, program);
        }

        classification outcome = classify(raw, tc.expected_output);
        result.verdict = outcome.verdict;
        result.output = outcome.output;
        result.execution_time = raw.wall_time;
        result.exit_code = raw.exit_code;
        result.error = describe_error(outcome.verdict, raw, limits);

        DLOG(INFO) << "Test case " << index + 1 << " of " << submit << ": " << get_display_message(result.verdict)
                   << " in " << result.execution_time << "s";
    } catch (std::exception &ex) {
        log_setup_fault(ex, fmt::format("Unable to judge test case {} of {}", index + 1, submit.problem_id));
        result.verdict = status::SETUP_ERROR;
        result.output.clear();
        result.execution_time = 0;
        result.error = SETUP_ERROR_MESSAGE;
    }
    return result;
}

}  // namespace codejudge
