#include "judge/submission.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/assign.hpp>
#include <unordered_map>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace codejudge {
using namespace std;
using namespace nlohmann;

// clang-format off
static const unordered_map<test_difficulty, const char *> difficulty_name = boost::assign::map_list_of
    (test_difficulty::EASY, "easy")
    (test_difficulty::MEDIUM, "medium")
    (test_difficulty::HARD, "hard");
// clang-format on

const char *get_difficulty_name(test_difficulty value) {
    return difficulty_name.at(value);
}

static test_difficulty parse_difficulty(const string &name) {
    string lower = boost::algorithm::to_lower_copy(name);
    for (auto &[value, str] : difficulty_name)
        if (lower == str) return value;
    throw invalid_argument("Unknown difficulty: " + name);
}

// 字符串原样保留，其他值序列化成 json
static string stringify(const json &value) {
    if (value.is_null()) return "";
    if (value.is_string()) return value.get<string>();
    return value.dump();
}

void verify(const submission &submit) {
    if (submit.test_cases.empty())
        throw invalid_submission("no test cases");
    if (boost::algorithm::trim_copy(submit.code).empty())
        throw invalid_submission("code is empty");

    if (submit.constraints.time_limit_seconds && !(*submit.constraints.time_limit_seconds > 0))
        throw invalid_submission("time limit should be positive");
    if (submit.constraints.memory_limit_mb && *submit.constraints.memory_limit_mb <= 0)
        throw invalid_submission("memory limit should be positive");

    for (size_t i = 0; i < submit.test_cases.size(); ++i) {
        auto &tc = submit.test_cases[i];
        if (tc.time_limit_seconds && !(*tc.time_limit_seconds > 0))
            throw invalid_submission("time limit of test case " + to_string(i + 1) + " should be positive");
        if (tc.memory_limit_mb && *tc.memory_limit_mb <= 0)
            throw invalid_submission("memory limit of test case " + to_string(i + 1) + " should be positive");
    }
}

void from_json(const json &j, test_case &tc) {
    if (const json *input = find_path(j, "input_data")) {
        if (input->is_array()) {
            vector<string> lines;
            for (auto &item : *input)
                lines.push_back(stringify(item));
            tc.input_data = boost::algorithm::join(lines, "\n");
        } else {
            tc.input_data = stringify(*input);
        }
    }

    if (const json *expected = find_path(j, "expected_output"))
        tc.expected_output = stringify(*expected);

    if (exists(j, "time_limit_seconds"))
        tc.time_limit_seconds = get_value<double>(j, "time_limit_seconds");
    if (exists(j, "memory_limit_mb"))
        tc.memory_limit_mb = get_value<int>(j, "memory_limit_mb");

    tc.is_hidden = get_value_def<bool>(j, false, "is_hidden");
    tc.difficulty = parse_difficulty(get_value_def<string>(j, "medium", "difficulty"));
    tc.description = get_value_def<string>(j, "", "description");
}

void from_json(const json &j, submission &submit) {
    submit.code = get_value<string>(j, "code");
    submit.language = get_value<string>(j, "language");
    if (const json *problem_id = find_path(j, "problem_id"))
        submit.problem_id = stringify(*problem_id);

    submit.test_cases.clear();
    for (auto &item : access(j, "test_cases"))
        submit.test_cases.push_back(item.get<test_case>());

    if (exists(j, "constraints", "time_limit_seconds"))
        submit.constraints.time_limit_seconds = get_value<double>(j, "constraints", "time_limit_seconds");
    if (exists(j, "constraints", "memory_limit_mb"))
        submit.constraints.memory_limit_mb = get_value<int>(j, "constraints", "memory_limit_mb");
}

}  // namespace codejudge
