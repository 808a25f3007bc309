#include "common/exceptions.hpp"
#include <limits>
#include <sstream>
#include "gtest/gtest.h"
#include "judge/submission.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace codejudge;

static submission valid_submission() {
    submission submit;
    submit.code = "def add(a, b):\n    return a + b\n";
    submit.language = "python";
    submit.problem_id = "add";
    submit.test_cases.push_back(make_test_case("2 3", "5"));
    return submit;
}

TEST(SubmissionTest, ParseSubmission) {
    submission submit = nlohmann::json::parse(R"({
        "code": "def add(a, b):\n    return a + b\n",
        "language": "python",
        "problem_id": 42,
        "test_cases": [
            {"input_data": "2 3", "expected_output": "5", "description": "small"},
            {"input_data": [1, "hello world", [1, 2]], "expected_output": 6, "is_hidden": true,
             "time_limit_seconds": 0.5, "memory_limit_mb": 64, "difficulty": "HARD"}
        ],
        "constraints": {"time_limit_seconds": 3}
    })").get<submission>();

    EXPECT_EQ(submit.language, "python");
    EXPECT_EQ(submit.problem_id, "42");
    ASSERT_EQ(submit.test_cases.size(), 2u);

    EXPECT_EQ(submit.test_cases[0].input_data, "2 3");
    EXPECT_EQ(submit.test_cases[0].description, "small");
    EXPECT_FALSE(submit.test_cases[0].is_hidden);
    EXPECT_FALSE(submit.test_cases[0].time_limit_seconds);
    EXPECT_EQ(submit.test_cases[0].difficulty, test_difficulty::MEDIUM);

    EXPECT_EQ(submit.test_cases[1].input_data, "1\nhello world\n[1,2]");
    EXPECT_EQ(submit.test_cases[1].expected_output, "6");
    EXPECT_TRUE(submit.test_cases[1].is_hidden);
    EXPECT_DOUBLE_EQ(*submit.test_cases[1].time_limit_seconds, 0.5);
    EXPECT_EQ(*submit.test_cases[1].memory_limit_mb, 64);
    EXPECT_EQ(submit.test_cases[1].difficulty, test_difficulty::HARD);
    EXPECT_STREQ(get_difficulty_name(submit.test_cases[1].difficulty), "hard");

    EXPECT_DOUBLE_EQ(*submit.constraints.time_limit_seconds, 3);
    EXPECT_FALSE(submit.constraints.memory_limit_mb);
}

TEST(SubmissionTest, MissingFields) {
    EXPECT_THROW(nlohmann::json::parse(R"({"language": "python", "test_cases": []})").get<submission>(), invalid_argument);
    EXPECT_THROW(nlohmann::json::parse(R"({"code": "x", "test_cases": []})").get<submission>(), invalid_argument);
    EXPECT_THROW(nlohmann::json::parse(R"({"code": "x", "language": "python"})").get<submission>(), invalid_argument);
    EXPECT_THROW(nlohmann::json::parse(R"({"input_data": "1", "difficulty": "extreme"})").get<test_case>(), invalid_argument);
}

TEST(SubmissionTest, VerifyAcceptsValidSubmission) {
    EXPECT_NO_THROW(verify(valid_submission()));
}

TEST(SubmissionTest, VerifyRejectsEmptyTestCases) {
    submission submit = valid_submission();
    submit.test_cases.clear();
    EXPECT_THROW(verify(submit), invalid_submission);
}

TEST(SubmissionTest, VerifyRejectsBlankCode) {
    submission submit = valid_submission();
    submit.code = " \n\t";
    EXPECT_THROW(verify(submit), invalid_submission);
}

TEST(SubmissionTest, VerifyRejectsNonPositiveLimits) {
    {
        submission submit = valid_submission();
        submit.constraints.time_limit_seconds = 0;
        EXPECT_THROW(verify(submit), invalid_submission);
    }
    {
        submission submit = valid_submission();
        submit.constraints.memory_limit_mb = -1;
        EXPECT_THROW(verify(submit), invalid_submission);
    }
    {
        submission submit = valid_submission();
        submit.test_cases[0].time_limit_seconds = -2.5;
        EXPECT_THROW(verify(submit), invalid_submission);
    }
    {
        submission submit = valid_submission();
        submit.test_cases[0].time_limit_seconds = numeric_limits<double>::quiet_NaN();
        EXPECT_THROW(verify(submit), invalid_submission);
    }
}

TEST(SubmissionTest, VerifyAcceptsHugeTimeLimit) {
    submission submit = valid_submission();
    submit.constraints.time_limit_seconds = 1e12;
    EXPECT_NO_THROW(verify(submit));
}

TEST(SubmissionTest, Describe) {
    stringstream ss;
    ss << valid_submission();
    EXPECT_EQ(ss.str(), "Submission[python-add, 1 test cases]");
}
