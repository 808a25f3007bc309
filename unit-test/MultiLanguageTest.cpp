#include "config.hpp"
#include "gtest/gtest.h"
#include "judge/programming.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace codejudge;

class MultiLanguageTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    static void TearDownTestCase() {
    }

    submission prepare(const string &language, const string &code) {
        submission submit;
        submit.language = language;
        submit.problem_id = "1234";
        submit.code = code;
        return submit;
    }

    judge_report judge(const submission &submit) {
        programming_judger judger(language_registry::builtin());
        return judger.judge(submit);
    }

    void test(const string &language, const string &code, const string &input, const string &expected) {
        submission submit = prepare(language, code);
        submit.test_cases.push_back(make_test_case(input, expected));
        judge_report report = judge(submit);
        ASSERT_EQ(report.results.size(), 1u);
        EXPECT_EQ(report.results[0].verdict, status::ACCEPTED)
            << "output: " << report.results[0].output << endl
            << "error: " << report.results[0].error;
        EXPECT_EQ(report.verdict, final_verdict::ACCEPTED);
    }
};

TEST_F(MultiLanguageTest, CTest) {
    SKIP_WITHOUT("gcc");
    test("c", R"(
int add(int a, int b) {
    return a + b;
})",
         "2 3", "5");
}

TEST_F(MultiLanguageTest, CStringTest) {
    SKIP_WITHOUT("gcc");
    test("c", R"(
#include <string.h>
int length(const char *s) {
    return (int) strlen(s);
})",
         "hello world\n", "11");
}

TEST_F(MultiLanguageTest, CDoubleTest) {
    SKIP_WITHOUT("gcc");
    test("c", "double half(double x) { return x / 2; }", "5", "2.5");
}

TEST_F(MultiLanguageTest, CProgramTest) {
    SKIP_WITHOUT("gcc");
    test("c", R"(
#include <stdio.h>
int main() { puts("hello world"); })",
         "", "hello world");
}

TEST_F(MultiLanguageTest, CppTest) {
    SKIP_WITHOUT("g++");
    test("cpp", R"(
#include <vector>
long long sum(const std::vector<int> &values) {
    long long total = 0;
    for (int v : values) total += v;
    return total;
})",
         "1 2 3 4", "10");
}

TEST_F(MultiLanguageTest, CppClassTest) {
    SKIP_WITHOUT("g++");
    test("c++", R"(
class Solution {
public:
    string reverseWords(string s) {
        stringstream in(s);
        vector<string> words;
        for (string word; in >> word;) words.push_back(word);
        reverse(words.begin(), words.end());
        string result;
        for (size_t i = 0; i < words.size(); ++i) result += (i ? " " : "") + words[i];
        return result;
    }
};)",
         "the sky is blue", "blue is sky the");
}

TEST_F(MultiLanguageTest, CppVectorResultTest) {
    SKIP_WITHOUT("g++");
    test("cpp", R"(
vector<int> doubled(vector<int> values) {
    for (auto &v : values) v *= 2;
    return values;
})",
         "1 2 3", "[2, 4, 6]");
}

TEST_F(MultiLanguageTest, CppProgramTest) {
    SKIP_WITHOUT("g++");
    test("cpp", R"(
#include <iostream>
int main() { std::cout << "hello world" << std::endl; })",
         "", "hello world");
}

TEST_F(MultiLanguageTest, Python3Test) {
    SKIP_WITHOUT("python3");
    test("python3", R"(
def add(a, b):
    return a + b
)",
         "2 3", "5");
}

TEST_F(MultiLanguageTest, PythonStringTest) {
    SKIP_WITHOUT("python3");
    test("python", R"(
def greet(name):
    return "Hello, " + name + "!"
)",
         "big world", "Hello, big world!");
}

TEST_F(MultiLanguageTest, PythonSingleNumberTest) {
    SKIP_WITHOUT("python3");
    test("py", R"(
def factorial(n):
    return 1 if n <= 1 else n * factorial(n - 1)
)",
         "10", "3628800");
}

TEST_F(MultiLanguageTest, PythonVariadicTest) {
    SKIP_WITHOUT("python3");
    test("python", R"(
def total(*values):
    return sum(values)
)",
         "1 2 3 4", "10");
}

TEST_F(MultiLanguageTest, PythonAsyncTest) {
    SKIP_WITHOUT("python3");
    test("python", R"(
import asyncio

async def square(x):
    await asyncio.sleep(0)
    return x * x
)",
         "12", "144");
}

TEST_F(MultiLanguageTest, JavaScriptTest) {
    SKIP_WITHOUT("node");
    test("js", R"(
function add(a, b) {
    return a + b;
})",
         "2 3", "5");
}

TEST_F(MultiLanguageTest, JavaScriptArrowTest) {
    SKIP_WITHOUT("node");
    test("javascript", "const shout = (s) => s.toUpperCase() + '!';", "hey you", "HEY YOU!");
}

TEST_F(MultiLanguageTest, JavaScriptAsyncTest) {
    SKIP_WITHOUT("node");
    test("node", "async function square(x) { return x * x; }", "12", "144");
}

TEST_F(MultiLanguageTest, JavaTest) {
    SKIP_WITHOUT("javac");
    SKIP_WITHOUT("java");
    test("java", R"(
public class Solution {
    public int add(int a, int b) {
        return a + b;
    }
})",
         "2 3", "5");
}

TEST_F(MultiLanguageTest, JavaStaticArrayTest) {
    SKIP_WITHOUT("javac");
    SKIP_WITHOUT("java");
    test("java", R"(
import java.util.Arrays;

class Solution {
    static int[] sorted(int[] values) {
        Arrays.sort(values);
        return values;
    }
})",
         "3 1 2", "[1, 2, 3]");
}

TEST_F(MultiLanguageTest, JavaProgramTest) {
    SKIP_WITHOUT("javac");
    SKIP_WITHOUT("java");
    test("java", R"(
public class Main {
    public static void main(String[] args) {
        System.out.println("hello world");
    }
})",
         "", "hello world");
}
