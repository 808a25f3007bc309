#include <algorithm>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "judge/harness.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace codejudge;

class HarnessGeneratorTest : public ::testing::Test {
protected:
    language_registry registry = language_registry::builtin();
    harness_generator generator;

    optional<entry_point> find(const string &language, const string &code) {
        return generator.get(registry.resolve(language).harness).find_entry_point(code);
    }

    execution_unit build(const string &language, const string &code, const string &input = "") {
        return generator.build(code, registry.resolve(language), make_test_case(input, ""));
    }
};

TEST_F(HarnessGeneratorTest, UnknownHarness) {
    EXPECT_THROW(generator.get("brainfuck"), internal_error);
}

TEST_F(HarnessGeneratorTest, PythonFirstTopLevelFunction) {
    auto entry = find("python", R"(
import math

class Helper:
    def inner(self):
        pass

# def commented(x):
TEXT = """
def quoted(x):
"""

def solve(n):
    return helper(n)

def helper(n):
    return n * 2
)");
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->name, "solve");
}

TEST_F(HarnessGeneratorTest, PythonAsyncFunction) {
    auto entry = find("python", "async def fetch(x):\n    return x\n");
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->name, "fetch");
}

TEST_F(HarnessGeneratorTest, PythonNoFunction) {
    EXPECT_FALSE(find("python", "print(input())\n"));
}

TEST_F(HarnessGeneratorTest, PythonWrap) {
    execution_unit unit = build("py", "def add(a, b):\n    return a + b\n", "2 3");
    EXPECT_EQ(unit.main_file, "solution.py");
    ASSERT_EQ(unit.files.size(), 1u);
    EXPECT_EQ(unit.files[0].name, "solution.py");
    EXPECT_EQ(unit.files[0].content.find("def add(a, b):\n    return a + b\n"), 0u);
    EXPECT_NE(unit.files[0].content.find("name = \"add\""), string::npos);
    EXPECT_EQ(unit.stdin_data, "2 3");
    ASSERT_TRUE(unit.entry);
    EXPECT_EQ(unit.entry->name, "add");
}

TEST_F(HarnessGeneratorTest, PythonWrapWithoutEntry) {
    execution_unit unit = build("python", "x = 1\n");
    EXPECT_FALSE(unit.entry);
    EXPECT_NE(unit.files[0].content.find("name = None"), string::npos);
}

TEST_F(HarnessGeneratorTest, JavaScriptDeclarations) {
    EXPECT_EQ(find("js", "function add(a, b) { return a + b; }")->name, "add");
    EXPECT_EQ(find("js", "const twice = (x) => x * 2;")->name, "twice");
    EXPECT_EQ(find("js", "let square = x => x * x;")->name, "square");
    EXPECT_EQ(find("js", "var legacy = function (x) { return x; };")->name, "legacy");
    EXPECT_EQ(find("js", "async function later(x) { return x; }")->name, "later");
    EXPECT_FALSE(find("js", "console.log(42);"));
    EXPECT_FALSE(find("js", "const limit = 10;"));
}

TEST_F(HarnessGeneratorTest, JavaScriptIgnoresNestedFunctions) {
    auto entry = find("javascript", R"(
const LIMIT = 3;
// function commented() {}
const solve = (n) => {
    function inner(x) { return x; }
    return inner(n);
};
)");
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->name, "solve");
}

TEST_F(HarnessGeneratorTest, JavaScriptWrap) {
    execution_unit unit = build("javascript", "function add(a, b) { return a + b; }", "1 2");
    EXPECT_EQ(unit.main_file, "solution.js");
    EXPECT_NE(unit.files[0].content.find("typeof add === 'function' ? add : null"), string::npos);
    EXPECT_EQ(unit.stdin_data, "1 2");
}

TEST_F(HarnessGeneratorTest, CppFunction) {
    auto entry = find("cpp", R"(
#include <vector>
#include <string>
using namespace std;

// int commented(int x) { return x; }
static const int LIMIT = 10;

long long sum(const vector<int> &values, int offset) {
    long long total = offset;
    for (int v : values) total += v;
    return total;
}
)");
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->kind, entry_point::entry_kind::FUNCTION);
    EXPECT_EQ(entry->name, "sum");
    EXPECT_EQ(entry->return_type, "long long");
    ASSERT_EQ(entry->parameters.size(), 2u);
    EXPECT_EQ(entry->parameters[0].type, "vector<int>");
    EXPECT_EQ(entry->parameters[0].name, "values");
    EXPECT_EQ(entry->parameters[1].type, "int");
    EXPECT_EQ(entry->parameters[1].name, "offset");
}

TEST_F(HarnessGeneratorTest, CppClassMethod) {
    auto entry = find("c++", R"(
class Solution {
    int cache[100];
    int helper(int x) { return x; }
public:
    Solution() {}
    string reverseWords(string s) {
        return s;
    }
};
)");
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->kind, entry_point::entry_kind::METHOD);
    EXPECT_EQ(entry->owner, "Solution");
    EXPECT_EQ(entry->name, "reverseWords");
    EXPECT_EQ(entry->return_type, "string");
    ASSERT_EQ(entry->parameters.size(), 1u);
    EXPECT_EQ(entry->parameters[0].type, "string");
}

TEST_F(HarnessGeneratorTest, CppCompleteProgram) {
    const string code = R"(
#include <iostream>
int square(int x) { return x * x; }
int main() {
    int n;
    std::cin >> n;
    std::cout << square(n) << std::endl;
}
)";
    auto entry = find("cpp", code);
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->kind, entry_point::entry_kind::PROGRAM);

    execution_unit unit = build("cpp", code);
    ASSERT_EQ(unit.files.size(), 1u);
    EXPECT_EQ(unit.files[0].content, code);
}

TEST_F(HarnessGeneratorTest, CppWrapGeneratesMain) {
    execution_unit unit = build("cpp", "int add(int a, int b) { return a + b; }", "2 3");
    EXPECT_EQ(unit.main_file, "solution.cpp");
    const string &content = unit.files[0].content;
    EXPECT_NE(content.find("#line 1 \"solution.cpp\"\nint add(int a, int b) { return a + b; }"), string::npos);
    EXPECT_NE(content.find("int main()"), string::npos);
    EXPECT_NE(content.find("add(judge_arg0, judge_arg1)"), string::npos);
}

TEST_F(HarnessGeneratorTest, CppUnsupportedParameter) {
    execution_unit unit = build("cpp", "int count(map<int, int> m) { return m.size(); }");
    EXPECT_NE(unit.files[0].content.find("Unsupported parameter type: map<int,int>"), string::npos);
}

TEST_F(HarnessGeneratorTest, CFunction) {
    auto entry = find("c", R"(
#include <string.h>
int length(char *s) {
    return strlen(s);
}
)");
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->name, "length");
    EXPECT_EQ(entry->return_type, "int");
    ASSERT_EQ(entry->parameters.size(), 1u);
    EXPECT_EQ(entry->parameters[0].type, "char*");
}

TEST_F(HarnessGeneratorTest, CIgnoresStructsAndPrototypes) {
    auto entry = find("c", R"(
struct point { int x, y; };
int distance(struct point p);
double scale(double factor) { return factor * 2; }
)");
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->name, "scale");
    EXPECT_EQ(entry->return_type, "double");
}

TEST_F(HarnessGeneratorTest, CNoEntry) {
    execution_unit unit = build("c", "int x = 3;");
    EXPECT_FALSE(unit.entry);
    EXPECT_NE(unit.files[0].content.find("No entry point found"), string::npos);
}

TEST_F(HarnessGeneratorTest, JavaMethod) {
    auto entry = find("java", R"(
import java.util.*;

class Helper {
    int help() { return 1; }
}

public class Solution {
    private int cache;

    public Solution() {}

    @Override
    public String toString() { return "Solution"; }
}
)");
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->kind, entry_point::entry_kind::METHOD);
    EXPECT_EQ(entry->owner, "Solution");
    EXPECT_EQ(entry->name, "toString");
    EXPECT_EQ(entry->return_type, "String");
}

TEST_F(HarnessGeneratorTest, JavaProgram) {
    auto entry = find("java", R"(
public class Main {
    public static void main(String[] args) {
        System.out.println("hello");
    }
}
)");
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->kind, entry_point::entry_kind::PROGRAM);
    EXPECT_EQ(entry->owner, "Main");
}

TEST_F(HarnessGeneratorTest, JavaWrap) {
    execution_unit unit = build("java", R"(package com.example;

public class Calculator {
    public int add(int a, int b) { return a + b; }
}
)");
    EXPECT_EQ(unit.main_class, "JudgeHarness");
    EXPECT_EQ(unit.main_file, "JudgeHarness.java");
    ASSERT_EQ(unit.files.size(), 2u);
    EXPECT_EQ(unit.files[0].name, "Calculator.java");
    EXPECT_EQ(unit.files[0].content.find("package"), string::npos);
    EXPECT_NE(unit.files[1].content.find("Calculator.class"), string::npos);
}

TEST_F(HarnessGeneratorTest, JavaWrapWithoutMethod) {
    execution_unit unit = build("java", "public class Main {\n    int x;\n    public Main() {}\n}\n");
    EXPECT_FALSE(unit.entry);
    ASSERT_EQ(unit.files.size(), 2u);
    EXPECT_EQ(unit.files[0].name, "Main.java");
    EXPECT_EQ(unit.files[1].name, "JudgeHarness.java");
    EXPECT_EQ(unit.main_class, "JudgeHarness");

    unit = build("java", "int x;");
    EXPECT_EQ(unit.files[0].name, "Solution.java");
}

TEST_F(HarnessGeneratorTest, BlankCommentsAndLiterals) {
    string code = "int a = 1; // tail\n/* block\n */ char *s = \"{\";\n#include <x>\n";
    string blanked = blank_comments_and_literals(code, true);
    EXPECT_EQ(blanked.size(), code.size());
    EXPECT_EQ(blanked.find("tail"), string::npos);
    EXPECT_EQ(blanked.find("block"), string::npos);
    EXPECT_EQ(blanked.find('{'), string::npos);
    EXPECT_EQ(blanked.find("include"), string::npos);
    EXPECT_EQ(count(blanked.begin(), blanked.end(), '\n'), count(code.begin(), code.end(), '\n'));
}
