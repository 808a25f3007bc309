#include <fmt/format.h>
#include <boost/algorithm/string.hpp>
#include <map>
#include <regex>
#include <set>
#include <sstream>
#include "judge/harness.hpp"

namespace codejudge {
using namespace std;

static const char *c_prelude = R"(#include <ctype.h>
#include <math.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
)";

static const char *c_support = R"(
static char *judge_read_all(void) {
    size_t capacity = 4096, length = 0;
    char *buffer = (char *) malloc(capacity);
    int ch;
    if (!buffer) exit(1);
    while ((ch = getchar()) != EOF) {
        if (length + 1 >= capacity) {
            char *grown = (char *) realloc(buffer, capacity * 2);
            if (!grown) exit(1);
            buffer = grown;
            capacity *= 2;
        }
        buffer[length++] = (char) ch;
    }
    buffer[length] = '\0';
    return buffer;
}

static char *judge_trim(char *str) {
    char *end;
    while (*str && isspace((unsigned char) *str)) ++str;
    end = str + strlen(str);
    while (end > str && isspace((unsigned char) end[-1])) --end;
    *end = '\0';
    return str;
}
)";

static const char *cpp_prelude = R"(#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdint>
#include <functional>
#include <iostream>
#include <iterator>
#include <map>
#include <numeric>
#include <queue>
#include <set>
#include <sstream>
#include <stack>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>
using namespace std;
)";

static const char *cpp_support = R"(
template <typename T>
static bool judge_read(std::istream &in, T &value) {
    return static_cast<bool>(in >> value);
}

static bool judge_read(std::istream &in, bool &value) {
    std::string token;
    if (!(in >> token)) return false;
    value = token == "true" || token == "True" || token == "1";
    return true;
}

template <typename T>
static void judge_write(std::ostream &os, const T &value) {
    os << value;
}

template <typename T>
static void judge_write(std::ostream &os, const std::vector<T> &values) {
    os << '[';
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) os << ", ";
        judge_write(os, values[i]);
    }
    os << ']';
}

static std::string judge_trim(const std::string &str) {
    size_t begin = str.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(begin, end - begin + 1);
}
)";

/**
 * @brief C 语言类型对应的 scanf, printf 格式
 */
struct c_format {
    const char *declared;  // 读入时使用的变量类型
    const char *scan;
    const char *print;
};

// clang-format off
static const map<string, c_format> c_formats = {
    {"int", {"int", "%d", "%d"}},
    {"long", {"long", "%ld", "%ld"}},
    {"long int", {"long", "%ld", "%ld"}},
    {"long long", {"long long", "%lld", "%lld"}},
    {"long long int", {"long long", "%lld", "%lld"}},
    {"unsigned", {"unsigned", "%u", "%u"}},
    {"unsigned int", {"unsigned", "%u", "%u"}},
    {"unsigned long", {"unsigned long", "%lu", "%lu"}},
    {"unsigned long long", {"unsigned long long", "%llu", "%llu"}},
    {"short", {"short", "%hd", "%hd"}},
    {"unsigned short", {"unsigned short", "%hu", "%hu"}},
    {"size_t", {"size_t", "%zu", "%zu"}},
    {"double", {"double", "%lf", "%.15g"}},
    {"float", {"float", "%f", "%g"}},
    {"char", {"char", " %c", "%c"}},
    {"bool", {"int", "%d", "%d"}},
    {"_Bool", {"int", "%d", "%d"}}
};

static const set<string> cpp_scalars = {
    "int", "long", "long int", "long long", "long long int", "short", "unsigned", "unsigned int",
    "unsigned long", "unsigned long long", "unsigned short", "size_t", "int32_t", "int64_t",
    "uint32_t", "uint64_t", "double", "float", "long double", "char", "bool"
};

static const set<string> type_keywords = {
    "int", "long", "short", "char", "double", "float", "unsigned", "signed", "bool", "void"
};

static const set<string> statement_keywords = {
    "if", "for", "while", "switch", "return", "sizeof", "catch", "do", "else"
};
// clang-format on

static string collapse_spaces(const string &str) {
    static const regex spaces(R"(\s+)");
    return boost::algorithm::trim_copy(regex_replace(str, spaces, " "));
}

/**
 * @brief 去掉类型中的 const, &, struct 等修饰
 * "const std::vector<int> &" 变为 "std::vector<int>"，"const char *" 变为 "char*"
 */
static string normalize_type(const string &type) {
    static const regex qualifiers(R"(\b(const|volatile|struct|enum|register|restrict|static|inline|extern|constexpr|virtual|explicit|friend)\b)");
    static const regex punctuation(R"(\s*(<|>|\*|,|::)\s*)");
    string result = boost::replace_all_copy(type, "&", " ");
    result = collapse_spaces(regex_replace(result, qualifiers, " "));
    return regex_replace(result, punctuation, "$1");
}

// 按照同一层的逗号切分，忽略尖括号和圆括号内的逗号
static vector<string> split_arguments(const string &str) {
    vector<string> result;
    int depth = 0;
    string current;
    for (char c : str) {
        if (c == '<' || c == '(' || c == '[') ++depth;
        if (c == '>' || c == ')' || c == ']') --depth;
        if (c == ',' && depth == 0) {
            result.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    result.push_back(current);
    return result;
}

static parameter parse_parameter(const string &raw) {
    static const regex named(R"(^(.*[\s*&>])([A-Za-z_]\w*)$)");

    string text = raw.substr(0, raw.find('='));
    boost::algorithm::trim(text);

    bool array = false;
    if (boost::algorithm::ends_with(text, "]")) {
        text = boost::algorithm::trim_copy(text.substr(0, text.find('[')));
        array = true;
    }

    parameter param;
    smatch match;
    if (regex_match(text, match, named) && !type_keywords.count(match[2])) {
        param.type = match[1];
        param.name = match[2];
    } else {
        param.type = text;
    }
    param.type = normalize_type(param.type) + (array ? "*" : "");
    return param;
}

/**
 * @brief 尝试将花括号之前的文本解析为函数定义的声明部分
 * @return 不是函数定义（如类、命名空间、初始化列表、模板函数、类外定义的成员函数）时返回空
 */
static optional<entry_point> parse_function_header(const string &raw) {
    static const regex tail(R"(\)\s*((const|noexcept|override|final)\s*)*$)");
    static const regex name_regex(R"(^(.*[\s*&>])([A-Za-z_]\w*)$)");

    string header = collapse_spaces(raw);
    if (header.empty() || boost::algorithm::starts_with(header, "template")) return {};

    smatch match;
    if (!regex_search(header, match, tail)) return {};
    size_t close = match.position(0);

    size_t open = string::npos;
    int depth = 0;
    for (size_t i = close + 1; i-- > 0;) {
        if (header[i] == ')') {
            ++depth;
        } else if (header[i] == '(' && --depth == 0) {
            open = i;
            break;
        }
    }
    if (open == string::npos) return {};

    string before = boost::algorithm::trim_copy(header.substr(0, open));
    smatch name_match;
    if (!regex_match(before, name_match, name_regex)) return {};

    entry_point entry;
    entry.name = name_match[2];
    string return_type = name_match[1];
    if (statement_keywords.count(entry.name) || return_type.find_first_of("()=;") != string::npos)
        return {};
    // 构造函数的初始化列表
    if (boost::replace_all_copy(return_type, "::", "").find(':') != string::npos)
        return {};
    entry.return_type = normalize_type(return_type);
    if (entry.return_type.empty()) return {};

    string params = boost::algorithm::trim_copy(header.substr(open + 1, close - open - 1));
    if (!params.empty() && params != "void")
        for (auto &param : split_arguments(params))
            entry.parameters.push_back(parse_parameter(param));
    return entry;
}

// 类中第一个 public 的成员函数定义，跳过构造函数和析构函数
static optional<entry_point> find_public_method(const string &text, const scope_segment &cls, const string &class_name, bool is_struct) {
    static const regex access_regex(R"((public|private|protected)\s*:(?!:))");

    bool is_public = is_struct;
    for (auto &seg : split_scope(text, cls.body_begin, cls.body_end)) {
        string header = seg.header;
        size_t label_end = 0;
        for (sregex_iterator it(header.begin(), header.end(), access_regex), last; it != last; ++it) {
            is_public = (*it)[1] == "public";
            label_end = it->position(0) + it->length(0);
        }
        header = header.substr(label_end);

        if (seg.terminator != '{' || !is_public) continue;
        auto entry = parse_function_header(header);
        if (!entry || entry->name == class_name) continue;
        entry->kind = entry_point::entry_kind::METHOD;
        entry->owner = class_name;
        return entry;
    }
    return {};
}

c_family_harness::c_family_harness(bool cpp) : cpp(cpp) {}

optional<entry_point> c_family_harness::find_entry_point(const string &code) const {
    static const regex class_regex(R"(^\s*(class|struct)\s+([A-Za-z_]\w*)\s*(final\b)?\s*(:[^{]*)?$)");

    string text = blank_comments_and_literals(code, true);
    vector<scope_segment> segments = split_scope(text, 0, text.size());

    for (auto &seg : segments) {
        if (seg.terminator != '{') continue;
        auto entry = parse_function_header(seg.header);
        if (entry && entry->name == "main") {
            entry->kind = entry_point::entry_kind::PROGRAM;
            return entry;
        }
    }

    for (auto &seg : segments) {
        if (seg.terminator != '{') continue;
        if (auto entry = parse_function_header(seg.header)) return entry;

        smatch match;
        string header = collapse_spaces(seg.header);
        if (cpp && regex_match(header, match, class_regex)) {
            if (auto entry = find_public_method(text, seg, match[2], match[1] == "struct"))
                return entry;
        }
    }
    return {};
}

enum class argument_kind {
    SCALAR,
    STRING,
    C_STRING,
    VECTOR,
    UNSUPPORTED
};

static argument_kind classify_cpp_type(const string &type, string &element) {
    static const regex vector_regex(R"(^vector<(.+)>$)");
    string plain = boost::replace_all_copy(type, "std::", "");
    if (plain == "string") return argument_kind::STRING;
    if (plain == "char*") return argument_kind::C_STRING;
    if (cpp_scalars.count(plain)) return argument_kind::SCALAR;

    smatch match;
    if (regex_match(plain, match, vector_regex)) {
        element = match[1];
        if (element == "string" || cpp_scalars.count(element)) return argument_kind::VECTOR;
    }
    return argument_kind::UNSUPPORTED;
}

static string unsupported_main(const string &type, bool cpp) {
    string message = quote_string("Unsupported parameter type: " + type + "\n");
    if (cpp)
        return fmt::format("\nint main() {{\n    std::cerr << {};\n    return 1;\n}}\n", message);
    else
        return fmt::format("\nint main(void) {{\n    fprintf(stderr, {});\n    return 1;\n}}\n", message);
}

string c_family_harness::generate_cpp_main(const entry_point &entry) const {
    ostringstream body;
    vector<string> args;
    for (size_t i = 0; i < entry.parameters.size(); ++i) {
        const parameter &param = entry.parameters[i];
        string var = fmt::format("judge_arg{}", i);
        string element;
        argument_kind kind = classify_cpp_type(param.type, element);
        switch (kind) {
            case argument_kind::STRING:
            case argument_kind::C_STRING:
                if (entry.parameters.size() == 1)
                    body << fmt::format("    std::string {} = judge_trim(judge_input);\n", var);
                else
                    body << fmt::format("    std::string {};\n    judge_read(judge_in, {});\n", var, var);
                args.push_back(kind == argument_kind::C_STRING ? "&" + var + "[0]" : var);
                break;
            case argument_kind::SCALAR:
                body << fmt::format("    {} {}{{}};\n    judge_read(judge_in, {});\n", param.type, var, var);
                args.push_back(var);
                break;
            case argument_kind::VECTOR:
                body << fmt::format("    {} {};\n", param.type, var);
                body << fmt::format("    for ({} judge_value; judge_read(judge_in, judge_value);)\n        {}.push_back(judge_value);\n", element, var);
                args.push_back(var);
                break;
            case argument_kind::UNSUPPORTED:
                return unsupported_main(param.type, true);
        }
    }

    string call = entry.name + "(" + boost::algorithm::join(args, ", ") + ")";
    if (entry.kind == entry_point::entry_kind::METHOD)
        call = entry.owner + "()." + call;

    string result;
    if (entry.return_type == "void")
        result = fmt::format("    {};\n", call);
    else
        result = fmt::format("    auto judge_result = {};\n    judge_write(std::cout, judge_result);\n    std::cout << std::endl;\n", call);

    return string(cpp_support) +
           "\nint main() {\n"
           "    std::string judge_input((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());\n"
           "    std::istringstream judge_in(judge_input);\n" +
           body.str() + result +
           "    return 0;\n"
           "}\n";
}

string c_family_harness::generate_c_main(const entry_point &entry) const {
    ostringstream body;
    vector<string> args;
    for (size_t i = 0; i < entry.parameters.size(); ++i) {
        const parameter &param = entry.parameters[i];
        string var = fmt::format("judge_arg{}", i);
        if (param.type == "char*") {
            if (entry.parameters.size() == 1)
                body << fmt::format("    char *{} = judge_trim(judge_read_all());\n", var);
            else
                body << fmt::format("    static char {}[1 << 20];\n    if (scanf(\"%1048575s\", {}) != 1) {}[0] = '\\0';\n", var, var, var);
        } else {
            auto it = c_formats.find(param.type);
            if (it == c_formats.end()) return unsupported_main(param.type, false);
            const c_format &format = it->second;
            body << fmt::format("    {} {} = 0;\n    if (scanf(\"{}\", &{}) != 1) {} = 0;\n", format.declared, var, format.scan, var, var);
        }
        args.push_back(var);
    }

    string call = entry.name + "(" + boost::algorithm::join(args, ", ") + ")";
    string result;
    if (entry.return_type == "void") {
        result = fmt::format("    {};\n", call);
    } else if (entry.return_type == "char*") {
        result = fmt::format("    printf(\"%s\\n\", {});\n", call);
    } else {
        auto it = c_formats.find(entry.return_type);
        if (it == c_formats.end()) return unsupported_main(entry.return_type, false);
        result = fmt::format("    printf(\"{}\\n\", {});\n", it->second.print, call);
    }

    return string(c_support) + "\nint main(void) {\n" + body.str() + result + "    return 0;\n}\n";
}

execution_unit c_family_harness::wrap(const string &code, const optional<entry_point> &entry, const language_profile &profile) const {
    execution_unit unit;
    unit.main_file = "solution" + profile.source_extension;
    unit.entry = entry;

    if (entry && entry->kind == entry_point::entry_kind::PROGRAM) {
        unit.files.push_back({unit.main_file, code});
        return unit;
    }

    string content = cpp ? cpp_prelude : c_prelude;
    content += "#line 1 " + quote_string(unit.main_file) + "\n";
    content += code;
    content += "\n#line 1 \"judge_main" + profile.source_extension + "\"\n";
    if (!entry)
        content += cpp ? "\nint main() {\n    std::cerr << \"No entry point found\" << std::endl;\n    return 1;\n}\n"
                       : "\nint main(void) {\n    fprintf(stderr, \"No entry point found\\n\");\n    return 1;\n}\n";
    else
        content += cpp ? generate_cpp_main(*entry) : generate_c_main(*entry);

    unit.files.push_back({unit.main_file, content});
    return unit;
}

}  // namespace codejudge
