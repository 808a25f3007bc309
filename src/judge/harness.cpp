#include "judge/harness.hpp"
#include <glog/logging.h>
#include <cctype>
#include "common/exceptions.hpp"

namespace codejudge {
using namespace std;

language_harness::~language_harness() = default;

harness_generator::harness_generator() {
    register_harness("python", make_unique<python_harness>());
    register_harness("javascript", make_unique<javascript_harness>());
    register_harness("c", make_unique<c_family_harness>(false));
    register_harness("cpp", make_unique<c_family_harness>(true));
    register_harness("java", make_unique<java_harness>());
}

void harness_generator::register_harness(const string &name, unique_ptr<language_harness> &&harness) {
    harnesses[name] = move(harness);
}

const language_harness &harness_generator::get(const string &name) const {
    auto it = harnesses.find(name);
    if (it == harnesses.end())
        throw internal_error("No harness named " + name);
    return *it->second;
}

execution_unit harness_generator::build(const string &code, const language_profile &profile, const test_case &tc) const {
    const language_harness &harness = get(profile.harness);
    optional<entry_point> entry = harness.find_entry_point(code);
    if (entry)
        DLOG(INFO) << "Found entry point " << entry->name << " in " << profile.id << " code";
    else
        LOG(WARNING) << "No entry point found in " << profile.id << " code";

    execution_unit unit = harness.wrap(code, entry, profile);
    unit.stdin_data = tc.input_data;
    return unit;
}

string blank_comments_and_literals(const string &code, bool strip_preprocessor) {
    enum class state {
        CODE,
        LINE_COMMENT,
        BLOCK_COMMENT,
        STRING,
        CHARACTER,
        PREPROCESSOR
    };

    string result = code;
    state s = state::CODE;
    bool line_start = true;  // 本行目前只有空白字符

    auto blank = [&](size_t i) {
        if (result[i] != '\n') result[i] = ' ';
    };

    for (size_t i = 0; i < code.size(); ++i) {
        char c = code[i];
        char next = i + 1 < code.size() ? code[i + 1] : '\0';

        switch (s) {
            case state::CODE:
                if (c == '/' && next == '/') {
                    s = state::LINE_COMMENT;
                    blank(i);
                } else if (c == '/' && next == '*') {
                    s = state::BLOCK_COMMENT;
                    blank(i), blank(++i);
                } else if (c == '"') {
                    s = state::STRING;
                    blank(i);
                } else if (c == '\'') {
                    s = state::CHARACTER;
                    blank(i);
                } else if (c == '#' && line_start && strip_preprocessor) {
                    s = state::PREPROCESSOR;
                    blank(i);
                }
                break;
            case state::LINE_COMMENT:
                if (c == '\n') s = state::CODE;
                blank(i);
                break;
            case state::BLOCK_COMMENT:
                if (c == '*' && next == '/') {
                    s = state::CODE;
                    blank(i), blank(++i);
                } else {
                    blank(i);
                }
                break;
            case state::STRING:
            case state::CHARACTER:
                if (c == '\\') {
                    blank(i);
                    if (i + 1 < code.size()) blank(++i);
                } else if (c == '\n' || (c == '"' && s == state::STRING) || (c == '\'' && s == state::CHARACTER)) {
                    s = state::CODE;
                    blank(i);
                } else {
                    blank(i);
                }
                break;
            case state::PREPROCESSOR:
                if (c == '\\' && next == '\n') {
                    blank(i);
                    ++i;
                } else if (c == '\n') {
                    s = state::CODE;
                } else {
                    blank(i);
                }
                break;
        }

        if (code[i] == '\n')
            line_start = true;
        else if (!isspace(static_cast<unsigned char>(code[i])))
            line_start = false;
    }
    return result;
}

vector<scope_segment> split_scope(const string &text, size_t begin, size_t end) {
    vector<scope_segment> segments;
    size_t start = begin;
    int paren = 0;
    for (size_t i = begin; i < end; ++i) {
        char c = text[i];
        if (c == '(') {
            ++paren;
        } else if (c == ')') {
            if (paren > 0) --paren;
        } else if (c == ';' && paren == 0) {
            segments.push_back({text.substr(start, i - start), ';', 0, 0});
            start = i + 1;
        } else if (c == '{') {
            int depth = 1;
            size_t j = i + 1;
            for (; j < end && depth > 0; ++j) {
                if (text[j] == '{') ++depth;
                else if (text[j] == '}') --depth;
            }
            segments.push_back({text.substr(start, i - start), '{', i + 1, depth == 0 ? j - 1 : end});
            start = j;
            i = j - 1;
            paren = 0;
        } else if (c == '}') {
            start = i + 1;
        }
    }
    return segments;
}

string quote_string(const string &str) {
    string result = "\"";
    for (char c : str) {
        switch (c) {
            case '\\': result += "\\\\"; break;
            case '"': result += "\\\""; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default: result += c; break;
        }
    }
    result += "\"";
    return result;
}

}  // namespace codejudge
