#include <boost/algorithm/string/replace.hpp>
#include <regex>
#include <sstream>
#include "judge/harness.hpp"

namespace codejudge {
using namespace std;

// 调用入口函数时依次尝试：整个输入是一个数字、按空白分隔的参数、整个输入作为字符串
static const char *python_template = R"(

def _judge_number(text):
    for cast in (int, float):
        try:
            return cast(text)
        except (TypeError, ValueError):
            pass
    return None


def _judge_main():
    import inspect
    import sys
    name = %ENTRY%
    fn = globals().get(name) if name else None
    if not callable(fn):
        sys.stderr.write("No entry point found\n")
        sys.exit(1)
    text = sys.stdin.read().strip()
    candidates = []
    number = _judge_number(text)
    if number is not None:
        candidates.append([number])
    tokens = []
    for token in text.split():
        value = _judge_number(token)
        tokens.append(token if value is None else value)
    candidates.append(tokens)
    candidates.append([text])
    try:
        signature = inspect.signature(fn)
    except (TypeError, ValueError):
        signature = None
    for args in candidates:
        if signature is not None:
            try:
                signature.bind(*args)
            except TypeError:
                continue
        result = fn(*args)
        if inspect.iscoroutine(result):
            import asyncio
            result = asyncio.run(result)
        print(result)
        return
    sys.stderr.write("Cannot adapt input to the parameters of %s\n" % name)
    sys.exit(1)


_judge_main()
)";

optional<entry_point> python_harness::find_entry_point(const string &code) const {
    static const regex def_regex(R"(^(?:async\s+)?def\s+([A-Za-z_][A-Za-z0-9_]*)\s*\()");

    istringstream stream(code);
    string line, triple;
    while (getline(stream, line)) {
        if (triple.empty()) {
            smatch match;
            if (regex_search(line, match, def_regex)) {
                entry_point entry;
                entry.name = match[1];
                return entry;
            }
        }

        // 跳过字符串和注释，记录跨行的三引号字符串
        size_t i = 0;
        while (i < line.size()) {
            if (!triple.empty()) {
                size_t end = line.find(triple, i);
                if (end == string::npos) break;
                i = end + 3;
                triple.clear();
                continue;
            }

            char c = line[i];
            if (c == '#') break;
            if (c == '"' || c == '\'') {
                string quotes(3, c);
                if (line.compare(i, 3, quotes) == 0) {
                    triple = quotes;
                    i += 3;
                    continue;
                }
                size_t j = i + 1;
                while (j < line.size() && line[j] != c) {
                    if (line[j] == '\\') ++j;
                    ++j;
                }
                i = j + 1;
                continue;
            }
            ++i;
        }
    }
    return {};
}

execution_unit python_harness::wrap(const string &code, const optional<entry_point> &entry, const language_profile &profile) const {
    string harness = python_template;
    boost::replace_all(harness, "%ENTRY%", entry ? quote_string(entry->name) : "None");

    execution_unit unit;
    unit.main_file = "solution" + profile.source_extension;
    unit.files.push_back({unit.main_file, code + "\n" + harness});
    unit.entry = entry;
    return unit;
}

}  // namespace codejudge
