#include <boost/algorithm/string/replace.hpp>
#include <regex>
#include "judge/harness.hpp"

namespace codejudge {
using namespace std;

static const char *javascript_template = R"(

;(function () {
    const fn = %FUNCTION%;
    if (typeof fn !== 'function') {
        process.stderr.write('No entry point found\n');
        process.exit(1);
    }
    const text = require('fs').readFileSync(0, 'utf8').trim();
    const toNumber = (s) => (s !== '' && !isNaN(Number(s)) ? Number(s) : null);
    const tokens = text === '' ? [] : text.split(/\s+/).map((t) => {
        const value = toNumber(t);
        return value === null ? t : value;
    });
    const candidates = [];
    const number = toNumber(text);
    if (number !== null) candidates.push([number]);
    candidates.push(tokens);
    candidates.push([text]);
    const args = candidates.find((c) => c.length === fn.length) || tokens;
    const result = fn(...args);
    if (result instanceof Promise) {
        result.then((value) => console.log(String(value)), (error) => {
            console.error(error);
            process.exit(1);
        });
    } else {
        console.log(String(result));
    }
})();
)";

// 只保留花括号外的代码，其他字符替换为空格
static string top_level_code(const string &code) {
    string stripped = blank_comments_and_literals(code, false);
    int depth = 0;
    for (char &c : stripped) {
        if (c == '{') {
            ++depth;
            c = ' ';
        } else if (c == '}') {
            if (depth > 0) --depth;
            c = ' ';
        } else if (depth > 0 && c != '\n') {
            c = ' ';
        }
    }
    return stripped;
}

optional<entry_point> javascript_harness::find_entry_point(const string &code) const {
    static const regex function_regex(R"((?:^|[^\w$.])(?:async\s+)?function\s*\*?\s*([A-Za-z_$][\w$]*)\s*\()");
    static const regex binding_regex(R"((?:^|[^\w$.])(?:const|let|var)\s+([A-Za-z_$][\w$]*)\s*=\s*(?:async\s+)?(?:function\b|\([^()]*\)\s*=>|[A-Za-z_$][\w$]*\s*=>))");

    string top = top_level_code(code);
    smatch function_match, binding_match;
    bool has_function = regex_search(top, function_match, function_regex);
    bool has_binding = regex_search(top, binding_match, binding_regex);
    if (!has_function && !has_binding) return {};

    entry_point entry;
    if (has_function && (!has_binding || function_match.position(0) < binding_match.position(0)))
        entry.name = function_match[1];
    else
        entry.name = binding_match[1];
    return entry;
}

execution_unit javascript_harness::wrap(const string &code, const optional<entry_point> &entry, const language_profile &profile) const {
    string harness = javascript_template;
    string function = "null";
    if (entry)
        function = "typeof " + entry->name + " === 'function' ? " + entry->name + " : null";
    boost::replace_all(harness, "%FUNCTION%", function);

    execution_unit unit;
    unit.main_file = "solution" + profile.source_extension;
    unit.files.push_back({unit.main_file, code + "\n" + harness});
    unit.entry = entry;
    return unit;
}

}  // namespace codejudge
