#include <boost/algorithm/string.hpp>
#include <regex>
#include "judge/harness.hpp"

namespace codejudge {
using namespace std;

// 通过反射调用入口方法，%CLASS% 和 %METHOD% 会被替换
static const char *java_template = R"(import java.lang.reflect.Array;
import java.lang.reflect.Constructor;
import java.lang.reflect.Method;
import java.lang.reflect.Modifier;
import java.nio.charset.StandardCharsets;
import java.util.ArrayList;
import java.util.Arrays;
import java.util.List;

public class JudgeHarness {
    private static Object convert(String token, Class<?> type) {
        if (type == int.class || type == Integer.class) return Integer.parseInt(token);
        if (type == long.class || type == Long.class) return Long.parseLong(token);
        if (type == double.class || type == Double.class) return Double.parseDouble(token);
        if (type == float.class || type == Float.class) return Float.parseFloat(token);
        if (type == short.class || type == Short.class) return Short.parseShort(token);
        if (type == byte.class || type == Byte.class) return Byte.parseByte(token);
        if (type == boolean.class || type == Boolean.class) return Boolean.parseBoolean(token);
        if (type == char.class || type == Character.class) return token.charAt(0);
        if (type == String.class || type == Object.class) return token;
        throw new IllegalArgumentException("Unsupported parameter type: " + type.getName());
    }

    private static Object guess(String token) {
        try {
            return Integer.parseInt(token);
        } catch (NumberFormatException e) {
        }
        try {
            return Long.parseLong(token);
        } catch (NumberFormatException e) {
        }
        try {
            return Double.parseDouble(token);
        } catch (NumberFormatException e) {
        }
        return token;
    }

    private static String format(Object value) {
        if (value == null) return "null";
        if (value instanceof int[]) return Arrays.toString((int[]) value);
        if (value instanceof long[]) return Arrays.toString((long[]) value);
        if (value instanceof double[]) return Arrays.toString((double[]) value);
        if (value instanceof float[]) return Arrays.toString((float[]) value);
        if (value instanceof boolean[]) return Arrays.toString((boolean[]) value);
        if (value instanceof char[]) return Arrays.toString((char[]) value);
        if (value instanceof short[]) return Arrays.toString((short[]) value);
        if (value instanceof byte[]) return Arrays.toString((byte[]) value);
        if (value instanceof Object[]) return Arrays.deepToString((Object[]) value);
        return String.valueOf(value);
    }

    public static void main(String[] args) throws Exception {
        String text = new String(System.in.readAllBytes(), StandardCharsets.UTF_8).trim();
        String[] tokens = text.isEmpty() ? new String[0] : text.split("\\s+");

        Method target = null;
        for (Method method : %CLASS%.class.getDeclaredMethods()) {
            if (method.getName().equals(%METHOD%)) {
                target = method;
                break;
            }
        }
        if (target == null) {
            System.err.println("No entry point found");
            System.exit(1);
        }
        target.setAccessible(true);

        Class<?>[] types = target.getParameterTypes();
        Object[] arguments = new Object[types.length];
        if (types.length == 1 && types[0] == String.class) {
            arguments[0] = text;
        } else {
            int position = 0;
            for (int i = 0; i < types.length; i++) {
                if (types[i].isArray()) {
                    Class<?> component = types[i].getComponentType();
                    Object array = Array.newInstance(component, tokens.length - position);
                    for (int j = 0; position < tokens.length; j++, position++)
                        Array.set(array, j, convert(tokens[position], component));
                    arguments[i] = array;
                } else if (List.class.isAssignableFrom(types[i])) {
                    List<Object> list = new ArrayList<>();
                    for (; position < tokens.length; position++)
                        list.add(guess(tokens[position]));
                    arguments[i] = list;
                } else {
                    if (position >= tokens.length)
                        throw new IllegalArgumentException("Not enough input for parameter " + (i + 1));
                    arguments[i] = convert(tokens[position++], types[i]);
                }
            }
        }

        Object instance = null;
        if (!Modifier.isStatic(target.getModifiers())) {
            Constructor<?> constructor = %CLASS%.class.getDeclaredConstructor();
            constructor.setAccessible(true);
            instance = constructor.newInstance();
        }
        Object result = target.invoke(instance, arguments);
        if (target.getReturnType() != void.class)
            System.out.println(format(result));
    }
}
)";

static const char *java_missing_entry = R"(public class JudgeHarness {
    public static void main(String[] args) {
        System.err.println("No entry point found");
        System.exit(1);
    }
}
)";

/**
 * @brief 找到入口类，优先选择 public 类，否则选择第一个类
 * @param text 已经去掉注释和字符串的代码
 * @param class_name 入口类的类名
 */
static optional<scope_segment> find_entry_class(const string &text, string &class_name) {
    static const regex class_regex(R"((?:^|\s)((?:(?:public|abstract|final|static|strictfp)\s+)*)class\s+([A-Za-z_$][\w$]*))");

    optional<scope_segment> entry_class;
    for (auto &seg : split_scope(text, 0, text.size())) {
        if (seg.terminator != '{') continue;
        smatch match;
        if (!regex_search(seg.header, match, class_regex)) continue;
        bool is_public = match[1].str().find("public") != string::npos;
        if (!entry_class || is_public) {
            entry_class = seg;
            class_name = match[2];
        }
        if (is_public) break;
    }
    return entry_class;
}

optional<entry_point> java_harness::find_entry_point(const string &code) const {
    static const regex main_regex(R"((?:^|\s)(?:(?:public|static|final)\s+)*void\s+main\s*\(\s*(?:final\s+)?String\s*(?:\[\s*\]|\.\.\.)\s*[A-Za-z_$][\w$]*\s*(?:\[\s*\])?\s*\)\s*(?:throws[^{]*)?$)");
    static const regex static_regex(R"(\bstatic\b)");
    static const regex method_regex(R"((?:^|\s)([\w$<>\[\],.?]+(?:\s*\[\s*\])*)\s+([A-Za-z_$][\w$]*)\s*\(([^()]*)\)\s*(?:throws[^{]*)?$)");
    static const regex modifiers(R"(@[\w$.]+(\([^)]*\))?|\b(public|private|protected|static|final|synchronized|abstract|native|strictfp)\b)");

    string text = blank_comments_and_literals(code, false);

    string class_name;
    optional<scope_segment> entry_class = find_entry_class(text, class_name);
    if (!entry_class) return {};

    entry_point entry;
    entry.owner = class_name;

    vector<scope_segment> members = split_scope(text, entry_class->body_begin, entry_class->body_end);
    for (auto &seg : members) {
        if (seg.terminator != '{') continue;
        if (regex_search(seg.header, main_regex) && regex_search(seg.header, static_regex)) {
            entry.kind = entry_point::entry_kind::PROGRAM;
            entry.name = "main";
            return entry;
        }
    }

    for (auto &seg : members) {
        if (seg.terminator != '{') continue;
        string header = regex_replace(seg.header, modifiers, " ");
        smatch match;
        if (!regex_search(header, match, method_regex)) continue;
        if (match[2] == class_name || match[1] == "new" || match[1] == "class" || match[1] == "interface" || match[1] == "enum") continue;
        entry.kind = entry_point::entry_kind::METHOD;
        entry.return_type = match[1];
        entry.name = match[2];
        return entry;
    }
    return {};
}

execution_unit java_harness::wrap(const string &code, const optional<entry_point> &entry, const language_profile &profile) const {
    static const regex package_regex(R"((^|\n)\s*package\s+[\w.]+\s*;)");

    // 编译产物必须放在 classpath 的根目录下
    string source = regex_replace(code, package_regex, "$1");

    execution_unit unit;
    unit.entry = entry;

    if (!entry) {
        // 类中没有可调用的方法时仍然要按类名命名文件，否则 javac 拒绝编译 public 类
        string class_name;
        if (!find_entry_class(blank_comments_and_literals(code, false), class_name) || class_name == "JudgeHarness")
            class_name = "Solution";
        unit.files.push_back({class_name + profile.source_extension, source});
        unit.files.push_back({"JudgeHarness" + profile.source_extension, java_missing_entry});
        unit.main_file = "JudgeHarness" + profile.source_extension;
        unit.main_class = "JudgeHarness";
        return unit;
    }

    unit.files.push_back({entry->owner + profile.source_extension, source});
    if (entry->kind == entry_point::entry_kind::PROGRAM) {
        unit.main_file = entry->owner + profile.source_extension;
        unit.main_class = entry->owner;
        return unit;
    }

    string harness = java_template;
    boost::replace_all(harness, "%CLASS%", entry->owner);
    boost::replace_all(harness, "%METHOD%", quote_string(entry->name));
    unit.files.push_back({"JudgeHarness" + profile.source_extension, harness});
    unit.main_file = "JudgeHarness" + profile.source_extension;
    unit.main_class = "JudgeHarness";
    return unit;
}

}  // namespace codejudge
