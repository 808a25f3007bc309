#include "judge/language.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace codejudge {
using namespace std;
using namespace nlohmann;

bool language_profile::compiled() const {
    return !compile_command.empty();
}

void from_json(const json &j, language_profile &profile) {
    profile.id = get_value<string>(j, "id");
    profile.aliases = get_value_def<vector<string>>(j, {}, "aliases");
    profile.source_extension = get_value<string>(j, "source_extension");
    profile.compile_command = get_value_def<vector<string>>(j, {}, "compile_command");
    profile.run_command = get_value<vector<string>>(j, "run_command");
    profile.default_timeout_seconds = get_value_def<double>(j, 2, "default_timeout_seconds");
    profile.default_memory_limit_mb = get_value_def<int>(j, 256, "default_memory_limit_mb");
    profile.limit_address_space = get_value_def<bool>(j, true, "limit_address_space");
    profile.harness = get_value_def<string>(j, profile.id, "harness");

    if (profile.id.empty())
        throw invalid_argument("language id should not be empty");
    if (profile.run_command.empty())
        throw invalid_argument("run_command of language " + profile.id + " should not be empty");
    if (profile.default_timeout_seconds <= 0 || profile.default_memory_limit_mb <= 0)
        throw invalid_argument("default limits of language " + profile.id + " should be positive");
}

language_registry language_registry::builtin() {
    language_registry registry;

    {
        language_profile python;
        python.id = "python";
        python.aliases = {"python3", "py"};
        python.source_extension = ".py";
        python.run_command = {"python3", "{source}"};
        python.default_timeout_seconds = 5;
        python.harness = "python";
        registry.add(python);
    }

    {
        language_profile c;
        c.id = "c";
        c.source_extension = ".c";
        c.compile_command = {"gcc", "-O2", "-std=gnu11", "-o", "{binary}", "{sources}", "-lm"};
        c.run_command = {"{binary}"};
        c.default_timeout_seconds = 2;
        c.harness = "c";
        registry.add(c);
    }

    {
        language_profile cpp;
        cpp.id = "c++";
        cpp.aliases = {"cpp", "cxx", "cc"};
        cpp.source_extension = ".cpp";
        cpp.compile_command = {"g++", "-O2", "-std=gnu++17", "-o", "{binary}", "{sources}"};
        cpp.run_command = {"{binary}"};
        cpp.default_timeout_seconds = 2;
        cpp.harness = "cpp";
        registry.add(cpp);
    }

    {
        language_profile java;
        java.id = "java";
        java.source_extension = ".java";
        java.compile_command = {"javac", "-encoding", "UTF-8", "-d", "{artifact_dir}", "{sources}"};
        java.run_command = {"java", "-Xmx{memory_mb}m", "-Xss64m", "-cp", "{artifact_dir}", "{main_class}"};
        java.default_timeout_seconds = 5;
        java.limit_address_space = false;
        java.harness = "java";
        registry.add(java);
    }

    {
        language_profile javascript;
        javascript.id = "javascript";
        javascript.aliases = {"js", "node"};
        javascript.source_extension = ".js";
        javascript.run_command = {"node", "{source}"};
        javascript.default_timeout_seconds = 5;
        javascript.limit_address_space = false;
        javascript.harness = "javascript";
        registry.add(javascript);
    }

    return registry;
}

void language_registry::add(const language_profile &profile) {
    for (auto it = index.begin(); it != index.end();) {
        if (it->second == profile.id)
            it = index.erase(it);
        else
            ++it;
    }

    profiles[profile.id] = profile;
    index[boost::algorithm::to_lower_copy(profile.id)] = profile.id;
    for (auto &alias : profile.aliases)
        index[boost::algorithm::to_lower_copy(alias)] = profile.id;
}

void language_registry::load(const json &j) {
    for (auto &item : access(j, "languages")) {
        language_profile profile = item.get<language_profile>();
        LOG(INFO) << "Loaded language " << profile.id;
        add(profile);
    }
}

void language_registry::load(const filesystem::path &file) {
    if (!filesystem::is_regular_file(file))
        throw internal_error("unable to open language configuration " + file.string());
    load(json::parse(read_file_content(file)));
}

const language_profile &language_registry::resolve(const string &language) const {
    auto it = index.find(boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(language)));
    if (it == index.end()) throw unsupported_language(language);
    return profiles.at(it->second);
}

vector<string> language_registry::languages() const {
    vector<string> result;
    for (auto &[id, profile] : profiles)
        result.push_back(id);
    return result;
}

}  // namespace codejudge
