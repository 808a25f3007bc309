#include "judge/runner.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/replace.hpp>
#include <map>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "judge/process.hpp"

namespace codejudge {
using namespace std;
namespace fs = std::filesystem;

/**
 * @brief 替换命令中的占位符
 * {sources} 单独作为一个参数时展开为多个参数
 */
static vector<string> expand_command(const vector<string> &command, const map<string, string> &variables, const vector<string> &sources) {
    vector<string> result;
    for (auto &arg : command) {
        if (arg == "{sources}") {
            result.insert(result.end(), sources.begin(), sources.end());
            continue;
        }
        string expanded = arg;
        for (auto &[key, value] : variables)
            boost::replace_all(expanded, key, value);
        result.push_back(expanded);
    }
    return result;
}

static vector<string> write_sources(const execution_unit &unit, const fs::path &dir) {
    vector<string> sources;
    for (auto &file : unit.files) {
        fs::path path = dir / assert_safe_path(file.name);
        write_file_content(path, file.content);
        sources.push_back(path.string());
    }
    return sources;
}

shared_ptr<const compiled_program> process_runner::compile(const execution_unit &unit, const language_profile &profile) const {
    if (!profile.compiled())
        throw internal_error("Language " + profile.id + " does not need compilation");

    auto program = make_shared<compiled_program>();
    program->directory = scoped_directory(RUN_DIR, "build-");
    fs::path src_dir = program->directory.path() / "src";
    program->artifact_dir = program->directory.path() / "bin";
    program->binary = program->artifact_dir / "program";
    program->main_class = unit.main_class;
    fs::create_directories(src_dir);
    fs::create_directories(program->artifact_dir);

    vector<string> sources = write_sources(unit, src_dir);
    map<string, string> variables = {
        {"{source}", (src_dir / unit.main_file).string()},
        {"{binary}", program->binary.string()},
        {"{artifact_dir}", program->artifact_dir.string()},
        {"{work_dir}", src_dir.string()},
        {"{main_class}", unit.main_class},
        {"{memory_mb}", to_string(profile.default_memory_limit_mb)}};

    process_options options;
    options.command = expand_command(profile.compile_command, variables, sources);
    options.work_dir = src_dir;
    options.timeout_seconds = COMPILE_TIME_LIMIT;

    LOG(INFO) << "Compiling " << profile.id << " program in " << program->directory.path();
    process_result result = run_process(options);

    program->compile_log = result.stdout_text + result.stderr_text;
    if (result.timed_out)
        program->compile_log += "\nCompilation time limit exceeded";
    program->success = !result.timed_out && result.exit_code == 0;

    if (program->success) {
        make_read_only(program->artifact_dir);
        LOG(INFO) << "Compiled " << profile.id << " program in " << result.wall_time << "s";
    } else {
        LOG(INFO) << "Compilation of " << profile.id << " program failed with exit code " << result.exit_code;
    }
    return program;
}

raw_execution_result process_runner::run(const execution_unit &unit, const language_profile &profile, const execution_limits &limits, const compiled_program *program) const {
    raw_execution_result raw;

    // 没有共享的编译产物时，本次运行单独编译，编译产物随本次运行删除
    shared_ptr<const compiled_program> own_program;
    if (profile.compiled() && !program) {
        own_program = compile(unit, profile);
        program = own_program.get();
    }
    if (program && !program->success) {
        raw.compile_failed = true;
        raw.compile_log = program->compile_log;
        return raw;
    }

    scoped_directory run_dir(RUN_DIR, "run-");
    map<string, string> variables = {
        {"{work_dir}", run_dir.path().string()},
        {"{main_class}", unit.main_class},
        {"{memory_mb}", to_string(limits.memory_limit_mb)}};

    vector<string> sources;
    if (program) {
        variables["{source}"] = (program->directory.path() / "src" / unit.main_file).string();
        variables["{binary}"] = program->binary.string();
        variables["{artifact_dir}"] = program->artifact_dir.string();
    } else {
        sources = write_sources(unit, run_dir.path());
        variables["{source}"] = (run_dir.path() / unit.main_file).string();
        variables["{binary}"] = (run_dir.path() / unit.main_file).string();
        variables["{artifact_dir}"] = run_dir.path().string();
    }

    process_options options;
    options.command = expand_command(profile.run_command, variables, sources);
    options.work_dir = run_dir.path();
    options.stdin_data = unit.stdin_data;
    options.timeout_seconds = limits.time_limit_seconds;
    if (profile.limit_address_space)
        options.memory_limit_bytes = (int64_t)limits.memory_limit_mb * 1024 * 1024;

    process_result result = run_process(options);
    DLOG(INFO) << "Ran " << profile.id << " program in " << result.wall_time << "s with exit code " << result.exit_code;

    raw.stdout_text = move(result.stdout_text);
    raw.stderr_text = move(result.stderr_text);
    raw.exit_code = result.exit_code;
    raw.signal = result.signal;
    raw.wall_time = result.wall_time;
    raw.timed_out = result.timed_out;
    raw.output_truncated = result.output_truncated;
    return raw;
}

}  // namespace codejudge
