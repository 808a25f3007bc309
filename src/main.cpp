#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <thread>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "judge/programming.hpp"
using namespace std;

static nlohmann::json read_submission(const string &path) {
    if (path == "-") return nlohmann::json::parse(cin);

    ifstream fin(path);
    if (!fin) throw runtime_error("Unable to open submission file " + path);
    return nlohmann::json::parse(fin);
}

static void write_report(const string &path, const nlohmann::json &report) {
    if (path.empty() || path == "-") {
        cout << report.dump(2) << endl;
        return;
    }

    ofstream fout(path);
    if (!fout) throw runtime_error("Unable to open output file " + path);
    fout << report.dump(2) << endl;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("codejudge options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("submission", po::value<string>(), "path of the submission json file, or - to read from standard input")
        ("output", po::value<string>(), "path to write the judge report json, default to standard output")
        ("languages", po::value<vector<string>>(), "json files extending or overriding the builtin language table")
        ("workers", po::value<size_t>(), "number of test cases judged in parallel, default to the number of cores")
        ("run-dir", po::value<string>(), "set the directory to compile and run user programs. You can either pass it from environ RUNDIR")
        ("compile-time-limit", po::value<double>(), "set time limit in seconds for compilation, default to 10. You can either pass it from environ COMPILETIMELIMIT")
        ("output-limit", po::value<int64_t>(), "set the maximum bytes kept for each output stream of user programs, default to 64MB. You can either pass it from environ OUTPUTLIMIT")
        ("no-shared-compilation", "compile the submission once for every test case instead of once for the whole submission")
        ("reveal-hidden", "include output, expected output and error message of hidden test cases in the report")
        ("debug", "turn on the debug mode to keep compilation and run directories for inspection. You can either pass it from environ DEBUG")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "codejudge: judge a source code submission against its test cases" << endl
             << "Usage: " << argv[0] << " --submission <file|-> [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "codejudge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (!vm.count("submission")) {
        cerr << "--submission is required" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    try {
        if (vm.count("debug")) {
            codejudge::DEBUG = true;
        } else if (getenv("DEBUG")) {
            codejudge::DEBUG = true;
        }

        if (vm.count("run-dir")) {
            codejudge::RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
        } else if (getenv("RUNDIR")) {
            codejudge::RUN_DIR = filesystem::path(getenv("RUNDIR"));
        }
        filesystem::create_directories(codejudge::RUN_DIR);

        if (vm.count("compile-time-limit")) {
            codejudge::COMPILE_TIME_LIMIT = vm["compile-time-limit"].as<double>();
        } else if (getenv("COMPILETIMELIMIT")) {
            codejudge::COMPILE_TIME_LIMIT = boost::lexical_cast<double>(getenv("COMPILETIMELIMIT"));
        }
        CHECK(codejudge::COMPILE_TIME_LIMIT > 0) << "Compile time limit should be positive";

        if (vm.count("output-limit")) {
            codejudge::OUTPUT_LIMIT = vm["output-limit"].as<int64_t>();
        } else if (getenv("OUTPUTLIMIT")) {
            codejudge::OUTPUT_LIMIT = boost::lexical_cast<int64_t>(getenv("OUTPUTLIMIT"));
        }
        CHECK(codejudge::OUTPUT_LIMIT > 0) << "Output limit should be positive";

        codejudge::language_registry languages = codejudge::language_registry::builtin();
        if (vm.count("languages"))
            for (auto &file : vm["languages"].as<vector<string>>())
                languages.load(filesystem::path(file));

        codejudge::judge_options options;
        options.workers = vm.count("workers") ? vm["workers"].as<size_t>() : max(1u, thread::hardware_concurrency());
        options.share_compilation = !vm.count("no-shared-compilation");

        codejudge::submission submit = read_submission(vm["submission"].as<string>()).get<codejudge::submission>();
        codejudge::programming_judger judger(move(languages), options);
        codejudge::judge_report report = judger.judge(submit);

        write_report(vm.count("output") ? vm["output"].as<string>() : "", codejudge::to_json(report, vm.count("reveal-hidden") > 0));
    } catch (codejudge::unsupported_language &ex) {
        cerr << ex.what() << endl;
        return EXIT_FAILURE;
    } catch (codejudge::invalid_submission &ex) {
        cerr << ex.what() << endl;
        return EXIT_FAILURE;
    } catch (std::exception &ex) {
        LOG(ERROR) << boost::diagnostic_information(ex);
        cerr << ex.what() << endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
