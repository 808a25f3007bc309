#include "test/environment.hpp"
#include <glog/logging.h>
#include <gtest/gtest.h>
#include <filesystem>
#include "common/utils.hpp"
#include "config.hpp"

namespace codejudge {
using namespace std;

void setup_test_environment() {
    if (getenv("DEBUG")) codejudge::DEBUG = true;

    codejudge::RUN_DIR = filesystem::path("/tmp/codejudge-test/run");
    filesystem::create_directories(codejudge::RUN_DIR);
    CHECK(filesystem::is_directory(codejudge::RUN_DIR))
        << "Run directory " << codejudge::RUN_DIR << " does not exist";
}

bool has_toolchain(const string &executable) {
    return find_executable(executable);
}

test_case make_test_case(const string &input, const string &expected) {
    test_case tc;
    tc.input_data = input;
    tc.expected_output = expected;
    return tc;
}

}  // namespace codejudge
