#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace codejudge {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::ACCEPTED, "Accepted")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::COMPILATION_ERROR, "Compilation Error")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::SETUP_ERROR, "Setup Error");

static const unordered_map<status, const char *> status_name = boost::assign::map_list_of
    (status::ACCEPTED, "ACCEPTED")
    (status::WRONG_ANSWER, "WRONG_ANSWER")
    (status::COMPILATION_ERROR, "COMPILATION_ERROR")
    (status::RUNTIME_ERROR, "RUNTIME_ERROR")
    (status::TIME_LIMIT_EXCEEDED, "TIME_LIMIT_EXCEEDED")
    (status::SETUP_ERROR, "SETUP_ERROR");

static const unordered_map<final_verdict, const char *> final_verdict_name = boost::assign::map_list_of
    (final_verdict::ACCEPTED, "ACCEPTED")
    (final_verdict::PARTIAL, "PARTIAL")
    (final_verdict::FAILED, "FAILED");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

const char *get_status_name(status stat) {
    return status_name.at(stat);
}

const char *get_final_verdict_name(final_verdict verdict) {
    return final_verdict_name.at(verdict);
}

}  // namespace codejudge
