#include "judge/classifier.hpp"
#include <boost/algorithm/string/trim.hpp>

namespace codejudge {
using namespace std;

classification classify(const raw_execution_result &raw, const string &expected_output) {
    string output = boost::algorithm::trim_copy(raw.stdout_text);

    if (raw.timed_out)
        return {status::TIME_LIMIT_EXCEEDED, output};
    if (raw.compile_failed)
        return {status::COMPILATION_ERROR, ""};

    string expected = boost::algorithm::trim_copy(expected_output);
    if (raw.exit_code != 0 || (output.empty() && !expected.empty()))
        return {status::RUNTIME_ERROR, output};

    return {output == expected ? status::ACCEPTED : status::WRONG_ANSWER, output};
}

}  // namespace codejudge
