#include "common/utils.hpp"
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <vector>
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

bool find_executable(const string &name) {
    if (name.find('/') != string::npos)
        return access(name.c_str(), X_OK) == 0;

    vector<string> dirs;
    string path = get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    boost::split(dirs, path, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        if (dir.empty()) continue;
        filesystem::path candidate = filesystem::path(dir) / name;
        error_code ec;
        if (access(candidate.c_str(), X_OK) == 0 && !filesystem::is_directory(candidate, ec))
            return true;
    }
    return false;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return duration<chrono::duration<double>>().count();
}
