#include "config.hpp"

namespace codejudge {
using namespace std;

double COMPILE_TIME_LIMIT = 10;          // 10s
int64_t OUTPUT_LIMIT = 64 * 1024 * 1024;  // 64M
double KILL_DELAY = 0.1;                  // 0.1s

filesystem::path RUN_DIR = filesystem::temp_directory_path() / "codejudge";
bool DEBUG = false;

}  // namespace codejudge
