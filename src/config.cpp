#include "config.hpp"

namespace difftest {
using namespace std;

filesystem::path CLANG_PATH = "/usr/bin/clang";
filesystem::path LLI_PATH = "/usr/bin/lli";
filesystem::path DIFF_PATH = "/usr/bin/diff";
filesystem::path RUNTIME_DATA_DIR;
filesystem::path CACHE_DIR;
filesystem::path WORK_DIR = "/tmp";
double COMPILE_TIMEOUT = 60;
double RUN_TIMEOUT = 300;
double KILL_GRACE_PERIOD = 30;
int DEFAULT_FLAKINESS = 5;
bool DEBUG = false;

}  // namespace difftest
