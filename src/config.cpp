#include "config.hpp"

namespace harness {
using namespace std;

double TIME_LIMIT = 10;             // 10s
long long MEMORY_LIMIT = 1 << 20;   // 1G
long long FILE_LIMIT = 1 << 16;     // 64M
size_t OUTPUT_LIMIT = 1 << 16;      // 64K
size_t CONCURRENCY = 1;

filesystem::path RUNNER_PATH;
filesystem::path RUN_DIR = "/tmp/harness";
bool DEBUG = false;

}  // namespace harness
