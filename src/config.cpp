#include "config.hpp"

namespace sortbot {
using namespace std;

double TIMEOUT = 30;            // 30s
string PYTHON = "python3";
filesystem::path RUN_DIR;
int MEMORY_LIMIT = 128;         // 128M
size_t OUTPUT_LIMIT = 1 << 20;  // 1M
int PROCESS_LIMIT = 1024;
size_t WORKERS = 1;
bool SANDBOX_ENABLED = true;
bool DEBUG = false;

}  // namespace sortbot
