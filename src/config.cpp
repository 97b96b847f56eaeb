#include "config.hpp"

namespace runner {
using namespace std;

filesystem::path RUN_DIR;
bool DEBUG = false;

}  // namespace runner
