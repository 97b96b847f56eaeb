#include "common/utils.hpp"
#include <stdlib.h>
#include <unistd.h>
#include <boost/algorithm/string.hpp>

namespace runner {
using namespace std;
namespace fs = std::filesystem;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

static bool is_executable_file(const fs::path &path) {
    error_code ec;
    return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

optional<fs::path> find_executable(const string &name, const string &search_path) {
    if (name.empty()) return nullopt;
    if (name.find('/') != string::npos) {
        if (is_executable_file(name)) return fs::absolute(name);
        return nullopt;
    }

    vector<string> dirs;
    boost::split(dirs, search_path, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / name;
        if (is_executable_file(candidate)) return candidate;
    }
    return nullopt;
}

elapsed_time::elapsed_time() : start(chrono::steady_clock::now()) {}

}  // namespace runner
