#include "common/metadata.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <fstream>
#include <system_error>
#include <vector>

namespace runner {
using namespace std;

map<string, string> read_metadata(const filesystem::path &metadata_file) {
    map<string, string> mp;
    ifstream fin(metadata_file);
    string line;
    while (getline(fin, line)) {
        auto colon = line.find(':');
        if (colon == string::npos) continue;
        string key = boost::trim_copy(line.substr(0, colon));
        string value = boost::trim_copy(line.substr(colon + 1));
        mp[key] = value;
    }
    return mp;
}

template <typename T>
static void append_meta(ofstream &metafile, const char *key, const T &message) {
    metafile << key << ": " << message << endl;
}

void write_metadata(const filesystem::path &metadata_file, const execution_result &result) {
    ofstream metafile(metadata_file, ofstream::out | ofstream::trunc);
    if (!metafile)
        throw system_error(errno, system_category(), "unable to open metafile " + metadata_file.string());

    if (result.exitcode) append_meta(metafile, "exitcode", *result.exitcode);
    if (result.signal) append_meta(metafile, "signal", *result.signal);
    append_meta(metafile, "wall-time", fmt::format("{:.3f}", result.wall_time));
    append_meta(metafile, "time-result", result.timed_out ? "hard-timelimit" : "");

    vector<string> output_truncated;
    if (result.stdout_truncated) output_truncated.push_back("stdout");
    if (result.stderr_truncated) output_truncated.push_back("stderr");
    append_meta(metafile, "output-truncated", boost::algorithm::join(output_truncated, ","));

    append_meta(metafile, "stdout-bytes", result.stdout_data.size());
    append_meta(metafile, "stderr-bytes", result.stderr_data.size());

    if (result.status == status::INTERNAL_ERROR)
        append_meta(metafile, "internal-error", result.internal_message);
}

}  // namespace runner
