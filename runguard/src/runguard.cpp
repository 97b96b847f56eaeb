#include <glog/logging.h>
#include <math.h>
#include <unistd.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include "common/io_utils.hpp"
#include "common/metadata.hpp"
#include "common/utils.hpp"
#include "run.hpp"

using namespace std;
using namespace runner;

struct seconds_limit {
    double value;
};

void validate(boost::any& v, const vector<string>& values, seconds_limit*, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);

    string const& s = validators::get_single_string(values);
    seconds_limit result;
    try {
        result.value = boost::lexical_cast<double>(s);
    } catch (boost::bad_lexical_cast&) {
        throw validation_error(validation_error::invalid_option_value);
    }

    if (!isfinite(result.value) || result.value <= 0)
        throw validation_error(validation_error::invalid_option_value);

    v = result;
}

static void write_stream(const string& filename, const string& data, ostream& fallback) {
    if (filename.empty()) {
        fallback << data;
        fallback.flush();
    } else {
        write_file_content(filename, data);
    }
}

int main(int argc, const char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("runguard options");
    po::positional_options_description pos;
    po::variables_map vm;

    runguard_options opt;

    // clang-format off
    desc.add_options()
        ("work-dir,d", po::value<string>(), "run command with working directory set to work-dir")
        ("wall-time,T", po::value<seconds_limit>(), "kill command after wall time clock seconds (floating point is acceptable)")
        ("cpu-time,t", po::value<seconds_limit>(), "set maximum CPU time (floating point is acceptable) consumption of the command in seconds")
        ("memory-limit,m", po::value<size_t>(), "set maximum memory consumption of the command in KB")
        ("file-limit,f", po::value<size_t>(), "set maximum created file size of the command in KB")
        ("nproc,p", po::value<size_t>(), "set maximum process living simutanously")
        ("allow-core-dumps", "do not disable core dumps")
        ("standard-input-file,i", po::value<string>(), "redirect command standard input fd to file")
        ("standard-output-file,o", po::value<string>(), "write captured command standard output to file")
        ("standard-error-file,e", po::value<string>(), "write captured command standard error to file")
        ("stream-size", po::value<size_t>(), "truncate command output streams at the size in KB")
        ("environment,E", "preserve PATH of the current environment (or only /usr/bin:/bin is loaded)")
        ("variable,V", po::value<vector<string>>(), "add additional environment variables (e.g. -Vkey1=value1 -Vkey2=value2)")
        ("out-meta,M", po::value<string>(), "write runguard monitor results (run time, exitcode, ...) to file")
        ("cmd", po::value<vector<string>>()->composing()->required(), "commands")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    pos.add("cmd", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(pos)
                      .run(),
                  vm);
        if (vm.count("help")) {
            cout << "Runguard: Running a command with wall time, resource and output limitations." << endl
                 << "Usage: " << argv[0] << " [options] -- [command]" << endl;
            cout << desc << endl;
            return 0;
        }

        if (vm.count("version")) {
            cout << "runguard (code-runner) 1.0" << endl;
            return 0;
        }

        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return 1;
    }

    string path = vm.count("environment") ? get_env("PATH", "/usr/bin:/bin") : "/usr/bin:/bin";
    opt.env.push_back("PATH=" + path);
    if (vm.count("variable")) {
        for (auto& variable : vm["variable"].as<vector<string>>())
            opt.env.push_back(variable);
    }

    if (vm.count("work-dir")) opt.work_dir = vm["work-dir"].as<string>();
    if (vm.count("wall-time")) opt.use_wall_limit = true, opt.wall_limit = vm["wall-time"].as<seconds_limit>().value;
    if (vm.count("cpu-time")) opt.use_cpu_limit = true, opt.cpu_limit = vm["cpu-time"].as<seconds_limit>().value;
    if (vm.count("memory-limit")) opt.memory_limit = (int64_t)vm["memory-limit"].as<size_t>() * 1024;
    if (vm.count("file-limit")) opt.file_limit = (int64_t)vm["file-limit"].as<size_t>() * 1024;
    if (vm.count("nproc")) opt.nproc = vm["nproc"].as<size_t>();
    if (vm.count("allow-core-dumps")) opt.no_core_dumps = false;
    if (vm.count("standard-input-file")) opt.stdin_filename = vm["standard-input-file"].as<string>();
    if (vm.count("stream-size")) opt.stream_size = (int64_t)vm["stream-size"].as<size_t>() * 1024;

    opt.command = vm["cmd"].as<vector<string>>();
    auto executable = find_executable(opt.command[0], path);
    if (!executable) {
        cerr << "command not found: " << opt.command[0] << endl;
        return 127;
    }
    opt.command[0] = executable->string();

    execution_result result = runit(opt);

    try {
        write_stream(vm.count("standard-output-file") ? vm["standard-output-file"].as<string>() : "", result.stdout_data, cout);
        write_stream(vm.count("standard-error-file") ? vm["standard-error-file"].as<string>() : "", result.stderr_data, cerr);
        if (vm.count("out-meta"))
            write_metadata(vm["out-meta"].as<string>(), result);
    } catch (std::exception& e) {
        LOG(ERROR) << e.what();
        return 1;
    }

    if (result.status == status::INTERNAL_ERROR) {
        cerr << result.internal_message << endl;
        return 1;
    }
    if (result.timed_out) return 124;
    return result.exitcode.value_or(1);
}
