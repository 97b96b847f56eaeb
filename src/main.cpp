#include <glog/logging.h>
#include <signal.h>
#include <string.h>
#include <sys/stat.h>
#include <boost/program_options.hpp>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/io_utils.hpp"
#include "common/messages.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "engine/config.hpp"
#include "engine/engine.hpp"
#include "engine/language.hpp"
#include "worker.hpp"
using namespace std;
using nlohmann::json;

void sigintHandler(int /* signum */) {
    runner::stop_workers();
}

static string dump_line(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

static int list_languages() {
    json languages = json::array();
    for (auto& info : runner::get_languages())
        languages.push_back({{"id", info.id},
                             {"name", info.name},
                             {"extension", info.extension},
                             {"template", info.template_code}});
    cout << languages.dump(2) << endl;
    return EXIT_SUCCESS;
}

static int run_batch(runner::engine& exec, size_t workers) {
    runner::concurrent_queue<runner::message::execution_task> task_queue;
    mutex output_mutex;
    auto output = [&output_mutex](const string& line) {
        scoped_lock guard(output_mutex);
        cout << line << '\n';
        cout.flush();
    };

    vector<thread> worker_threads;
    for (size_t i = 0; i < workers; ++i)
        worker_threads.push_back(runner::start_worker(i, task_queue, exec, output));

    string line;
    size_t line_no = 0;
    while (!runner::workers_stopped() && getline(cin, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == string::npos) continue;

        runner::message::execution_task task;
        try {
            json j = json::parse(line);
            task.id = j.value("id", json());
            task.request = j.get<runner::execution_request>();
        } catch (json::exception& e) {
            LOG(WARNING) << "Malformed request at line " << line_no << ": " << e.what();
            json j = runner::to_response(runner::make_result(runner::status::INVALID_INPUT, "Malformed request"));
            j["id"] = task.id;
            output(dump_line(j));
            continue;
        }
        task_queue.push(task);
    }
    task_queue.close();

    for (auto& th : worker_threads)
        th.join();

    return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    // 不设置 SA_RESTART，使阻塞在标准输入上的读取被 SIGINT 打断
    struct sigaction sigact;
    memset(&sigact, 0, sizeof(sigact));
    sigact.sa_handler = sigintHandler;
    sigemptyset(&sigact.sa_mask);
    sigaction(SIGINT, &sigact, nullptr);

    namespace po = boost::program_options;
    po::options_description desc("runner options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "load engine configuration from the given JSON file")
        ("profile", po::value<string>()->default_value("development"), "configuration profile: development, production or testing")
        ("run-dir", po::value<string>(), "set the directory to create workspaces in. You can either pass it from environ RUNDIR")
        ("log-file", po::value<string>(), "also write logs to files with the given path prefix")
        ("language,l", po::value<string>(), "language of the code: python, c, javascript or html. Inferred from --file when omitted")
        ("file,f", po::value<string>(), "read the code from file")
        ("code,c", po::value<string>(), "code to execute")
        ("client", po::value<string>()->default_value("cli"), "client id used by rate limiting")
        ("batch", "read JSON-lines requests {id, code, language, client_id} from stdin and write JSON-lines responses to stdout")
        ("workers,w", po::value<size_t>(), "number of worker threads in batch mode, default to max_concurrent_executions")
        ("list-languages", "print supported languages as JSON")
        ("clean", "remove stale workspaces left in the run directory")
        ("debug", "turn on the debug mode to log every command executed. You can either pass it from environ DEBUG")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "Runner: Execute untrusted code with validation, resource limits and rate limiting" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "code-runner 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("list-languages"))
        return list_languages();

    if (vm.count("debug") || getenv("DEBUG"))
        runner::DEBUG = true;

    runner::engine_config config;
    try {
        config = runner::load_config(vm.count("config") ? vm["config"].as<string>() : "", vm["profile"].as<string>());
    } catch (std::exception& e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    FLAGS_minloglevel = config.min_log_level;
    if (vm.count("log-file")) {
        string log_file = vm["log-file"].as<string>();
        google::SetLogDestination(google::INFO, log_file.c_str());
        FLAGS_logtostderr = false;
        FLAGS_alsologtostderr = true;
    }

    if (vm.count("run-dir")) {
        runner::RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        runner::RUN_DIR = filesystem::path(getenv("RUNDIR"));
    } else {
        runner::RUN_DIR = config.run_dir;
    }
    config.run_dir = runner::RUN_DIR;

    // 工作目录只允许当前用户访问
    umask(0077);
    error_code ec;
    filesystem::create_directories(runner::RUN_DIR, ec);
    CHECK(filesystem::is_directory(runner::RUN_DIR))
        << "Run directory " << runner::RUN_DIR << " does not exist";

    runner::engine exec(config);

    if (vm.count("clean")) {
        size_t removed = exec.workspaces().clean_stale();
        cout << "Removed " << removed << " stale workspaces" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("batch")) {
        size_t workers = vm.count("workers") ? vm["workers"].as<size_t>() : config.max_concurrent_executions;
        return run_batch(exec, max<size_t>(workers, 1));
    }

    runner::execution_request request;
    request.client_id = vm["client"].as<string>();
    if (vm.count("code")) {
        request.code = vm["code"].as<string>();
    } else if (vm.count("file")) {
        filesystem::path file = vm["file"].as<string>();
        if (!filesystem::is_regular_file(file)) {
            cerr << "File " << file << " does not exist" << endl;
            return EXIT_FAILURE;
        }
        request.code = runner::read_file_content(file);
    } else {
        cerr << "Either --code, --file or --batch should be specified" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("language")) {
        request.language = vm["language"].as<string>();
    } else {
        runner::language lang = vm.count("file") ? runner::language_from_filename(vm["file"].as<string>())
                                                  : runner::language::python;
        request.language = runner::get_language_info(lang).id;
    }

    runner::execution_response response = runner::to_response(exec.execute(request));
    cout << dump_line(response) << endl;
    return response.success ? EXIT_SUCCESS : EXIT_FAILURE;
}
