#include "engine/strategy.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/replace.hpp>
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "engine/javascript.hpp"
#include "run.hpp"

namespace runner {
using namespace std;

static const char *CHILD_PATH = "/usr/bin:/bin";

static filesystem::path resolve_executable(const string &name, const engine_config &config) {
    auto path = find_executable(name, config.search_path);
    if (!path) throw internal_error(fmt::format("executable {} not found in {}", name, config.search_path));
    return *path;
}

language_strategy make_strategy(language lang) {
    switch (lang) {
        case language::python: return python_strategy{};
        case language::c: return c_strategy{};
        case language::javascript: return javascript_strategy{};
        case language::html: return html_strategy{};
    }
    throw internal_error("Unrecognized language");
}

vector<string> build_command(const python_strategy &, const workspace &ws, const engine_config &config) {
    return make_command(resolve_executable(config.python, config), "-B", "-I", ws.source_name());
}

vector<string> build_compile_command(const c_strategy &, const workspace &ws, const engine_config &config) {
    return make_command(resolve_executable(config.c_compiler, config),
                        "-std=gnu11", "-O2", "-Wall", "-Wextra",
                        "-fstack-protector-strong", "-fPIE", "-pie", "-D_FORTIFY_SOURCE=2",
                        ws.source_name(), "-o", "main", "-lm");
}

vector<string> build_command(const c_strategy &, const workspace &, const engine_config &) {
    return {"./main"};
}

runguard_options make_runguard_options(const workspace &ws, const engine_config &config,
                                       vector<string> command, double timeout, bool memory_limit) {
    runguard_options opt;
    opt.command = move(command);
    opt.work_dir = ws.root_dir().string();
    opt.env = {
        string("PATH=") + CHILD_PATH,
        "HOME=" + ws.root_dir().string(),
        "LANG=C.UTF-8"};
    if (ws.lang == language::python) {
        opt.env.push_back("PYTHONDONTWRITEBYTECODE=1");
        opt.env.push_back("PYTHONIOENCODING=utf-8");
    }

    opt.use_wall_limit = true;
    opt.wall_limit = timeout;
    opt.use_cpu_limit = true;
    opt.cpu_limit = timeout + 1;
    if (memory_limit && config.memory_limit > 0) opt.memory_limit = config.memory_limit * 1024;
    if (config.file_limit > 0) opt.file_limit = config.file_limit * 1024;
    opt.nproc = config.process_limit;
    opt.stream_size = config.max_output_size;
    opt.no_core_dumps = true;

    if (DEBUG) LOG(INFO) << "Command: " << boost::algorithm::join(opt.command, " ");
    return opt;
}

/**
 * @brief 在工作目录中运行命令
 * 解释器的回溯信息中包含源文件的绝对路径，这里去掉工作目录前缀，避免泄露服务器的目录结构
 */
static execution_result run_in_workspace(const workspace &ws, const runguard_options &opt) {
    execution_result result = runit(opt);
    // 子进程看到的是解析过符号链接的路径
    error_code ec;
    filesystem::path dir = filesystem::canonical(ws.root_dir(), ec);
    if (ec) dir = filesystem::absolute(ws.root_dir()).lexically_normal();
    string prefix = dir.string() + "/";
    boost::algorithm::replace_all(result.stdout_data, prefix, "");
    boost::algorithm::replace_all(result.stderr_data, prefix, "");
    return result;
}

/**
 * @brief 编译 C 代码
 * @return 若编译失败，返回 COMPILE_FAILED 结果，编译器诊断信息保存在 stdout_data 中
 */
static optional<execution_result> compile(const c_strategy &strategy, workspace &ws, const engine_config &config) {
    auto opt = make_runguard_options(ws, config, build_compile_command(strategy, ws, config), config.compile_timeout, false);
    execution_result compile_result = run_in_workspace(ws, opt);
    if (compile_result.status == status::INTERNAL_ERROR) return compile_result;

    if (compile_result.timed_out) {
        LOG(INFO) << "Compilation timed out after " << config.compile_timeout << "s";
        return make_result(status::COMPILE_FAILED, "Compilation timed out");
    }

    if (compile_result.status != status::SUCCESS) {
        execution_result result = make_result(status::COMPILE_FAILED, "Compilation failed");
        // gcc 的诊断信息写在标准错误输出中
        result.stdout_data = compile_result.stdout_data + compile_result.stderr_data;
        result.stdout_truncated = compile_result.stdout_truncated || compile_result.stderr_truncated;
        result.exitcode = compile_result.exitcode;
        return result;
    }

    ws.binary_file = ws.root_dir() / "main";
    return nullopt;
}

execution_result execute(const language_strategy &strategy, workspace &ws, const string &code, const engine_config &config) {
    return visit(overloaded{
                     [&](const python_strategy &s) {
                         return run_in_workspace(ws, make_runguard_options(ws, config, build_command(s, ws, config), config.execution_timeout, true));
                     },
                     [&](const c_strategy &s) {
                         if (auto failure = compile(s, ws, config)) return *failure;
                         return run_in_workspace(ws, make_runguard_options(ws, config, build_command(s, ws, config), config.execution_timeout, true));
                     },
                     [&](const javascript_strategy &) {
                         javascript_options opt;
                         opt.timeout = config.execution_timeout;
                         opt.memory_limit = config.memory_limit > 0 ? config.memory_limit * 1024 : -1;
                         opt.stream_size = config.max_output_size;
                         return run_javascript(code, opt);
                     },
                     [&](const html_strategy &) {
                         execution_result result;
                         result.stdout_data = code;
                         result.exitcode = 0;
                         result.status = status::SUCCESS;
                         result.success = true;
                         return result;
                     }},
                 strategy);
}

}  // namespace runner
