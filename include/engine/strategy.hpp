#pragma once

#include <string>
#include <variant>
#include <vector>
#include "common/execution_result.hpp"
#include "engine/config.hpp"
#include "engine/language.hpp"
#include "engine/workspace.hpp"
#include "runguard_options.hpp"

namespace runner {

/**
 * @brief Python 代码由解释器直接执行
 * python3 -B -I main.py
 */
struct python_strategy {};

/**
 * @brief C 代码先编译再运行
 * 编译失败时返回编译器的诊断信息，不运行程序
 */
struct c_strategy {};

/**
 * @brief JavaScript 代码在嵌入的 QuickJS 运行时中执行，不创建子进程
 */
struct javascript_strategy {};

/**
 * @brief HTML 不执行，原样返回页面代码
 */
struct html_strategy {};

using language_strategy = std::variant<python_strategy, c_strategy, javascript_strategy, html_strategy>;

language_strategy make_strategy(language lang);

/**
 * @brief 运行 Python 代码的命令，命令在工作目录中执行，参数中只出现相对路径
 * @throw internal_error 若在 search_path 中找不到解释器
 */
std::vector<std::string> build_command(const python_strategy &, const workspace &ws, const engine_config &config);

/**
 * @brief 编译 C 代码的命令
 * @throw internal_error 若在 search_path 中找不到编译器
 */
std::vector<std::string> build_compile_command(const c_strategy &, const workspace &ws, const engine_config &config);

/**
 * @brief 运行编译产物的命令
 */
std::vector<std::string> build_command(const c_strategy &, const workspace &ws, const engine_config &config);

/**
 * @brief 构造在工作目录中运行命令的 runguard 参数
 * 子进程不继承当前进程的环境变量，只有 PATH、HOME、LANG 以及语言相关的变量
 * @param timeout 墙上时间限制，单位为秒
 * @param memory_limit 是否限制内存（编译器不限制内存）
 */
runguard_options make_runguard_options(const workspace &ws, const engine_config &config,
                                       std::vector<std::string> command, double timeout, bool memory_limit);

/**
 * @brief 按语言执行工作目录中的代码
 * @param code 用户代码，JavaScript 和 HTML 直接使用，不读取工作目录中的文件
 */
execution_result execute(const language_strategy &strategy, workspace &ws, const std::string &code,
                         const engine_config &config);

}  // namespace runner
