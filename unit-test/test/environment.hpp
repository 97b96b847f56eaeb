#pragma once

#include <filesystem>
#include <string>
#include "engine/config.hpp"

/**
 * 测试环境
 * 所有测试共享同一个私有的运行目录 RUN_DIR，测试结束后删除。
 * 需要 python3 或者 gcc 的测试在找不到对应程序时跳过。
 */
namespace runner {

void setup_test_environment();

void teardown_test_environment();

/**
 * @brief 测试使用的引擎配置
 * 基于 testing 配置，工作目录为 RUN_DIR，运行时间限制缩短为 2 秒
 */
engine_config test_config();

/**
 * @brief 在测试配置的 search_path 中查找程序
 */
bool has_executable(const std::string &name);

/**
 * @brief RUN_DIR 下工作目录的数量
 */
std::size_t count_workspaces(const std::filesystem::path &run_dir);

}  // namespace runner
