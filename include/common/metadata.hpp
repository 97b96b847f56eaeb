#pragma once

#include <filesystem>
#include <map>
#include <string>
#include "common/execution_result.hpp"

namespace runner {

/**
 * @brief 读入并解析 runguard 产生的 metadata 文件
 * 文件每行格式为 "key: value"
 * @return metadata 文件的解析结果
 */
std::map<std::string, std::string> read_metadata(const std::filesystem::path &metadata_file);

/**
 * @brief 将执行结果以 "key: value" 的格式写入 metadata 文件
 * 包含 exitcode、signal、wall-time、time-result、output-truncated、
 * stdout-bytes、stderr-bytes，以及内部错误时的 internal-error
 */
void write_metadata(const std::filesystem::path &metadata_file, const execution_result &result);

}  // namespace runner
