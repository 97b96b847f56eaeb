#pragma once

#include <filesystem>
#include <string>

namespace runner {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 将 content 写入文件，文件已存在时覆盖
 * @throw std::system_error 若无法打开或写入文件
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 统计 UTF-8 字符串中的字符（码点）个数
 * @note 调用方需要先通过 utf8_check_is_valid 检查合法性
 */
std::size_t utf8_length(const std::string &string);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击，工作目录的名称
 * 只能由执行引擎生成，不能出现 "/"、".." 等路径成分。
 * @param subpath 被检查的文件名
 * @return subpath 本身
 */
std::string assert_safe_path(const std::string &subpath);

}  // namespace runner
