#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace runner {

/**
 * @brief 支持的语言，这个集合是封闭的
 * 新增语言需要同时修改语言表、校验规则以及执行策略
 */
enum class language {
    python,
    c,
    javascript,
    html
};

/**
 * @brief 语言的元数据
 */
struct language_info {
    language lang;

    /**
     * @brief 语言的稳定名称，即请求中使用的名称，比如 "python"
     */
    std::string id;

    /**
     * @brief 展示用的名称，比如 "Python"
     */
    std::string name;

    /**
     * @brief 源代码文件的扩展名，包括 "."
     */
    std::string extension;

    /**
     * @brief 新建文件时使用的示例代码
     */
    std::string template_code;
};

/**
 * @brief 所有支持的语言，按照 language 枚举的顺序排列
 */
const std::vector<language_info> &get_languages();

const language_info &get_language_info(language lang);

/**
 * @brief 根据稳定名称解析语言（大小写敏感）
 * @return 若语言不受支持，返回 std::nullopt
 */
std::optional<language> parse_language(const std::string &id);

/**
 * @brief 根据文件扩展名推断语言
 * .py, .c, .js, .html, .htm 以外的扩展名一律视为 python
 */
language language_from_filename(const std::filesystem::path &filename);

}  // namespace runner
