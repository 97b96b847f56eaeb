#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "engine/config.hpp"
#include "engine/language.hpp"

namespace runner {

/**
 * @brief 一条黑名单模式
 * 匹配时忽略大小写，并且代码和模式中连续的空白字符都被视为一个空格。
 * 以标识符字符开头的模式只在标识符边界处匹配，因此 "file(" 不会命中 "profile("。
 */
struct denylist_pattern {
    std::string pattern;

    /**
     * @brief 模式所属的危险类别，比如 "process spawning"
     * 拒绝请求时只返回类别，不返回命中的模式本身
     */
    std::string category;

    /**
     * @brief 以 "(" 结尾的调用模式在 "." 之后是否也匹配
     * 为 true 时 "os.system(" 命中 "system("；为 false 时 "re.compile(" 不命中 "compile("
     */
    bool member = false;
};

struct validation_result {
    bool allowed;

    /**
     * @brief 拒绝的原因，allowed 为真时为空
     */
    std::optional<std::string> reason;

    /**
     * @brief SUCCESS、INVALID_INPUT 或者 VALIDATION_REJECTED
     */
    runner::status status;

    static validation_result accept();
    static validation_result reject(runner::status status, const std::string &reason);
};

/**
 * @brief 内置的黑名单
 */
const std::vector<denylist_pattern> &builtin_denylist(language lang);

/**
 * @brief 被禁止导入的 Python 模块
 */
const std::vector<std::string> &restricted_python_modules();

/**
 * @brief 将代码转为小写，并将连续的空白字符替换为一个空格
 * 只转换 ASCII 字符，多字节的 UTF-8 字符保持不变
 */
std::string normalize_code(const std::string &code);

/**
 * @brief 去掉 normalize_code 结果中不位于两个标识符字符之间的空格
 * 例如 "x = eval (1)" 变为 "x=eval(1)"，"return eval(1)" 保持不变
 */
std::string compact_code(const std::string &normalized);

/**
 * @brief 在 Python 代码中查找 import 语句导入的受限模块
 * 支持 "import a, os"、"import os.path as p"、"from os import system" 以及分号分隔的多条语句
 * @return 第一个受限模块的名称，没有时返回 std::nullopt
 */
std::optional<std::string> find_restricted_import(const std::string &code);

/**
 * @brief 代码校验器
 * 对代码做静态的黑名单检查，只作为纵深防御的一层，不能替代运行时的隔离。
 * 校验器构造后不再修改，可以被多个线程同时调用。
 */
class validator {
public:
    explicit validator(const engine_config &config);

    /**
     * @brief 校验代码
     * 依次检查：代码是否为空、是否为合法 UTF-8、长度是否超出限制、
     * 语言是否受支持、是否命中黑名单。
     * @param code 用户提交的代码
     * @param language 语言的稳定名称
     */
    validation_result validate(const std::string &code, const std::string &language) const;

private:
    std::size_t max_code_length;
    std::map<language, std::vector<denylist_pattern>> patterns;
};

}  // namespace runner
