#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "engine/language.hpp"

namespace runner {

struct rate_limit_config {
    bool enabled = true;

    /**
     * @brief 每个客户端在一个时间窗口内允许的请求数
     */
    std::size_t requests = 50;

    /**
     * @brief 时间窗口长度，单位为秒
     */
    double window = 3600;
};

/**
 * @brief 执行引擎的配置
 * 所有配置项都有默认值，配置文件中只需要给出需要修改的项。
 */
struct engine_config {
    /**
     * @brief 代码的最大长度（按 UTF-8 字符计数）
     */
    std::size_t max_code_length = 50000;

    /**
     * @brief 运行用户程序的墙上时间限制，单位为秒
     */
    double execution_timeout = 10;

    /**
     * @brief 编译 C 语言程序的墙上时间限制，单位为秒
     */
    double compile_timeout = 10;

    /**
     * @brief 同时执行的用户程序数量上限
     * @defaultValue CPU 核心数
     */
    std::size_t max_concurrent_executions;

    rate_limit_config rate_limit;

    /**
     * @brief 每个输出流保留的最大字节数
     */
    int64_t max_output_size = 65536;

    int64_t memory_limit = 262144;  // KB
    int64_t file_limit = 16384;     // KB
    int64_t process_limit = -1;

    std::string python = "python3";
    std::string c_compiler = "gcc";

    /**
     * @brief 查找解释器和编译器的路径（冒号分隔）
     */
    std::string search_path = "/usr/local/bin:/usr/bin:/bin";

    /**
     * @brief 每种语言额外的黑名单模式，附加在内置黑名单之后
     */
    std::map<language, std::vector<std::string>> denylist;

    std::filesystem::path run_dir;

    /**
     * @brief glog 的最低日志级别，0 为 INFO，1 为 WARNING
     */
    int min_log_level = 0;

    engine_config();
};

/**
 * @brief 获取命名配置的默认值
 * development: 默认配置
 * production: 只记录 WARNING 及以上级别的日志
 * testing: 速率限制放宽到每个窗口 1000 次请求
 * @throw std::invalid_argument 若配置名称未知
 */
engine_config profile_config(const std::string &profile);

/**
 * @brief 将 JSON 中出现的配置项覆盖到 config 上
 * @throw std::invalid_argument 若配置项的类型或者取值不合法
 */
void from_json(const nlohmann::json &j, engine_config &config);

/**
 * @brief 先取命名配置的默认值，再用配置文件覆盖
 * @param file 配置文件路径，为空时只使用命名配置
 */
engine_config load_config(const std::filesystem::path &file, const std::string &profile);

}  // namespace runner
