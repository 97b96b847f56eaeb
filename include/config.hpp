#pragma once

#include <filesystem>

namespace runner {

/**
 * @brief 用户代码编译及运行的根目录
 * 每次执行都会在 RUN_DIR 下创建一个独立的工作目录，执行结束后删除。
 * RUN_DIR 的文件结构如下：
 *
 * RUN_DIR
 * ├── run-0f8fad5b-d9cb-469f-a165-70867728950e // 随机生成的 uuid
 * │   ├── main.c // 用户代码，扩展名由语言决定
 * │   └── main // C 语言编译产生的可执行文件
 * └── run-...
 *
 * @defaultValue 系统临时目录下的 code-runner 文件夹
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，执行引擎会在日志中记录每一条执行的命令。
 */
extern bool DEBUG;

}  // namespace runner
