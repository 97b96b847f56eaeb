#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace runner {

struct runguard_options {
    /**
     * @brief 要执行的命令，command[0] 必须是可执行文件的路径
     * 不会经过 shell 解释，也不会在 PATH 中查找
     */
    std::vector<std::string> command;

    /**
     * @brief 子进程的工作目录
     */
    std::string work_dir;

    /**
     * @brief 子进程的全部环境变量（"KEY=VALUE"）
     * 子进程不继承当前进程的环境变量
     */
    std::vector<std::string> env;

    bool use_wall_limit = false;
    double wall_limit = 0;  // wall clock time in seconds

    bool use_cpu_limit = false;
    double cpu_limit = 0;  // CPU time in seconds

    int64_t memory_limit = -1;  // Memory limit in bytes
    int64_t file_limit = -1;    // Output file size limit in bytes
    int64_t nproc = -1;         // Maximum processes of the run user
    int64_t stream_size = -1;   // Captured bytes per stream
    bool no_core_dumps = true;

    /**
     * @brief 标准输入文件，为空时使用 /dev/null
     */
    std::string stdin_filename;
};

}  // namespace runner
