#pragma once

#include "common/execution_result.hpp"
#include "runguard_options.hpp"

namespace runner {

/**
 * @brief 根据传入的设置运行指定的程序
 * 该函数可以被多个线程同时调用，每次调用之间没有共享状态。
 * 1. 创建 stdout、stderr 管道，以及报告 execve 失败的 close-on-exec 管道
 * 2. 调用 fork 创建子进程
 *    1. 对于子进程（fork 之后只调用 async-signal-safe 的函数）
 *       1. 调用 setsid 分离到独立的会话和进程组，以便我们通过 SIGKILL 可以杀死进程组内所有进程
 *       2. 将 stdin 重定向到 /dev/null，stdout、stderr 重定向到管道
 *       3. 通过 rlimit 限制 CPU 时间、地址空间、文件大小、进程数，禁止 core dump
 *       4. 切换到工作目录，关闭其他文件描述符
 *       5. 以给定的环境变量调用 execve
 *    2. 对于父进程
 *       1. 通过 poll 读取管道，超出 stream_size 的输出被读取后丢弃
 *       2. 墙上时间超出限制时向进程组发送 SIGTERM，等待 0.1s 后发送 SIGKILL
 * 3. 子进程结束后杀死进程组内的所有进程，确保用户程序 fork 出来的子进程不会留驻系统
 * 4. 检查子进程是否正常退出
 *    1. 若因为信号终止，且为 SIGXCPU 则为超时，否则为运行错误
 *
 * 无法创建子进程时会重试一次。所有的失败（包括内部错误）都保存在返回值中，
 * 该函数不会抛出异常。
 */
execution_result runit(const runguard_options &opt);

}  // namespace runner
