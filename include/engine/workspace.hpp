#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "engine/language.hpp"

namespace runner {

/**
 * @brief 一次执行独占的工作目录
 * 目录及用户代码在构造时创建，析构时递归删除。
 * 无论执行成功、失败、超时还是抛出异常，离开作用域时都会清理。
 *
 * root_dir
 * ├── main.c // 用户代码，文件名固定为 main 加上语言的扩展名
 * └── main // C 语言编译产生的可执行文件
 */
class workspace {
public:
    /**
     * @throw workspace_error 若两次尝试都无法创建目录或写入代码
     */
    workspace(const std::filesystem::path &run_dir, language lang, const std::string &code);
    ~workspace();

    workspace(const workspace &) = delete;
    workspace &operator=(const workspace &) = delete;

    const std::filesystem::path &root_dir() const;

    /**
     * @brief 用户代码文件的完整路径
     */
    std::filesystem::path source_file() const;

    /**
     * @brief 用户代码文件名，相对于 root_dir
     */
    std::string source_name() const;

    /**
     * @brief 编译产物的路径，编译成功前为空
     */
    std::optional<std::filesystem::path> binary_file;

    language lang;

private:
    std::filesystem::path root;

    void create(const std::filesystem::path &run_dir, const std::string &code);
};

/**
 * @brief 在 run_dir 下分配工作目录
 */
class workspace_manager {
public:
    explicit workspace_manager(const std::filesystem::path &run_dir);

    std::unique_ptr<workspace> acquire(language lang, const std::string &code) const;

    /**
     * @brief 删除 run_dir 下残留的工作目录
     * 宿主进程被 SIGKILL 时析构函数来不及执行，工作目录会残留下来。
     * 调用时必须确保没有正在进行的执行。
     * @return 删除的目录数
     */
    std::size_t clean_stale() const;

    const std::filesystem::path &run_dir() const;

private:
    std::filesystem::path dir;
};

}  // namespace runner
