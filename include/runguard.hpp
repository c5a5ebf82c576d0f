#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace grader {

struct runguard_options {
    /**
     * @brief 要执行的命令，command[0] 不含 '/' 时在 PATH 中查找
     */
    std::vector<std::string> command;

    /**
     * @brief 子进程的工作目录
     */
    std::filesystem::path work_dir;

    /**
     * @brief 通过管道写入子进程标准输入的内容
     * 为 false 时子进程的标准输入是 /dev/null
     */
    bool use_stdin = false;
    std::string stdin_content;

    /**
     * @brief 时钟时间限制，单位为秒
     * 超时后向整个进程组发送 SIGTERM，100ms 后发送 SIGKILL
     */
    double wall_limit = 10;

    /**
     * @brief stdout 和 stderr 各自最多捕获的字节数
     */
    std::size_t stream_size = 65536;

    /**
     * @brief 输出超过 stream_size 时是否立即结束子进程
     * 为 false 时多余的输出被丢弃，只标记 output_truncated
     */
    bool kill_on_output_limit = true;
};

struct runguard_result {
    /**
     * @brief 时钟时间
     * 单位为秒
     */
    double wall_time = -1;

    /**
     * @brief 子进程退出码，被信号结束时为 128 + signal
     */
    int exitcode = -1;

    /**
     * @brief 结束子进程的信号，-1 表示正常退出
     */
    int signal = -1;

    /**
     * @brief 命令无法启动的原因（可执行文件不存在、工作目录不存在等），为空表示成功启动
     */
    std::string internal_error;

    /**
     * @brief 超时时为 "hard-timelimit"，否则为空
     */
    std::string time_result;

    /**
     * @brief 是否有输出超过了 stream_size
     */
    bool output_truncated = false;

    std::string stdout_content;
    std::string stderr_content;

    bool timed_out() const;
    bool started() const;
};

/**
 * @brief 在子进程中执行命令，捕获输出并强制执行时间限制
 * 子进程拥有独立的进程组，禁止产生 core dump。
 * 函数返回时子进程及其进程组内的所有进程都已经结束。
 * @throw internal_error 创建管道、fork、waitpid 等系统调用失败
 */
runguard_result run_guarded(const runguard_options &opt);

}  // namespace grader
