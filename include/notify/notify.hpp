#pragma once

#include <filesystem>

/**
 * 唤醒信号
 * Ingestion Gateway 插入新提交后改写通知文件，空闲的 runner 通过 inotify
 * 监听文件的修改，从而不必等到下一次轮询就能开始认领。
 * 信号可能丢失（比如 runner 正在执行其他任务时），所以 runner 必须同时轮询数据库，
 * 这里的任何失败都不影响正确性。
 */
namespace grader::notify {

/**
 * @brief 确保通知文件及其所在目录存在
 */
void ensure_notify_file(const std::filesystem::path &path);

/**
 * @brief 唤醒所有正在监听的 runner
 * 将当前时间（纳秒）写入通知文件
 * @throw internal_error 文件无法写入
 */
void ping(const std::filesystem::path &path);

struct listener {
    /**
     * @brief 监听通知文件的修改
     * @param path 通知文件路径，必须已经存在
     * @param timeout_ms 每次 listen 最多等待的毫秒数
     * @throw internal_error inotify 初始化失败
     */
    listener(const std::filesystem::path &path, int timeout_ms);
    listener(const listener &) = delete;
    ~listener();

    listener &operator=(const listener &) = delete;

    /**
     * @brief 等待通知或者超时
     * @return true 表示收到了通知，false 表示超时
     */
    bool listen();

    /**
     * @brief 等待通知，最多等待 timeout_ms 毫秒（覆盖构造时的超时）
     */
    bool listen(int timeout_ms);

private:
    int fd;
    int timeout_ms;
    std::filesystem::path path;
};

}  // namespace grader::notify
