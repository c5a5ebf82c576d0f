#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace grader {

/**
 * @brief 按固定间隔在独立线程中执行任务
 * 任务抛出的异常会被记录，线程继续按间隔执行，直到 stop 被调用。
 * 析构时自动停止并等待线程结束。
 */
struct periodic_thread {
    /**
     * @param name 线程名称，用于日志
     * @param interval 两次执行开始之间的间隔
     * @param task 要执行的任务
     */
    periodic_thread(std::string name, std::chrono::milliseconds interval, std::function<void()> task);
    periodic_thread(const periodic_thread &) = delete;
    ~periodic_thread();

    periodic_thread &operator=(const periodic_thread &) = delete;

    /**
     * @brief 启动线程，第一次执行在一个间隔之后
     */
    void start();

    /**
     * @brief 停止线程，正在执行的任务会执行完
     */
    void stop();

private:
    std::string name;
    std::chrono::milliseconds interval;
    std::function<void()> task;

    std::thread worker;
    std::mutex mut;
    std::condition_variable cond;
    bool stopping = false;

    void loop();
};

}  // namespace grader
