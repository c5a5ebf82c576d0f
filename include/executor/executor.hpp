#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "config.hpp"
#include "executor/checker.hpp"
#include "executor/fetcher.hpp"
#include "plan/test_config.hpp"
#include "reporter/reporter.hpp"
#include "store/job_store.hpp"

namespace grader::executor {

/**
 * @brief 一次评测的结果，写入 exec_status_code 与 exec_status_text
 */
struct job_result {
    submission_status status = submission_status::AUTOGRADER_FAILURE;

    // markdown 格式的报告
    std::string text;

    std::vector<case_result> cases;
};

/**
 * @brief 在 runner 进程中执行已认领的提交
 * 一个 job_executor 同一时间只执行一个提交。
 */
struct job_executor {
    /**
     * @param store 执行任务的线程使用的存储连接
     * @param runner_id 当前 runner 的 id
     */
    job_executor(store::job_store &store, reporter::result_reporter &reporter, source_fetcher &fetcher,
                 const runner_settings &settings, int runner_id);

    /**
     * @brief 执行一个已认领的提交并终止它
     * 提交内的任何错误都会变成终止状态写回数据库，只有数据库本身的错误会抛出。
     * 如果提交在执行期间被看门狗释放，结果会被丢弃。
     * @throw database_error 数据库不可用
     */
    void execute(const store::submission &submit);

    /**
     * @brief 拉取、构建并运行测试计划，不访问数据库
     * @param workspace 本次评测使用的空目录
     */
    job_result grade(const store::submission &submit, const std::filesystem::path &workspace);

    /**
     * @brief 当前 runner 的工作区
     */
    std::filesystem::path workspace() const;

private:
    store::job_store &store;
    reporter::result_reporter &reporter;
    source_fetcher &fetcher;
    runner_settings settings;
    int runner_id;

    void report(const store::submission &submit, const job_result &result);
};

/**
 * @brief 汇总所有测试点的结果
 * 优先级：执行错误（含输出超限） > 逻辑错误 > 超时（含跳过） > 成功。没有测试点时为 SUBMISSION_ERROR。
 */
submission_status aggregate(const std::vector<case_result> &cases);

/**
 * @brief 生成 markdown 报告，列出每个组和测试点的结果以及前几个失败的详情
 * 结果不超过 MAX_STATUS_TEXT 字节
 */
std::string summarize(submission_status status, const std::vector<case_result> &cases);

/**
 * @brief 不包含测试点的报告，用于构建失败、测试配置错误等情况
 */
std::string summarize(submission_status status, const std::string &details);

/**
 * @brief 构建目录中不允许出现的文件
 */
struct prohibited_file {
    // 相对于构建目录
    std::string path;
    std::string mimetype;
};

/**
 * @brief 递归扫描构建目录，找出既不是文本文件也不在允许列表中的文件
 * .git 目录不参与扫描，allowed_binary_files 中的目录整个跳过
 * @throw internal_error 目录无法读取或者 MIME 类型无法获得
 */
std::vector<prohibited_file> find_prohibited_files(const std::filesystem::path &build_dir, const plan::build_config &build);

/**
 * @brief exec_status_text 的最大长度
 */
extern const std::size_t MAX_STATUS_TEXT;

}  // namespace grader::executor
