#pragma once

#include <string>

namespace grader {

/**
 * @brief 表示整个提交的评测状态，对应数据库中的 exec_status_code
 * 4xx 表示学生代码本身的问题，5xx 表示评测系统的问题，
 * 这样上报时学生不会因为基础设施故障而被误判。
 */
enum class submission_status {
    /**
     * @brief 提交在队列中，或者已被 runner 认领但还没开始执行
     */
    NOT_STARTED = 0,

    /**
     * @brief runner 已经开始执行该提交
     */
    RUNNING = 100,

    /**
     * @brief 所有被选中的测试点都通过了
     */
    SUCCESS = 200,

    /**
     * @brief 提交本身无法评测，比如评测标签没有选中任何测试、源代码目录不存在
     */
    SUBMISSION_ERROR = 400,

    /**
     * @brief 构建命令返回非零值
     */
    BUILD_ERROR = 401,

    /**
     * @brief 构建命令超时
     */
    BUILD_TIMED_OUT = 402,

    /**
     * @brief 至少一个测试点的输出或返回值不符合预期
     */
    TEST_CASES_FAILED = 403,

    /**
     * @brief 至少一个测试点超时，且没有测试点是逻辑错误
     */
    TEST_CASES_TIMED_OUT = 404,

    /**
     * @brief 至少一个测试点无法运行：可执行文件不存在、输出超限、被资源限制杀死
     */
    EXECUTION_FAULT = 405,

    /**
     * @brief 评测系统内部错误：仓库拉取失败、测试配置错误、runner 被中断
     */
    AUTOGRADER_FAILURE = 500,

    /**
     * @brief 提交被反复释放，超过了最大尝试次数，不再重试
     */
    QUARANTINED = 501
};

/**
 * @brief 单个测试点的评测结果
 */
enum class case_status {
    ACCEPTED,
    WRONG_EXIT_CODE,
    WRONG_STDOUT,
    WRONG_STDERR,
    FILE_NOT_FOUND,

    /**
     * @brief 文件存在，但 MIME 类型不符合要求
     */
    WRONG_FILE_TYPE,
    TIME_LIMIT_EXCEEDED,
    OUTPUT_LIMIT_EXCEEDED,
    EXECUTION_FAULT,

    /**
     * @brief 总时间用完，测试点没有被执行
     */
    SKIPPED
};

/**
 * @brief GitHub commit status 的 state 字段
 */
enum class commit_state {
    PENDING,
    SUCCESS,
    FAILURE,
    ERROR
};

const char *get_display_message(submission_status stat);

const char *get_display_message(case_status stat);

const char *commit_state_string(commit_state state);

/**
 * @brief 将提交状态映射到上报给 GitHub 的 commit state
 */
commit_state to_commit_state(submission_status stat);

/**
 * @brief 数据库中读出的整数转换为状态
 * @throw database_error 未知的状态码
 */
submission_status submission_status_from_code(int code);

/**
 * @brief 提交状态是否为终止状态
 */
bool is_terminal(submission_status stat);

}  // namespace grader
