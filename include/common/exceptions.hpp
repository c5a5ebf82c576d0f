#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace grader {

struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是外部命令（git、构建脚本）本身的问题，或者运行环境不满足要求
 */
struct internal_error : public grader_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示网络错误，通常由 CURL 产生
 */
struct network_error : public grader_exception {
    network_error();
    explicit network_error(const std::string &message);
};

/**
 * @brief 表示数据库查询错误
 * 数据库不可达时 runner 无法继续工作，该异常会一直抛到 main 函数
 */
struct database_error : public grader_exception {
    database_error();
    explicit database_error(const std::string &message);
};

/**
 * @brief Webhook 签名缺失或者不匹配
 * 不会修改任何状态
 */
struct authentication_failed : public grader_exception {
    authentication_failed();
    explicit authentication_failed(const std::string &message);
};

/**
 * @brief Webhook 内容无法解析，或者缺少必要字段
 * 不会修改任何状态
 */
struct malformed_payload : public grader_exception {
    malformed_payload();
    explicit malformed_payload(const std::string &message);
};

/**
 * @brief 测试配置中出现了未知的 kind
 * 整个提交将以 AutograderFailure 结束，runner 本身不会崩溃
 */
struct unsupported_test_kind : public grader_exception {
    unsupported_test_kind();
    explicit unsupported_test_kind(const std::string &message);
};

/**
 * @brief 测试配置文件格式错误（TOML 语法错误、未知选项、类型不匹配等）
 */
struct malformed_test_config : public grader_exception {
    malformed_test_config();
    explicit malformed_test_config(const std::string &message);
};

}  // namespace grader
