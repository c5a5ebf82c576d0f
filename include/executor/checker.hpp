#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include "common/status.hpp"
#include "plan/test_config.hpp"
#include "runguard.hpp"

namespace grader::executor {

/**
 * @brief 单个测试点的评测结果
 */
struct case_result {
    std::string name;

    // 测试点所在组的标题
    std::string group;

    case_status status = case_status::SKIPPED;

    // 第一个不匹配的检查的描述，通过时为空
    std::string message;

    // 秒
    double time = 0;

    bool passed() const;
};

/**
 * @brief 执行测试点时的上下文
 */
struct check_context {
    // 学生代码构建完成后所在的目录，也是测试程序的工作目录
    std::filesystem::path build_dir;

    // stdout、stderr 各自的最大捕获字节数
    std::size_t max_output;

    // 整个测试计划剩余的时间，秒
    double remaining_time;

    // checker 可以随意使用的临时目录，每个测试点使用其中以测试点名称命名的子目录
    std::filesystem::path scratch_dir;
};

/**
 * @brief 一种测试点类型的评测逻辑
 * 每个 kind 对应一个 checker，测试点内部的错误（程序无法启动、超时）
 * 都折叠为该测试点的结果，不抛出异常。
 */
struct checker {
    virtual ~checker();

    virtual plan::test_kind kind() const = 0;

    /**
     * @brief 评测一个测试点
     * @throw internal_error 系统调用失败等与测试点无关的错误
     */
    virtual case_result check(const plan::test_case &test, const check_context &ctx) const = 0;
};

/**
 * @brief kind = "run"：运行学生程序并比较退出码、stdout、stderr
 */
struct run_checker : public checker {
    plan::test_kind kind() const override;

    case_result check(const plan::test_case &test, const check_context &ctx) const override;
};

/**
 * @brief kind = "gen_asm_and_run"：学生程序生成汇编代码，汇编、链接后运行生成的程序
 * 汇编和链接在 scratch_dir 下进行，所有阶段共用测试点的时间限制。
 */
struct gen_asm_checker : public checker {
    plan::test_kind kind() const override;

    /**
     * @throw internal_error 临时目录无法创建或者汇编文件无法写入
     */
    case_result check(const plan::test_case &test, const check_context &ctx) const override;
};

/**
 * @brief kind = "check_file_exists"：检查构建目录中是否存在某个文件，可选地检查 MIME 类型
 */
struct file_checker : public checker {
    plan::test_kind kind() const override;

    case_result check(const plan::test_case &test, const check_context &ctx) const override;
};

/**
 * @brief 按 trim/strip_whitespace 选项处理输出，比较之前对期望值和实际值都做同样的处理
 * @param trim 去掉首尾的 ASCII 空白字符
 * @param strip_whitespace 去掉所有 ASCII 空白字符
 */
std::string treat_output(const std::string &content, bool trim, bool strip_whitespace);

/**
 * @brief 根据程序的运行结果判定 run 测试点
 * 检查顺序为退出码、stdout、stderr，返回第一个不匹配的检查
 */
case_result judge_run(const plan::run_options &options, const runguard_result &run);

/**
 * @brief assemble_cmd 中会被替换为汇编文件名的参数
 */
extern const std::string ASM_FILE_PLACEHOLDER;

/**
 * @brief 通过 `file -E -b --mime` 获得文件的 MIME 类型，比如 "text/plain"
 * @throw internal_error file 命令无法运行或者失败
 */
std::string detect_mimetype(const std::filesystem::path &path);

/**
 * @brief 注册一种测试点类型的 checker
 * 必须在 runner 开始认领提交之前完成注册，之后只读
 */
void register_checker(std::unique_ptr<checker> &&checker);

/**
 * @brief 注册 run、gen_asm_and_run 和 check_file_exists 三种 checker
 */
void register_default_checkers();

/**
 * @throw unsupported_test_kind 该类型没有注册 checker
 */
const checker &get_checker(plan::test_kind kind);

}  // namespace grader::executor
