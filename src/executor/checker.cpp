#include "executor/checker.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <cstring>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace grader::executor {
using namespace std;
namespace fs = std::filesystem;

// 失败描述中最多展示的输出长度
static const size_t EXCERPT_LENGTH = 256;

const string ASM_FILE_PLACEHOLDER = "<ASM_FILE>";

static const string ASM_FILE = "gen.asm";

// file 命令的时间限制，秒
static const double MIMETYPE_TIMEOUT = 10;

bool case_result::passed() const {
    return status == case_status::ACCEPTED;
}

checker::~checker() = default;

static bool is_ascii_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

string treat_output(const string &content, bool trim, bool strip_whitespace) {
    if (strip_whitespace) {
        string result;
        for (char c : content)
            if (!is_ascii_space(c)) result += c;
        return result;
    }
    if (trim) return boost::algorithm::trim_copy_if(content, is_ascii_space);
    return content;
}

static string excerpt(const string &content) {
    // 报告会作为 JSON 发送，不能包含非法的 UTF-8
    if (!utf8_check_is_valid(content))
        return fmt::format("({} bytes of binary output)", content.size());
    if (content.size() <= EXCERPT_LENGTH) return content;
    size_t cut = EXCERPT_LENGTH;
    while (cut > 0 && ((unsigned char)content[cut] & 0xC0) == 0x80) --cut;
    return content.substr(0, cut) + "...";
}

static bool compare_stream(const char *stream, const string &expected, const string &actual, bool trim, bool strip_whitespace, string &message) {
    if (treat_output(expected, trim, strip_whitespace) == treat_output(actual, trim, strip_whitespace))
        return true;
    message = fmt::format("{} mismatch\nexpected:\n{}\nactual:\n{}", stream, excerpt(expected), excerpt(actual));
    return false;
}

case_result judge_run(const plan::run_options &options, const runguard_result &run) {
    case_result result;
    result.time = max(run.wall_time, 0.0);

    if (!run.started()) {
        result.status = case_status::EXECUTION_FAULT;
        result.message = run.internal_error;
    } else if (run.timed_out()) {
        result.status = case_status::TIME_LIMIT_EXCEEDED;
        result.message = fmt::format("killed after {:.3f}s", run.wall_time);
    } else if (run.output_truncated) {
        result.status = case_status::OUTPUT_LIMIT_EXCEEDED;
        result.message = "output limit exceeded";
    } else if (run.signal == SIGXCPU || run.signal == SIGXFSZ || run.signal == SIGKILL) {
        // 被资源限制或者外部结束，不是学生程序自己的退出
        result.status = case_status::EXECUTION_FAULT;
        result.message = fmt::format("killed by signal {} ({})", run.signal, strsignal(run.signal));
    } else if (run.exitcode != options.code) {
        result.status = case_status::WRONG_EXIT_CODE;
        result.message = fmt::format("expected exit code {}, got {}", options.code, run.exitcode);
        if (run.signal != -1)
            result.message += fmt::format(" (terminated by signal {}, {})", run.signal, strsignal(run.signal));
    } else if (!options.ignore_stdout &&
               !compare_stream("stdout", options.stdout_content, run.stdout_content, options.trim_stdout, options.strip_whitespace_stdout, result.message)) {
        result.status = case_status::WRONG_STDOUT;
    } else if (!options.ignore_stderr &&
               !compare_stream("stderr", options.stderr_content, run.stderr_content, options.trim_stderr, options.strip_whitespace_stderr, result.message)) {
        result.status = case_status::WRONG_STDERR;
    } else {
        result.status = case_status::ACCEPTED;
    }
    return result;
}

/**
 * @brief 在构建目录中运行学生程序，输入文件作为最后一个参数
 */
static runguard_result run_student(const plan::run_options &options, const plan::test_case &test, const check_context &ctx) {
    fs::path bin(options.bin);
    if (bin.is_relative()) bin = ctx.build_dir / bin;

    runguard_options opt;
    opt.command.push_back(bin.string());
    opt.command.insert(opt.command.end(), options.args.begin(), options.args.end());
    if (!test.input_file.empty()) {
        error_code ec;
        fs::path input = fs::absolute(test.input_file, ec);
        if (ec) throw internal_error(fmt::format("unable to resolve input file {}: {}", test.input_file, ec.message()));
        opt.command.push_back(input.string());
    }
    opt.work_dir = ctx.build_dir;
    opt.use_stdin = !options.ignore_stdin;
    opt.stdin_content = options.stdin_content;
    opt.wall_limit = min<double>(test.timeout, ctx.remaining_time);
    opt.stream_size = ctx.max_output;
    return run_guarded(opt);
}

plan::test_kind run_checker::kind() const {
    return plan::test_kind::RUN;
}

case_result run_checker::check(const plan::test_case &test, const check_context &ctx) const {
    auto run = run_student(test.run, test, ctx);
    auto result = judge_run(test.run, run);
    result.name = test.name;
    return result;
}

/**
 * @brief 运行汇编或者链接命令
 * @param failure 退出码不符合时的描述
 * @param wall_limit 本阶段可用的时间，秒
 * @return 是否成功，失败时 result 被填好
 */
static bool run_stage(const char *failure, const vector<string> &command, int expected_code, const fs::path &dir,
                      double wall_limit, const check_context &ctx, const string &assembly, case_result &result) {
    if (wall_limit <= 0) {
        result.status = case_status::TIME_LIMIT_EXCEEDED;
        result.message = fmt::format("{}\nno time left", failure);
        return false;
    }

    runguard_options opt;
    opt.command = command;
    opt.work_dir = dir;
    opt.wall_limit = wall_limit;
    opt.stream_size = ctx.max_output;
    auto run = run_guarded(opt);
    result.time += max(run.wall_time, 0.0);

    if (!run.started()) {
        result.status = case_status::EXECUTION_FAULT;
        result.message = fmt::format("{}\n{}", failure, run.internal_error);
    } else if (run.timed_out()) {
        result.status = case_status::TIME_LIMIT_EXCEEDED;
        result.message = fmt::format("{}\nkilled after {:.3f}s", failure, run.wall_time);
    } else if (run.output_truncated) {
        result.status = case_status::OUTPUT_LIMIT_EXCEEDED;
        result.message = fmt::format("{}\noutput limit exceeded", failure);
    } else if (run.exitcode != expected_code) {
        result.status = case_status::WRONG_EXIT_CODE;
        result.message = fmt::format("{}\nexpected exit code {}, got {}\nstdout:\n{}\nstderr:\n{}\ngenerated assembly:\n{}",
                                     failure, expected_code, run.exitcode, excerpt(run.stdout_content), excerpt(run.stderr_content), excerpt(assembly));
    } else {
        return true;
    }
    return false;
}

plan::test_kind gen_asm_checker::kind() const {
    return plan::test_kind::GEN_ASM_AND_RUN;
}

case_result gen_asm_checker::check(const plan::test_case &test, const check_context &ctx) const {
    const plan::gen_asm_options &options = test.gen_asm;
    double limit = min<double>(test.timeout, ctx.remaining_time);

    auto generate = run_student(options.generate, test, ctx);
    auto result = judge_run(options.generate, generate);
    result.name = test.name;
    if (!result.passed()) return result;

    if (ctx.scratch_dir.empty())
        throw internal_error("no scratch directory for generated assembly");
    fs::path dir = ctx.scratch_dir / test.name;
    error_code ec;
    fs::remove_all(dir, ec);
    if (!ec) fs::create_directories(dir, ec);
    if (ec) throw internal_error(fmt::format("unable to create {}: {}", dir, ec.message()));
    defer { remove_directory_quietly(dir); };
    write_file_content(dir / ASM_FILE, generate.stdout_content);

    vector<string> assemble = options.assemble_cmd;
    replace(assemble.begin(), assemble.end(), ASM_FILE_PLACEHOLDER, ASM_FILE);
    if (!run_stage("Failed to assemble the generated program.", assemble, options.assemble_code, dir,
                   limit - result.time, ctx, generate.stdout_content, result))
        return result;
    if (!run_stage("Failed to compile the generated assembly program.", options.compile_cmd, options.compile_code, dir,
                   limit - result.time, ctx, generate.stdout_content, result))
        return result;

    double elapsed = result.time;
    if (limit - elapsed <= 0) {
        result.status = case_status::TIME_LIMIT_EXCEEDED;
        result.message = "no time left to run the generated program";
        return result;
    }
    runguard_options opt;
    opt.command = options.run_cmd;
    opt.work_dir = dir;
    opt.use_stdin = !options.run.ignore_stdin;
    opt.stdin_content = options.run.stdin_content;
    opt.wall_limit = limit - elapsed;
    opt.stream_size = ctx.max_output;
    auto run = run_guarded(opt);

    result = judge_run(options.run, run);
    result.name = test.name;
    result.time += elapsed;
    return result;
}

string detect_mimetype(const fs::path &path) {
    runguard_options opt;
    opt.command = {"file", "-E", "-b", "--mime", path.string()};
    opt.work_dir = path.parent_path().empty() ? fs::path(".") : path.parent_path();
    opt.wall_limit = MIMETYPE_TIMEOUT;
    opt.stream_size = 4096;

    auto run = run_guarded(opt);
    if (!run.started())
        throw internal_error(fmt::format("unable to detect MIME type of {}: {}", path, run.internal_error));
    if (run.timed_out() || run.exitcode != 0)
        throw internal_error(fmt::format("unable to detect MIME type of {}: file exited with code {}: {}{}", path, run.exitcode,
                                         run.stdout_content, run.stderr_content));

    // 输出形如 "text/plain; charset=us-ascii"
    string output = boost::algorithm::trim_copy(run.stdout_content);
    string mimetype = output.substr(0, output.find(' '));
    if (boost::algorithm::ends_with(mimetype, ";")) mimetype.pop_back();
    return mimetype;
}

plan::test_kind file_checker::kind() const {
    return plan::test_kind::CHECK_FILE_EXISTS;
}

case_result file_checker::check(const plan::test_case &test, const check_context &ctx) const {
    case_result result;
    result.name = test.name;
    fs::path path = ctx.build_dir / assert_safe_path(test.check_file.path);
    error_code ec;
    bool exists = fs::exists(path, ec);
    if (ec) throw internal_error(fmt::format("unable to access {}: {}", path, ec.message()));

    if (!exists) {
        result.status = case_status::FILE_NOT_FOUND;
        result.message = fmt::format("file {} not found", test.check_file.path);
        return result;
    }
    if (!test.check_file.ignore_mimetype) {
        string mimetype = detect_mimetype(path);
        if (!boost::algorithm::starts_with(mimetype, test.check_file.mimetype_prefix)) {
            result.status = case_status::WRONG_FILE_TYPE;
            result.message = fmt::format("Invalid MIME type {}.", mimetype);
            return result;
        }
    }
    result.status = case_status::ACCEPTED;
    return result;
}

static map<plan::test_kind, unique_ptr<checker>> checkers;

void register_checker(unique_ptr<checker> &&checker) {
    auto kind = checker->kind();
    checkers[kind] = move(checker);
}

void register_default_checkers() {
    register_checker(make_unique<run_checker>());
    register_checker(make_unique<gen_asm_checker>());
    register_checker(make_unique<file_checker>());
}

const checker &get_checker(plan::test_kind kind) {
    // 由于 checkers 只会在 runner 启动时注册，因此之后都不会修改
    auto it = checkers.find(kind);
    if (it == checkers.end())
        throw unsupported_test_kind(fmt::format("no checker for test kind {}", plan::kind_name(kind)));
    return *it->second;
}

}  // namespace grader::executor
