#include "executor/executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "runguard.hpp"

namespace grader::executor {
using namespace std;
namespace fs = std::filesystem;

const size_t MAX_STATUS_TEXT = 16 * 1024;

// 报告中展示详情的失败测试点数量
static const size_t MAX_FAILURE_DETAILS = 5;

// 构建失败时报告中保留的输出长度
static const size_t MAX_BUILD_OUTPUT = 4096;

static const string TRUNCATED_MARK = "\n\n*(report truncated)*\n";

static string truncate_text(const string &text) {
    if (text.size() <= MAX_STATUS_TEXT) return text;
    size_t cut = MAX_STATUS_TEXT - TRUNCATED_MARK.size();
    // 不截断 UTF-8 字符
    while (cut > 0 && ((unsigned char)text[cut] & 0xC0) == 0x80) --cut;
    return text.substr(0, cut) + TRUNCATED_MARK;
}

static string tail(const string &text, size_t length) {
    if (text.size() <= length) return text;
    return "..." + text.substr(text.size() - length);
}

submission_status aggregate(const vector<case_result> &cases) {
    if (cases.empty()) return submission_status::SUBMISSION_ERROR;

    bool fault = false, failed = false, timed_out = false;
    for (auto &result : cases) {
        switch (result.status) {
            case case_status::ACCEPTED:
                break;
            case case_status::EXECUTION_FAULT:
            case case_status::OUTPUT_LIMIT_EXCEEDED:
                fault = true;
                break;
            case case_status::WRONG_EXIT_CODE:
            case case_status::WRONG_STDOUT:
            case case_status::WRONG_STDERR:
            case case_status::FILE_NOT_FOUND:
            case case_status::WRONG_FILE_TYPE:
                failed = true;
                break;
            case case_status::TIME_LIMIT_EXCEEDED:
            case case_status::SKIPPED:
                timed_out = true;
                break;
        }
    }
    if (fault) return submission_status::EXECUTION_FAULT;
    if (failed) return submission_status::TEST_CASES_FAILED;
    if (timed_out) return submission_status::TEST_CASES_TIMED_OUT;
    return submission_status::SUCCESS;
}

string summarize(submission_status status, const vector<case_result> &cases) {
    size_t passed = count_if(cases.begin(), cases.end(), [](const case_result &result) { return result.passed(); });

    string text = fmt::format("## {}\n\n{}/{} test cases passed.\n", get_display_message(status), passed, cases.size());

    const string *group = nullptr;
    for (auto &result : cases) {
        if (!group || *group != result.group) {
            group = &result.group;
            text += fmt::format("\n### {}\n\n", result.group);
        }
        text += fmt::format("- {} `{}`: {}", result.passed() ? ":white_check_mark:" : ":x:", result.name, get_display_message(result.status));
        if (result.status != case_status::SKIPPED)
            text += fmt::format(" ({:.3f}s)", result.time);
        text += "\n";
    }

    size_t details = 0;
    for (auto &result : cases) {
        if (result.passed() || result.message.empty()) continue;
        if (details == 0) text += "\n### Failures\n";
        if (details == MAX_FAILURE_DETAILS) {
            text += "\nMore failures are omitted.\n";
            break;
        }
        text += fmt::format("\n#### {}\n\n```\n{}\n```\n", result.name, result.message);
        ++details;
    }
    return truncate_text(text);
}

string summarize(submission_status status, const string &details) {
    string text = fmt::format("## {}\n", get_display_message(status));
    if (!details.empty())
        text += fmt::format("\n```\n{}\n```\n", details);
    return truncate_text(text);
}

job_executor::job_executor(store::job_store &store, reporter::result_reporter &reporter, source_fetcher &fetcher,
                           const runner_settings &settings, int runner_id)
    : store(store), reporter(reporter), fetcher(fetcher), settings(settings), runner_id(runner_id) {}

fs::path job_executor::workspace() const {
    return settings.workspace_dir / fmt::format("runner{}", runner_id);
}

static void run_group(const plan::test_group &group, check_context ctx, const elapsed_time &timer, int timeout_total, vector<case_result> &results) {
    for (auto &test : group.tests) {
        case_result result;
        double remaining = timeout_total - timer.duration<chrono::milliseconds>().count() / 1000.0;
        if (remaining <= 0) {
            result.name = test.name;
            result.status = case_status::SKIPPED;
            result.message = fmt::format("total time limit of {}s exceeded", timeout_total);
        } else {
            ctx.remaining_time = remaining;
            try {
                result = get_checker(test.kind).check(test, ctx);
            } catch (std::exception &ex) {
                LOG(WARNING) << "Unable to run test " << test.source << ": " << boost::diagnostic_information(ex);
                result.name = test.name;
                result.status = case_status::EXECUTION_FAULT;
                result.message = ex.what();
            }
        }
        result.group = group.title;
        VLOG(1) << fmt::format("Test {}: {} {}", test.source, get_display_message(result.status), result.message);
        results.push_back(move(result));
    }

    for (auto &subgroup : group.subgroups)
        run_group(subgroup, ctx, timer, timeout_total, results);
}

static void scan_directory(const fs::path &dir, const fs::path &prefix, const plan::build_config &build, vector<prohibited_file> &found) {
    error_code ec;
    fs::directory_iterator it(dir, ec), end;
    if (ec) throw internal_error(fmt::format("unable to scan {}: {}", dir, ec.message()));

    vector<fs::directory_entry> entries;
    for (; it != end; it.increment(ec))
        entries.push_back(*it);
    if (ec) throw internal_error(fmt::format("unable to scan {}: {}", dir, ec.message()));
    sort(entries.begin(), entries.end());

    for (auto &entry : entries) {
        fs::path relative = prefix / entry.path().filename();
        if (relative == ".git") continue;
        if (find(build.allowed_binary_files.begin(), build.allowed_binary_files.end(), relative.generic_string()) != build.allowed_binary_files.end()) {
            VLOG(1) << "Found allowed binary file " << relative;
            continue;
        }
        bool is_link = entry.is_symlink(ec);
        bool is_dir = !ec && !is_link && entry.is_directory(ec);
        if (ec) throw internal_error(fmt::format("unable to scan {}: {}", entry.path(), ec.message()));
        if (is_dir) {
            scan_directory(entry.path(), relative, build, found);
            continue;
        }

        string mimetype = detect_mimetype(entry.path());
        // 空文件的类型是 inode/x-empty
        if (boost::algorithm::starts_with(mimetype, "text/") || mimetype == "inode/x-empty") continue;
        bool allowed = any_of(build.allowed_binary_mimetypes.begin(), build.allowed_binary_mimetypes.end(),
                              [&](const string &prefix) { return boost::algorithm::starts_with(mimetype, prefix); });
        if (allowed) {
            VLOG(1) << "Found allowed binary file " << relative << " with MIME type " << mimetype;
            continue;
        }
        LOG(INFO) << "Found prohibited file " << relative << " with MIME type " << mimetype;
        found.push_back({relative.generic_string(), mimetype});
    }
}

vector<prohibited_file> find_prohibited_files(const fs::path &build_dir, const plan::build_config &build) {
    vector<prohibited_file> found;
    scan_directory(build_dir, fs::path(), build, found);
    return found;
}

job_result job_executor::grade(const store::submission &submit, const fs::path &workspace) {
    job_result result;

    plan::test_plan tests;
    try {
        tests = plan::resolve_plan(settings.test_root, submit.grading_tags);
    } catch (malformed_test_config &ex) {
        LOG(ERROR) << "Malformed test configuration: " << ex.what();
        result.status = submission_status::AUTOGRADER_FAILURE;
        result.text = summarize(result.status, fmt::format("Malformed test configuration: {}", ex.what()));
        return result;
    } catch (unsupported_test_kind &ex) {
        LOG(ERROR) << "Unsupported test kind: " << ex.what();
        result.status = submission_status::AUTOGRADER_FAILURE;
        result.text = summarize(result.status, ex.what());
        return result;
    }

    if (tests.root.count() == 0) {
        result.status = submission_status::SUBMISSION_ERROR;
        result.text = summarize(result.status, fmt::format("No test case is selected by grading tags [{}].", join_tags(submit.grading_tags)));
        return result;
    }

    fs::path repo_dir = workspace / "repo";
    try {
        fetcher.fetch(submit, repo_dir);
    } catch (internal_error &ex) {
        LOG(ERROR) << "Unable to fetch submission " << submit.id << ": " << ex.what();
        result.status = submission_status::AUTOGRADER_FAILURE;
        result.text = summarize(result.status, fmt::format("Unable to fetch commit {}: {}", submit.github_commit, ex.what()));
        return result;
    }

    fs::path build_dir = (repo_dir / tests.build.srcdir).lexically_normal();
    if (!fs::is_directory(build_dir)) {
        result.status = submission_status::SUBMISSION_ERROR;
        result.text = summarize(result.status, fmt::format("Source directory \"{}\" does not exist in the repository.", tests.build.srcdir));
        return result;
    }

    if (tests.build.prohibit_binary_files) {
        auto found = find_prohibited_files(build_dir, tests.build);
        if (!found.empty()) {
            string details = "The following files are not allowed in the submission:";
            for (auto &file : found)
                details += fmt::format("\n{} ({})", file.path, file.mimetype);
            result.status = submission_status::BUILD_ERROR;
            result.text = summarize(result.status, details);
            return result;
        }
    }

    {
        runguard_options opt;
        opt.command = tests.build.cmd;
        opt.work_dir = build_dir;
        opt.wall_limit = tests.build.timeout;
        opt.stream_size = tests.limits.max_output;
        opt.kill_on_output_limit = false;

        LOG(INFO) << fmt::format("Building submission {} in {}", submit.id, build_dir);
        auto build = run_guarded(opt);
        if (!build.started()) {
            result.status = submission_status::AUTOGRADER_FAILURE;
            result.text = summarize(result.status, build.internal_error);
            return result;
        } else if (build.timed_out()) {
            result.status = submission_status::BUILD_TIMED_OUT;
            result.text = summarize(result.status, fmt::format("Build did not finish in {}s.", tests.build.timeout));
            return result;
        } else if (build.exitcode != 0) {
            result.status = submission_status::BUILD_ERROR;
            result.text = summarize(result.status, fmt::format("Build exited with code {}.\n{}{}", build.exitcode,
                                                               tail(build.stdout_content, MAX_BUILD_OUTPUT), tail(build.stderr_content, MAX_BUILD_OUTPUT)));
            return result;
        }
    }

    check_context ctx;
    ctx.build_dir = build_dir;
    ctx.max_output = tests.limits.max_output;
    ctx.remaining_time = tests.limits.timeout_total;
    ctx.scratch_dir = workspace / "scratch";

    elapsed_time timer;
    run_group(tests.root, ctx, timer, tests.limits.timeout_total, result.cases);

    result.status = aggregate(result.cases);
    result.text = summarize(result.status, result.cases);
    return result;
}

void job_executor::execute(const store::submission &submit) {
    if (!store.mark_running(submit.id, runner_id)) {
        LOG(WARNING) << "Submission " << submit.id << " is no longer owned by runner " << runner_id << ", skipping";
        return;
    }
    LOG(INFO) << "Submission " << submit.id << " is running on runner " << runner_id;

    job_result result;
    fs::path dir = workspace();
    {
        defer {
            if (!DEBUG) remove_directory_quietly(dir);
        };

        try {
            fs::remove_all(dir);
            fs::create_directories(dir);
            result = grade(submit, dir);
        } catch (database_error &) {
            throw;
        } catch (std::exception &ex) {
            LOG(ERROR) << "Autograder failure while grading submission " << submit.id << ": " << boost::diagnostic_information(ex);
            result.status = submission_status::AUTOGRADER_FAILURE;
            result.text = summarize(result.status, ex.what());
        }
    }

    if (!store.finalize_submission(submit.id, runner_id, result.status, result.text)) {
        LOG(WARNING) << "Submission " << submit.id << " was released from runner " << runner_id << " while grading, result discarded";
        return;
    }
    LOG(INFO) << fmt::format("Submission {} finished on runner {}: {} ({})", submit.id, runner_id, get_display_message(result.status), static_cast<int>(result.status));

    report(submit, result);
}

void job_executor::report(const store::submission &submit, const job_result &result) {
    try {
        reporter.set_status(submit, to_commit_state(result.status), get_display_message(result.status));
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to set commit status of submission " << submit.id << ": " << ex.what();
    }
    try {
        reporter.post_comment(submit, result.text);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to comment on submission " << submit.id << ": " << ex.what();
    }
}

}  // namespace grader::executor
