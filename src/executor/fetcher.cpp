#include "executor/fetcher.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/replace.hpp>
#include "common/exceptions.hpp"
#include "common/hmac.hpp"
#include "common/utils.hpp"
#include "runguard.hpp"

namespace grader::executor {
using namespace std;
namespace fs = std::filesystem;

source_fetcher::~source_fetcher() = default;

git_fetcher::git_fetcher(const github_settings &settings, int timeout)
    : settings(settings), timeout(timeout) {
    // 凭据错误时 git 不能停下来等待输入
    set_env("GIT_TERMINAL_PROMPT", "0");
}

string git_fetcher::remote_url(const store::submission &submit) const {
    const string &address = submit.github_address.empty() ? settings.address : submit.github_address;
    return fmt::format("https://{}/{}/{}.git", address, submit.github_org, submit.github_repo);
}

string git_fetcher::auth_header() const {
    if (settings.auth_token.empty()) return "";
    return "Authorization: Basic " + base64_encode("x-access-token:" + settings.auth_token);
}

void git_fetcher::git(const vector<string> &args, const fs::path &work_dir) {
    runguard_options opt;
    opt.command = {"git"};
    opt.command.insert(opt.command.end(), args.begin(), args.end());
    opt.work_dir = work_dir;
    opt.wall_limit = timeout;
    opt.kill_on_output_limit = false;

    auto result = run_guarded(opt);

    string output = result.stderr_content;
    if (!settings.auth_token.empty()) {
        boost::algorithm::replace_all(output, settings.auth_token, "***");
        boost::algorithm::replace_all(output, auth_header(), "***");
    }

    const string &subcommand = args.size() > 2 && args[0] == "-c" ? args[2] : args[0];
    if (!result.started())
        throw internal_error(result.internal_error);
    if (result.timed_out())
        throw internal_error(fmt::format("git {} timed out after {}s", subcommand, timeout));
    if (result.exitcode != 0)
        throw internal_error(fmt::format("git {} exited with code {}: {}", subcommand, result.exitcode, output));
}

void git_fetcher::fetch(const store::submission &submit, const fs::path &repo_dir) {
    LOG(INFO) << fmt::format("Fetching {}/{}@{} into {}", submit.github_org, submit.github_repo, submit.github_commit, repo_dir);
    fs::create_directories(repo_dir);
    git({"init", "-q"}, repo_dir);
    git({"remote", "add", "origin", remote_url(submit)}, repo_dir);
    vector<string> fetch_args;
    string header = auth_header();
    if (!header.empty()) fetch_args = {"-c", "http.extraHeader=" + header};
    fetch_args.insert(fetch_args.end(), {"fetch", "-q", "--depth", "1", "origin", submit.github_commit});
    git(fetch_args, repo_dir);
    git({"checkout", "-q", "FETCH_HEAD"}, repo_dir);
}

}  // namespace grader::executor
