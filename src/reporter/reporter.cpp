#include "reporter/reporter.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace grader::reporter {
using namespace std;
using nlohmann::json;

// GitHub 限制 commit status 的 description 最多 140 个字符
static const size_t MAX_STATUS_DESCRIPTION = 140;

static const long REQUEST_TIMEOUT_SECONDS = 30;

result_reporter::~result_reporter() = default;

github_reporter::github_reporter(const github_settings &settings)
    : settings(settings) {}

static size_t write_response(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto response = static_cast<string *>(userdata);
    response->append(ptr, size * nmemb);
    return size * nmemb;
}

static string api_base(const store::submission &submit, const github_settings &settings) {
    const string &address = submit.github_address.empty() ? settings.address : submit.github_address;
    return fmt::format("https://{}/api/v3/repos/{}/{}", address, submit.github_org, submit.github_repo);
}

string github_reporter::status_url(const store::submission &submit) const {
    return fmt::format("{}/statuses/{}", api_base(submit, settings), submit.github_commit);
}

string github_reporter::comment_url(const store::submission &submit) const {
    return fmt::format("{}/commits/{}/comments", api_base(submit, settings), submit.github_commit);
}

void github_reporter::post(const string &url, const string &body) {
    CURL *curl = curl_easy_init();
    if (!curl) throw network_error("unable to initialize curl for " + url);

    string response;
    char errbuf[CURL_ERROR_SIZE] = {0};
    struct curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/vnd.github+json");
    headers = curl_slist_append(headers, "X-GitHub-Api-Version: 2022-11-28");
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, ("Authorization: Bearer " + settings.auth_token).c_str());

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "grader");
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)body.size());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_response);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, REQUEST_TIMEOUT_SECONDS);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK)
        throw network_error(fmt::format("POST {} failed: {}", url, errbuf[0] ? errbuf : curl_easy_strerror(res)));
    if (http_code < 200 || http_code >= 300)
        throw network_error(fmt::format("POST {} returned HTTP {}: {}", url, http_code, response));
    VLOG(1) << "POST " << url << " returned HTTP " << http_code;
}

void github_reporter::set_status(const store::submission &submit, commit_state state, const string &description) {
    json body = {
        {"state", commit_state_string(state)},
        {"description", description.substr(0, MAX_STATUS_DESCRIPTION)},
        {"context", "grader"}};
    post(status_url(submit), body.dump());
}

void github_reporter::post_comment(const store::submission &submit, const string &message) {
    string text = message;
    if (!settings.comment_signature.empty())
        text += "\n\n" + settings.comment_signature;
    json body = {{"body", text}};
    post(comment_url(submit), body.dump());
}

void log_reporter::set_status(const store::submission &submit, commit_state state, const string &description) {
    LOG(INFO) << fmt::format("Commit status of {}/{}@{}: {} {}", submit.github_org, submit.github_repo, submit.github_commit, commit_state_string(state), description);
}

void log_reporter::post_comment(const store::submission &submit, const string &message) {
    LOG(INFO) << fmt::format("Commit comment on {}/{}@{}:\n{}", submit.github_org, submit.github_repo, submit.github_commit, message);
}

}  // namespace grader::reporter
