#include "gateway/gateway.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include "common/exceptions.hpp"
#include "common/hmac.hpp"
#include "common/utils.hpp"
#include "notify/notify.hpp"

namespace grader::gateway {
using namespace std;
using nlohmann::json;

static const string SIGNATURE_PREFIX = "sha256=";

static string required_string(const json &j, const char *object, const char *key) {
    if (!j.count(object) || !j.at(object).is_object())
        throw malformed_payload(fmt::format("missing field {}", object));
    const json &obj = j.at(object);
    if (!obj.count(key) || !obj.at(key).is_string())
        throw malformed_payload(fmt::format("missing field {}.{}", object, key));
    return obj.at(key).get<string>();
}

void from_json(const json &j, push_event &event) {
    if (!j.is_object()) throw malformed_payload("payload is not a JSON object");
    if (!j.count("ref") || !j.at("ref").is_string()) throw malformed_payload("missing field ref");
    event.ref = j.at("ref").get<string>();
    event.repo_name = required_string(j, "repository", "name");
    event.repo_full_name = required_string(j, "repository", "full_name");
    event.organization = required_string(j, "repository", "organization");
    event.pusher_name = required_string(j, "pusher", "name");
    event.pusher_email = required_string(j, "pusher", "email");
    event.commit_id = required_string(j, "head_commit", "id");
    event.commit_message = required_string(j, "head_commit", "message");
}

void to_json(json &j, const ingest_response &response) {
    j = {{"code", response.code}, {"message", response.message}};
    if (response.submission_id >= 0)
        j["submission_id"] = response.submission_id;
}

void verify_signature(const string &secret, const string &signature, const string &body) {
    if (secret.empty())
        throw authentication_failed("webhook secret is not configured");
    if (signature.empty())
        throw authentication_failed("missing secret signature");
    if (!boost::algorithm::starts_with(signature, SIGNATURE_PREFIX))
        throw authentication_failed("invalid secret signature");

    string expected = SIGNATURE_PREFIX + hmac_sha256_hex(secret, body);
    DLOG(INFO) << "Computed signature: " << expected;
    DLOG(INFO) << "Received signature: " << signature;
    if (!constant_time_equals(expected, signature))
        throw authentication_failed("invalid secret signature");
}

set<string> parse_grading_tags(const string &message) {
    set<string> tags;
    vector<string> words;
    boost::algorithm::split(words, message, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
    for (auto &word : words) {
        if (word.size() < 2) continue;
        if (word[0] == '#' || word[0] == '%')
            tags.insert(word.substr(1));
    }
    return tags;
}

static bool any_prefix(const vector<string> &prefixes, const string &name) {
    return any_of(prefixes.begin(), prefixes.end(), [&](const string &prefix) { return boost::algorithm::starts_with(name, prefix); });
}

static bool any_suffix(const vector<string> &suffixes, const string &name) {
    return any_of(suffixes.begin(), suffixes.end(), [&](const string &suffix) { return boost::algorithm::ends_with(name, suffix); });
}

bool repository_allowed(const github_settings &settings, const string &repo_name) {
    if (!settings.allowed_repo_prefixes.empty() && !any_prefix(settings.allowed_repo_prefixes, repo_name))
        return false;
    if (!settings.allowed_repo_suffixes.empty() && !any_suffix(settings.allowed_repo_suffixes, repo_name))
        return false;
    if (any_prefix(settings.prohibited_repo_prefixes, repo_name))
        return false;
    if (any_suffix(settings.prohibited_repo_suffixes, repo_name))
        return false;
    return true;
}

static ingest_response accepted(const string &message) {
    ingest_response response;
    response.message = message;
    return response;
}

ingest_response ingest(const github_settings &settings, const ingest_request &request, const store_factory &connect,
                       reporter::result_reporter &reporter, const filesystem::path &notify_path) {
    if (request.event.empty())
        throw malformed_payload("missing event type");

    if (request.body.size() > settings.max_payload)
        throw malformed_payload(fmt::format("payload of {} bytes exceeds the limit of {} bytes", request.body.size(), settings.max_payload));

    try {
        verify_signature(settings.webhook_secret, request.signature, request.body);
    } catch (authentication_failed &ex) {
        LOG(WARNING) << "Unauthorized submission request: " << ex.what();
        throw;
    }

    if (request.event == "ping")
        return accepted("ping was authenticated");
    if (request.event != "push")
        throw malformed_payload(fmt::format("invalid event type \"{}\"", request.event));

    push_event event;
    try {
        event = json::parse(request.body).get<push_event>();
    } catch (json::exception &ex) {
        throw malformed_payload(fmt::format("invalid JSON format: {}", ex.what()));
    }
    VLOG(1) << "Received push event of " << event.repo_full_name << "@" << event.commit_id << " by " << event.pusher_name;

    if (event.organization != settings.org) {
        if (settings.allow_any_org) {
            LOG(WARNING) << fmt::format("Allowing submission from organization {}, although {} was expected", event.organization, settings.org);
        } else {
            LOG(WARNING) << "Invalid GitHub organization " << event.organization;
            throw authentication_failed(fmt::format("invalid GitHub organization \"{}\"", event.organization));
        }
    }

    if (event.ref != settings.branch) {
        LOG(INFO) << fmt::format("Rejected push to {} of {}", event.ref, event.repo_full_name);
        throw malformed_payload(fmt::format("ref {} does not match {}", event.ref, settings.branch));
    }

    if (!repository_allowed(settings, event.repo_name)) {
        LOG(INFO) << "Push from " << event.repo_full_name << " will not be considered for grading";
        return accepted("not a repository to be graded");
    }

    auto tags = parse_grading_tags(event.commit_message);
    if (tags.empty()) {
        LOG(INFO) << "Push from " << event.repo_full_name << " will not be considered for grading, no grading tags provided";
        return accepted("no grading tags provided");
    }

    store::submission submit;
    submit.grading_tags = tags;
    submit.github_address = settings.address;
    submit.github_org = event.organization;
    submit.github_repo = event.repo_name;
    submit.github_user = event.pusher_name;
    submit.github_commit = event.commit_id;
    submit.id = connect()->insert_submission(submit);

    vector<string> quoted;
    for (auto &tag : tags) quoted.push_back("`" + tag + "`");
    try {
        reporter.post_comment(submit, fmt::format("**[Submission ID: {} | {}]**\n\n"
                                                  "The autograder has successfully received your submission and will start grading as soon as a runner is available. "
                                                  "Additional information and results of your submission will be provided as comments here.",
                                                  submit.id, boost::algorithm::join(quoted, ", ")));
    } catch (std::exception &ex) {
        LOG(WARNING) << "Could not submit commit message: " << ex.what() << ". Will not reject this submission since it is already created.";
    }
    try {
        reporter.set_status(submit, commit_state::PENDING, "Waiting In Queue");
    } catch (std::exception &ex) {
        LOG(WARNING) << "Could not create commit status: " << ex.what() << ". Will not reject this submission since it is already created.";
    }

    if (!notify_path.empty()) {
        try {
            notify::ping(notify_path);
        } catch (std::exception &ex) {
            LOG(WARNING) << "Could not ping the runners: " << ex.what();
        }
    }

    LOG(INFO) << fmt::format("Submission {}@{} successfully inserted with id {}", event.repo_full_name, event.commit_id, submit.id);
    ingest_response response = accepted(fmt::format("submission {} received", submit.id));
    response.submission_id = submit.id;
    return response;
}

}  // namespace grader::gateway
