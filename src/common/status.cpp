#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<submission_status, const char *> submission_status_string = boost::assign::map_list_of
    (submission_status::NOT_STARTED, "Not Started")
    (submission_status::RUNNING, "Running")
    (submission_status::SUCCESS, "Success")
    (submission_status::SUBMISSION_ERROR, "Submission Error")
    (submission_status::BUILD_ERROR, "Build Error")
    (submission_status::BUILD_TIMED_OUT, "Build Timed Out")
    (submission_status::TEST_CASES_FAILED, "Test Cases Failed")
    (submission_status::TEST_CASES_TIMED_OUT, "Test Cases Timed Out")
    (submission_status::EXECUTION_FAULT, "Execution Fault")
    (submission_status::AUTOGRADER_FAILURE, "Autograder Failure")
    (submission_status::QUARANTINED, "Quarantined");

static const unordered_map<case_status, const char *> case_status_string = boost::assign::map_list_of
    (case_status::ACCEPTED, "Passed")
    (case_status::WRONG_EXIT_CODE, "Wrong Exit Code")
    (case_status::WRONG_STDOUT, "Wrong Standard Output")
    (case_status::WRONG_STDERR, "Wrong Standard Error")
    (case_status::FILE_NOT_FOUND, "File Not Found")
    (case_status::WRONG_FILE_TYPE, "Wrong File Type")
    (case_status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (case_status::OUTPUT_LIMIT_EXCEEDED, "Output Limit Exceeded")
    (case_status::EXECUTION_FAULT, "Execution Fault")
    (case_status::SKIPPED, "Skipped");
// clang-format on

const char *get_display_message(submission_status stat) {
    return submission_status_string.at(stat);
}

const char *get_display_message(case_status stat) {
    return case_status_string.at(stat);
}

const char *commit_state_string(commit_state state) {
    switch (state) {
        case commit_state::PENDING: return "pending";
        case commit_state::SUCCESS: return "success";
        case commit_state::FAILURE: return "failure";
        case commit_state::ERROR: return "error";
    }
    return "error";
}

commit_state to_commit_state(submission_status stat) {
    int code = static_cast<int>(stat);
    if (code < 200) return commit_state::PENDING;
    if (code < 300) return commit_state::SUCCESS;
    if (code < 500) return commit_state::FAILURE;
    return commit_state::ERROR;
}

submission_status submission_status_from_code(int code) {
    auto stat = static_cast<submission_status>(code);
    if (!submission_status_string.count(stat))
        throw database_error("unknown submission status code " + std::to_string(code));
    return stat;
}

bool is_terminal(submission_status stat) {
    return stat != submission_status::NOT_STARTED && stat != submission_status::RUNNING;
}

}  // namespace grader
