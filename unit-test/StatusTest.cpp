#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/status.hpp"

using namespace std;
using namespace grader;

TEST(StatusTest, CommitStateSeparatesStudentAndInfrastructureFaults) {
    EXPECT_EQ(commit_state::PENDING, to_commit_state(submission_status::NOT_STARTED));
    EXPECT_EQ(commit_state::PENDING, to_commit_state(submission_status::RUNNING));
    EXPECT_EQ(commit_state::SUCCESS, to_commit_state(submission_status::SUCCESS));
    for (auto stat : {submission_status::SUBMISSION_ERROR, submission_status::BUILD_ERROR, submission_status::BUILD_TIMED_OUT,
                      submission_status::TEST_CASES_FAILED, submission_status::TEST_CASES_TIMED_OUT, submission_status::EXECUTION_FAULT})
        EXPECT_EQ(commit_state::FAILURE, to_commit_state(stat)) << get_display_message(stat);
    EXPECT_EQ(commit_state::ERROR, to_commit_state(submission_status::AUTOGRADER_FAILURE));
    EXPECT_EQ(commit_state::ERROR, to_commit_state(submission_status::QUARANTINED));

    EXPECT_STREQ("pending", commit_state_string(commit_state::PENDING));
    EXPECT_STREQ("error", commit_state_string(commit_state::ERROR));
}

TEST(StatusTest, StatusCodes) {
    EXPECT_EQ(submission_status::TEST_CASES_TIMED_OUT, submission_status_from_code(404));
    EXPECT_EQ(submission_status::QUARANTINED, submission_status_from_code(501));
    EXPECT_THROW(submission_status_from_code(999), database_error);

    EXPECT_FALSE(is_terminal(submission_status::NOT_STARTED));
    EXPECT_FALSE(is_terminal(submission_status::RUNNING));
    EXPECT_TRUE(is_terminal(submission_status::BUILD_ERROR));
}

TEST(StatusTest, DisplayMessages) {
    EXPECT_STREQ("Test Cases Failed", get_display_message(submission_status::TEST_CASES_FAILED));
    EXPECT_STREQ("Wrong Exit Code", get_display_message(case_status::WRONG_EXIT_CODE));
    EXPECT_STREQ("Wrong File Type", get_display_message(case_status::WRONG_FILE_TYPE));
}
