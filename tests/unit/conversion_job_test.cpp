#include <page_validation/conversion_job.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

using namespace page_validation;

TEST(ConversionJobTest, ConversionWithoutValidation) {
    ConversionJob job("job-1");
    EXPECT_EQ(job.state(), JobState::Pending);
    EXPECT_FALSE(job.finished());
    job.start();
    job.complete();
    EXPECT_TRUE(job.finished());
    EXPECT_EQ(job.history(), (std::vector<JobState>{ JobState::Pending, JobState::Converting, JobState::Done }));
}

TEST(ConversionJobTest, ValidationThenFailure) {
    ConversionJob job("job-2");
    job.start();
    job.begin_validation();
    job.fail("renderer unavailable");
    EXPECT_EQ(job.state(), JobState::Failed);
    EXPECT_EQ(job.failure_reason(), "renderer unavailable");
    EXPECT_EQ(job.history().size(), 4u);
}

TEST(ConversionJobTest, IllegalTransitionsThrow) {
    ConversionJob job("job-3");
    EXPECT_THROW(job.complete(), std::logic_error);
    EXPECT_THROW(job.begin_validation(), std::logic_error);
    EXPECT_THROW(job.fail("early"), std::logic_error);
    EXPECT_EQ(job.state(), JobState::Pending);

    job.start();
    job.complete();
    EXPECT_THROW(job.start(), std::logic_error);
    EXPECT_THROW(job.fail("late"), std::logic_error);
    EXPECT_TRUE(job.failure_reason().empty());
}

TEST(ConversionJobTest, TransitionTable) {
    EXPECT_TRUE(can_transition(JobState::Pending, JobState::Converting));
    EXPECT_TRUE(can_transition(JobState::Converting, JobState::Failed));
    EXPECT_TRUE(can_transition(JobState::Validating, JobState::Done));
    EXPECT_FALSE(can_transition(JobState::Validating, JobState::Converting));
    EXPECT_FALSE(can_transition(JobState::Done, JobState::Failed));
    EXPECT_FALSE(can_transition(JobState::Failed, JobState::Pending));
    EXPECT_EQ(to_string(JobState::Validating), "validating");
}
