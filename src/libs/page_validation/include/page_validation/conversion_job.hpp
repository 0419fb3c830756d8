#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace page_validation {

enum class JobState { Pending, Converting, Validating, Done, Failed };

std::string_view to_string(JobState state);

// pending -> converting -> (validating ->) done, with failed reachable from converting and validating.
bool can_transition(JobState from, JobState to);

// Lifecycle of one conversion. Illegal transitions throw std::logic_error.
class ConversionJob {
public:
    explicit ConversionJob(std::string id);

    const std::string& id() const { return id_; }
    JobState state() const { return state_; }
    const std::vector<JobState>& history() const { return history_; }
    const std::string& failure_reason() const { return failure_reason_; }
    bool finished() const { return state_ == JobState::Done || state_ == JobState::Failed; }

    void start();
    void begin_validation();
    void complete();
    void fail(std::string reason);

private:
    void transition(JobState next);

    std::string id_;
    JobState state_ = JobState::Pending;
    std::vector<JobState> history_;
    std::string failure_reason_;
};

} // namespace page_validation
