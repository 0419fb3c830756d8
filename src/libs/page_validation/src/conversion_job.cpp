#include <page_validation/conversion_job.hpp>
#include <page_model/logging.hpp>
#include <stdexcept>

namespace page_validation {

std::string_view to_string(JobState state) {
    switch (state) {
    case JobState::Pending: return "pending";
    case JobState::Converting: return "converting";
    case JobState::Validating: return "validating";
    case JobState::Done: return "done";
    case JobState::Failed: return "failed";
    }
    return "pending";
}

bool can_transition(JobState from, JobState to) {
    switch (from) {
    case JobState::Pending: return to == JobState::Converting;
    case JobState::Converting:
        return to == JobState::Validating || to == JobState::Done || to == JobState::Failed;
    case JobState::Validating: return to == JobState::Done || to == JobState::Failed;
    case JobState::Done:
    case JobState::Failed: return false;
    }
    return false;
}

ConversionJob::ConversionJob(std::string id)
    : id_(std::move(id))
{
    history_.push_back(state_);
}

void ConversionJob::start() {
    transition(JobState::Converting);
}

void ConversionJob::begin_validation() {
    transition(JobState::Validating);
}

void ConversionJob::complete() {
    transition(JobState::Done);
}

void ConversionJob::fail(std::string reason) {
    transition(JobState::Failed);
    failure_reason_ = std::move(reason);
    page_model::conversion_logger()->warn("Job {} failed: {}", id_, failure_reason_);
}

void ConversionJob::transition(JobState next) {
    if (!can_transition(state_, next)) {
        throw std::logic_error("job " + id_ + ": illegal transition " + std::string(to_string(state_)) + " -> "
            + std::string(to_string(next)));
    }
    page_model::conversion_logger()->debug("Job {}: {} -> {}", id_, to_string(state_), to_string(next));
    state_ = next;
    history_.push_back(next);
}

} // namespace page_validation
