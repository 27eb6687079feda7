#include "server/answer_tracker.hpp"

namespace livequiz::server {

std::string to_string(AdvancePolicy policy) {
  switch (policy) {
    case AdvancePolicy::DelayAfterAnswer:
      return "delay-after-answer";
    case AdvancePolicy::WaitForAll:
      return "wait-for-all";
  }
  return "wait-for-all";
}

std::optional<AdvancePolicy> advance_policy_from_string(const std::string& value) {
  if (value == "delay-after-answer") return AdvancePolicy::DelayAfterAnswer;
  if (value == "wait-for-all") return AdvancePolicy::WaitForAll;
  return std::nullopt;
}

AnswerTracker::AnswerTracker(AdvancePolicy policy) : policy_(policy) {}

void AnswerTracker::reset(int question_id, std::string message_id) {
  question_id_ = question_id;
  message_id_ = std::move(message_id);
  answered_.clear();
  acked_.clear();
  armed_ = false;
}

void AnswerTracker::clear() {
  reset(-1);
}

bool AnswerTracker::record(const std::string& participant_id) {
  return answered_.insert(participant_id).second;
}

bool AnswerTracker::has_answered(const std::string& participant_id) const {
  return answered_.count(participant_id) > 0;
}

bool AnswerTracker::acknowledge(const std::string& participant_id,
                                const std::string& message_id) {
  if (message_id_.empty() || message_id != message_id_) return false;
  return acked_.insert(participant_id).second;
}

bool AnswerTracker::should_arm(std::size_t answered_present, std::size_t participant_count) const {
  switch (policy_) {
    case AdvancePolicy::DelayAfterAnswer:
      return answered_present > 0;
    case AdvancePolicy::WaitForAll:
      return !armed_ && participant_count > 0 && answered_present >= participant_count;
  }
  return false;
}

}  // namespace livequiz::server
