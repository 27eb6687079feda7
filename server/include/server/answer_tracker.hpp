#pragma once

#include <optional>
#include <set>
#include <string>

namespace livequiz::server {

enum class AdvancePolicy {
  DelayAfterAnswer,  // every accepted answer (re)arms the advance
  WaitForAll         // advance once every connected participant answered
};

std::string to_string(AdvancePolicy policy);
std::optional<AdvancePolicy> advance_policy_from_string(const std::string& value);

// Who answered (and acknowledged) the question currently on screen.
// Not synchronized; owned by the coordinator.
class AnswerTracker {
 public:
  explicit AnswerTracker(AdvancePolicy policy = AdvancePolicy::WaitForAll);

  void reset(int question_id, std::string message_id = {});
  void clear();

  // False if the participant already answered this question.
  bool record(const std::string& participant_id);
  bool has_answered(const std::string& participant_id) const;

  bool acknowledge(const std::string& participant_id, const std::string& message_id);

  // Whether an accepted answer (or a departure) should arm the advance.
  // `answered_present` counts answers from participants still connected.
  bool should_arm(std::size_t answered_present, std::size_t participant_count) const;

  // Arming is one-shot per question under WaitForAll.
  void mark_armed() { armed_ = true; }
  bool armed() const { return armed_; }

  int question_id() const { return question_id_; }
  const std::string& message_id() const { return message_id_; }
  const std::set<std::string>& answered() const { return answered_; }
  std::size_t answered_count() const { return answered_.size(); }
  std::size_t ack_count() const { return acked_.size(); }
  AdvancePolicy policy() const { return policy_; }

 private:
  AdvancePolicy policy_;
  int question_id_{-1};
  std::string message_id_;
  std::set<std::string> answered_;
  std::set<std::string> acked_;
  bool armed_{false};
};

}  // namespace livequiz::server
