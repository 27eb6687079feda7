#include "common/payloads.hpp"

#include <charconv>

#include "common/codec.hpp"

namespace livequiz {

namespace {

std::optional<std::vector<std::string>> fields_exact(const std::string& payload,
                                                     std::size_t count,
                                                     const char* what,
                                                     std::string& error) {
  auto fields = split_fields(payload);
  if (!fields) {
    error = std::string(what) + ": invalid escape sequence";
    return std::nullopt;
  }
  if (fields->size() != count) {
    error = std::string(what) + ": expected " + std::to_string(count) + " fields, got " +
            std::to_string(fields->size());
    return std::nullopt;
  }
  return fields;
}

template <typename T>
std::optional<T> parse_number(const std::string& text) {
  if (text.empty()) return std::nullopt;
  T value{};
  const char* first = text.data();
  const char* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) return std::nullopt;
  return value;
}

}  // namespace

std::optional<int> parse_int(const std::string& text) {
  return parse_number<int>(text);
}

std::optional<std::int64_t> parse_int64(const std::string& text) {
  return parse_number<std::int64_t>(text);
}

std::string join_payload(const JoinRequest& join) {
  return join_fields({join.participant_id, join.name});
}

std::optional<JoinRequest> parse_join(const std::string& payload, std::string& error) {
  auto f = fields_exact(payload, 2, "STUDENT_JOIN", error);
  if (!f) return std::nullopt;
  if ((*f)[0].empty() || (*f)[1].empty()) {
    error = "STUDENT_JOIN: id and name are required";
    return std::nullopt;
  }
  return JoinRequest{(*f)[0], (*f)[1]};
}

std::string answer_payload(const AnswerSubmission& answer) {
  return join_fields({std::to_string(answer.question_id), std::to_string(answer.option),
                      std::to_string(answer.latency_ms)});
}

std::optional<AnswerSubmission> parse_answer(const std::string& payload, std::string& error) {
  auto f = fields_exact(payload, 3, "ANSWER", error);
  if (!f) return std::nullopt;
  auto qid = parse_int((*f)[0]);
  auto option = parse_int((*f)[1]);
  auto latency = parse_int64((*f)[2]);
  if (!qid || !option || !latency) {
    error = "ANSWER: numeric fields expected";
    return std::nullopt;
  }
  if (*latency < 0) {
    error = "ANSWER: negative latency";
    return std::nullopt;
  }
  if (*latency > kMaxAnswerLatencyMs) {
    error = "ANSWER: latency out of range";
    return std::nullopt;
  }
  return AnswerSubmission{*qid, *option, *latency};
}

std::string question_payload(const QuestionView& question) {
  return join_fields({std::to_string(question.id), question.text,
                      std::to_string(question.time_limit), std::to_string(question.points),
                      question.options[0], question.options[1], question.options[2],
                      question.options[3]});
}

std::optional<QuestionView> parse_question(const std::string& payload, std::string& error) {
  auto f = fields_exact(payload, 8, "QUESTION", error);
  if (!f) return std::nullopt;
  auto id = parse_int((*f)[0]);
  auto limit = parse_int((*f)[2]);
  auto points = parse_int((*f)[3]);
  if (!id || !limit || !points) {
    error = "QUESTION: numeric fields expected";
    return std::nullopt;
  }
  QuestionView q;
  q.id = *id;
  q.text = (*f)[1];
  q.time_limit = *limit;
  q.points = *points;
  for (std::size_t i = 0; i < q.options.size(); ++i) {
    q.options[i] = (*f)[4 + i];
  }
  return q;
}

std::string result_payload(const ResultView& result) {
  return join_fields({result.correct ? "1" : "0", std::to_string(result.points_earned),
                      result.message, std::to_string(result.total_score)});
}

std::optional<ResultView> parse_result(const std::string& payload, std::string& error) {
  auto f = fields_exact(payload, 4, "RESULT", error);
  if (!f) return std::nullopt;
  auto points = parse_int((*f)[1]);
  auto total = parse_int((*f)[3]);
  if (((*f)[0] != "0" && (*f)[0] != "1") || !points || !total) {
    error = "RESULT: malformed fields";
    return std::nullopt;
  }
  return ResultView{(*f)[0] == "1", *points, (*f)[2], *total};
}

std::string leaderboard_payload(const std::vector<LeaderboardRow>& rows) {
  std::vector<std::string> records;
  records.reserve(rows.size());
  for (const auto& r : rows) {
    records.push_back(join_fields({std::to_string(r.rank), r.name, std::to_string(r.score),
                                   std::to_string(r.correct), std::to_string(r.answered)}));
  }
  return join_records(records);
}

std::optional<std::vector<LeaderboardRow>> parse_leaderboard(const std::string& payload,
                                                             std::string& error) {
  auto records = split_records(payload);
  if (!records) {
    error = "LEADERBOARD: invalid escape sequence";
    return std::nullopt;
  }
  std::vector<LeaderboardRow> rows;
  rows.reserve(records->size());
  for (const auto& record : *records) {
    auto f = fields_exact(record, 5, "LEADERBOARD", error);
    if (!f) return std::nullopt;
    auto rank = parse_int((*f)[0]);
    auto score = parse_int((*f)[2]);
    auto correct = parse_int((*f)[3]);
    auto answered = parse_int((*f)[4]);
    if (!rank || !score || !correct || !answered) {
      error = "LEADERBOARD: numeric fields expected";
      return std::nullopt;
    }
    rows.push_back(LeaderboardRow{*rank, (*f)[1], *score, *correct, *answered});
  }
  return rows;
}

std::string timer_sync_payload(const TimerSyncView& sync) {
  return join_fields({std::to_string(sync.remaining), sync.state});
}

std::optional<TimerSyncView> parse_timer_sync(const std::string& payload, std::string& error) {
  auto f = fields_exact(payload, 2, "TIMER_SYNC", error);
  if (!f) return std::nullopt;
  auto remaining = parse_int((*f)[0]);
  if (!remaining) {
    error = "TIMER_SYNC: remaining must be a number";
    return std::nullopt;
  }
  return TimerSyncView{*remaining, (*f)[1]};
}

std::string timer_control_payload(const TimerControlView& control) {
  return join_fields({control.action, std::to_string(control.value)});
}

std::optional<TimerControlView> parse_timer_control(const std::string& payload,
                                                    std::string& error) {
  auto f = fields_exact(payload, 2, "TIMER_CONTROL", error);
  if (!f) return std::nullopt;
  const auto& action = (*f)[0];
  if (action != "pause" && action != "resume" && action != "extend") {
    error = "TIMER_CONTROL: unknown action " + action;
    return std::nullopt;
  }
  auto value = parse_int((*f)[1]);
  if (!value) {
    error = "TIMER_CONTROL: value must be a number";
    return std::nullopt;
  }
  return TimerControlView{action, *value};
}

}  // namespace livequiz
