#pragma once

#include <array>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "common/payloads.hpp"

namespace livequiz::server {

struct Question {
  int id{};
  std::string text;
  std::array<std::string, 4> options;
  int correct_index{};
  int time_limit{};  // seconds
  int points{};
};

// Wire form sent to participants (correct option withheld).
QuestionView view_of(const Question& question);

// Owns the question set of one server run and the monotonic question id
// counter. Loading only; editing the bank is left to external tooling.
class QuestionBank {
 public:
  QuestionBank();

  QuestionBank(const QuestionBank&) = delete;
  QuestionBank& operator=(const QuestionBank&) = delete;

  std::optional<Question> add(const std::string& text,
                              const std::array<std::string, 4>& options,
                              int correct_index,
                              int time_limit,
                              int points,
                              std::string* error = nullptr);

  // The built-in networking set. Returns the number of questions added.
  int load_defaults();

  // JSON array of {"text", "options":[4], "correct", "time_limit", "points"}.
  // Returns the number of questions added, or -1 with error filled.
  int load_json(const std::string& path, std::string* error = nullptr);

  // Read-only load from an SQLite question file (see data/schema.sql).
  // Returns the number of questions added, or -1 with error filled.
  int load_sqlite(const std::string& path, std::string* error = nullptr);

  std::vector<Question> all() const;
  std::vector<Question> pick(std::size_t count);
  std::optional<Question> find(int question_id) const;
  std::size_t size() const;
  void clear();

 private:
  mutable std::mutex mtx_;
  std::vector<Question> questions_;
  int next_id_{1};
  std::mt19937 rng_;
};

}  // namespace livequiz::server
