#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace livequiz::server {

struct ScoreInput {
  bool correct{false};
  std::int64_t response_ms{0};  // 0 if unknown
  int streak{0};                // consecutive correct answers before this one
  int question_points{0};
  int time_limit{0};  // seconds
};

// Stateless scoring strategy: ScoreInput -> points to add.
class ScoringPolicy {
 public:
  virtual ~ScoringPolicy() = default;
  virtual int points(const ScoreInput& input) const = 0;
  virtual std::string name() const = 0;
};

struct TimeBonusTier {
  std::int64_t under_ms;
  int bonus;
};

// Fixed base + stepwise time bonus + capped streak bonus.
class StreakBonusPolicy : public ScoringPolicy {
 public:
  struct Config {
    int base_points = 10;
    int max_streak_bonus = 5;
    // Checked in order; first tier whose bound exceeds the response time wins.
    std::vector<TimeBonusTier> tiers = {
        {2000, 5}, {4000, 4}, {6000, 3}, {8000, 2}, {10000, 1}};
  };

  StreakBonusPolicy();
  explicit StreakBonusPolicy(Config config);

  int points(const ScoreInput& input) const override;
  std::string name() const override { return "streak"; }

  int time_bonus(std::int64_t response_ms) const;
  int streak_bonus(int streak) const;

 private:
  Config config_;
};

// Per-question formula: 150% of the question's points under half the limit,
// 125% under three quarters, otherwise the plain points.
class TimeFractionPolicy : public ScoringPolicy {
 public:
  int points(const ScoreInput& input) const override;
  std::string name() const override { return "time-fraction"; }
};

// "streak" or "time-fraction"; nullptr for anything else.
std::unique_ptr<ScoringPolicy> make_scoring_policy(const std::string& name);

}  // namespace livequiz::server
