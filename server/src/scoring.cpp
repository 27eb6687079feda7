#include "server/scoring.hpp"

#include <algorithm>

namespace livequiz::server {

StreakBonusPolicy::StreakBonusPolicy() = default;

StreakBonusPolicy::StreakBonusPolicy(Config config) : config_(std::move(config)) {}

int StreakBonusPolicy::time_bonus(std::int64_t response_ms) const {
  if (response_ms <= 0) return 0;
  for (const auto& tier : config_.tiers) {
    if (response_ms < tier.under_ms) return std::max(0, tier.bonus);
  }
  return 0;
}

int StreakBonusPolicy::streak_bonus(int streak) const {
  return std::min(config_.max_streak_bonus, std::max(0, streak));
}

int StreakBonusPolicy::points(const ScoreInput& input) const {
  if (!input.correct) return 0;
  return config_.base_points + time_bonus(input.response_ms) + streak_bonus(input.streak);
}

int TimeFractionPolicy::points(const ScoreInput& input) const {
  if (!input.correct) return 0;
  const std::int64_t limit_ms = static_cast<std::int64_t>(input.time_limit) * 1000;
  const int base = input.question_points;
  const std::int64_t response_ms = std::min(input.response_ms, limit_ms);
  if (response_ms < limit_ms / 2) {
    return base * 3 / 2;
  }
  if (response_ms < limit_ms - limit_ms / 4) {
    return base * 5 / 4;
  }
  return base;
}

std::unique_ptr<ScoringPolicy> make_scoring_policy(const std::string& name) {
  if (name == "streak") return std::make_unique<StreakBonusPolicy>();
  if (name == "time-fraction") return std::make_unique<TimeFractionPolicy>();
  return nullptr;
}

}  // namespace livequiz::server
