#pragma once

#include <cstddef>
#include <optional>

#include "internal/model/work_item.hpp"

namespace workgraph::runtime::config {
class AnalyticsWeightsConfig;
}

namespace workgraph::analytics {

/*
  Coefficients of the bottleneck, recommendation and risk formulas.

  Defaults:
    priority weight     critical=4 high=3 medium=2 low=1
    weighted impact     direct + 0.5 * (transitive \ direct)
    score               10 * weight + 2 * unlocks - min(5, effort / 4)
    reasons             "unblocks N tasks" from 3 unlocks, "quick win" up to 4h
*/
struct AnalyticsWeights {
  double low      = 1.0;
  double medium   = 2.0;
  double high     = 3.0;
  double critical = 4.0;

  double transitive_factor = 0.5;

  double priority_score_multiplier = 10.0;
  double unlock_score_multiplier   = 2.0;
  double effort_divisor_hours      = 4.0;
  double effort_penalty_cap        = 5.0;

  std::size_t unlock_reason_threshold = 3;
  double      quick_win_max_hours     = 4.0;

  model::Priority high_priority_floor = model::Priority::kHigh;

  double PriorityWeight(model::Priority priority) const;

  // 0 when effort is unset.
  double EffortPenalty(const std::optional<double>& effort_hours) const;
};

// Fields absent from the config keep their defaults.
AnalyticsWeights WeightsFromConfig(const workgraph::runtime::config::AnalyticsWeightsConfig& config);

} // namespace workgraph::analytics
