#include "internal/analytics/analytics_weights.hpp"

#include <algorithm>

#include "config/config.pb.h"

namespace workgraph::analytics {

double AnalyticsWeights::PriorityWeight(model::Priority priority) const {
  switch (priority) {
    case model::Priority::kLow:
      return low;
    case model::Priority::kMedium:
      return medium;
    case model::Priority::kHigh:
      return high;
    case model::Priority::kCritical:
      return critical;
  }
  return medium;
}

double AnalyticsWeights::EffortPenalty(const std::optional<double>& effort_hours) const {
  if (!effort_hours || effort_divisor_hours <= 0.0) {
    return 0.0;
  }
  return std::min(effort_penalty_cap, *effort_hours / effort_divisor_hours);
}

AnalyticsWeights WeightsFromConfig(const workgraph::runtime::config::AnalyticsWeightsConfig& config) {
  AnalyticsWeights weights;

  const auto& priority = config.priority();
  if (priority.has_low()) weights.low = priority.low();
  if (priority.has_medium()) weights.medium = priority.medium();
  if (priority.has_high()) weights.high = priority.high();
  if (priority.has_critical()) weights.critical = priority.critical();

  if (config.has_transitive_factor()) weights.transitive_factor = config.transitive_factor();
  if (config.has_priority_score_multiplier()) weights.priority_score_multiplier = config.priority_score_multiplier();
  if (config.has_unlock_score_multiplier()) weights.unlock_score_multiplier = config.unlock_score_multiplier();
  if (config.has_effort_divisor_hours()) weights.effort_divisor_hours = config.effort_divisor_hours();
  if (config.has_effort_penalty_cap()) weights.effort_penalty_cap = config.effort_penalty_cap();
  if (config.has_unlock_reason_threshold()) weights.unlock_reason_threshold = config.unlock_reason_threshold();
  if (config.has_quick_win_max_hours()) weights.quick_win_max_hours = config.quick_win_max_hours();
  return weights;
}

} // namespace workgraph::analytics
