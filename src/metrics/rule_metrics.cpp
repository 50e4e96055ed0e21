//
// Association rule statistics
//
#include <trade_eval/metrics/metrics_computer.h>
#include "armadillo_utils.h"

#include <spdlog/spdlog.h>
#include <algorithm>

namespace {

using trade_eval::AssociationRule;

bool ConsequentMentions(AssociationRule const &rule, std::string const &token) {
  return std::ranges::any_of(rule.consequent, [&](std::string const &item) {
    return item.find(token) != std::string::npos;
  });
}

trade_eval::RuleGroupStats
GroupStats(std::vector<AssociationRule const *> const &group) {
  std::vector<double> confidence;
  std::vector<double> lift;
  confidence.reserve(group.size());
  lift.reserve(group.size());
  for (const auto *rule : group) {
    confidence.push_back(rule->confidence);
    lift.push_back(rule->lift);
  }
  return {.count = group.size(),
          .mean_confidence = trade_eval::utils::MeanOrNull(confidence),
          .mean_lift = trade_eval::utils::MeanOrNull(lift)};
}

} // namespace

namespace trade_eval {

std::optional<RuleMetrics>
MetricsComputer::ComputeRules(RuleTable const &rules) const {
  if (rules.empty()) {
    SPDLOG_DEBUG("Rule table is empty; rules category not computed");
    return std::nullopt;
  }

  std::vector<AssociationRule const *> all;
  std::vector<AssociationRule const *> predictive;
  std::map<epoch_core::RuleDirection, std::vector<AssociationRule const *>>
      by_direction;
  std::vector<double> support;

  all.reserve(rules.size());
  support.reserve(rules.size());
  for (const auto &rule : rules) {
    all.push_back(&rule);
    support.push_back(rule.support);

    if (!ConsequentMentions(rule, m_config.forward_return_label)) {
      continue;
    }
    predictive.push_back(&rule);
    for (const auto direction : RULE_DIRECTIONS) {
      if (ConsequentMentions(
              rule, epoch_core::RuleDirectionWrapper::ToString(direction))) {
        by_direction[direction].push_back(&rule);
      }
    }
  }

  const auto overall = GroupStats(all);
  RuleMetrics result{.num_rules = rules.size(),
                     .mean_confidence = overall.mean_confidence,
                     .mean_lift = overall.mean_lift,
                     .mean_support = utils::MeanOrNull(support),
                     .predictive = GroupStats(predictive)};
  for (const auto direction : RULE_DIRECTIONS) {
    result.by_direction[direction] = GroupStats(by_direction[direction]);
  }

  SPDLOG_INFO("Rules evaluated: {} total, {} predictive", result.num_rules,
              result.predictive.count);
  return result;
}

} // namespace trade_eval
