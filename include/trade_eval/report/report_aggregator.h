#pragma once
//
// Report aggregator
//
// The one place where metric values leave their computation types.
// epoch_frame::Scalar values are unwrapped here into int64_t/double; a null or
// non-finite Scalar becomes NotComputed.
//
#include <trade_eval/metrics/metrics_computer.h>
#include <trade_eval/report/evaluation_report.h>
#include <trade_eval/strategy/simulator.h>
#include <vector>

namespace trade_eval {

ReportValue Normalize(MetricValue const &value);
ReportValue Normalize(double value);
ReportValue Normalize(size_t value);

class ReportAggregator {
public:
  void AddClustering(ClusteringMetrics const &metrics);
  void AddClassification(ClassificationMetrics const &metrics);
  void AddRules(RuleMetrics const &metrics);
  void AddProfitability(std::vector<strategy::SimulationResult> const &results);

  /**
   * @brief Records a failed category; replaces anything added for it
   */
  void AddError(epoch_core::ReportCategory category, std::string reason);

  [[nodiscard]] EvaluationReport Build() &&;

private:
  EvaluationReport::Categories m_categories;
};

} // namespace trade_eval
