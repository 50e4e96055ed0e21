//
// Report aggregation
//
#include <trade_eval/report/report_aggregator.h>
#include <spdlog/spdlog.h>
#include <cmath>
#include <format>

namespace trade_eval {

ReportValue Normalize(MetricValue const &value) {
  if (value.is_null()) {
    return NotComputed{};
  }
  return Normalize(value.as_double());
}

ReportValue Normalize(double value) {
  if (!std::isfinite(value)) {
    return NotComputed{};
  }
  return value;
}

ReportValue Normalize(size_t value) { return static_cast<int64_t>(value); }

void ReportAggregator::AddClustering(ClusteringMetrics const &metrics) {
  MetricMap out{
      {"silhouette_score", Normalize(metrics.silhouette)},
      {"num_clusters", Normalize(metrics.clusters.size())},
      {"total_rows", Normalize(metrics.total_rows)},
  };

  for (const auto &cluster : metrics.clusters) {
    const auto prefix = std::format("cluster_{}", cluster.cluster_id);
    out[prefix + "_size"] = Normalize(cluster.size);
    out[prefix + "_pct"] = Normalize(cluster.pct_of_rows);
    for (size_t f = 0; f < cluster.feature_means.size() &&
                       f < metrics.feature_names.size();
         ++f) {
      out[std::format("{}_{}_mean", prefix, metrics.feature_names[f])] =
          Normalize(cluster.feature_means[f]);
    }
    if (cluster.anomaly_pct) {
      out[prefix + "_anomaly_pct"] = Normalize(*cluster.anomaly_pct);
    }
  }
  m_categories[epoch_core::ReportCategory::clustering] = std::move(out);
}

void ReportAggregator::AddClassification(ClassificationMetrics const &metrics) {
  MetricMap out{
      {"precision", Normalize(metrics.precision)},
      {"recall", Normalize(metrics.recall)},
      {"f1_score", Normalize(metrics.f1)},
      {"num_samples", Normalize(metrics.num_samples)},
      {"num_actual_anomalies", Normalize(metrics.num_actual)},
      {"num_detected_anomalies", Normalize(metrics.num_detected)},
      {"pct_actual_anomalies", Normalize(metrics.pct_actual)},
      {"pct_detected_anomalies", Normalize(metrics.pct_detected)},
  };
  if (metrics.confusion) {
    out["tn"] = Normalize(metrics.confusion->tn);
    out["fp"] = Normalize(metrics.confusion->fp);
    out["fn"] = Normalize(metrics.confusion->fn);
    out["tp"] = Normalize(metrics.confusion->tp);
  }
  m_categories[epoch_core::ReportCategory::anomalies] = std::move(out);
}

void ReportAggregator::AddRules(RuleMetrics const &metrics) {
  MetricMap out{
      {"num_rules", Normalize(metrics.num_rules)},
      {"mean_confidence", Normalize(metrics.mean_confidence)},
      {"mean_lift", Normalize(metrics.mean_lift)},
      {"mean_support", Normalize(metrics.mean_support)},
      {"num_predictive_rules", Normalize(metrics.predictive.count)},
      {"predictive_mean_confidence",
       Normalize(metrics.predictive.mean_confidence)},
      {"predictive_mean_lift", Normalize(metrics.predictive.mean_lift)},
  };
  for (const auto &[direction, stats] : metrics.by_direction) {
    const auto dir = epoch_core::RuleDirectionWrapper::ToString(direction);
    out["num_rules_" + dir] = Normalize(stats.count);
    out["mean_confidence_" + dir] = Normalize(stats.mean_confidence);
    out["mean_lift_" + dir] = Normalize(stats.mean_lift);
  }
  m_categories[epoch_core::ReportCategory::rules] = std::move(out);
}

void ReportAggregator::AddProfitability(
    std::vector<strategy::SimulationResult> const &results) {
  MetricMap out;
  size_t total_trades = 0;
  for (const auto &result : results) {
    out[result.strategy + "_return_pct"] = Normalize(result.return_pct);
    out[result.strategy + "_final_capital"] = Normalize(result.final_capital);
    out[result.strategy + "_trades"] = Normalize(result.trade_count);
    total_trades += result.trade_count;
  }
  out["total_trades"] = Normalize(total_trades);
  m_categories[epoch_core::ReportCategory::profitability] = std::move(out);
}

void ReportAggregator::AddError(epoch_core::ReportCategory category,
                                std::string reason) {
  SPDLOG_WARN("Category {} recorded as failed: {}",
              epoch_core::ReportCategoryWrapper::ToString(category), reason);
  m_categories[category] = CategoryError{std::move(reason)};
}

EvaluationReport ReportAggregator::Build() && {
  return EvaluationReport{std::move(m_categories)};
}

} // namespace trade_eval
