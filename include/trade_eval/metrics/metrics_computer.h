#pragma once
//
// Metrics over model outputs
//
// Scores the clustering, anomaly detection and rule mining collaborators.
// Values that can legitimately be underived (a silhouette over one cluster,
// the mean of an empty group) are carried as epoch_frame::Scalar where a null
// Scalar means "not computed"; the report aggregator turns them into plain
// numbers.
//
#include <trade_eval/core/config.h>
#include <trade_eval/core/constants.h>
#include <trade_eval/core/model_output.h>
#include <epoch_frame/scalar.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace trade_eval {

using MetricValue = epoch_frame::Scalar;

struct ClusterBreakdown {
  int64_t cluster_id{};
  size_t size{};
  double pct_of_rows{};
  std::vector<MetricValue> feature_means{}; // parallel to ClusteringMetrics::feature_names
  std::optional<double> anomaly_pct{};      // set only when anomalies were supplied
};

struct ClusteringMetrics {
  MetricValue silhouette{};
  size_t total_rows{};
  std::vector<std::string> feature_names{};
  std::vector<ClusterBreakdown> clusters{}; // ascending cluster_id, unassigned excluded
};

struct ConfusionCounts {
  size_t tn{};
  size_t fp{};
  size_t fn{};
  size_t tp{};
};

struct ClassificationMetrics {
  double precision{};
  double recall{};
  double f1{};
  size_t num_samples{};
  size_t num_actual{};
  size_t num_detected{};
  double pct_actual{};
  double pct_detected{};
  std::optional<ConfusionCounts> confusion{}; // only when labels observed are exactly {0, 1}
};

struct RuleGroupStats {
  size_t count{};
  MetricValue mean_confidence{};
  MetricValue mean_lift{};
};

struct RuleMetrics {
  size_t num_rules{};
  MetricValue mean_confidence{};
  MetricValue mean_lift{};
  MetricValue mean_support{};
  RuleGroupStats predictive{};
  std::map<epoch_core::RuleDirection, RuleGroupStats> by_direction{};
};

// Ratio with the zero-denominator case defined as 0
double SafeRatio(double numerator, double denominator);

/**
 * @brief Precision, recall and F1 from confusion counts
 *
 * Any ratio whose denominator is zero is exactly 0.
 */
ClassificationMetrics ClassificationFromCounts(ConfusionCounts const &counts);

class MetricsComputer {
public:
  explicit MetricsComputer(EvaluationConfig config);

  /**
   * @brief Silhouette score and per-cluster breakdown
   *
   * @param clusters Cluster assignments with the features they were fit on
   * @param anomalies Optional anomaly series used for per-cluster overlap
   * @return std::nullopt when there are no cluster rows at all
   */
  [[nodiscard]] std::optional<ClusteringMetrics>
  ComputeClustering(ClusterSeries const &clusters,
                    AnomalySeries const *anomalies) const;

  /**
   * @brief Detector quality against ground-truth labels
   *
   * @return std::nullopt when no row carries a ground-truth label
   */
  [[nodiscard]] std::optional<ClassificationMetrics>
  ComputeClassification(AnomalySeries const &anomalies) const;

  /**
   * @return std::nullopt for an empty rule table
   */
  [[nodiscard]] std::optional<RuleMetrics>
  ComputeRules(RuleTable const &rules) const;

private:
  EvaluationConfig m_config;
};

} // namespace trade_eval
