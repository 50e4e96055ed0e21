//
// Clustering quality: silhouette over assigned rows and per-cluster breakdown
//
#include <trade_eval/metrics/metrics_computer.h>
#include <trade_eval/alignment/feature_alignment.h>
#include "armadillo_utils.h"

#include <epoch_core/macros.h>
#include <mlpack/core.hpp>
#include <mlpack/core/cv/metrics/silhouette_score.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace {

using trade_eval::ClusterAssignment;

bool HasAllFeatures(ClusterAssignment const &row) {
  return std::ranges::all_of(row.features,
                             [](double x) { return std::isfinite(x); });
}

// Silhouette needs >= 2 samples spread over >= 2 clusters; anything less is
// "not computed", which is not the same as a score of zero.
epoch_frame::Scalar Silhouette(trade_eval::ClusterSeries const &clusters) {
  const size_t n_features = clusters.feature_names.size();
  if (n_features == 0) {
    SPDLOG_DEBUG("Silhouette skipped: cluster series carries no features");
    return epoch_frame::Scalar{};
  }

  std::vector<size_t> selected;
  std::unordered_map<int64_t, size_t> label_map;
  for (size_t i = 0; i < clusters.rows.size(); ++i) {
    const auto &row = clusters.rows[i];
    if (row.cluster_id < 0 || !HasAllFeatures(row)) {
      continue;
    }
    selected.push_back(i);
    label_map.emplace(row.cluster_id, label_map.size());
  }

  if (selected.size() < 2 || label_map.size() < 2) {
    SPDLOG_DEBUG("Silhouette skipped: {} valid rows in {} clusters",
                 selected.size(), label_map.size());
    return epoch_frame::Scalar{};
  }

  // mlpack expects contiguous labels
  arma::Row<size_t> labels(selected.size());
  for (size_t j = 0; j < selected.size(); ++j) {
    labels(j) = label_map.at(clusters.rows[selected[j]].cluster_id);
  }

  const arma::mat X =
      trade_eval::utils::MatFromClusterRows(clusters.rows, selected, n_features);
  const double score =
      mlpack::SilhouetteScore::Overall(X, labels, mlpack::EuclideanDistance());
  if (!std::isfinite(score)) {
    return epoch_frame::Scalar{};
  }
  return epoch_frame::Scalar{score};
}

bool IsFlagged(trade_eval::AnomalyScore const &score) {
  return score.ground_truth_label.value_or(score.predicted_label) > 0;
}

} // namespace

namespace trade_eval {

std::optional<ClusteringMetrics>
MetricsComputer::ComputeClustering(ClusterSeries const &clusters,
                                   AnomalySeries const *anomalies) const {
  if (clusters.rows.empty()) {
    return std::nullopt;
  }

  const size_t n_features = clusters.feature_names.size();
  for (size_t i = 0; i < clusters.rows.size(); ++i) {
    AssertFromFormat(clusters.rows[i].features.size() == n_features,
                     "Cluster row {} carries {} features, expected {}", i,
                     clusters.rows[i].features.size(), n_features);
  }

  ClusteringMetrics result;
  result.total_rows = clusters.rows.size();
  result.feature_names = clusters.feature_names;
  result.silhouette = Silhouette(clusters);

  std::vector<std::optional<AnomalyScore>> anomaly_column;
  if (anomalies) {
    std::vector<int64_t> axis;
    axis.reserve(clusters.rows.size());
    for (const auto &row : clusters.rows) {
      axis.push_back(row.timestamp);
    }
    anomaly_column = AlignByTimestamp(axis, *anomalies);
  }

  std::map<int64_t, std::vector<size_t>> members;
  for (size_t i = 0; i < clusters.rows.size(); ++i) {
    if (clusters.rows[i].cluster_id >= 0) {
      members[clusters.rows[i].cluster_id].push_back(i);
    }
  }

  for (const auto &[cluster_id, indices] : members) {
    ClusterBreakdown breakdown;
    breakdown.cluster_id = cluster_id;
    breakdown.size = indices.size();
    breakdown.pct_of_rows = static_cast<double>(indices.size()) /
                            static_cast<double>(result.total_rows) * 100.0;

    breakdown.feature_means.reserve(n_features);
    for (size_t f = 0; f < n_features; ++f) {
      std::vector<double> values;
      values.reserve(indices.size());
      for (const auto i : indices) {
        values.push_back(clusters.rows[i].features[f]);
      }
      breakdown.feature_means.push_back(utils::MeanOrNull(values));
    }

    if (anomalies) {
      const auto flagged = std::ranges::count_if(indices, [&](size_t i) {
        return anomaly_column[i].has_value() && IsFlagged(*anomaly_column[i]);
      });
      breakdown.anomaly_pct = static_cast<double>(flagged) /
                              static_cast<double>(indices.size()) * 100.0;
    }

    result.clusters.emplace_back(std::move(breakdown));
  }

  SPDLOG_INFO("Clustering evaluated: {} rows, {} clusters, silhouette {}",
              result.total_rows, result.clusters.size(),
              result.silhouette.is_null() ? std::string{"not computed"}
                                          : std::to_string(result.silhouette.as_double()));
  return result;
}

} // namespace trade_eval
