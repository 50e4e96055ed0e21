#include <trade_eval/alignment/feature_alignment.h>
#include <limits>

namespace trade_eval {

AlignedSeries Align(PriceSeries const &window, ClusterSeries const *clusters,
                    AnomalySeries const *anomalies) {
  const auto axis = window.Timestamps();

  std::vector<std::optional<ClusterAssignment>> cluster_column;
  if (clusters) {
    cluster_column = AlignByTimestamp(axis, clusters->rows);
  }

  std::vector<std::optional<AnomalyScore>> anomaly_column;
  if (anomalies) {
    anomaly_column = AlignByTimestamp(axis, *anomalies);
  }

  AlignedSeries rows;
  rows.reserve(window.size());
  for (size_t i = 0; i < window.size(); ++i) {
    AlignedRow row{.index = i, .bar = window[i]};
    if (clusters && cluster_column[i]) {
      row.cluster_id = cluster_column[i]->cluster_id;
    }
    if (anomalies) {
      row.anomaly = anomaly_column[i];
    }
    rows.emplace_back(std::move(row));
  }

  SPDLOG_DEBUG("Aligned {} price rows (clusters={}, anomalies={})", rows.size(),
               clusters != nullptr, anomalies != nullptr);
  return rows;
}

PriceSeries SelectTestWindow(PriceSeries const &series,
                             EvaluationConfig const &config) {
  if (config.test_start || config.test_end) {
    return series.Between(
        config.test_start.value_or(std::numeric_limits<int64_t>::min()),
        config.test_end.value_or(std::numeric_limits<int64_t>::max()));
  }
  return series.Tail(config.test_fraction);
}

} // namespace trade_eval
