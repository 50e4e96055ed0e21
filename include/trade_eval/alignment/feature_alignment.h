#pragma once
//
// Feature alignment
//
// Joins a price window with model outputs on exact timestamps. The price
// window is the axis: its order is never changed, model rows outside it are
// dropped, and axis rows a model never scored carry std::nullopt ("no signal").
//
#include <trade_eval/core/config.h>
#include <trade_eval/core/model_output.h>
#include <trade_eval/core/price_series.h>
#include <spdlog/spdlog.h>
#include <optional>
#include <unordered_map>
#include <vector>

namespace trade_eval {

struct AlignedRow {
  size_t index{};  // position within the window
  PriceBar bar{};
  std::optional<int64_t> cluster_id{};
  std::optional<AnomalyScore> anomaly{};
};

using AlignedSeries = std::vector<AlignedRow>;

/**
 * @brief Attaches series values to an axis of timestamps by exact match
 *
 * @param axis Timestamps defining the output rows, in output order
 * @param series Rows exposing a `timestamp` member; order is irrelevant
 * @return One entry per axis timestamp, std::nullopt where series has none
 *
 * Duplicate timestamps in @p series keep their first occurrence.
 */
template <typename T>
std::vector<std::optional<T>> AlignByTimestamp(std::vector<int64_t> const &axis,
                                               std::vector<T> const &series) {
  std::unordered_map<int64_t, size_t> lookup;
  lookup.reserve(series.size());
  size_t duplicates = 0;
  for (size_t i = 0; i < series.size(); ++i) {
    if (!lookup.emplace(series[i].timestamp, i).second) {
      ++duplicates;
    }
  }
  if (duplicates > 0) {
    SPDLOG_WARN("AlignByTimestamp: {} duplicate timestamps ignored", duplicates);
  }

  std::vector<std::optional<T>> result;
  result.reserve(axis.size());
  for (const auto timestamp : axis) {
    const auto it = lookup.find(timestamp);
    if (it == lookup.end()) {
      result.emplace_back(std::nullopt);
    } else {
      result.emplace_back(series[it->second]);
    }
  }
  return result;
}

/**
 * @brief Builds one aligned row per bar of @p window
 *
 * Either model series may be null, in which case every row carries no signal
 * for it.
 */
AlignedSeries Align(PriceSeries const &window, ClusterSeries const *clusters,
                    AnomalySeries const *anomalies);

/**
 * @brief Selects the out-of-sample window the strategies are scored on
 *
 * An explicit [test_start, test_end] range wins over test_fraction; a missing
 * bound is open.
 */
PriceSeries SelectTestWindow(PriceSeries const &series,
                             EvaluationConfig const &config);

} // namespace trade_eval
