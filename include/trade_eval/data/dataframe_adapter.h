#pragma once
//
// epoch_frame DataFrame -> typed evaluation inputs
//
// Frames carrying time series (prices, clusters, anomalies) must have a UTC
// timestamp index. The rule table is a plain frame, one row per rule.
//
#include <trade_eval/core/model_output.h>
#include <trade_eval/core/price_series.h>
#include <epoch_frame/dataframe.h>
#include <string>
#include <vector>

namespace trade_eval::data {

/**
 * @brief Bars from open/high/low/close/volume columns
 *
 * Only close is required; a missing open/high/low column falls back to
 * close and a missing volume column leaves volume unset.
 */
PriceSeries PriceSeriesFromDataFrame(epoch_frame::DataFrame const &df);

/**
 * @brief Cluster assignments from the cluster column
 *
 * @param feature_columns Columns to carry as features; when empty every
 * numeric column other than the cluster and anomaly columns is used
 */
ClusterSeries
ClusterSeriesFromDataFrame(epoch_frame::DataFrame const &df,
                           std::vector<std::string> const &feature_columns = {});

/**
 * @brief Anomaly scores from anomaly_probability, anomaly_pred and the
 * optional ground-truth anomaly column
 *
 * Without an anomaly_pred column the predicted label is probability > 0.5.
 * A null ground-truth cell means "unlabelled".
 */
AnomalySeries AnomalySeriesFromDataFrame(epoch_frame::DataFrame const &df);

/**
 * @brief Rules from antecedents/consequents ('|' separated items) and the
 * numeric rule columns; leverage and conviction default to 0 when absent
 */
RuleTable RuleTableFromDataFrame(epoch_frame::DataFrame const &df);

/**
 * @brief Loads a CSV file
 *
 * @param timestamp_index When set, the "index" column becomes a UTC
 * nanosecond timestamp index
 * @throws std::runtime_error if the file cannot be read or parsed
 */
epoch_frame::DataFrame ReadCsv(std::string const &path, bool timestamp_index);

} // namespace trade_eval::data
