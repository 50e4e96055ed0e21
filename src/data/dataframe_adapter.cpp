//
// DataFrame adapters
//
#include <trade_eval/data/dataframe_adapter.h>
#include <trade_eval/core/constants.h>
#include <epoch_core/macros.h>
#include <epoch_frame/factory/index_factory.h>
#include <epoch_frame/serialization.h>
#include <arrow/type_traits.h>
#include <spdlog/spdlog.h>
#include <cmath>
#include <filesystem>
#include <limits>
#include <set>

namespace {

using epoch_frame::DataFrame;

std::vector<double> ReadDoubleColumn(DataFrame const &df,
                                     std::string const &name) {
  AssertFromFormat(df.contains(name), "Missing required column '{}'", name);

  auto column_array = df[name].contiguous_array();
  if (column_array.type()->id() != arrow::Type::DOUBLE) {
    column_array = column_array.cast(arrow::float64());
  }
  const auto view = column_array.to_view<double>();

  std::vector<double> values(static_cast<size_t>(view->length()));
  for (int64_t i = 0; i < view->length(); ++i) {
    values[i] = view->IsNull(i) ? std::numeric_limits<double>::quiet_NaN()
                                : view->Value(i);
  }
  return values;
}

std::vector<double> ReadDoubleColumnOr(DataFrame const &df,
                                       std::string const &name,
                                       std::vector<double> const &fallback) {
  return df.contains(name) ? ReadDoubleColumn(df, name) : fallback;
}

std::vector<int64_t> ReadTimestamps(DataFrame const &df) {
  const auto view = df.index()->array().to_timestamp_view();
  AssertFromFormat(view != nullptr, "Frame index is not a timestamp index");
  return {view->raw_values(), view->raw_values() + view->length()};
}

// Integral label stored in a float column; NaN marks a missing label
template <typename T>
std::optional<T> ToLabel(double value, std::string const &column) {
  if (std::isnan(value)) {
    return std::nullopt;
  }
  const double rounded = std::round(value);
  constexpr auto lowest = static_cast<double>(std::numeric_limits<T>::min());
  AssertFromFormat(rounded >= lowest && rounded < -lowest,
                   "Label {} in column '{}' does not fit a {}-bit integer",
                   value, column, sizeof(T) * 8);
  return static_cast<T>(rounded);
}

std::set<std::string> SplitItems(std::string const &cell) {
  std::set<std::string> items;
  size_t begin = 0;
  while (begin <= cell.size()) {
    auto end = cell.find(trade_eval::RULE_ITEM_SEPARATOR, begin);
    if (end == std::string::npos) {
      end = cell.size();
    }
    auto item = cell.substr(begin, end - begin);
    const auto first = item.find_first_not_of(" \t");
    const auto last = item.find_last_not_of(" \t");
    if (first != std::string::npos) {
      items.insert(item.substr(first, last - first + 1));
    }
    begin = end + 1;
  }
  return items;
}

} // namespace

namespace trade_eval::data {

PriceSeries PriceSeriesFromDataFrame(DataFrame const &df) {
  const auto timestamps = ReadTimestamps(df);
  const auto close = ReadDoubleColumn(df, CLOSE);
  const auto open = ReadDoubleColumnOr(df, OPEN, close);
  const auto high = ReadDoubleColumnOr(df, HIGH, close);
  const auto low = ReadDoubleColumnOr(df, LOW, close);
  const bool has_volume = df.contains(VOLUME);
  const auto volume = has_volume ? ReadDoubleColumn(df, VOLUME)
                                 : std::vector<double>{};

  std::vector<PriceBar> bars(timestamps.size());
  for (size_t i = 0; i < bars.size(); ++i) {
    bars[i] = PriceBar{.timestamp = timestamps[i],
                       .open = open[i],
                       .high = high[i],
                       .low = low[i],
                       .close = close[i]};
    if (has_volume && !std::isnan(volume[i])) {
      bars[i].volume = volume[i];
    }
  }
  return PriceSeries{std::move(bars)};
}

ClusterSeries
ClusterSeriesFromDataFrame(DataFrame const &df,
                           std::vector<std::string> const &feature_columns) {
  const auto timestamps = ReadTimestamps(df);
  const auto cluster = ReadDoubleColumn(df, columns::CLUSTER);

  ClusterSeries result;
  result.feature_names = feature_columns;
  if (result.feature_names.empty()) {
    static const std::set<std::string> kReserved{
        columns::INDEX, columns::CLUSTER, columns::ANOMALY_PROBABILITY,
        columns::ANOMALY_PREDICTED, columns::ANOMALY_GROUND_TRUTH};
    for (const auto &name : df.column_names()) {
      if (!kReserved.contains(name) &&
          arrow::is_numeric(df[name].contiguous_array().type()->id())) {
        result.feature_names.push_back(name);
      }
    }
  }

  std::vector<std::vector<double>> features;
  features.reserve(result.feature_names.size());
  for (const auto &name : result.feature_names) {
    features.push_back(ReadDoubleColumn(df, name));
  }

  result.rows.reserve(timestamps.size());
  for (size_t i = 0; i < timestamps.size(); ++i) {
    ClusterAssignment row{.timestamp = timestamps[i],
                          .cluster_id = ToLabel<int64_t>(cluster[i], columns::CLUSTER)
                                            .value_or(UNASSIGNED_CLUSTER)};
    row.features.reserve(features.size());
    for (const auto &column : features) {
      row.features.push_back(column[i]);
    }
    result.rows.emplace_back(std::move(row));
  }

  SPDLOG_DEBUG("Read {} cluster rows with {} features", result.rows.size(),
               result.feature_names.size());
  return result;
}

AnomalySeries AnomalySeriesFromDataFrame(DataFrame const &df) {
  const auto timestamps = ReadTimestamps(df);
  const auto probability = ReadDoubleColumn(df, columns::ANOMALY_PROBABILITY);
  const bool has_predicted = df.contains(columns::ANOMALY_PREDICTED);
  const auto predicted = has_predicted
                             ? ReadDoubleColumn(df, columns::ANOMALY_PREDICTED)
                             : std::vector<double>{};
  const bool has_truth = df.contains(columns::ANOMALY_GROUND_TRUTH);
  const auto truth = has_truth
                         ? ReadDoubleColumn(df, columns::ANOMALY_GROUND_TRUTH)
                         : std::vector<double>{};

  AnomalySeries result;
  result.reserve(timestamps.size());
  for (size_t i = 0; i < timestamps.size(); ++i) {
    const double p = std::isnan(probability[i]) ? 0.0 : probability[i];
    AnomalyScore score{.timestamp = timestamps[i], .probability = p};
    score.predicted_label = has_predicted
                                ? ToLabel<int>(predicted[i], columns::ANOMALY_PREDICTED)
                                      .value_or(0)
                                : static_cast<int>(p > 0.5);
    if (has_truth) {
      score.ground_truth_label = ToLabel<int>(truth[i], columns::ANOMALY_GROUND_TRUTH);
    }
    result.emplace_back(score);
  }
  return result;
}

RuleTable RuleTableFromDataFrame(DataFrame const &df) {
  const auto n = df.num_rows();
  if (n == 0) {
    return {};
  }

  AssertFromFormat(df.contains(columns::ANTECEDENTS) &&
                       df.contains(columns::CONSEQUENTS),
                   "Rule table requires '{}' and '{}' columns",
                   columns::ANTECEDENTS, columns::CONSEQUENTS);
  const auto antecedents =
      df[columns::ANTECEDENTS].contiguous_array().to_vector<std::string>();
  const auto consequents =
      df[columns::CONSEQUENTS].contiguous_array().to_vector<std::string>();

  const std::vector<double> zeros(n, 0.0);
  const auto support = ReadDoubleColumn(df, columns::SUPPORT);
  const auto confidence = ReadDoubleColumn(df, columns::CONFIDENCE);
  const auto lift = ReadDoubleColumn(df, columns::LIFT);
  const auto leverage = ReadDoubleColumnOr(df, columns::LEVERAGE, zeros);
  const auto conviction = ReadDoubleColumnOr(df, columns::CONVICTION, zeros);

  RuleTable rules;
  rules.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    rules.push_back(AssociationRule{.antecedent = SplitItems(antecedents[i]),
                                    .consequent = SplitItems(consequents[i]),
                                    .support = support[i],
                                    .confidence = confidence[i],
                                    .lift = lift[i],
                                    .leverage = leverage[i],
                                    .conviction = conviction[i]});
  }
  return rules;
}

epoch_frame::DataFrame ReadCsv(std::string const &path, bool timestamp_index) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("CSV file not found: " + path);
  }

  auto df_res = epoch_frame::read_csv_file(path, epoch_frame::CSVReadOptions{});
  if (!df_res.ok()) {
    throw std::runtime_error("Failed to read CSV " + path + ": " +
                             df_res.status().ToString());
  }
  auto df = df_res.ValueOrDie();

  if (timestamp_index) {
    AssertFromFormat(df.contains(columns::INDEX),
                     "CSV {} has no '{}' column", path, columns::INDEX);
    df = df.set_index(columns::INDEX);
    auto ts_array = df.index()->array().cast(
        arrow::timestamp(arrow::TimeUnit::NANO, "UTC"));
    auto ts_index = epoch_frame::factory::index::make_index(
        ts_array.value(), epoch_frame::MonotonicDirection::Increasing,
        columns::INDEX);
    df = df.set_index(ts_index);
  }

  SPDLOG_DEBUG("Loaded {} rows from {}", df.num_rows(), path);
  return df;
}

} // namespace trade_eval::data
