//
// Evaluator
//
#include <trade_eval/evaluator.h>
#include <trade_eval/alignment/feature_alignment.h>
#include <trade_eval/report/report_aggregator.h>
#include <trade_eval/strategy/catalog.h>
#include <spdlog/spdlog.h>
#include <tbb/parallel_for_each.h>
#include <algorithm>
#include <numeric>

namespace {

using epoch_core::ReportCategory;
using epoch_core::ReportCategoryWrapper;

// Runs one category; a thrown exception becomes that category's error marker
template <typename T, typename Compute, typename Add>
void EvaluateCategory(trade_eval::ReportAggregator &aggregator,
                      ReportCategory category,
                      trade_eval::ModelResult<T> const &input, Compute compute,
                      Add add) {
  const auto name = ReportCategoryWrapper::ToString(category);

  if (std::holds_alternative<trade_eval::Omitted>(input)) {
    SPDLOG_DEBUG("No input for {}; category omitted", name);
    return;
  }
  if (const auto *error = std::get_if<trade_eval::ModelError>(&input)) {
    aggregator.AddError(category, error->reason);
    return;
  }

  try {
    const auto metrics = compute(std::get<T>(input));
    if (!metrics) {
      SPDLOG_INFO("Nothing to evaluate for {}; category omitted", name);
      return;
    }
    add(*metrics);
  } catch (const std::exception &e) {
    spdlog::error("Failed to evaluate {}: {}", name, e.what());
    aggregator.AddError(category, e.what());
  }
}

} // namespace

namespace trade_eval {

Evaluator::Evaluator(EvaluationConfig config)
    : m_config(std::move(config)), m_metrics(m_config),
      m_simulator(m_config) {}

EvaluationReport Evaluator::Evaluate(EvaluationInputs const &inputs) const {
  ReportAggregator aggregator;
  const auto *anomalies = GetIfPresent(inputs.anomalies);

  EvaluateCategory(
      aggregator, ReportCategory::clustering, inputs.clusters,
      [&](ClusterSeries const &clusters) {
        return m_metrics.ComputeClustering(clusters, anomalies);
      },
      [&](ClusteringMetrics const &m) { aggregator.AddClustering(m); });

  EvaluateCategory(
      aggregator, ReportCategory::anomalies, inputs.anomalies,
      [&](AnomalySeries const &series) {
        return m_metrics.ComputeClassification(series);
      },
      [&](ClassificationMetrics const &m) { aggregator.AddClassification(m); });

  EvaluateCategory(
      aggregator, ReportCategory::rules, inputs.rules,
      [&](RuleTable const &rules) { return m_metrics.ComputeRules(rules); },
      [&](RuleMetrics const &m) { aggregator.AddRules(m); });

  if (inputs.prices.empty()) {
    SPDLOG_INFO("No prices; profitability omitted");
  } else {
    try {
      aggregator.AddProfitability(Backtest(inputs.prices, anomalies));
    } catch (const std::exception &e) {
      spdlog::error("Failed to evaluate profitability: {}", e.what());
      aggregator.AddError(ReportCategory::profitability, e.what());
    }
  }

  return std::move(aggregator).Build();
}

std::vector<strategy::SimulationResult>
Evaluator::Backtest(PriceSeries const &prices,
                    AnomalySeries const *anomalies) const {
  const auto window = SelectTestWindow(prices, m_config);
  const auto aligned = Align(window, nullptr, anomalies);
  SPDLOG_INFO("Backtesting over {} of {} bars", window.size(), prices.size());

  std::vector<strategy::ISignalFunctionPtr> signals;
  signals.emplace_back(
      std::make_unique<strategy::MovingAverageCrossover>(m_config));
  if (anomalies) {
    signals.emplace_back(std::make_unique<strategy::AnomalyTriggered>(m_config));
  }

  std::vector<strategy::SimulationResult> results(signals.size() + 1);
  results[0] = strategy::BuyAndHold(aligned, m_config.initial_capital);

  std::vector<size_t> slots(signals.size());
  std::iota(slots.begin(), slots.end(), 0);
  const auto run = [&](size_t i) {
    results[i + 1] = m_simulator.Run(aligned, *signals[i]);
  };

  if (m_config.parallel_strategies) {
    tbb::parallel_for_each(slots.begin(), slots.end(), run);
  } else {
    std::ranges::for_each(slots, run);
  }
  return results;
}

} // namespace trade_eval
