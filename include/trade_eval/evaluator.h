#pragma once
//
// Evaluator
//
// Runs every category of an evaluation and hands the results to the
// ReportAggregator. Categories are isolated: a category with no input is
// omitted, and one that fails is recorded as an error while the others are
// still produced.
//
#include <trade_eval/core/config.h>
#include <trade_eval/core/model_output.h>
#include <trade_eval/core/price_series.h>
#include <trade_eval/metrics/metrics_computer.h>
#include <trade_eval/report/evaluation_report.h>
#include <trade_eval/strategy/simulator.h>
#include <vector>

namespace trade_eval {

struct EvaluationInputs {
  PriceSeries prices{};
  ModelResult<ClusterSeries> clusters{Omitted{}};
  ModelResult<AnomalySeries> anomalies{Omitted{}};
  ModelResult<RuleTable> rules{Omitted{}};
};

class Evaluator {
public:
  explicit Evaluator(EvaluationConfig config);

  [[nodiscard]] EvaluationReport Evaluate(EvaluationInputs const &inputs) const;

  /**
   * @brief Buy-and-hold, moving average crossover and, when scores are
   * given, the anomaly strategy over the test window of @p prices
   *
   * @return One result per strategy, buy-and-hold first
   */
  [[nodiscard]] std::vector<strategy::SimulationResult>
  Backtest(PriceSeries const &prices, AnomalySeries const *anomalies) const;

  [[nodiscard]] const EvaluationConfig &config() const { return m_config; }

private:
  EvaluationConfig m_config;
  MetricsComputer m_metrics;
  strategy::StrategySimulator m_simulator;
};

} // namespace trade_eval
