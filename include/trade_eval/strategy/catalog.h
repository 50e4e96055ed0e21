#pragma once
//
// Concrete signal functions
//
#include <trade_eval/core/config.h>
#include <trade_eval/strategy/signal_function.h>
#include <deque>
#include <optional>

namespace trade_eval::strategy {

/**
 * @brief Long while the short SMA is above the long SMA
 *
 * Signals fire on crosses only. The first tick establishes the baseline, and an
 * SMA whose window is not yet full counts as "not above".
 */
class MovingAverageCrossover final : public ISignalFunction {
public:
  MovingAverageCrossover(size_t short_window, size_t long_window);
  explicit MovingAverageCrossover(EvaluationConfig const &config)
      : MovingAverageCrossover(config.short_window, config.long_window) {}

  std::string Name() const override;
  epoch_core::TradeSignal Next(AlignedRow const &row,
                               Position const &position) override;
  void Reset() override;

private:
  // Rolling mean of the last `window` closes; nullopt until full
  class RollingMean {
  public:
    explicit RollingMean(size_t window) : m_window(window) {}
    std::optional<double> Push(double value);
    void Clear();

  private:
    size_t m_window;
    std::deque<double> m_values;
    double m_sum{};
  };

  RollingMean m_short;
  RollingMean m_long;
  std::optional<bool> m_was_above;
};

/**
 * @brief Enters on a high anomaly probability, exits after a fixed number of
 * ticks
 */
class AnomalyTriggered final : public ISignalFunction {
public:
  AnomalyTriggered(double probability_threshold, size_t holding_period);
  explicit AnomalyTriggered(EvaluationConfig const &config)
      : AnomalyTriggered(config.probability_threshold, config.holding_period) {}

  std::string Name() const override;
  epoch_core::TradeSignal Next(AlignedRow const &row,
                               Position const &position) override;
  void Reset() override {}

private:
  double m_threshold;
  size_t m_holding_period;
};

} // namespace trade_eval::strategy
