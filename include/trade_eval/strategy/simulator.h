#pragma once
//
// Single position strategy simulator
//
// Walks an aligned window in chronological order carrying
// {capital, position, trade_count}. Commission is charged as a fraction of
// capital on every leg. A position still open when the window ends is
// liquidated at the last close, so results always describe a flat book.
//
#include <trade_eval/core/config.h>
#include <trade_eval/strategy/signal_function.h>
#include <optional>
#include <string>
#include <vector>

namespace trade_eval::strategy {

struct TradeRecord {
  epoch_core::TradeSide side{epoch_core::TradeSide::Buy};
  size_t index{};
  int64_t timestamp{};
  double price{};
  double capital_after{};
  bool forced{false}; // liquidation at window end
};

struct SimulationResult {
  std::string strategy;
  double initial_capital{};
  double final_capital{};
  double return_pct{};
  size_t trade_count{};
  Position final_position{Flat{}};
  std::optional<std::vector<TradeRecord>> trade_log{};
};

class StrategySimulator {
public:
  explicit StrategySimulator(EvaluationConfig config);

  /**
   * @brief Runs @p signal over @p window from a fresh state
   *
   * The signal function is reset before the first tick. An empty window
   * yields return_pct 0 and no trades.
   */
  [[nodiscard]] SimulationResult Run(AlignedSeries const &window,
                                     ISignalFunction &signal) const;

private:
  struct State {
    double capital{};
    Position position{Flat{}};
    size_t trade_count{};
    std::optional<std::vector<TradeRecord>> log{};
  };

  State Step(State state, AlignedRow const &row,
             epoch_core::TradeSignal signal) const;

  State Enter(State state, AlignedRow const &row) const;
  State Exit(State state, AlignedRow const &row, bool forced) const;

  EvaluationConfig m_config;
};

/**
 * @brief Percentage change from the first to the last close
 *
 * Buy-and-hold is a reference figure rather than a simulated strategy: no
 * commission is charged and no trades are counted.
 */
SimulationResult BuyAndHold(AlignedSeries const &window, double initial_capital);

} // namespace trade_eval::strategy
