//
// Strategy simulator
//
#include <trade_eval/strategy/simulator.h>
#include <spdlog/spdlog.h>
#include <format>
#include <stdexcept>

namespace trade_eval::strategy {

StrategySimulator::StrategySimulator(EvaluationConfig config)
    : m_config(std::move(config)) {
  m_config.Validate();
}

SimulationResult StrategySimulator::Run(AlignedSeries const &window,
                                        ISignalFunction &signal) const {
  signal.Reset();

  State state{.capital = m_config.initial_capital};
  if (m_config.record_trades) {
    state.log.emplace();
  }

  for (const auto &row : window) {
    const auto action = signal.Next(row, state.position);
    state = Step(std::move(state), row, action);
  }

  if (!window.empty() && !IsFlat(state.position)) {
    SPDLOG_DEBUG("{}: liquidating open position at window end", signal.Name());
    state = Exit(std::move(state), window.back(), true);
  }

  SimulationResult result{
      .strategy = signal.Name(),
      .initial_capital = m_config.initial_capital,
      .final_capital = state.capital,
      .return_pct = (state.capital / m_config.initial_capital - 1.0) * 100.0,
      .trade_count = state.trade_count,
      .final_position = state.position,
      .trade_log = std::move(state.log)};

  SPDLOG_INFO("{}: return {:.2f}% over {} ticks with {} trades",
              result.strategy, result.return_pct, window.size(),
              result.trade_count);
  return result;
}

StrategySimulator::State StrategySimulator::Step(State state,
                                                 AlignedRow const &row,
                                                 epoch_core::TradeSignal signal) const {
  switch (signal) {
  case epoch_core::TradeSignal::Enter:
    if (IsFlat(state.position)) {
      return Enter(std::move(state), row);
    }
    break;
  case epoch_core::TradeSignal::Exit:
    if (!IsFlat(state.position)) {
      return Exit(std::move(state), row, false);
    }
    break;
  default:
    break;
  }
  return state;
}

StrategySimulator::State StrategySimulator::Enter(State state,
                                                  AlignedRow const &row) const {
  state.capital -= state.capital * m_config.commission_rate;
  state.position = Long{.entry_price = row.bar.close, .entry_index = row.index};
  ++state.trade_count;

  if (state.log) {
    state.log->push_back(TradeRecord{.side = epoch_core::TradeSide::Buy,
                                     .index = row.index,
                                     .timestamp = row.bar.timestamp,
                                     .price = row.bar.close,
                                     .capital_after = state.capital});
  }
  return state;
}

StrategySimulator::State StrategySimulator::Exit(State state,
                                                 AlignedRow const &row,
                                                 bool forced) const {
  const auto &position = std::get<Long>(state.position);
  const double trade_return = row.bar.close / position.entry_price - 1.0;
  state.capital *= 1.0 + trade_return;
  state.capital -= state.capital * m_config.commission_rate;
  state.position = Flat{};
  ++state.trade_count;

  if (state.log) {
    state.log->push_back(TradeRecord{.side = epoch_core::TradeSide::Sell,
                                     .index = row.index,
                                     .timestamp = row.bar.timestamp,
                                     .price = row.bar.close,
                                     .capital_after = state.capital,
                                     .forced = forced});
  }
  return state;
}

SimulationResult BuyAndHold(AlignedSeries const &window,
                            double initial_capital) {
  SimulationResult result{.strategy = strategies::BUY_HOLD,
                          .initial_capital = initial_capital,
                          .final_capital = initial_capital};
  if (window.empty()) {
    return result;
  }

  const double first = window.front().bar.close;
  const double last = window.back().bar.close;
  if (!(first > 0.0)) {
    throw std::runtime_error(
        std::format("Buy and hold: first close of the window is {}", first));
  }
  result.return_pct = (last - first) / first * 100.0;
  result.final_capital = initial_capital * (1.0 + result.return_pct / 100.0);
  return result;
}

} // namespace trade_eval::strategy
