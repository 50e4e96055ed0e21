//
// Moving average crossover signal
//
#include <trade_eval/strategy/catalog.h>
#include <epoch_core/macros.h>
#include <cmath>

namespace trade_eval::strategy {

std::optional<double>
MovingAverageCrossover::RollingMean::Push(double value) {
  m_values.push_back(value);
  m_sum += value;
  if (m_values.size() > m_window) {
    m_sum -= m_values.front();
    m_values.pop_front();
  }
  if (m_values.size() < m_window) {
    return std::nullopt;
  }
  return m_sum / static_cast<double>(m_window);
}

void MovingAverageCrossover::RollingMean::Clear() {
  m_values.clear();
  m_sum = 0;
}

MovingAverageCrossover::MovingAverageCrossover(size_t short_window,
                                               size_t long_window)
    : m_short(short_window), m_long(long_window) {
  AssertFromFormat(short_window >= 1 && long_window >= 1,
                   "MovingAverageCrossover windows must be >= 1, got {} and {}",
                   short_window, long_window);
}

std::string MovingAverageCrossover::Name() const {
  return strategies::MA_CROSSOVER;
}

epoch_core::TradeSignal
MovingAverageCrossover::Next(AlignedRow const &row, Position const &position) {
  const auto fast = m_short.Push(row.bar.close);
  const auto slow = m_long.Push(row.bar.close);

  // NaN comparisons are false, so a NaN close also reads as "not above"
  const bool is_above = fast && slow && (*fast - *slow) > 0;

  const auto was_above = m_was_above;
  m_was_above = is_above;
  if (!was_above) {
    return epoch_core::TradeSignal::Hold;
  }

  if (!*was_above && is_above && IsFlat(position)) {
    return epoch_core::TradeSignal::Enter;
  }
  if (*was_above && !is_above && !IsFlat(position)) {
    return epoch_core::TradeSignal::Exit;
  }
  return epoch_core::TradeSignal::Hold;
}

void MovingAverageCrossover::Reset() {
  m_short.Clear();
  m_long.Clear();
  m_was_above.reset();
}

} // namespace trade_eval::strategy
