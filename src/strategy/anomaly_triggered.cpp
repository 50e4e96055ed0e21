//
// Anomaly triggered signal
//
#include <trade_eval/strategy/catalog.h>
#include <epoch_core/macros.h>

namespace trade_eval::strategy {

AnomalyTriggered::AnomalyTriggered(double probability_threshold,
                                   size_t holding_period)
    : m_threshold(probability_threshold), m_holding_period(holding_period) {
  AssertFromFormat(probability_threshold >= 0.0 && probability_threshold <= 1.0,
                   "AnomalyTriggered threshold must be in [0, 1], got {}",
                   probability_threshold);
  AssertFromFormat(holding_period >= 1,
                   "AnomalyTriggered holding period must be >= 1, got {}",
                   holding_period);
}

std::string AnomalyTriggered::Name() const { return strategies::ANOMALY; }

epoch_core::TradeSignal AnomalyTriggered::Next(AlignedRow const &row,
                                               Position const &position) {
  if (row.anomaly) {
    AssertFromFormat(row.anomaly->probability >= 0.0 &&
                         row.anomaly->probability <= 1.0,
                     "Anomaly probability at row {} must be in [0, 1], got {}",
                     row.index, row.anomaly->probability);
  }

  if (const auto *open = std::get_if<Long>(&position)) {
    if (row.index - open->entry_index >= m_holding_period) {
      return epoch_core::TradeSignal::Exit;
    }
    return epoch_core::TradeSignal::Hold;
  }

  if (row.anomaly && row.anomaly->probability > m_threshold) {
    return epoch_core::TradeSignal::Enter;
  }
  return epoch_core::TradeSignal::Hold;
}

} // namespace trade_eval::strategy
