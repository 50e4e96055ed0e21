#include <trade_eval/core/price_series.h>
#include <algorithm>
#include <cmath>
#include <format>
#include <iterator>
#include <stdexcept>

namespace trade_eval {

PriceSeries::PriceSeries(std::vector<PriceBar> bars) : m_bars(std::move(bars)) {
  for (size_t i = 0; i < m_bars.size(); ++i) {
    const double close = m_bars[i].close;
    if (!std::isfinite(close) || close <= 0.0) {
      throw std::invalid_argument(std::format(
          "PriceSeries closes must be finite and > 0: row {} ({}) has close {}",
          i, m_bars[i].timestamp, close));
    }
    if (i > 0 && m_bars[i].timestamp <= m_bars[i - 1].timestamp) {
      throw std::invalid_argument(std::format(
          "PriceSeries timestamps must be strictly increasing: row {} ({}) "
          "follows row {} ({})",
          i, m_bars[i].timestamp, i - 1, m_bars[i - 1].timestamp));
    }
  }
}

std::vector<int64_t> PriceSeries::Timestamps() const {
  std::vector<int64_t> result;
  result.reserve(m_bars.size());
  std::ranges::transform(m_bars, std::back_inserter(result),
                         [](PriceBar const &bar) { return bar.timestamp; });
  return result;
}

std::vector<double> PriceSeries::Closes() const {
  std::vector<double> result;
  result.reserve(m_bars.size());
  std::ranges::transform(m_bars, std::back_inserter(result),
                         [](PriceBar const &bar) { return bar.close; });
  return result;
}

PriceSeries PriceSeries::Slice(size_t start, size_t end) const {
  end = std::min(end, m_bars.size());
  if (start >= end) {
    return PriceSeries{};
  }
  PriceSeries result;
  result.m_bars.assign(m_bars.begin() + static_cast<std::ptrdiff_t>(start),
                       m_bars.begin() + static_cast<std::ptrdiff_t>(end));
  return result;
}

PriceSeries PriceSeries::Between(int64_t start, int64_t end) const {
  auto first = std::ranges::lower_bound(m_bars, start, {}, &PriceBar::timestamp);
  auto last = std::ranges::upper_bound(m_bars, end, {}, &PriceBar::timestamp);
  if (first >= last) {
    return PriceSeries{};
  }
  PriceSeries result;
  result.m_bars.assign(first, last);
  return result;
}

PriceSeries PriceSeries::Tail(double fraction) const {
  const auto n_test =
      static_cast<size_t>(static_cast<double>(m_bars.size()) * fraction);
  if (n_test == 0) {
    return *this;
  }
  return Slice(m_bars.size() - n_test, m_bars.size());
}

} // namespace trade_eval
