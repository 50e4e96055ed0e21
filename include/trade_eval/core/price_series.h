#pragma once
//
// Price series
//
// Ordered OHLCV bars keyed by UTC nanosecond timestamps. Construction enforces
// strictly increasing, unique timestamps; once built the series is read-only.
//
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace trade_eval {

struct PriceBar {
  int64_t timestamp{}; // UTC nanoseconds since epoch
  double open{};
  double high{};
  double low{};
  double close{};
  std::optional<double> volume{};
};

class PriceSeries {
public:
  PriceSeries() = default;

  /**
   * @brief Builds a series from bars already in chronological order
   *
   * @throws std::invalid_argument if timestamps are not strictly increasing
   *         or a close is not a finite positive price
   */
  explicit PriceSeries(std::vector<PriceBar> bars);

  [[nodiscard]] size_t size() const { return m_bars.size(); }
  [[nodiscard]] bool empty() const { return m_bars.empty(); }

  [[nodiscard]] const PriceBar &operator[](size_t i) const { return m_bars[i]; }
  [[nodiscard]] const PriceBar &front() const { return m_bars.front(); }
  [[nodiscard]] const PriceBar &back() const { return m_bars.back(); }

  [[nodiscard]] auto begin() const { return m_bars.begin(); }
  [[nodiscard]] auto end() const { return m_bars.end(); }

  [[nodiscard]] const std::vector<PriceBar> &bars() const { return m_bars; }

  [[nodiscard]] std::vector<int64_t> Timestamps() const;
  [[nodiscard]] std::vector<double> Closes() const;

  /**
   * @brief Rows in [start, end) by position; end is clamped to size()
   */
  [[nodiscard]] PriceSeries Slice(size_t start, size_t end) const;

  /**
   * @brief Rows whose timestamp lies in [start, end] (both inclusive)
   */
  [[nodiscard]] PriceSeries Between(int64_t start, int64_t end) const;

  /**
   * @brief Last floor(size() * fraction) rows; the whole series when that
   * count is zero
   */
  [[nodiscard]] PriceSeries Tail(double fraction) const;

private:
  std::vector<PriceBar> m_bars;
};

} // namespace trade_eval
