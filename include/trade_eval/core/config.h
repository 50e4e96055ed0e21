#pragma once
//
// Evaluation configuration
//
// One immutable value handed to every component at construction. Defaults
// match the backtesting parameters of the mining pipeline (10k starting
// capital, 0.1% commission per leg, 20/50 SMA cross, 0.7 anomaly threshold,
// 5 tick holding period, last 20% of the series as test window).
//
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

namespace trade_eval {

struct EvaluationConfig {
  double initial_capital{10000.0};
  double commission_rate{0.001}; // fraction of capital per trade leg
  size_t short_window{20};
  size_t long_window{50};
  double probability_threshold{0.7};
  size_t holding_period{5};

  // Test window: last floor(n * test_fraction) rows unless a range is given
  double test_fraction{0.2};
  std::optional<int64_t> test_start{}; // UTC nanoseconds, inclusive
  std::optional<int64_t> test_end{};   // UTC nanoseconds, inclusive

  // Consequent token marking a forward-return rule
  std::string forward_return_label{"forward_return"};

  bool record_trades{false};
  bool parallel_strategies{false};

  /**
   * @brief Throws when any field is outside its admissible range
   */
  void Validate() const;

  void decode(const YAML::Node &node);
};

EvaluationConfig LoadEvaluationConfig(std::string const &path);

} // namespace trade_eval

namespace YAML {
template <> struct convert<trade_eval::EvaluationConfig> {
  static bool decode(const Node &node, trade_eval::EvaluationConfig &t) {
    t.decode(node);
    return true;
  }
};
} // namespace YAML
