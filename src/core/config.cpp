#include <trade_eval/core/config.h>
#include <epoch_core/macros.h>
#include <epoch_frame/datetime.h>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace {
// Accepts "YYYY-MM-DD" or "YYYY-MM-DD HH:MM:SS", interpreted as UTC
int64_t ParseUtcNanos(std::string const &str) {
  if (str.size() == 10) {
    return epoch_frame::DateTime::from_str(str, "UTC", "%Y-%m-%d")
        .m_nanoseconds.count();
  }
  return epoch_frame::DateTime::from_str(str, "UTC").m_nanoseconds.count();
}

// Positive count; a malformed or negative value is an error, not the default
size_t DecodeCount(const YAML::Node &element, std::string const &key,
                   size_t fallback) {
  const auto node = element[key];
  if (!node || node.IsNull()) {
    return fallback;
  }
  const auto value = node.as<int64_t>();
  AssertFromFormat(value >= 1, "{} must be >= 1, got {}", key, value);
  return static_cast<size_t>(value);
}

std::optional<int64_t> DecodeOptionalTimestamp(const YAML::Node &node) {
  if (!node || node.IsNull()) {
    return std::nullopt;
  }
  return ParseUtcNanos(node.as<std::string>());
}
} // namespace

namespace trade_eval {

void EvaluationConfig::Validate() const {
  AssertFromFormat(initial_capital > 0.0,
                   "initial_capital must be > 0, got {}", initial_capital);
  AssertFromFormat(commission_rate >= 0.0 && commission_rate < 1.0,
                   "commission_rate must be in [0, 1), got {}",
                   commission_rate);
  AssertFromFormat(short_window >= 1, "short_window must be >= 1");
  AssertFromFormat(long_window >= 1, "long_window must be >= 1");
  AssertFromFormat(probability_threshold >= 0.0 && probability_threshold <= 1.0,
                   "probability_threshold must be in [0, 1], got {}",
                   probability_threshold);
  AssertFromFormat(holding_period >= 1, "holding_period must be >= 1");
  AssertFromFormat(test_fraction > 0.0 && test_fraction <= 1.0,
                   "test_fraction must be in (0, 1], got {}", test_fraction);
  if (test_start && test_end) {
    AssertFromFormat(*test_start <= *test_end,
                     "test_start must not be after test_end");
  }
  AssertFromFormat(!forward_return_label.empty(),
                   "forward_return_label must not be empty");
}

void EvaluationConfig::decode(const YAML::Node &element) {
  initial_capital = element["initial_capital"].as<double>(initial_capital);
  commission_rate = element["commission_rate"].as<double>(commission_rate);
  short_window = DecodeCount(element, "short_window", short_window);
  long_window = DecodeCount(element, "long_window", long_window);
  probability_threshold =
      element["probability_threshold"].as<double>(probability_threshold);
  holding_period = DecodeCount(element, "holding_period", holding_period);
  test_fraction = element["test_fraction"].as<double>(test_fraction);
  test_start = DecodeOptionalTimestamp(element["test_start"]);
  test_end = DecodeOptionalTimestamp(element["test_end"]);
  forward_return_label =
      element["forward_return_label"].as<std::string>(forward_return_label);
  record_trades = element["record_trades"].as<bool>(record_trades);
  parallel_strategies =
      element["parallel_strategies"].as<bool>(parallel_strategies);
}

EvaluationConfig LoadEvaluationConfig(std::string const &path) {
  AssertFromFormat(std::filesystem::exists(path),
                   "Configuration file not found: {}", path);

  auto config = YAML::LoadFile(path).as<EvaluationConfig>();
  config.Validate();

  SPDLOG_DEBUG("Loaded evaluation config from {} (capital={}, commission={}, "
               "sma={}/{}, threshold={}, holding={})",
               path, config.initial_capital, config.commission_rate,
               config.short_window, config.long_window,
               config.probability_threshold, config.holding_period);
  return config;
}

} // namespace trade_eval
