//
// Detector classification metrics
//
#include <trade_eval/metrics/metrics_computer.h>
#include <epoch_core/macros.h>
#include <spdlog/spdlog.h>
#include <set>

namespace trade_eval {

double SafeRatio(double numerator, double denominator) {
  if (denominator == 0.0) {
    return 0.0;
  }
  return numerator / denominator;
}

ClassificationMetrics ClassificationFromCounts(ConfusionCounts const &counts) {
  const auto tp = static_cast<double>(counts.tp);
  const auto fp = static_cast<double>(counts.fp);
  const auto fn = static_cast<double>(counts.fn);

  ClassificationMetrics result;
  result.precision = SafeRatio(tp, tp + fp);
  result.recall = SafeRatio(tp, tp + fn);
  result.f1 = SafeRatio(2.0 * result.precision * result.recall,
                        result.precision + result.recall);
  result.num_samples = counts.tn + counts.fp + counts.fn + counts.tp;
  result.num_actual = counts.tp + counts.fn;
  result.num_detected = counts.tp + counts.fp;
  result.pct_actual = SafeRatio(static_cast<double>(result.num_actual),
                                static_cast<double>(result.num_samples)) *
                      100.0;
  result.pct_detected = SafeRatio(static_cast<double>(result.num_detected),
                                  static_cast<double>(result.num_samples)) *
                        100.0;
  return result;
}

MetricsComputer::MetricsComputer(EvaluationConfig config)
    : m_config(std::move(config)) {
  m_config.Validate();
}

std::optional<ClassificationMetrics>
MetricsComputer::ComputeClassification(AnomalySeries const &anomalies) const {
  ConfusionCounts counts;
  std::set<int> observed_labels;

  for (const auto &score : anomalies) {
    if (!score.ground_truth_label) {
      continue;
    }
    const int actual = *score.ground_truth_label;
    const int predicted = score.predicted_label;
    observed_labels.insert(actual);
    observed_labels.insert(predicted);

    const bool is_actual = actual > 0;
    const bool is_detected = predicted > 0;
    if (is_actual && is_detected) {
      ++counts.tp;
    } else if (is_actual) {
      ++counts.fn;
    } else if (is_detected) {
      ++counts.fp;
    } else {
      ++counts.tn;
    }
  }

  const size_t labelled = counts.tn + counts.fp + counts.fn + counts.tp;
  if (labelled == 0) {
    SPDLOG_DEBUG("No ground-truth labels among {} anomaly rows",
                 anomalies.size());
    return std::nullopt;
  }

  auto result = ClassificationFromCounts(counts);
  if (observed_labels == std::set<int>{0, 1}) {
    result.confusion = counts;
  }

  SPDLOG_INFO("Anomaly detector: precision={:.4f} recall={:.4f} f1={:.4f} "
              "over {} labelled rows",
              result.precision, result.recall, result.f1, labelled);
  return result;
}

} // namespace trade_eval
