#pragma once
//
// Evaluation report
//
// Category -> metric name -> plain value. Only the ReportAggregator builds
// one; afterwards it is read-only.
//
#include <trade_eval/core/constants.h>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace trade_eval {

// A metric that was attempted but could not be derived
struct NotComputed {
  bool operator==(NotComputed const &) const = default;
};

using ReportValue = std::variant<NotComputed, int64_t, double>;

using MetricMap = std::map<std::string, ReportValue>;

// A category whose computation failed as a whole
struct CategoryError {
  std::string reason;
};

using CategoryReport = std::variant<MetricMap, CategoryError>;

class EvaluationReport {
public:
  using Categories = std::map<epoch_core::ReportCategory, CategoryReport>;

  EvaluationReport() = default;
  explicit EvaluationReport(Categories categories)
      : m_categories(std::move(categories)) {}

  [[nodiscard]] bool Contains(epoch_core::ReportCategory category) const {
    return m_categories.contains(category);
  }

  /**
   * @return nullptr when the category was omitted
   */
  [[nodiscard]] const CategoryReport *
  Get(epoch_core::ReportCategory category) const {
    const auto it = m_categories.find(category);
    return it == m_categories.end() ? nullptr : &it->second;
  }

  /**
   * @return The metric map of a computed category, nullptr when the category
   * is omitted or failed
   */
  [[nodiscard]] const MetricMap *
  Metrics(epoch_core::ReportCategory category) const {
    const auto *entry = Get(category);
    return entry ? std::get_if<MetricMap>(entry) : nullptr;
  }

  /**
   * @return The value of one metric, nullopt when absent
   */
  [[nodiscard]] std::optional<ReportValue>
  Value(epoch_core::ReportCategory category, std::string const &metric) const {
    const auto *metrics = Metrics(category);
    if (!metrics) {
      return std::nullopt;
    }
    const auto it = metrics->find(metric);
    if (it == metrics->end()) {
      return std::nullopt;
    }
    return it->second;
  }

  [[nodiscard]] const Categories &categories() const { return m_categories; }
  [[nodiscard]] bool empty() const { return m_categories.empty(); }

private:
  Categories m_categories;
};

} // namespace trade_eval
