#pragma once
//
// Model outputs consumed by the evaluator
//
// Clustering, anomaly detection and rule mining run elsewhere; these are the
// shapes of what they hand over. Every input to an evaluation is wrapped in a
// ModelResult so that a missing model and a failed model are distinct states.
//
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace trade_eval {

struct ClusterAssignment {
  int64_t timestamp{};
  int64_t cluster_id{-1}; // -1 means unassigned
  std::vector<double> features{}; // parallel to ClusterSeries::feature_names; NaN when missing
};

struct ClusterSeries {
  std::vector<std::string> feature_names{};
  std::vector<ClusterAssignment> rows{};
};

struct AnomalyScore {
  int64_t timestamp{};
  double probability{};
  int predicted_label{};
  std::optional<int> ground_truth_label{};
};

using AnomalySeries = std::vector<AnomalyScore>;

struct AssociationRule {
  std::set<std::string> antecedent{};
  std::set<std::string> consequent{};
  double support{};
  double confidence{};
  double lift{};
  double leverage{};
  double conviction{};
};

using RuleTable = std::vector<AssociationRule>;

// The producer was not run or produced nothing for this evaluation
struct Omitted {};

// The producer ran and failed
struct ModelError {
  std::string reason;
};

template <typename T> using ModelResult = std::variant<Omitted, T, ModelError>;

template <typename T> bool IsPresent(ModelResult<T> const &result) {
  return std::holds_alternative<T>(result);
}

template <typename T> const T *GetIfPresent(ModelResult<T> const &result) {
  return std::get_if<T>(&result);
}

} // namespace trade_eval
