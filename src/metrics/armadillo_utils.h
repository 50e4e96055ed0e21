#pragma once
//
// Typed rows to Armadillo conversion
//
#include <trade_eval/core/model_output.h>
#include <epoch_frame/scalar.h>
#include <armadillo>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace trade_eval::utils {

/**
 * @brief Feature matrix in mlpack layout (features as rows, observations as
 * columns) for the selected cluster rows
 *
 * @param rows All cluster rows
 * @param selected Positions in @p rows to copy, in output column order
 * @param n_features Number of features every row carries
 */
inline arma::mat MatFromClusterRows(std::vector<ClusterAssignment> const &rows,
                                    std::vector<size_t> const &selected,
                                    size_t n_features) {
  arma::mat X(n_features, selected.size());
  for (size_t j = 0; j < selected.size(); ++j) {
    const auto &features = rows[selected[j]].features;
    if (features.size() != n_features) {
      throw std::runtime_error("Cluster row feature count does not match "
                               "feature_names");
    }
    for (size_t f = 0; f < n_features; ++f) {
      X(f, j) = features[f];
    }
  }
  return X;
}

/**
 * @brief Mean of the finite values, null Scalar when there are none
 */
inline epoch_frame::Scalar MeanOrNull(std::vector<double> const &values) {
  arma::vec v(values.size());
  size_t n = 0;
  for (const auto x : values) {
    if (std::isfinite(x)) {
      v(n++) = x;
    }
  }
  if (n == 0) {
    return epoch_frame::Scalar{};
  }
  return epoch_frame::Scalar{arma::mean(v.head(n))};
}

} // namespace trade_eval::utils
