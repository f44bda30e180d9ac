/*
 * Copyright (C) 2026 Swift Navigation Inc.
 * Contact: Swift Navigation <dev@swiftnav.com>
 *
 * This source is subject to the license found in the file 'LICENSE' which must
 * be distributed together with this source. All other rights reserved.
 *
 * THIS CODE AND INFORMATION IS PROVIDED "AS IS" WITHOUT WARRANTY OF ANY KIND,
 * EITHER EXPRESSED OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND/OR FITNESS FOR A PARTICULAR PURPOSE.
 */

#ifndef MONACO_SRC_STATS_DIAGNOSTICS_HPP_
#define MONACO_SRC_STATS_DIAGNOSTICS_HPP_

namespace monaco {

inline Eigen::VectorXd weighted_mean(const Eigen::MatrixXd &positions,
                                     const Eigen::VectorXd &weights) {
  MONACO_ASSERT(positions.rows() == weights.size());
  return positions.transpose() * weights / weights.sum();
}

inline Eigen::MatrixXd weighted_covariance(const Eigen::MatrixXd &positions,
                                           const Eigen::VectorXd &weights) {
  const Eigen::VectorXd mean = weighted_mean(positions, weights);
  const Eigen::MatrixXd centered = positions.rowwise() - mean.transpose();
  return centered.transpose() * weights.asDiagonal() * centered /
         weights.sum();
}

/*
 * Total weight carried by the particles within `radius` of `center`.
 */
inline double mass_within(const Space &space, const Eigen::MatrixXd &positions,
                          const Eigen::VectorXd &weights,
                          const Eigen::VectorXd &center, double radius) {
  MONACO_ASSERT(positions.rows() == weights.size());
  double mass = 0.;
  for (Eigen::Index i = 0; i < positions.rows(); ++i) {
    if (space.distance(positions.row(i).transpose(), center) <= radius) {
      mass += weights[i];
    }
  }
  return mass / weights.sum();
}

inline double mass_within(const Space &space, const IterationRecord &record,
                          const Eigen::VectorXd &center, double radius) {
  return mass_within(space, record.positions, record.weights, center, radius);
}

/*
 * Average of the effective sample size across records, typically the
 * same iteration of independent runs.
 */
inline double mean_effective_sample_size(
    const std::vector<IterationRecord> &records) {
  MONACO_ASSERT(!records.empty());
  double total = 0.;
  for (const auto &record : records) {
    total += record.effective_sample_size;
  }
  return total / cast::to_double(records.size());
}

inline double mean_acceptance_rate(const RunHistory &history) {
  MONACO_ASSERT(history.size() > 1);
  double total = 0.;
  // The initial entry didn't propose anything.
  for (std::size_t i = 1; i < history.size(); ++i) {
    total += history[i].acceptance_rate;
  }
  return total / cast::to_double(history.size() - 1);
}

/*
 * Computes the two-sided Kolmogorov-Smirnov test to determine
 * if the samples came from a uniform distribution.
 */
inline double uniform_ks_test(const std::vector<double> &samples) {
  double largest_difference_between_sample_and_expected_cdf = 0.;
  std::vector<double> sorted(samples);
  std::sort(sorted.begin(), sorted.end());
  double n = cast::to_double(sorted.size());
  for (std::size_t i = 0; i < sorted.size(); ++i) {
    const auto di = cast::to_double(i);

    const double difference =
        std::max((di + 1) / n - sorted[i], sorted[i] - di / n);
    if (difference > largest_difference_between_sample_and_expected_cdf) {
      largest_difference_between_sample_and_expected_cdf = difference;
    }
  }
  return largest_difference_between_sample_and_expected_cdf;
}

} // namespace monaco

#endif /* MONACO_SRC_STATS_DIAGNOSTICS_HPP_ */
