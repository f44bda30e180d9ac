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

#ifndef MONACO_SRC_UTILS_WEIGHT_UTILS_HPP_
#define MONACO_SRC_UTILS_WEIGHT_UTILS_HPP_

/*
 * Importance weights are carried around in log space, a population's
 * log weights are "normalized" when their log-sum-exp is zero which is
 * the same as the probability weights summing to one.
 */

namespace monaco {

inline double log_sum_exp(const Eigen::VectorXd &xs) {
  if (xs.size() == 0) {
    return -HUGE_VAL;
  }
  const double max = xs.maxCoeff();
  if (!std::isfinite(max)) {
    return max;
  }
  return max + std::log((xs.array() - max).exp().sum());
}

inline double log_sum_exp(double a, double b) {
  if (a == -HUGE_VAL) {
    return b;
  }
  if (b == -HUGE_VAL) {
    return a;
  }
  const double max = std::max(a, b);
  return max + std::log(std::exp(a - max) + std::exp(b - max));
}

/*
 * Anything which isn't a usable log weight (NaN or +inf) is replaced
 * by a zero weight.  Returns the number of entries which were replaced.
 */
inline std::size_t sanitize_log_weights(Eigen::VectorXd *log_weights) {
  std::size_t clamped = 0;
  for (Eigen::Index i = 0; i < log_weights->size(); ++i) {
    const double lw = (*log_weights)[i];
    if (std::isnan(lw) || lw == HUGE_VAL) {
      (*log_weights)[i] = -HUGE_VAL;
      ++clamped;
    }
  }
  return clamped;
}

/*
 * Shifts the log weights so that they sum to one in probability
 * space.  A population in which every weight vanished carries no
 * information so it falls back to uniform weights, which is counted
 * as one more clamped value.
 */
inline Eigen::VectorXd normalize_log_weights(const Eigen::VectorXd &log_weights,
                                             std::size_t *clamped = nullptr) {
  Eigen::VectorXd output(log_weights);
  std::size_t n_clamped = sanitize_log_weights(&output);

  const double normalizer = log_sum_exp(output);
  if (!std::isfinite(normalizer)) {
    const double n = cast::to_double(output.size());
    output.setConstant(-std::log(n));
    ++n_clamped;
  } else {
    output.array() -= normalizer;
  }

  if (clamped != nullptr) {
    *clamped += n_clamped;
  }
  return output;
}

inline Eigen::VectorXd uniform_log_weights(Eigen::Index n) {
  return Eigen::VectorXd::Constant(n, -std::log(cast::to_double(n)));
}

inline Eigen::VectorXd to_probabilities(const Eigen::VectorXd &log_weights) {
  return log_weights.array().exp();
}

/*
 * The effective sample size 1 / sum(w^2) of normalized weights.
 */
inline double effective_sample_size(const Eigen::VectorXd &weights) {
  const double sum_of_squares = weights.squaredNorm();
  if (sum_of_squares <= 0.) {
    return 0.;
  }
  return 1. / sum_of_squares;
}

/*
 * Same as above but for log weights which need not be normalized:
 *
 *   ESS = (sum w)^2 / sum(w^2)
 */
inline double effective_sample_size_from_log(const Eigen::VectorXd &log_weights) {
  const double log_total = log_sum_exp(log_weights);
  if (!std::isfinite(log_total)) {
    return 0.;
  }
  const Eigen::VectorXd doubled = 2. * log_weights;
  return std::exp(2. * log_total - log_sum_exp(doubled));
}

} // namespace monaco

#endif /* MONACO_SRC_UTILS_WEIGHT_UTILS_HPP_ */
