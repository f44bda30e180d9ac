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

#ifndef MONACO_SRC_CORE_ANNEALING_HPP_
#define MONACO_SRC_CORE_ANNEALING_HPP_

namespace monaco {

/*
 * Maps an iteration index to the inverse temperature beta(t) which
 * multiplies the potential at that iteration.  A schedule of length A
 * stores beta(0), ..., beta(A - 1), all strictly less than one, and
 * beta(t) = 1 for every t >= A.  An empty schedule means no annealing.
 */
class AnnealingSchedule {
public:
  AnnealingSchedule() : betas_(){};

  /*
   * Linear schedule, beta(t) = (t + 1) / (A + 1) for t < A.
   */
  explicit AnnealingSchedule(std::size_t length) : betas_(length) {
    const double denominator = cast::to_double(length) + 1.;
    for (std::size_t t = 0; t < length; ++t) {
      betas_[t] = (cast::to_double(t) + 1.) / denominator;
    }
  }

  /*
   * Geometric schedule starting at `initial_beta` and multiplying by a
   * constant factor so that beta(A) would be exactly one.
   */
  static AnnealingSchedule geometric(std::size_t length, double initial_beta) {
    MONACO_CONFIG_CHECK(initial_beta > 0. && initial_beta < 1.,
                        "AnnealingSchedule: initial beta must be in (0, 1).");
    std::vector<double> betas(length);
    const double n = cast::to_double(length);
    for (std::size_t t = 0; t < length; ++t) {
      betas[t] = std::pow(initial_beta, 1. - cast::to_double(t) / n);
    }
    return from_betas(betas);
  }

  /*
   * An explicit list of inverse temperatures, validated to be finite,
   * within (0, 1] and non-decreasing.
   */
  static AnnealingSchedule from_betas(const std::vector<double> &betas) {
    double previous = 0.;
    for (const auto &beta : betas) {
      MONACO_CONFIG_CHECK(std::isfinite(beta) && beta > 0. && beta <= 1.,
                          "AnnealingSchedule: betas must be within (0, 1].");
      MONACO_CONFIG_CHECK(beta >= previous,
                          "AnnealingSchedule: betas must be non-decreasing.");
      previous = beta;
    }
    AnnealingSchedule output;
    output.betas_ = betas;
    return output;
  }

  double beta(std::size_t iteration) const {
    if (iteration >= betas_.size()) {
      return 1.;
    }
    return betas_[iteration];
  }

  std::size_t length() const { return betas_.size(); }

  const std::vector<double> &betas() const { return betas_; }

  bool is_annealed(std::size_t iteration) const {
    return iteration < betas_.size();
  }

  bool operator==(const AnnealingSchedule &other) const {
    return betas_ == other.betas_;
  }

private:
  std::vector<double> betas_;
};

} // namespace monaco

#endif /* MONACO_SRC_CORE_ANNEALING_HPP_ */
