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

#ifndef MONACO_SRC_UTILS_RANDOM_UTILS_HPP_
#define MONACO_SRC_UTILS_RANDOM_UTILS_HPP_

namespace monaco {

template <typename _Scalar, int _Rows, int _Cols, typename DistributionType,
          typename RandomNumberGenerator>
void random_fill(Eigen::Matrix<_Scalar, _Rows, _Cols> &matrix,
                 DistributionType &dist, RandomNumberGenerator &rng) {

  auto random_sample = [&]() { return dist(rng); };

  matrix = Eigen::Matrix<_Scalar, _Rows, _Cols>::NullaryExpr(
      matrix.rows(), matrix.cols(), random_sample);
}

template <typename _Scalar, int _Rows, int _Cols,
          typename RandomNumberGenerator>
void gaussian_fill(Eigen::Matrix<_Scalar, _Rows, _Cols> &matrix, double mean,
                   double sd, RandomNumberGenerator &rng) {
  std::normal_distribution<_Scalar> dist(mean, sd);
  random_fill(matrix, dist, rng);
}

/*
 * Draws a single index with probability proportional to `weights`,
 * which must be non-negative with a positive sum.
 */
inline std::size_t random_index(const Eigen::VectorXd &weights,
                                std::default_random_engine &gen) {
  MONACO_ASSERT(weights.size() > 0);
  std::discrete_distribution<std::size_t> dist(weights.data(),
                                               weights.data() + weights.size());
  return dist(gen);
}

enum class ResamplingScheme { systematic, multinomial };

/*
 * Systematic resampling: a single uniform offset shared by n evenly
 * spaced points on the cumulative weights.  Has lower variance than
 * multinomial resampling and keeps the number of copies of particle i
 * within one of n * w_i.  Particles with zero weight are never picked.
 */
inline std::vector<std::size_t>
systematic_resample(const Eigen::VectorXd &weights, std::size_t n,
                    std::default_random_engine &gen) {
  MONACO_ASSERT(weights.size() > 0);
  const double total = weights.sum();
  MONACO_ASSERT(total > 0.);

  const double step = 1. / cast::to_double(n);
  std::uniform_real_distribution<double> offset(0., step);
  double position = offset(gen);

  std::vector<std::size_t> output;
  output.reserve(n);

  // Rounding in the cumulative sum must never land on a trailing
  // particle without weight.
  Eigen::Index last = weights.size() - 1;
  while (last > 0 && !(weights[last] > 0.)) {
    --last;
  }
  Eigen::Index i = 0;
  double cumulative = weights[0] / total;
  for (std::size_t j = 0; j < n; ++j) {
    while (cumulative <= position && i < last) {
      ++i;
      cumulative += weights[i] / total;
    }
    output.push_back(cast::to_size(i));
    position += step;
  }
  return output;
}

inline std::vector<std::size_t>
multinomial_resample(const Eigen::VectorXd &weights, std::size_t n,
                     std::default_random_engine &gen) {
  MONACO_ASSERT(weights.size() > 0);
  std::discrete_distribution<std::size_t> dist(weights.data(),
                                               weights.data() + weights.size());
  std::vector<std::size_t> output(n);
  for (auto &index : output) {
    index = dist(gen);
  }
  return output;
}

inline std::vector<std::size_t> resample(const Eigen::VectorXd &weights,
                                         std::size_t n,
                                         const ResamplingScheme &scheme,
                                         std::default_random_engine &gen) {
  if (scheme == ResamplingScheme::multinomial) {
    return multinomial_resample(weights, n, gen);
  }
  return systematic_resample(weights, n, gen);
}

/*
 * Picks out the rows of `matrix` (or entries of a vector) in the order
 * given by `indices`, repeats are allowed.
 */
template <typename _Scalar, int _Rows, int _Cols>
inline Eigen::Matrix<_Scalar, _Rows, _Cols>
subset_rows(const Eigen::Matrix<_Scalar, _Rows, _Cols> &matrix,
            const std::vector<std::size_t> &indices) {
  Eigen::Matrix<_Scalar, _Rows, _Cols> output(cast::to_index(indices.size()),
                                              matrix.cols());
  for (std::size_t i = 0; i < indices.size(); ++i) {
    output.row(cast::to_index(i)) = matrix.row(cast::to_index(indices[i]));
  }
  return output;
}

template <typename X>
inline std::vector<X> subset(const std::vector<X> &xs,
                             const std::vector<std::size_t> &indices) {
  std::vector<X> output;
  output.reserve(indices.size());
  for (const auto &i : indices) {
    output.push_back(xs[i]);
  }
  return output;
}

} // namespace monaco

#endif /* MONACO_SRC_UTILS_RANDOM_UTILS_HPP_ */
