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

#ifndef MONACO_SRC_CORE_POPULATION_HPP_
#define MONACO_SRC_CORE_POPULATION_HPP_

namespace monaco {

/*
 * The particles a sampler evolves in place.  Each row of `positions`
 * is a state, `potentials` caches the (untempered) potential of each
 * of them and `log_weights` holds normalized importance weights (which
 * stay uniform for samplers that don't weight particles).
 * `scale_indices` remembers which proposal scale last moved each
 * particle.
 */
struct PopulationState {
  Eigen::MatrixXd positions;
  Eigen::VectorXd potentials;
  Eigen::VectorXd log_weights;
  std::vector<std::size_t> scale_indices;
  std::size_t iteration;

  PopulationState()
      : positions(), potentials(), log_weights(), scale_indices(),
        iteration(0){};

  explicit PopulationState(const Eigen::MatrixXd &positions_)
      : positions(positions_),
        potentials(Eigen::VectorXd::Zero(positions_.rows())),
        log_weights(uniform_log_weights(positions_.rows())),
        scale_indices(cast::to_size(positions_.rows()), 0), iteration(0){};

  std::size_t size() const { return cast::to_size(positions.rows()); }

  Eigen::Index dimension() const { return positions.cols(); }

  Eigen::VectorXd weights() const { return to_probabilities(log_weights); }

  Eigen::VectorXd position(std::size_t i) const {
    return positions.row(cast::to_index(i)).transpose();
  }

  /*
   * Replaces the population by copies of the particles in `indices`,
   * every copy carries the same weight afterwards.
   */
  void keep(const std::vector<std::size_t> &indices) {
    positions = subset_rows(positions, indices);
    potentials = subset_rows(potentials, indices);
    scale_indices = subset(scale_indices, indices);
    log_weights = uniform_log_weights(positions.rows());
  }

  bool operator==(const PopulationState &other) const {
    return same_matrix(positions, other.positions) &&
           same_matrix(potentials, other.potentials) &&
           same_matrix(log_weights, other.log_weights) &&
           scale_indices == other.scale_indices && iteration == other.iteration;
  }
};

} // namespace monaco

#endif /* MONACO_SRC_CORE_POPULATION_HPP_ */
