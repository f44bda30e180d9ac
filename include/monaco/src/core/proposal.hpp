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

#ifndef MONACO_SRC_CORE_PROPOSAL_HPP_
#define MONACO_SRC_CORE_PROPOSAL_HPP_

namespace monaco {

enum class BoundaryMode { none, reflect };

/*
 * The candidates drawn for a whole population along with the index of
 * the scale each of them was drawn with and the particle whose
 * position the kernel was centered on.
 */
struct ProposedMoves {
  Eigen::MatrixXd candidates;
  std::vector<std::size_t> scale_indices;
  std::vector<std::size_t> origins;

  std::size_t size() const { return scale_indices.size(); }

  std::size_t origin(std::size_t i) const {
    return origins.empty() ? i : origins[i];
  }
};

/*
 * A multi-scale random walk: a candidate for x is drawn uniformly from
 * the ball of radius r_k around x, where the scale k is picked from a
 * mixture over the radii {r_1, ..., r_K}.  The kernel density is
 *
 *   K_w(x, y) = sum_k w_k 1{d(x, y) <= r_k} / V(r_k)
 *
 * which only depends on d(x, y) so it is symmetric as long as the
 * forward and backward moves use the same mixture weights w.
 *
 * The proposal itself (space, radii, prior weights) is read only
 * configuration which can be shared between runs.  The mixture weights
 * actually used at a given iteration are owned by the run and passed
 * in explicitly.
 */
class BallProposal {
public:
  template <typename SpaceType>
  BallProposal(const SpaceType &space, const std::vector<double> &scales,
               BoundaryMode boundary = BoundaryMode::none)
      : BallProposal(space, scales, std::vector<double>(scales.size(), 1.),
                     boundary) {}

  template <typename SpaceType>
  BallProposal(const SpaceType &space, const std::vector<double> &scales,
               const std::vector<double> &prior_weights,
               BoundaryMode boundary = BoundaryMode::none)
      : space_(std::make_shared<SpaceType>(space)), scales_(), prior_weights_(),
        log_volumes_(), boundary_(boundary) {
    static_assert(std::is_base_of<Space, SpaceType>::value,
                  "BallProposal requires a type derived from Space");
    MONACO_CONFIG_CHECK(!scales.empty(),
                        "BallProposal: expected at least one scale.");
    MONACO_CONFIG_CHECK(prior_weights.size() == scales.size(),
                        "BallProposal: expected one prior weight per scale.");

    const auto k = cast::to_index(scales.size());
    scales_.resize(k);
    prior_weights_.resize(k);
    log_volumes_.resize(k);
    for (Eigen::Index i = 0; i < k; ++i) {
      const double r = scales[cast::to_size(i)];
      const double w = prior_weights[cast::to_size(i)];
      MONACO_CONFIG_CHECK(std::isfinite(r) && r > 0.,
                          "BallProposal: scales must be finite and > 0.");
      MONACO_CONFIG_CHECK(std::isfinite(w) && w >= 0.,
                          "BallProposal: prior weights must be finite and >= 0.");
      scales_[i] = r;
      prior_weights_[i] = w;
      log_volumes_[i] = space_->log_ball_volume(r);
    }
    MONACO_CONFIG_CHECK(prior_weights_.sum() > 0.,
                        "BallProposal: prior weights must have a positive sum.");
    prior_weights_ /= prior_weights_.sum();
  }

  std::size_t size() const { return cast::to_size(scales_.size()); }

  const Space &get_space() const { return *space_; }

  const std::shared_ptr<const Space> &get_space_ptr() const { return space_; }

  const Eigen::VectorXd &get_scales() const { return scales_; }

  const Eigen::VectorXd &get_prior_weights() const { return prior_weights_; }

  BoundaryMode get_boundary() const { return boundary_; }

  std::size_t sample_scale(const Eigen::VectorXd &weights,
                           std::default_random_engine &gen) const {
    MONACO_ASSERT(weights.size() == scales_.size());
    if (weights.size() == 1) {
      return 0;
    }
    return random_index(weights, gen);
  }

  Eigen::VectorXd sample(const Eigen::VectorXd &x, std::size_t scale_index,
                         std::default_random_engine &gen) const {
    MONACO_ASSERT(scale_index < size());
    const Eigen::VectorXd y =
        space_->sample_ball(x, scales_[cast::to_index(scale_index)], gen);
    if (boundary_ == BoundaryMode::reflect) {
      return space_->reflect(y);
    }
    return y;
  }

  /*
   * Draws one candidate per row of `xs`, for each particle the scale
   * is drawn first followed by the displacement.
   */
  ProposedMoves sample(const Eigen::MatrixXd &xs, const Eigen::VectorXd &weights,
                       std::default_random_engine &gen) const {
    ProposedMoves moves;
    moves.candidates.resize(xs.rows(), xs.cols());
    moves.scale_indices.resize(cast::to_size(xs.rows()));
    moves.origins.resize(cast::to_size(xs.rows()));
    for (Eigen::Index i = 0; i < xs.rows(); ++i) {
      const std::size_t k = sample_scale(weights, gen);
      moves.scale_indices[cast::to_size(i)] = k;
      moves.origins[cast::to_size(i)] = cast::to_size(i);
      moves.candidates.row(i) = sample(xs.row(i).transpose(), k, gen).transpose();
    }
    return moves;
  }

  /*
   * log K_w evaluated for two states separated by `distance`,
   * -inf when the states are further apart than the largest radius.
   */
  double log_density(double distance, const Eigen::VectorXd &weights) const {
    MONACO_ASSERT(weights.size() == scales_.size());
    double output = -HUGE_VAL;
    for (Eigen::Index k = 0; k < scales_.size(); ++k) {
      if (distance <= scales_[k] && weights[k] > 0.) {
        output = log_sum_exp(output, std::log(weights[k]) - log_volumes_[k]);
      }
    }
    return output;
  }

  double log_density(const Eigen::VectorXd &x, const Eigen::VectorXd &y,
                     const Eigen::VectorXd &weights) const {
    return log_density(space_->distance(x, y), weights);
  }

  /*
   * log [ K_backward(y, x) / K_forward(x, y) ], the correction which
   * keeps a Metropolis-Hastings step in detailed balance when the
   * mixture weights used to propose x -> y differ from the ones which
   * would be used for the reverse move.  Zero whenever both sets of
   * weights agree.
   */
  double log_density_ratio(const Eigen::VectorXd &x, const Eigen::VectorXd &y,
                           const Eigen::VectorXd &forward_weights,
                           const Eigen::VectorXd &backward_weights) const {
    const double d = space_->distance(x, y);
    const double backward = log_density(d, backward_weights);
    if (backward == -HUGE_VAL) {
      return -HUGE_VAL;
    }
    const double forward = log_density(d, forward_weights);
    if (forward == -HUGE_VAL) {
      // The forward move could never have been proposed.
      return -HUGE_VAL;
    }
    return backward - forward;
  }

  /*
   * K(i, j) = K_w(xs.row(i), ys.row(j))
   */
  Eigen::MatrixXd kernel_matrix(const Eigen::MatrixXd &xs,
                                const Eigen::MatrixXd &ys,
                                const Eigen::VectorXd &weights) const {
    MONACO_ASSERT(weights.size() == scales_.size());
    const Eigen::MatrixXd distances = space_->distance_matrix(xs, ys);
    const Eigen::VectorXd heights =
        (weights.array().log() - log_volumes_.array()).exp();

    Eigen::MatrixXd K = Eigen::MatrixXd::Zero(distances.rows(), distances.cols());
    for (Eigen::Index k = 0; k < scales_.size(); ++k) {
      if (weights[k] > 0.) {
        K += heights[k] *
             (distances.array() <= scales_[k]).cast<double>().matrix();
      }
    }
    return K;
  }

  /*
   * Multiplicatively moves the mixture weights towards the scales which
   * performed better than average,
   *
   *   w_k <- w_k * (f_k / sum_j w_j f_j)^rate
   *
   * followed by renormalization and flooring each weight at `floor` so
   * no scale is ever abandoned for good.  Feedback entries which are
   * NaN (no particle used that scale) are treated as average.  Uniform
   * feedback is a fixed point.
   */
  Eigen::VectorXd reweight_scales(const Eigen::VectorXd &weights,
                                  const Eigen::VectorXd &feedback,
                                  double rate = 1., double floor = 0.) const {
    MONACO_ASSERT(weights.size() == scales_.size());
    MONACO_ASSERT(feedback.size() == scales_.size());

    double observed_weight = 0.;
    double observed_total = 0.;
    for (Eigen::Index k = 0; k < feedback.size(); ++k) {
      if (std::isfinite(feedback[k]) && feedback[k] >= 0.) {
        observed_weight += weights[k];
        observed_total += weights[k] * feedback[k];
      }
    }
    if (observed_weight <= 0. || observed_total <= 0. ||
        !std::isfinite(observed_total)) {
      return weights;
    }
    const double average = observed_total / observed_weight;

    Eigen::VectorXd output(weights);
    for (Eigen::Index k = 0; k < feedback.size(); ++k) {
      if (std::isfinite(feedback[k]) && feedback[k] >= 0.) {
        output[k] *= std::pow(feedback[k] / average, rate);
      }
    }
    if (!(output.sum() > 0.) || !output.allFinite()) {
      return weights;
    }
    output /= output.sum();

    if (floor > 0. && (output.array() < floor).any()) {
      output = output.cwiseMax(floor);
      output /= output.sum();
    }
    return output;
  }

private:
  std::shared_ptr<const Space> space_;
  Eigen::VectorXd scales_;
  Eigen::VectorXd prior_weights_;
  Eigen::VectorXd log_volumes_;
  BoundaryMode boundary_;
};

} // namespace monaco

#endif /* MONACO_SRC_CORE_PROPOSAL_HPP_ */
