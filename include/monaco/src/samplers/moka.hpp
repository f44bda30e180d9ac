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

#ifndef MONACO_SRC_SAMPLERS_MOKA_HPP_
#define MONACO_SRC_SAMPLERS_MOKA_HPP_

namespace monaco {

struct MokaOptions {
  // Exponent applied to the relative performance of each scale.
  double adaptation_rate = 1.;
  // No scale weight is allowed to drop below this value.
  double scale_weight_floor = 1e-3;
};

/*
 * Adapts the proposal scale weights using the expected squared jumping
 * distance each scale achieved during the previous iteration,
 *
 *   f_k = mean_{i : k_i = k} alpha_i d(x_{o_i}, y_i)^2
 *
 * where o_i is the particle the kernel drawing y_i was centered on.
 * Scales which moved the population further (once accounting for the
 * probability the move was accepted) gain weight.
 */
class MokaScaleAdaptation {
public:
  explicit MokaScaleAdaptation(const MokaOptions &options = MokaOptions())
      : options_(options), feedback_() {
    MONACO_CONFIG_CHECK(std::isfinite(options_.adaptation_rate) &&
                            options_.adaptation_rate >= 0.,
                        "MOKA: the adaptation rate must be finite and >= 0.");
    MONACO_CONFIG_CHECK(options_.scale_weight_floor >= 0. &&
                            options_.scale_weight_floor < 1.,
                        "MOKA: the scale weight floor must be in [0, 1).");
  }

  std::string get_name() const { return "moka"; }

  const MokaOptions &get_options() const { return options_; }

  const Eigen::VectorXd &get_feedback() const { return feedback_; }

  void validate(const BallProposal &proposal) const {
    MONACO_CONFIG_CHECK(options_.scale_weight_floor *
                                cast::to_double(proposal.size()) <
                            1.,
                        "MOKA: the scale weight floor is too large for the "
                        "number of scales.");
  }

  void adapt(IterationContext &context, const PopulationState &) const {
    if (feedback_.size() != context.scale_weights.size()) {
      return;
    }
    context.scale_weights = context.proposal.reweight_scales(
        context.scale_weights, feedback_, options_.adaptation_rate,
        options_.scale_weight_floor);
  }

  /*
   * Must be called before the population moves, `state` still holds
   * the positions the candidates were proposed from.
   */
  void observe(const IterationContext &context, const PopulationState &state,
               const ProposedMoves &moves, const Evaluation &evaluation) {
    const auto k = cast::to_index(context.proposal.size());
    Eigen::VectorXd totals = Eigen::VectorXd::Zero(k);
    Eigen::VectorXd counts = Eigen::VectorXd::Zero(k);
    for (std::size_t i = 0; i < moves.size(); ++i) {
      const auto row = cast::to_index(i);
      const auto scale = cast::to_index(moves.scale_indices[i]);
      const double d =
          context.space.distance(state.position(moves.origin(i)),
                                 moves.candidates.row(row).transpose());
      const double alpha = std::exp(evaluation.log_acceptance[row]);
      totals[scale] += std::isfinite(d) ? alpha * d * d : 0.;
      counts[scale] += 1.;
    }

    feedback_.resize(k);
    for (Eigen::Index j = 0; j < k; ++j) {
      feedback_[j] = counts[j] > 0. ? totals[j] / counts[j]
                                    : std::numeric_limits<double>::quiet_NaN();
    }
  }

private:
  MokaOptions options_;
  Eigen::VectorXd feedback_;
};

struct NoScaleAdaptation {
  std::string get_name() const { return ""; }

  void validate(const BallProposal &) const {}

  void adapt(IterationContext &, const PopulationState &) const {}

  void observe(const IterationContext &, const PopulationState &,
               const ProposedMoves &, const Evaluation &) {}
};

} // namespace monaco

#endif /* MONACO_SRC_SAMPLERS_MOKA_HPP_ */
