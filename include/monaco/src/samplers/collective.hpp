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

#ifndef MONACO_SRC_SAMPLERS_COLLECTIVE_HPP_
#define MONACO_SRC_SAMPLERS_COLLECTIVE_HPP_

namespace monaco {

struct CollectiveOptions {
  ResamplingScheme scheme = ResamplingScheme::systematic;
  // Resample every `resample_interval` iterations, zero disables it.
  std::size_t resample_interval = 1;
};

/*
 * Collective Monte Carlo: the candidate for every particle is drawn
 * from the kernel mixture centered on the whole population,
 *
 *   Q(y) = sum_j nu_j K_w(x_j, y),
 *
 * a component j first and then a scale around x_j.  With the other
 * particles held fixed, moving x_i to y_i is a Metropolis-Hastings
 * step with
 *
 *   alpha_i = min(1, pi(y_i) Q_i'(x_i) / (pi(x_i) Q_i(y_i)))
 *
 * where Q_i' is the mixture once particle i sits at y_i.  The
 * acceptance probabilities then act as importance weights across the
 * population: particle i is represented by x_i with weight 1 - alpha_i
 * and y_i with weight alpha_i, and N particles are resampled from
 * those 2N entries.  Each resampled particle is the outcome of an
 * accept / reject step of one of the particles so the tempered target
 * is left invariant.  When no resampling is scheduled (or there is a
 * single particle) every particle takes its own accept / reject step
 * instead, so with one particle the sampler reduces to PMH draw for
 * draw.
 *
 * The scale adaptation (MOKA) and the deconvolution of the mixture
 * weights nu (KIDS) are policies so the four variants share one
 * implementation.  Without deconvolution nu is uniform.
 */
template <typename ScaleAdaptation = NoScaleAdaptation,
          typename Deconvolution = NoDeconvolution>
class CollectiveRule : public SamplingRule {
public:
  explicit CollectiveRule(const CollectiveOptions &options = CollectiveOptions(),
                          const ScaleAdaptation &adaptation = ScaleAdaptation(),
                          const Deconvolution &deconvolution = Deconvolution())
      : options_(options), adaptation_(adaptation),
        deconvolution_(deconvolution), mixture_weights_(), clamped_(0){};

  std::string get_name() const {
    std::string name;
    for (const auto &part :
         {adaptation_.get_name(), deconvolution_.get_name()}) {
      if (!part.empty()) {
        name += part + "_";
      }
    }
    return name + "cmc";
  }

  const CollectiveOptions &get_options() const { return options_; }

  const ScaleAdaptation &get_adaptation() const { return adaptation_; }

  const Deconvolution &get_deconvolution() const { return deconvolution_; }

  /*
   * The weights nu of the mixture the latest candidates were drawn
   * from.
   */
  const Eigen::VectorXd &get_mixture_weights() const {
    return mixture_weights_;
  }

  void validate(const BallProposal &proposal) const {
    adaptation_.validate(proposal);
  }

  void adapt(IterationContext &context, const PopulationState &state) {
    adaptation_.adapt(context, state);
  }

  ProposedMoves propose(IterationContext &context, const PopulationState &state,
                        std::default_random_engine &gen) {
    clamped_ = 0;
    mixture_weights_ =
        deconvolution_.mixture_weights(context, state, &clamped_);
    MONACO_ASSERT(mixture_weights_.size() == state.positions.rows());

    const std::size_t n = state.size();
    std::discrete_distribution<std::size_t> component(
        mixture_weights_.data(),
        mixture_weights_.data() + mixture_weights_.size());

    ProposedMoves moves;
    moves.candidates.resize(state.positions.rows(), state.positions.cols());
    moves.scale_indices.resize(n);
    moves.origins.resize(n);
    for (std::size_t i = 0; i < n; ++i) {
      const std::size_t j = n > 1 ? component(gen) : 0;
      const std::size_t k =
          context.proposal.sample_scale(context.scale_weights, gen);
      moves.origins[i] = j;
      moves.scale_indices[i] = k;
      moves.candidates.row(cast::to_index(i)) =
          context.proposal.sample(state.position(j), k, gen).transpose();
    }
    return moves;
  }

  /*
   * log [ Q_i'(x_i) / Q_i(y_i) ], the two mixtures only differ in the
   * component belonging to particle i itself.
   */
  Eigen::VectorXd log_proposal_ratio(const IterationContext &context,
                                     const PopulationState &state,
                                     const ProposedMoves &moves) const {
    MONACO_ASSERT(mixture_weights_.size() == state.positions.rows());
    // between(j, i) = K(x_j, x_i) and towards(j, i) = K(x_j, y_i)
    const Eigen::MatrixXd between = context.proposal.kernel_matrix(
        state.positions, state.positions, context.scale_weights);
    const Eigen::MatrixXd towards = context.proposal.kernel_matrix(
        state.positions, moves.candidates, context.scale_weights);

    const Eigen::Index n = state.positions.rows();
    Eigen::VectorXd output(n);
    for (Eigen::Index i = 0; i < n; ++i) {
      double forward = 0.;
      double backward = 0.;
      for (Eigen::Index j = 0; j < n; ++j) {
        forward += mixture_weights_[j] * towards(j, i);
        const double reverse = j == i ? towards(i, i) : between(j, i);
        backward += mixture_weights_[j] * reverse;
      }
      if (!(forward > 0.) || !(backward > 0.)) {
        output[i] = -HUGE_VAL;
      } else {
        output[i] = std::log(backward) - std::log(forward);
      }
    }
    return output;
  }

  UpdateSummary update(IterationContext &context, PopulationState *state,
                       const ProposedMoves &moves, const Evaluation &evaluation,
                       std::default_random_engine &gen) {
    UpdateSummary summary;
    summary.clamped = clamped_;
    adaptation_.observe(context, *state, moves, evaluation);
    summary.importance_ess =
        effective_sample_size_from_log(evaluation.log_acceptance);

    std::size_t accepted = 0;
    if (should_resample(context.iteration) && state->size() > 1) {
      accepted = resample_moves(state, moves, evaluation, gen);
      summary.resampled = true;
    } else {
      accepted = metropolis_step(state, moves, evaluation, gen);
    }
    summary.acceptance_rate =
        cast::to_double(accepted) / cast::to_double(state->size());
    summary.effective_sample_size = effective_sample_size(state->weights());
    return summary;
  }

private:
  bool should_resample(std::size_t iteration) const {
    return options_.resample_interval > 0 &&
           (iteration + 1) % options_.resample_interval == 0;
  }

  /*
   * Entry 2i keeps particle i where it is and entry 2i + 1 moves it to
   * its candidate.  Returns the number of candidates resampled.
   */
  std::size_t resample_moves(PopulationState *state, const ProposedMoves &moves,
                             const Evaluation &evaluation,
                             std::default_random_engine &gen) const {
    const std::size_t n = state->size();
    Eigen::VectorXd weights(2 * state->positions.rows());
    for (std::size_t i = 0; i < n; ++i) {
      const auto row = cast::to_index(i);
      const double alpha = std::exp(evaluation.log_acceptance[row]);
      weights[2 * row] = 1. - alpha;
      weights[2 * row + 1] = alpha;
    }

    PopulationState next(*state);
    std::size_t accepted = 0;
    const std::vector<std::size_t> picks =
        resample(weights, n, options_.scheme, gen);
    for (std::size_t i = 0; i < n; ++i) {
      const std::size_t source = picks[i] / 2;
      const auto row = cast::to_index(i);
      const auto source_row = cast::to_index(source);
      if (picks[i] % 2 == 1) {
        next.positions.row(row) = moves.candidates.row(source_row);
        next.potentials[row] = evaluation.candidate_potentials[source_row];
        ++accepted;
      } else {
        next.positions.row(row) = state->positions.row(source_row);
        next.potentials[row] = state->potentials[source_row];
      }
      next.scale_indices[i] = moves.scale_indices[source];
    }
    next.log_weights = uniform_log_weights(state->positions.rows());
    *state = next;
    return accepted;
  }

  CollectiveOptions options_;
  ScaleAdaptation adaptation_;
  Deconvolution deconvolution_;
  Eigen::VectorXd mixture_weights_;
  std::size_t clamped_;
};

using CmcRule = CollectiveRule<NoScaleAdaptation, NoDeconvolution>;
using MokaCmcRule = CollectiveRule<MokaScaleAdaptation, NoDeconvolution>;
using KidsCmcRule = CollectiveRule<NoScaleAdaptation, KidsDeconvolution>;
using MokaKidsCmcRule = CollectiveRule<MokaScaleAdaptation, KidsDeconvolution>;

class CMC : public PopulationSampler<CmcRule> {
public:
  template <typename SpaceType>
  CMC(const SpaceType &space, const Eigen::MatrixXd &start,
      const BallProposal &proposal, std::size_t annealing = 0,
      const CollectiveOptions &options = CollectiveOptions())
      : CMC(space, start, proposal, AnnealingSchedule(annealing), options){};

  template <typename SpaceType>
  CMC(const SpaceType &space, const Eigen::MatrixXd &start,
      const BallProposal &proposal, const AnnealingSchedule &annealing,
      const CollectiveOptions &options = CollectiveOptions())
      : PopulationSampler<CmcRule>(space, start, proposal, annealing,
                                   CmcRule(options)){};
};

class MokaCMC : public PopulationSampler<MokaCmcRule> {
public:
  template <typename SpaceType>
  MokaCMC(const SpaceType &space, const Eigen::MatrixXd &start,
          const BallProposal &proposal, std::size_t annealing = 0,
          const MokaOptions &moka = MokaOptions(),
          const CollectiveOptions &options = CollectiveOptions())
      : MokaCMC(space, start, proposal, AnnealingSchedule(annealing), moka,
                options){};

  template <typename SpaceType>
  MokaCMC(const SpaceType &space, const Eigen::MatrixXd &start,
          const BallProposal &proposal, const AnnealingSchedule &annealing,
          const MokaOptions &moka = MokaOptions(),
          const CollectiveOptions &options = CollectiveOptions())
      : PopulationSampler<MokaCmcRule>(
            space, start, proposal, annealing,
            MokaCmcRule(options, MokaScaleAdaptation(moka))){};
};

class KidsCMC : public PopulationSampler<KidsCmcRule> {
public:
  template <typename SpaceType>
  KidsCMC(const SpaceType &space, const Eigen::MatrixXd &start,
          const BallProposal &proposal, std::size_t annealing = 0,
          const KidsOptions &kids = KidsOptions(),
          const CollectiveOptions &options = CollectiveOptions())
      : KidsCMC(space, start, proposal, AnnealingSchedule(annealing), kids,
                options){};

  template <typename SpaceType>
  KidsCMC(const SpaceType &space, const Eigen::MatrixXd &start,
          const BallProposal &proposal, const AnnealingSchedule &annealing,
          const KidsOptions &kids = KidsOptions(),
          const CollectiveOptions &options = CollectiveOptions())
      : PopulationSampler<KidsCmcRule>(
            space, start, proposal, annealing,
            KidsCmcRule(options, NoScaleAdaptation(), KidsDeconvolution(kids))){};
};

class MokaKidsCMC : public PopulationSampler<MokaKidsCmcRule> {
public:
  template <typename SpaceType>
  MokaKidsCMC(const SpaceType &space, const Eigen::MatrixXd &start,
              const BallProposal &proposal, std::size_t annealing = 0,
              const MokaOptions &moka = MokaOptions(),
              const KidsOptions &kids = KidsOptions(),
              const CollectiveOptions &options = CollectiveOptions())
      : MokaKidsCMC(space, start, proposal, AnnealingSchedule(annealing), moka,
                    kids, options){};

  template <typename SpaceType>
  MokaKidsCMC(const SpaceType &space, const Eigen::MatrixXd &start,
              const BallProposal &proposal, const AnnealingSchedule &annealing,
              const MokaOptions &moka = MokaOptions(),
              const KidsOptions &kids = KidsOptions(),
              const CollectiveOptions &options = CollectiveOptions())
      : PopulationSampler<MokaKidsCmcRule>(
            space, start, proposal, annealing,
            MokaKidsCmcRule(options, MokaScaleAdaptation(moka),
                            KidsDeconvolution(kids))){};
};

} // namespace monaco

#endif /* MONACO_SRC_SAMPLERS_COLLECTIVE_HPP_ */
