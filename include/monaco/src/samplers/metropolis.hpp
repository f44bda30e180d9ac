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

#ifndef MONACO_SRC_SAMPLERS_METROPOLIS_HPP_
#define MONACO_SRC_SAMPLERS_METROPOLIS_HPP_

namespace monaco {

/*
 * N independent Metropolis-Hastings chains which happen to be advanced
 * in lock step.  Particles never interact and their weights stay
 * uniform.
 */
class MetropolisRule : public SamplingRule {
public:
  std::string get_name() const { return "parallel_metropolis_hastings"; }

  UpdateSummary update(IterationContext &, PopulationState *state,
                       const ProposedMoves &moves, const Evaluation &evaluation,
                       std::default_random_engine &gen) {
    UpdateSummary summary;
    const std::size_t accepted = metropolis_step(state, moves, evaluation, gen);
    summary.acceptance_rate =
        cast::to_double(accepted) / cast::to_double(state->size());
    summary.effective_sample_size = effective_sample_size(state->weights());
    summary.importance_ess = summary.effective_sample_size;
    return summary;
  }
};

class ParallelMetropolisHastings : public PopulationSampler<MetropolisRule> {
public:
  template <typename SpaceType>
  ParallelMetropolisHastings(const SpaceType &space,
                             const Eigen::MatrixXd &start,
                             const BallProposal &proposal,
                             std::size_t annealing = 0)
      : ParallelMetropolisHastings(space, start, proposal,
                                   AnnealingSchedule(annealing)){};

  template <typename SpaceType>
  ParallelMetropolisHastings(const SpaceType &space,
                             const Eigen::MatrixXd &start,
                             const BallProposal &proposal,
                             const AnnealingSchedule &annealing)
      : PopulationSampler<MetropolisRule>(space, start, proposal, annealing){};
};

using PMH = ParallelMetropolisHastings;

} // namespace monaco

#endif /* MONACO_SRC_SAMPLERS_METROPOLIS_HPP_ */
