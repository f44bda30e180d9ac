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

#ifndef MONACO_SRC_SAMPLERS_NPAIS_HPP_
#define MONACO_SRC_SAMPLERS_NPAIS_HPP_

namespace monaco {

/*
 * Every sample the non-parametric importance sampler has drawn, each
 * one doubles as a component of the mixture proposal: a ball of the
 * component's radius centered on the sample.
 *
 * Components are stored in flat arrays which only ever grow.  The log
 * normalizer of the weights and the log sum of squared weights are
 * kept up to date as components are appended so the ESS of the whole
 * memory is available in constant time.  Weights depend on the inverse
 * temperature, when it changes every weight is recomputed from the
 * stored potential and proposal density.
 */
class ProposalMemory {
public:
  ProposalMemory() : ProposalMemory(0){};

  explicit ProposalMemory(Eigen::Index dimension)
      : dimension_(dimension), beta_(1.), locations_(), scale_indices_(),
        radii_(), log_volumes_(), potentials_(), log_proposal_densities_(),
        log_weights_(), log_normalizer_(-HUGE_VAL),
        log_sum_of_squares_(-HUGE_VAL){};

  std::size_t size() const { return radii_.size(); }

  bool empty() const { return radii_.empty(); }

  Eigen::Index dimension() const { return dimension_; }

  double get_beta() const { return beta_; }

  /*
   * Recomputes every weight for a new inverse temperature.
   */
  void set_beta(double beta) {
    if (beta == beta_) {
      return;
    }
    beta_ = beta;
    log_normalizer_ = -HUGE_VAL;
    log_sum_of_squares_ = -HUGE_VAL;
    for (std::size_t m = 0; m < size(); ++m) {
      log_weights_[m] = compute_log_weight(potentials_[m],
                                           log_proposal_densities_[m]);
      accumulate(log_weights_[m]);
    }
  }

  void append(const BallProposal &proposal, const Eigen::MatrixXd &locations,
              const std::vector<std::size_t> &scale_indices,
              const Eigen::VectorXd &potentials,
              const Eigen::VectorXd &log_proposal_densities) {
    MONACO_ASSERT(locations.cols() == dimension_);
    MONACO_ASSERT(cast::to_index(scale_indices.size()) == locations.rows());
    MONACO_ASSERT(potentials.size() == locations.rows());
    MONACO_ASSERT(log_proposal_densities.size() == locations.rows());

    for (Eigen::Index i = 0; i < locations.rows(); ++i) {
      for (Eigen::Index d = 0; d < dimension_; ++d) {
        locations_.push_back(locations(i, d));
      }
      const std::size_t k = scale_indices[cast::to_size(i)];
      const double radius = proposal.get_scales()[cast::to_index(k)];
      scale_indices_.push_back(k);
      radii_.push_back(radius);
      log_volumes_.push_back(proposal.get_space().log_ball_volume(radius));
      potentials_.push_back(potentials[i]);
      log_proposal_densities_.push_back(log_proposal_densities[i]);
      log_weights_.push_back(
          compute_log_weight(potentials[i], log_proposal_densities[i]));
      accumulate(log_weights_.back());
    }
  }

  Eigen::VectorXd location(std::size_t m) const {
    MONACO_ASSERT(m < size());
    return Eigen::Map<const Eigen::VectorXd>(
        &locations_[m * cast::to_size(dimension_)], dimension_);
  }

  Eigen::MatrixXd locations() const {
    using RowMajorMatrix =
        Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
    return Eigen::Map<const RowMajorMatrix>(
        locations_.data(), cast::to_index(size()), dimension_);
  }

  std::size_t scale_index(std::size_t m) const { return scale_indices_[m]; }

  double radius(std::size_t m) const { return radii_[m]; }

  /*
   * Unnormalized log weights, -beta U - log q.
   */
  Eigen::VectorXd log_weights() const {
    return Eigen::Map<const Eigen::VectorXd>(log_weights_.data(),
                                             cast::to_index(size()));
  }

  Eigen::VectorXd weights() const {
    if (!std::isfinite(log_normalizer_)) {
      return Eigen::VectorXd::Zero(cast::to_index(size()));
    }
    return (log_weights().array() - log_normalizer_).exp();
  }

  double log_normalizer() const { return log_normalizer_; }

  double effective_sample_size() const {
    if (!std::isfinite(log_normalizer_)) {
      return 0.;
    }
    return std::exp(2. * log_normalizer_ - log_sum_of_squares_);
  }

  /*
   * Log of the weights W_m the mixture proposal uses.  Until a sample
   * with positive weight has been stored every component carries the
   * same weight.
   */
  Eigen::VectorXd log_mixture_weights() const {
    MONACO_ASSERT(!empty());
    if (!std::isfinite(log_normalizer_)) {
      return Eigen::VectorXd::Constant(cast::to_index(size()),
                                       -std::log(cast::to_double(size())));
    }
    return log_weights().array() - log_normalizer_;
  }

  /*
   * log of the mixture density  sum_m W_m 1{d(y, x_m) <= r_m} / V(r_m)
   * for every row of `ys`.
   */
  Eigen::VectorXd log_density(const Space &space,
                              const Eigen::MatrixXd &ys) const {
    Eigen::VectorXd output = Eigen::VectorXd::Constant(ys.rows(), -HUGE_VAL);
    if (empty()) {
      return output;
    }

    const auto m = cast::to_index(size());
    const Eigen::RowVectorXd radii =
        Eigen::Map<const Eigen::RowVectorXd>(radii_.data(), m);
    const Eigen::RowVectorXd log_heights =
        (log_mixture_weights().transpose().array() -
         Eigen::Map<const Eigen::RowVectorXd>(log_volumes_.data(), m).array())
            .matrix();

    const Eigen::MatrixXd distances = space.distance_matrix(ys, locations());
    for (Eigen::Index i = 0; i < ys.rows(); ++i) {
      const Eigen::VectorXd terms =
          (distances.row(i).array() <= radii.array())
              .select(log_heights.array(), -HUGE_VAL)
              .matrix()
              .transpose();
      output[i] = log_sum_exp(terms);
    }
    return output;
  }

  std::vector<std::size_t> sample_components(std::size_t n,
                                             std::default_random_engine &gen) const {
    const Eigen::VectorXd w = log_mixture_weights().array().exp();
    std::discrete_distribution<std::size_t> dist(w.data(), w.data() + w.size());
    std::vector<std::size_t> output;
    for (std::size_t i = 0; i < n; ++i) {
      output.push_back(dist(gen));
    }
    return output;
  }

  bool operator==(const ProposalMemory &other) const {
    return dimension_ == other.dimension_ && beta_ == other.beta_ &&
           locations_ == other.locations_ &&
           scale_indices_ == other.scale_indices_ &&
           potentials_ == other.potentials_ &&
           log_proposal_densities_ == other.log_proposal_densities_;
  }

private:
  double compute_log_weight(double potential, double log_proposal_density) const {
    if (potential == HUGE_VAL || log_proposal_density == -HUGE_VAL) {
      return -HUGE_VAL;
    }
    const double output = -beta_ * potential - log_proposal_density;
    return std::isnan(output) ? -HUGE_VAL : output;
  }

  void accumulate(double log_weight) {
    log_normalizer_ = log_sum_exp(log_normalizer_, log_weight);
    log_sum_of_squares_ = log_sum_exp(log_sum_of_squares_, 2. * log_weight);
  }

  Eigen::Index dimension_;
  double beta_;
  std::vector<double> locations_;
  std::vector<std::size_t> scale_indices_;
  std::vector<double> radii_;
  std::vector<double> log_volumes_;
  std::vector<double> potentials_;
  std::vector<double> log_proposal_densities_;
  std::vector<double> log_weights_;
  double log_normalizer_;
  double log_sum_of_squares_;
};

struct NpaisOptions {
  std::size_t population_size = 100;
  // Probability with which a sample is drawn from the initial proposal.
  double q0_weight = 0.1;
};

/*
 * Non-parametric adaptive importance sampling.  Nothing is ever
 * rejected, every candidate is importance weighted against the
 * proposal it was drawn from,
 *
 *   q_t(y) = a q0(y) + (1 - a) sum_m W_m K_{r_m}(x_m, y)
 *
 * and added to the memory, so the proposal keeps improving as the
 * memory grows.  The density q0 is exp(-V0) and must provide a sampler.
 */
class NpaisRule : public SamplingRule {
public:
  NpaisRule() : NpaisRule(nullptr, NpaisOptions()){};

  template <typename DensityType,
            typename std::enable_if<std::is_base_of<Target, DensityType>::value,
                                    int>::type = 0>
  NpaisRule(const DensityType &q0, const NpaisOptions &options)
      : NpaisRule(std::make_shared<DensityType>(q0), options){};

  NpaisRule(std::shared_ptr<const Target> q0, const NpaisOptions &options)
      : q0_(std::move(q0)), options_(options), memory_() {
    if (q0_ != nullptr) {
      MONACO_CONFIG_CHECK(q0_->has_sampler(),
                          "NPAIS: the initial proposal must provide a sampler.");
    }
    MONACO_CONFIG_CHECK(options_.population_size > 0,
                        "NPAIS: expected a positive population size.");
    MONACO_CONFIG_CHECK(options_.q0_weight > 0. && options_.q0_weight < 1.,
                        "NPAIS: the initial proposal weight must be in (0, 1).");
  }

  std::string get_name() const { return "npais"; }

  const NpaisOptions &get_options() const { return options_; }

  const ProposalMemory &memory() const { return memory_; }

  void validate(const BallProposal &) const {
    MONACO_CONFIG_CHECK(q0_ != nullptr, "NPAIS: missing initial proposal.");
  }

  void initialize(IterationContext &context, const Eigen::MatrixXd &,
                  PopulationState *state, UpdateSummary *summary,
                  std::default_random_engine &gen) {
    const std::size_t n = options_.population_size;
    memory_ = ProposalMemory(context.space.dimension());
    memory_.set_beta(context.beta);

    ProposedMoves draws;
    draws.candidates = q0_->sample(n, gen);
    MONACO_ASSERT(draws.candidates.rows() == cast::to_index(n));
    MONACO_ASSERT(draws.candidates.cols() == context.space.dimension());
    for (std::size_t i = 0; i < n; ++i) {
      draws.scale_indices.push_back(
          context.proposal.sample_scale(context.scale_weights, gen));
    }

    const Eigen::VectorXd potentials =
        evaluate_potential(context.target, draws.candidates, &summary->rejected);
    const Eigen::VectorXd log_q0 = -q0_->potential(draws.candidates);
    store(context, draws, potentials, log_q0, state, summary);
  }

  ProposedMoves propose(IterationContext &context, const PopulationState &,
                        std::default_random_engine &gen) {
    const std::size_t n = options_.population_size;
    const std::vector<std::size_t> components = memory_.sample_components(n, gen);

    std::uniform_real_distribution<double> uniform_real(0.0, 1.0);
    ProposedMoves moves;
    moves.candidates.resize(cast::to_index(n), context.space.dimension());
    for (std::size_t i = 0; i < n; ++i) {
      const auto row = cast::to_index(i);
      if (uniform_real(gen) < options_.q0_weight) {
        moves.candidates.row(row) = q0_->sample(1, gen).row(0);
      } else {
        const std::size_t m = components[i];
        moves.candidates.row(row) =
            context.proposal
                .sample(memory_.location(m), memory_.scale_index(m), gen)
                .transpose();
      }
      moves.scale_indices.push_back(
          context.proposal.sample_scale(context.scale_weights, gen));
    }
    return moves;
  }

  UpdateSummary update(IterationContext &context, PopulationState *state,
                       const ProposedMoves &moves, const Evaluation &evaluation,
                       std::default_random_engine &) {
    const double log_a = std::log(options_.q0_weight);
    const double log_one_minus_a = std::log1p(-options_.q0_weight);
    const Eigen::VectorXd log_q0 = -q0_->potential(moves.candidates);
    // The memory density has to be evaluated before the batch joins it.
    const Eigen::VectorXd log_memory =
        memory_.log_density(context.space, moves.candidates);

    Eigen::VectorXd log_q(log_q0.size());
    for (Eigen::Index i = 0; i < log_q.size(); ++i) {
      log_q[i] = log_sum_exp(log_a + log_q0[i], log_one_minus_a + log_memory[i]);
    }

    UpdateSummary summary;
    memory_.set_beta(context.beta);
    store(context, moves, evaluation.candidate_potentials, log_q, state,
          &summary);
    return summary;
  }

  /*
   * Draws `n` stored samples with probability proportional to their
   * current weight.
   */
  Eigen::MatrixXd resample(std::size_t n, std::default_random_engine &gen) const {
    MONACO_CONFIG_CHECK(!memory_.empty(),
                        "NPAIS: nothing to resample before the sampler ran.");
    const Eigen::MatrixXd locations = memory_.locations();
    return subset_rows(locations, memory_.sample_components(n, gen));
  }

private:
  void store(const IterationContext &context, const ProposedMoves &batch,
             const Eigen::VectorXd &potentials,
             const Eigen::VectorXd &log_proposal_densities,
             PopulationState *state, UpdateSummary *summary) {
    memory_.append(context.proposal, batch.candidates, batch.scale_indices,
                   potentials, log_proposal_densities);

    const auto n = batch.candidates.rows();
    const Eigen::VectorXd log_weights =
        memory_.log_weights().tail(n);

    *state = PopulationState(batch.candidates);
    state->potentials = potentials;
    state->scale_indices = batch.scale_indices;
    state->log_weights = normalize_log_weights(log_weights, &summary->clamped);

    std::size_t weighted = 0;
    for (Eigen::Index i = 0; i < n; ++i) {
      if (log_weights[i] > -HUGE_VAL) {
        ++weighted;
      }
    }
    summary->acceptance_rate =
        cast::to_double(weighted) / cast::to_double(cast::to_size(n));
    summary->effective_sample_size = memory_.effective_sample_size();
    summary->importance_ess = effective_sample_size(state->weights());
    summary->memory_size = memory_.size();
  }

  std::shared_ptr<const Target> q0_;
  NpaisOptions options_;
  ProposalMemory memory_;
};

class NPAIS : public PopulationSampler<NpaisRule> {
public:
  template <typename SpaceType, typename DensityType>
  NPAIS(const SpaceType &space, const Eigen::MatrixXd &start,
        const BallProposal &proposal, std::size_t annealing,
        const DensityType &q0, const NpaisOptions &options)
      : NPAIS(space, start, proposal, AnnealingSchedule(annealing), q0,
              options){};

  template <typename SpaceType, typename DensityType>
  NPAIS(const SpaceType &space, const Eigen::MatrixXd &start,
        const BallProposal &proposal, const AnnealingSchedule &annealing,
        const DensityType &q0, const NpaisOptions &options)
      : PopulationSampler<NpaisRule>(space, start, proposal, annealing,
                                     NpaisRule(q0, options)){};

  /*
   * The start population is only used to check dimensions, samples are
   * drawn from q0 instead.
   */
  template <typename SpaceType, typename DensityType>
  NPAIS(const SpaceType &space, const BallProposal &proposal,
        std::size_t annealing, const DensityType &q0,
        const NpaisOptions &options)
      : NPAIS(space, Eigen::MatrixXd::Zero(1, space.dimension()), proposal,
              annealing, q0, options){};

  const ProposalMemory &memory() const { return get_rule().memory(); }

  Eigen::MatrixXd resample(std::size_t n,
                           std::default_random_engine &gen) const {
    return get_rule().resample(n, gen);
  }
};

} // namespace monaco

#endif /* MONACO_SRC_SAMPLERS_NPAIS_HPP_ */
