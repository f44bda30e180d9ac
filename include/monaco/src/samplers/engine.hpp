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

#ifndef MONACO_SRC_SAMPLERS_ENGINE_HPP_
#define MONACO_SRC_SAMPLERS_ENGINE_HPP_

namespace monaco {

/*
 * Everything a sampling rule is allowed to look at while performing
 * iteration `iteration` (zero based).  The references are only valid
 * for the duration of that iteration.  `scale_weights` belongs to the
 * run and may be modified by rules which adapt the proposal.
 */
struct IterationContext {
  const Space &space;
  const BallProposal &proposal;
  const Target &target;
  std::size_t iteration;
  double beta;
  Eigen::VectorXd &scale_weights;
};

/*
 * The outcome of evaluating a batch of candidates.  Potentials are
 * untempered, `log_acceptance` holds log min(1, alpha) for each
 * particle moving to its candidate.
 */
struct Evaluation {
  Eigen::VectorXd candidate_potentials;
  Eigen::VectorXd log_acceptance;
  std::size_t rejected;
};

/*
 * What a rule reports back about the iteration it just performed.
 */
struct UpdateSummary {
  double acceptance_rate = 0.;
  double effective_sample_size = 0.;
  double importance_ess = 0.;
  std::size_t rejected = 0;
  std::size_t clamped = 0;
  std::size_t memory_size = 0;
  bool resampled = false;
};

/*
 * Evaluates the potential for every row of `points` in a single call,
 * anything the target couldn't evaluate (NaN) is treated as infeasible.
 */
inline Eigen::VectorXd evaluate_potential(const Target &target,
                                          const Eigen::MatrixXd &points,
                                          std::size_t *rejected) {
  Eigen::VectorXd output = target.potential(points);
  MONACO_ASSERT(output.size() == points.rows());
  for (Eigen::Index i = 0; i < output.size(); ++i) {
    if (std::isnan(output[i])) {
      output[i] = HUGE_VAL;
      ++(*rejected);
    }
  }
  return output;
}

/*
 * log min(1, exp(-beta (U(y) - U(x))) K(y, x) / K(x, y))
 *
 * An infeasible candidate is never accepted, a feasible candidate
 * always replaces an infeasible state.
 */
inline double log_acceptance_probability(double current, double candidate,
                                         double beta, double log_kernel_ratio) {
  if (candidate == HUGE_VAL || log_kernel_ratio == -HUGE_VAL) {
    return -HUGE_VAL;
  }
  if (current == HUGE_VAL) {
    return 0.;
  }
  const double log_ratio = -beta * (candidate - current) + log_kernel_ratio;
  if (std::isnan(log_ratio)) {
    return -HUGE_VAL;
  }
  return std::min(0., log_ratio);
}

/*
 * A Metropolis-Hastings accept / reject decision for every particle.
 * Exactly one uniform is drawn per particle (in order) regardless of
 * the acceptance probability.  Returns the number of accepted moves.
 */
inline std::size_t metropolis_step(PopulationState *state,
                                   const ProposedMoves &moves,
                                   const Evaluation &evaluation,
                                   std::default_random_engine &gen) {
  MONACO_ASSERT(moves.size() == state->size());
  std::uniform_real_distribution<double> uniform_real(0.0, 1.0);
  std::size_t accepted = 0;
  for (std::size_t i = 0; i < moves.size(); ++i) {
    const auto row = cast::to_index(i);
    const double random = uniform_real(gen);
    if (std::log(random) < evaluation.log_acceptance[row]) {
      state->positions.row(row) = moves.candidates.row(row);
      state->potentials[row] = evaluation.candidate_potentials[row];
      ++accepted;
    }
    state->scale_indices[i] = moves.scale_indices[i];
  }
  return accepted;
}

/*
 * Default behavior of every stage of an iteration.  Rules derive from
 * this and hide the stages they need to customize, the engine always
 * calls them through the concrete rule type.
 */
class SamplingRule {
public:
  void validate(const BallProposal &) const {}

  void initialize(IterationContext &context, const Eigen::MatrixXd &start,
                  PopulationState *state, UpdateSummary *summary,
                  std::default_random_engine &) {
    *state = PopulationState(start);
    state->potentials =
        evaluate_potential(context.target, start, &summary->rejected);
    summary->effective_sample_size = effective_sample_size(state->weights());
    summary->importance_ess = summary->effective_sample_size;
  }

  void adapt(IterationContext &, const PopulationState &) {}

  ProposedMoves propose(IterationContext &context, const PopulationState &state,
                        std::default_random_engine &gen) {
    return context.proposal.sample(state.positions, context.scale_weights, gen);
  }

  /*
   * log [ q(y_i -> x_i) / q(x_i -> y_i) ] for every particle moving to
   * its candidate.  Each candidate was drawn around its own particle,
   * forward and backward moves share this iteration's scale weights.
   */
  Eigen::VectorXd log_proposal_ratio(const IterationContext &context,
                                     const PopulationState &state,
                                     const ProposedMoves &moves) const {
    Eigen::VectorXd output(moves.candidates.rows());
    for (Eigen::Index i = 0; i < output.size(); ++i) {
      output[i] = context.proposal.log_density_ratio(
          state.position(cast::to_size(i)), moves.candidates.row(i).transpose(),
          context.scale_weights, context.scale_weights);
    }
    return output;
  }
};

/*
 * The iteration skeleton shared by every population sampler:
 *
 *   INIT   : the rule builds the initial population, entry 0 is recorded.
 *   t >= 0 : with beta = beta(t)
 *              ADAPT    (rule)   update the proposal scale weights
 *              PROPOSE  (rule)   one candidate per particle
 *              EVALUATE (engine) potentials and acceptance probabilities,
 *                                the rule supplies the proposal ratios
 *              UPDATE   (rule)   accept / weight / resample / store
 *            entry t + 1 is recorded.
 *
 * The sampler keeps its configuration (space, proposal, schedule,
 * start population and rule options) separate from the state of the
 * current run, so a fit sampler can be copied and run any number of
 * times.
 */
template <typename UpdateRule> class PopulationSampler {
public:
  using RuleType = UpdateRule;

  template <typename SpaceType>
  PopulationSampler(const SpaceType &space, const Eigen::MatrixXd &start,
                    const BallProposal &proposal,
                    const AnnealingSchedule &annealing,
                    const UpdateRule &rule = UpdateRule())
      : space_(std::make_shared<SpaceType>(space)), start_(start),
        proposal_(proposal), annealing_(annealing), initial_rule_(rule),
        rule_(rule), target_(), state_(), scale_weights_(), history_() {
    static_assert(std::is_base_of<Space, SpaceType>::value,
                  "PopulationSampler requires a type derived from Space");
    MONACO_CONFIG_CHECK(start_.rows() > 0,
                        "expected a start population with at least one particle.");
    MONACO_CONFIG_CHECK(start_.cols() == space_->dimension(),
                        "start population dimension doesn't match the space.");
    MONACO_CONFIG_CHECK(
        proposal_.get_space().dimension() == space_->dimension(),
        "proposal dimension doesn't match the space.");
    MONACO_CONFIG_CHECK(start_.allFinite(),
                        "start population contains non finite values.");
    initial_rule_.validate(proposal_);
  }

  std::string get_name() const { return initial_rule_.get_name(); }

  template <typename TargetType>
  PopulationSampler &fit(const TargetType &target) {
    static_assert(std::is_base_of<Target, TargetType>::value,
                  "fit requires a type derived from Target");
    target_ = std::make_shared<TargetType>(target);
    history_ = RunHistory();
    return *this;
  }

  bool is_fit() const { return target_ != nullptr; }

  /*
   * Starts a new run from the start population and performs
   * `iterations` iterations after the initial one.
   */
  template <typename CallbackFunc = NullCallback>
  RunHistory run(std::size_t iterations, std::default_random_engine &gen,
                 CallbackFunc &&callback = NullCallback()) {
    MONACO_CONFIG_CHECK(iterations > 0, "expected at least one iteration.");
    reset(gen, std::forward<CallbackFunc>(callback));
    advance(iterations, gen, std::forward<CallbackFunc>(callback));
    return history_;
  }

  /*
   * Independent runs one after the other, each seeded from `gen`.
   */
  std::vector<RunHistory> run(std::size_t iterations, std::size_t repetitions,
                              std::default_random_engine &gen) {
    MONACO_CONFIG_CHECK(repetitions > 0, "expected at least one repetition.");
    std::vector<RunHistory> output;
    for (const auto &seed : draw_seeds(repetitions, gen)) {
      std::default_random_engine run_gen(seed);
      output.emplace_back(run(iterations, run_gen));
    }
    return output;
  }

  /*
   * Discards the current run and performs the INIT stage.
   */
  template <typename CallbackFunc = NullCallback>
  void reset(std::default_random_engine &gen,
             CallbackFunc &&callback = NullCallback()) {
    MONACO_CONFIG_CHECK(is_fit(), "the sampler must be fit before it is run.");
    rule_ = initial_rule_;
    history_ = RunHistory();
    scale_weights_ = proposal_.get_prior_weights();

    auto context = make_context(0);
    UpdateSummary summary;
    rule_.initialize(context, start_, &state_, &summary, gen);
    state_.iteration = 0;
    record(context.beta, summary, std::forward<CallbackFunc>(callback));
  }

  /*
   * Continues the current run for another `iterations` iterations.
   */
  template <typename CallbackFunc = NullCallback>
  void advance(std::size_t iterations, std::default_random_engine &gen,
               CallbackFunc &&callback = NullCallback()) {
    MONACO_CONFIG_CHECK(!history_.empty(),
                        "advance requires a run which has been started.");
    for (std::size_t i = 0; i < iterations; ++i) {
      step(gen, std::forward<CallbackFunc>(callback));
    }
  }

  template <typename CallbackFunc = NullCallback>
  void step(std::default_random_engine &gen,
            CallbackFunc &&callback = NullCallback()) {
    MONACO_ASSERT(!history_.empty());
    const std::size_t t = state_.iteration;
    auto context = make_context(t);

    rule_.adapt(context, state_);
    const ProposedMoves moves = rule_.propose(context, state_, gen);
    MONACO_ASSERT(cast::to_index(moves.size()) == moves.candidates.rows());
    const Evaluation evaluation = evaluate(context, moves);
    UpdateSummary summary =
        rule_.update(context, &state_, moves, evaluation, gen);
    summary.rejected += evaluation.rejected;

    state_.iteration = t + 1;
    record(context.beta, summary, std::forward<CallbackFunc>(callback));
  }

  std::size_t population_size() const {
    return state_.size() > 0 ? state_.size() : cast::to_size(start_.rows());
  }

  const Space &get_space() const { return *space_; }

  const Eigen::MatrixXd &get_start() const { return start_; }

  const BallProposal &get_proposal() const { return proposal_; }

  const AnnealingSchedule &get_annealing() const { return annealing_; }

  const UpdateRule &get_rule() const { return rule_; }

  const Target &get_target() const {
    MONACO_ASSERT(is_fit());
    return *target_;
  }

  const PopulationState &get_state() const { return state_; }

  const Eigen::VectorXd &get_scale_weights() const { return scale_weights_; }

  const RunHistory &get_history() const { return history_; }

protected:
  static std::vector<std::default_random_engine::result_type>
  draw_seeds(std::size_t n, std::default_random_engine &gen) {
    std::vector<std::default_random_engine::result_type> seeds;
    for (std::size_t i = 0; i < n; ++i) {
      seeds.push_back(gen());
    }
    return seeds;
  }

  UpdateRule &mutable_rule() { return rule_; }

private:
  IterationContext make_context(std::size_t iteration) {
    return IterationContext{*space_,
                            proposal_,
                            *target_,
                            iteration,
                            annealing_.beta(iteration),
                            scale_weights_};
  }

  Evaluation evaluate(const IterationContext &context,
                      const ProposedMoves &moves) const {
    Evaluation evaluation;
    evaluation.rejected = 0;
    evaluation.candidate_potentials =
        evaluate_potential(*target_, moves.candidates, &evaluation.rejected);

    const Eigen::Index n = moves.candidates.rows();
    evaluation.log_acceptance.resize(n);
    if (state_.positions.rows() != n) {
      for (Eigen::Index i = 0; i < n; ++i) {
        evaluation.log_acceptance[i] =
            evaluation.candidate_potentials[i] == HUGE_VAL ? -HUGE_VAL : 0.;
      }
      return evaluation;
    }

    const Eigen::VectorXd log_kernel_ratios =
        rule_.log_proposal_ratio(context, state_, moves);
    MONACO_ASSERT(log_kernel_ratios.size() == n);
    for (Eigen::Index i = 0; i < n; ++i) {
      evaluation.log_acceptance[i] = log_acceptance_probability(
          state_.potentials[i], evaluation.candidate_potentials[i],
          context.beta, log_kernel_ratios[i]);
    }
    return evaluation;
  }

  template <typename CallbackFunc>
  void record(double beta, const UpdateSummary &summary,
              CallbackFunc &&callback) {
    IterationRecord entry;
    entry.iteration = state_.iteration;
    entry.beta = beta;
    entry.positions = state_.positions;
    entry.weights = state_.weights();
    entry.scale_weights = scale_weights_;
    entry.acceptance_rate = summary.acceptance_rate;
    entry.effective_sample_size = summary.effective_sample_size;
    entry.importance_ess = summary.importance_ess;
    entry.rejected = summary.rejected;
    entry.clamped = summary.clamped;
    entry.memory_size = summary.memory_size;
    entry.resampled = summary.resampled;
    history_.append(entry);
    callback(history_.back());
  }

  std::shared_ptr<const Space> space_;
  Eigen::MatrixXd start_;
  BallProposal proposal_;
  AnnealingSchedule annealing_;
  UpdateRule initial_rule_;
  UpdateRule rule_;
  std::shared_ptr<const Target> target_;
  PopulationState state_;
  Eigen::VectorXd scale_weights_;
  RunHistory history_;
};

} // namespace monaco

#endif /* MONACO_SRC_SAMPLERS_ENGINE_HPP_ */
