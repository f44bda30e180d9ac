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

#ifndef MONACO_SRC_CORE_HISTORY_HPP_
#define MONACO_SRC_CORE_HISTORY_HPP_

namespace monaco {

/*
 * Everything recorded about a single iteration.  Every sampler fills
 * in the same fields with the same shapes so downstream diagnostics
 * can treat them uniformly:
 *
 *   positions     : N x D particles after the iteration.
 *   weights       : N normalized probability weights of those particles.
 *   scale_weights : K mixture weights of the proposal used.
 *   acceptance_rate : fraction of candidates which were accepted (for
 *                   importance samplers, which received a non-zero
 *                   weight).
 *   effective_sample_size : 1 / sum(w^2) of `weights`, for the
 *                   non-parametric sampler over its whole memory.
 *   importance_ess : 1 / sum(w^2) of the importance weights the
 *                   iteration produced before any resampling took place.
 *   rejected      : candidates whose potential could not be evaluated
 *                   (NaN) and were treated as infeasible.
 *   clamped       : weights (or deconvolution iterates) which had to be
 *                   clamped to zero, or populations which fell back to
 *                   uniform weights.
 *   memory_size   : number of stored proposal components (zero for
 *                   samplers without memory).
 */
struct IterationRecord {
  std::size_t iteration;
  double beta;
  Eigen::MatrixXd positions;
  Eigen::VectorXd weights;
  Eigen::VectorXd scale_weights;
  double acceptance_rate;
  double effective_sample_size;
  double importance_ess;
  std::size_t rejected;
  std::size_t clamped;
  std::size_t memory_size;
  bool resampled;

  IterationRecord()
      : iteration(0), beta(1.), positions(), weights(), scale_weights(),
        acceptance_rate(0.), effective_sample_size(0.), importance_ess(0.),
        rejected(0),
        clamped(0), memory_size(0), resampled(false){};

  std::size_t size() const { return cast::to_size(positions.rows()); }

  Eigen::VectorXd weighted_mean() const {
    return positions.transpose() * weights;
  }

  bool operator==(const IterationRecord &other) const {
    return iteration == other.iteration && beta == other.beta &&
           same_matrix(positions, other.positions) &&
           same_matrix(weights, other.weights) &&
           same_matrix(scale_weights, other.scale_weights) &&
           acceptance_rate == other.acceptance_rate &&
           effective_sample_size == other.effective_sample_size &&
           importance_ess == other.importance_ess &&
           rejected == other.rejected && clamped == other.clamped &&
           memory_size == other.memory_size && resampled == other.resampled;
  }
};

/*
 * The append only sequence of records produced by a run, entry 0
 * describes the initial population.
 */
class RunHistory {
public:
  using const_iterator = std::vector<IterationRecord>::const_iterator;

  RunHistory() : records_(){};

  void append(const IterationRecord &record) {
    MONACO_ASSERT(records_.empty() ||
                  record.iteration == records_.back().iteration + 1);
    records_.push_back(record);
  }

  std::size_t size() const { return records_.size(); }

  bool empty() const { return records_.empty(); }

  const IterationRecord &operator[](std::size_t i) const { return records_[i]; }

  const IterationRecord &at(std::size_t i) const { return records_.at(i); }

  const IterationRecord &front() const { return records_.front(); }

  const IterationRecord &back() const { return records_.back(); }

  const_iterator begin() const { return records_.begin(); }

  const_iterator end() const { return records_.end(); }

  const std::vector<IterationRecord> &records() const { return records_; }

  std::vector<double> acceptance_rates() const {
    std::vector<double> output;
    for (const auto &record : records_) {
      output.push_back(record.acceptance_rate);
    }
    return output;
  }

  std::vector<double> effective_sample_sizes() const {
    std::vector<double> output;
    for (const auto &record : records_) {
      output.push_back(record.effective_sample_size);
    }
    return output;
  }

  bool operator==(const RunHistory &other) const {
    return records_ == other.records_;
  }

private:
  std::vector<IterationRecord> records_;
};

} // namespace monaco

#endif /* MONACO_SRC_CORE_HISTORY_HPP_ */
