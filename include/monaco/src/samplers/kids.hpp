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

#ifndef MONACO_SRC_SAMPLERS_KIDS_HPP_
#define MONACO_SRC_SAMPLERS_KIDS_HPP_

namespace monaco {

/*
 * Richardson-Lucy deconvolution of `observed` through `kernel`, where
 * kernel(i, j) is the (unnormalized) influence of particle j on
 * particle i.  Columns are normalized so each particle spreads a unit
 * of mass:
 *
 *   P = kernel diag(c)^-1,  c_j = sum_i kernel(i, j)
 *   w_j <- w_j sum_i P_ij observed_i / (P w)_i
 *
 * Every iterate is non-negative and sums to one, entries which turn
 * negative or non finite are clamped to zero and counted in `clamped`.
 * If an iterate vanishes entirely the observed weights are returned.
 */
inline Eigen::VectorXd
richardson_lucy(const Eigen::VectorXd &observed, const Eigen::MatrixXd &kernel,
                std::size_t iterations, std::size_t *clamped = nullptr,
                std::vector<Eigen::VectorXd> *iterates = nullptr) {
  MONACO_ASSERT(kernel.rows() == observed.size());
  MONACO_ASSERT(kernel.cols() == observed.size());

  std::size_t n_clamped = 0;
  Eigen::VectorXd column_sums = kernel.colwise().sum().transpose();
  for (Eigen::Index j = 0; j < column_sums.size(); ++j) {
    if (!(column_sums[j] > 0.) || !std::isfinite(column_sums[j])) {
      // A particle which influences nothing keeps its observed weight.
      column_sums[j] = HUGE_VAL;
    }
  }

  Eigen::VectorXd estimate = observed;
  for (std::size_t k = 0; k < iterations; ++k) {
    const Eigen::VectorXd blurred =
        kernel * estimate.cwiseQuotient(column_sums);

    Eigen::VectorXd ratio(blurred.size());
    for (Eigen::Index i = 0; i < blurred.size(); ++i) {
      ratio[i] = blurred[i] > 0. ? observed[i] / blurred[i] : 0.;
    }

    const Eigen::VectorXd correction =
        (kernel.transpose() * ratio).cwiseQuotient(column_sums);
    for (Eigen::Index j = 0; j < estimate.size(); ++j) {
      if (column_sums[j] == HUGE_VAL) {
        continue;
      }
      const double value = estimate[j] * correction[j];
      if (!std::isfinite(value) || value < 0.) {
        estimate[j] = 0.;
        ++n_clamped;
      } else {
        estimate[j] = value;
      }
    }

    const double total = estimate.sum();
    if (!(total > 0.) || !std::isfinite(total)) {
      estimate = observed;
      ++n_clamped;
      break;
    }
    estimate /= total;

    if (iterates != nullptr) {
      iterates->push_back(estimate);
    }
  }

  if (clamped != nullptr) {
    *clamped += n_clamped;
  }
  return estimate;
}

enum class InnerIterationPolicy { constant, annealed };

struct KidsOptions {
  std::size_t iterations = 30;
  InnerIterationPolicy policy = InnerIterationPolicy::constant;
};

/*
 * Sharpens the mixture the collective proposal draws from.  Drawing
 * around every particle with the same weight proposes from the
 * population blurred by the kernel, instead the particle weights are
 * treated as the kernel evaluated between particles convolved with
 * the unknown mixture weights which are recovered by Richardson-Lucy.
 */
class KidsDeconvolution {
public:
  explicit KidsDeconvolution(const KidsOptions &options = KidsOptions())
      : options_(options) {
    MONACO_CONFIG_CHECK(options_.iterations > 0,
                        "KIDS: expected at least one deconvolution iteration.");
  }

  std::string get_name() const { return "kids"; }

  const KidsOptions &get_options() const { return options_; }

  std::size_t inner_iterations(double beta) const {
    if (options_.policy == InnerIterationPolicy::annealed) {
      const double scaled =
          std::round(cast::to_double(options_.iterations) * beta);
      return std::max<std::size_t>(1, static_cast<std::size_t>(scaled));
    }
    return options_.iterations;
  }

  /*
   * Uses the scale weights of the current iteration, so it has to be
   * called once they have been adapted.
   */
  Eigen::VectorXd mixture_weights(const IterationContext &context,
                                  const PopulationState &state,
                                  std::size_t *clamped) const {
    const Eigen::VectorXd observed = state.weights();
    if (state.size() == 1) {
      return observed;
    }
    const Eigen::MatrixXd kernel = context.proposal.kernel_matrix(
        state.positions, state.positions, context.scale_weights);
    return richardson_lucy(observed, kernel, inner_iterations(context.beta),
                           clamped);
  }

private:
  KidsOptions options_;
};

struct NoDeconvolution {
  std::string get_name() const { return ""; }

  Eigen::VectorXd mixture_weights(const IterationContext &,
                                  const PopulationState &state,
                                  std::size_t *) const {
    return state.weights();
  }
};

} // namespace monaco

#endif /* MONACO_SRC_SAMPLERS_KIDS_HPP_ */
