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

#ifndef MONACO_SRC_CORE_TARGET_HPP_
#define MONACO_SRC_CORE_TARGET_HPP_

namespace monaco {

/*
 * A Target is the (unnormalized) distribution we'd like to sample
 * from, described by its potential U(x) = -log p(x) + constant.
 *
 * Potentials are always requested for a whole batch of states (one
 * per row) since they are typically the expensive part of a run.
 * A potential of +inf marks an infeasible state.
 *
 * Some targets also know how to draw exact samples, those are only
 * ever used to produce reference samples for diagnostics.
 */
class Target {
public:
  virtual ~Target(){};

  virtual std::string get_name() const = 0;

  virtual Eigen::VectorXd potential(const Eigen::MatrixXd &points) const = 0;

  virtual bool has_sampler() const { return false; }

  virtual Eigen::MatrixXd sample(std::size_t n,
                                 std::default_random_engine &gen) const {
    (void)n;
    (void)gen;
    throw std::logic_error(get_name() + " can not draw exact samples.");
  }
};

/*
 * A mixture of isotropic gaussians,
 *
 *   p(x) = sum_m w_m N(x | mu_m, sigma_m^2 I)
 *
 * with means stored as the rows of `means`.
 */
class GaussianMixture : public Target {
public:
  GaussianMixture(const Eigen::MatrixXd &means, const Eigen::VectorXd &deviations,
                  const Eigen::VectorXd &weights)
      : means_(means), deviations_(deviations), weights_(weights) {
    MONACO_CONFIG_CHECK(means_.rows() > 0 && means_.cols() > 0,
                        "GaussianMixture: expected at least one component.");
    MONACO_CONFIG_CHECK(deviations_.size() == means_.rows() &&
                            weights_.size() == means_.rows(),
                        "GaussianMixture: means, deviations and weights must "
                        "describe the same number of components.");
    MONACO_CONFIG_CHECK((deviations_.array() > 0.).all() &&
                            deviations_.allFinite(),
                        "GaussianMixture: deviations must be finite and > 0.");
    MONACO_CONFIG_CHECK((weights_.array() >= 0.).all() &&
                            weights_.allFinite() && weights_.sum() > 0.,
                        "GaussianMixture: weights must be >= 0 with a positive "
                        "sum.");
    weights_ /= weights_.sum();

    const double d = cast::to_double(means_.cols());
    log_normalizers_ = weights_.array().log() -
                       0.5 * d * (2. * M_PI * deviations_.array().square()).log();
  }

  std::string get_name() const override { return "gaussian_mixture"; }

  Eigen::Index dimension() const { return means_.cols(); }

  const Eigen::MatrixXd &get_means() const { return means_; }

  const Eigen::VectorXd &get_deviations() const { return deviations_; }

  const Eigen::VectorXd &get_weights() const { return weights_; }

  Eigen::VectorXd potential(const Eigen::MatrixXd &points) const override {
    MONACO_ASSERT(points.cols() == means_.cols());
    Eigen::VectorXd output(points.rows());
    Eigen::VectorXd log_terms(means_.rows());
    for (Eigen::Index i = 0; i < points.rows(); ++i) {
      const Eigen::VectorXd squared_distances =
          (means_.rowwise() - points.row(i)).rowwise().squaredNorm();
      log_terms = log_normalizers_.array() -
                  squared_distances.array() /
                      (2. * deviations_.array().square());
      output[i] = -log_sum_exp(log_terms);
    }
    return output;
  }

  bool has_sampler() const override { return true; }

  Eigen::MatrixXd sample(std::size_t n,
                         std::default_random_engine &gen) const override {
    Eigen::MatrixXd output(cast::to_index(n), means_.cols());
    Eigen::VectorXd noise(means_.cols());
    for (Eigen::Index i = 0; i < output.rows(); ++i) {
      const auto m = cast::to_index(random_index(weights_, gen));
      gaussian_fill(noise, 0., deviations_[m], gen);
      output.row(i) = means_.row(m) + noise.transpose();
    }
    return output;
  }

private:
  Eigen::MatrixXd means_;
  Eigen::VectorXd deviations_;
  Eigen::VectorXd weights_;
  Eigen::VectorXd log_normalizers_;
};

/*
 * An arbitrary potential restricted to the unit hypercube [0, 1]^D,
 * states outside of it are infeasible.
 */
class UnitPotential : public Target {
public:
  using PotentialFunction = std::function<double(const Eigen::VectorXd &)>;

  UnitPotential(Eigen::Index dimension, PotentialFunction func)
      : dimension_(dimension), func_(std::move(func)) {
    MONACO_CONFIG_CHECK(dimension_ > 0,
                        "UnitPotential: dimension must be positive.");
    MONACO_CONFIG_CHECK(static_cast<bool>(func_),
                        "UnitPotential: expected a potential function.");
  }

  std::string get_name() const override { return "unit_potential"; }

  Eigen::VectorXd potential(const Eigen::MatrixXd &points) const override {
    MONACO_ASSERT(points.cols() == dimension_);
    Eigen::VectorXd output(points.rows());
    for (Eigen::Index i = 0; i < points.rows(); ++i) {
      const Eigen::VectorXd x = points.row(i).transpose();
      if ((x.array() < 0.).any() || (x.array() > 1.).any()) {
        output[i] = HUGE_VAL;
      } else {
        output[i] = func_(x);
      }
    }
    return output;
  }

private:
  Eigen::Index dimension_;
  PotentialFunction func_;
};

/*
 * The normalized uniform density over the bounding box of a
 * EuclideanSpace, a typical choice for the initial proposal q0 of the
 * non-parametric importance sampler.
 */
class UniformDensity : public Target {
public:
  explicit UniformDensity(const EuclideanSpace &space) : space_(space) {}

  std::string get_name() const override { return "uniform_density"; }

  Eigen::VectorXd potential(const Eigen::MatrixXd &points) const override {
    const double log_volume = std::log(space_.box_volume());
    Eigen::VectorXd output(points.rows());
    for (Eigen::Index i = 0; i < points.rows(); ++i) {
      output[i] =
          space_.contains(points.row(i).transpose()) ? log_volume : HUGE_VAL;
    }
    return output;
  }

  bool has_sampler() const override { return true; }

  Eigen::MatrixXd sample(std::size_t n,
                         std::default_random_engine &gen) const override {
    return space_.sample_uniform(n, gen);
  }

private:
  EuclideanSpace space_;
};

} // namespace monaco

#endif /* MONACO_SRC_CORE_TARGET_HPP_ */
