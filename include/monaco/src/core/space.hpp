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

#ifndef MONACO_SRC_CORE_SPACE_HPP_
#define MONACO_SRC_CORE_SPACE_HPP_

namespace monaco {

/*
 * A Space describes the geometry of the domain particles live in.
 * Samplers only ever use it through this interface: the distance
 * between two states, the volume of a metric ball (which normalizes
 * the ball kernels used for proposals) and a couple of ways to draw
 * uniform states.
 *
 * Spaces are immutable once constructed and are shared (read only)
 * between every run which uses them.
 */
class Space {
public:
  virtual ~Space(){};

  virtual std::string get_name() const = 0;

  virtual Eigen::Index dimension() const = 0;

  virtual double distance(const Eigen::VectorXd &x,
                          const Eigen::VectorXd &y) const = 0;

  /*
   * Volume of the ball of radius r, must be strictly increasing in r.
   */
  virtual double ball_volume(double radius) const = 0;

  virtual Eigen::MatrixXd sample_uniform(std::size_t n,
                                         std::default_random_engine &gen) const = 0;

  /*
   * A state drawn uniformly from the ball of `radius` around `center`.
   */
  virtual Eigen::VectorXd sample_ball(const Eigen::VectorXd &center,
                                      double radius,
                                      std::default_random_engine &gen) const = 0;

  /*
   * Maps a state which left the admissible region back into it,
   * spaces without a boundary leave states untouched.
   */
  virtual Eigen::VectorXd reflect(const Eigen::VectorXd &x) const { return x; }

  /*
   * D(i, j) = distance(xs.row(i), ys.row(j))
   */
  virtual Eigen::MatrixXd distance_matrix(const Eigen::MatrixXd &xs,
                                          const Eigen::MatrixXd &ys) const {
    Eigen::MatrixXd D(xs.rows(), ys.rows());
    for (Eigen::Index i = 0; i < xs.rows(); ++i) {
      const Eigen::VectorXd x = xs.row(i).transpose();
      for (Eigen::Index j = 0; j < ys.rows(); ++j) {
        D(i, j) = distance(x, ys.row(j).transpose());
      }
    }
    return D;
  }

  double log_ball_volume(double radius) const {
    return std::log(ball_volume(radius));
  }
};

/*
 * The usual R^D with the euclidean metric.  The box [lower, upper]^D
 * is where `sample_uniform` draws from and what `reflect` folds
 * states back into, it doesn't otherwise restrict the space.
 */
class EuclideanSpace : public Space {
public:
  explicit EuclideanSpace(Eigen::Index dimension, double lower = 0.,
                          double upper = 1.)
      : dimension_(dimension), lower_(lower), upper_(upper) {
    MONACO_CONFIG_CHECK(dimension_ > 0,
                        "EuclideanSpace: dimension must be positive.");
    MONACO_CONFIG_CHECK(std::isfinite(lower_) && std::isfinite(upper_) &&
                            lower_ < upper_,
                        "EuclideanSpace: expected finite lower < upper.");
  }

  std::string get_name() const override { return "euclidean_space"; }

  Eigen::Index dimension() const override { return dimension_; }

  double lower() const { return lower_; }

  double upper() const { return upper_; }

  double box_volume() const {
    return std::pow(upper_ - lower_, cast::to_double(dimension_));
  }

  bool contains(const Eigen::VectorXd &x) const {
    return (x.array() >= lower_).all() && (x.array() <= upper_).all();
  }

  double distance(const Eigen::VectorXd &x,
                  const Eigen::VectorXd &y) const override {
    return (x - y).norm();
  }

  Eigen::MatrixXd distance_matrix(const Eigen::MatrixXd &xs,
                                  const Eigen::MatrixXd &ys) const override {
    Eigen::MatrixXd D(xs.rows(), ys.rows());
    for (Eigen::Index i = 0; i < xs.rows(); ++i) {
      D.row(i) = (ys.rowwise() - xs.row(i)).rowwise().norm().transpose();
    }
    return D;
  }

  // pi^(D/2) / Gamma(D/2 + 1) * r^D
  double ball_volume(double radius) const override {
    const double d = cast::to_double(dimension_);
    return std::pow(M_PI, 0.5 * d) / std::tgamma(0.5 * d + 1.) *
           std::pow(radius, d);
  }

  Eigen::MatrixXd sample_uniform(std::size_t n,
                                 std::default_random_engine &gen) const override {
    Eigen::MatrixXd output(cast::to_index(n), dimension_);
    std::uniform_real_distribution<double> uniform(lower_, upper_);
    random_fill(output, uniform, gen);
    return output;
  }

  Eigen::VectorXd sample_ball(const Eigen::VectorXd &center, double radius,
                              std::default_random_engine &gen) const override {
    MONACO_ASSERT(center.size() == dimension_);
    // An isotropic gaussian gives a uniformly random direction, the
    // radial distribution of a uniform ball has cdf (s / r)^D.
    Eigen::VectorXd direction(dimension_);
    double norm = 0.;
    while (norm == 0.) {
      gaussian_fill(direction, 0., 1., gen);
      norm = direction.norm();
    }
    std::uniform_real_distribution<double> uniform(0., 1.);
    const double s =
        radius * std::pow(uniform(gen), 1. / cast::to_double(dimension_));
    return center + (s / norm) * direction;
  }

  Eigen::VectorXd reflect(const Eigen::VectorXd &x) const override {
    const double width = upper_ - lower_;
    Eigen::VectorXd output(x);
    for (Eigen::Index i = 0; i < output.size(); ++i) {
      if (!std::isfinite(output[i])) {
        continue;
      }
      double offset = std::fmod(output[i] - lower_, 2. * width);
      if (offset < 0.) {
        offset += 2. * width;
      }
      if (offset > width) {
        offset = 2. * width - offset;
      }
      output[i] = lower_ + offset;
    }
    return output;
  }

private:
  Eigen::Index dimension_;
  double lower_;
  double upper_;
};

} // namespace monaco

#endif /* MONACO_SRC_CORE_SPACE_HPP_ */
