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

#include <gtest/gtest.h>

#include <monaco/Core>

namespace monaco {

TEST(test_space, test_euclidean_distance) {
  const EuclideanSpace space(2);
  Eigen::VectorXd x(2);
  x << 0., 0.;
  Eigen::VectorXd y(2);
  y << 3., 4.;
  EXPECT_DOUBLE_EQ(space.distance(x, y), 5.);
  EXPECT_DOUBLE_EQ(space.distance(y, x), 5.);
  EXPECT_DOUBLE_EQ(space.distance(x, x), 0.);
}

TEST(test_space, test_ball_volume) {
  EXPECT_NEAR(EuclideanSpace(1).ball_volume(0.5), 1., 1e-12);
  EXPECT_NEAR(EuclideanSpace(2).ball_volume(1.), M_PI, 1e-12);
  EXPECT_NEAR(EuclideanSpace(3).ball_volume(2.), 4. / 3. * M_PI * 8., 1e-10);

  const EuclideanSpace space(5);
  EXPECT_LT(space.ball_volume(0.1), space.ball_volume(0.2));
  EXPECT_NEAR(space.log_ball_volume(0.3), std::log(space.ball_volume(0.3)),
              1e-12);
}

TEST(test_space, test_distance_matrix) {
  const EuclideanSpace space(3);
  std::default_random_engine gen(2012);
  const Eigen::MatrixXd xs = space.sample_uniform(5, gen);
  const Eigen::MatrixXd ys = space.sample_uniform(7, gen);

  const Eigen::MatrixXd D = space.distance_matrix(xs, ys);
  ASSERT_EQ(D.rows(), 5);
  ASSERT_EQ(D.cols(), 7);
  for (Eigen::Index i = 0; i < xs.rows(); ++i) {
    for (Eigen::Index j = 0; j < ys.rows(); ++j) {
      EXPECT_NEAR(D(i, j),
                  space.distance(xs.row(i).transpose(), ys.row(j).transpose()),
                  1e-12);
    }
  }
}

TEST(test_space, test_sample_uniform_in_box) {
  const EuclideanSpace space(2, -1., 3.);
  std::default_random_engine gen(2012);
  const Eigen::MatrixXd samples = space.sample_uniform(1000, gen);
  EXPECT_EQ(samples.rows(), 1000);
  EXPECT_EQ(samples.cols(), 2);
  EXPECT_GE(samples.minCoeff(), -1.);
  EXPECT_LE(samples.maxCoeff(), 3.);
  EXPECT_NEAR(samples.mean(), 1., 0.1);
  EXPECT_DOUBLE_EQ(space.box_volume(), 16.);
}

TEST(test_space, test_sample_ball) {
  const EuclideanSpace space(3);
  std::default_random_engine gen(2012);
  const Eigen::VectorXd center = Eigen::VectorXd::Constant(3, 0.5);
  const double radius = 0.2;

  const std::size_t n = 5000;
  Eigen::VectorXd mean = Eigen::VectorXd::Zero(3);
  std::size_t inner = 0;
  for (std::size_t i = 0; i < n; ++i) {
    const Eigen::VectorXd y = space.sample_ball(center, radius, gen);
    const double d = space.distance(center, y);
    EXPECT_LE(d, radius);
    if (d <= 0.5 * radius) {
      ++inner;
    }
    mean += y / cast::to_double(n);
  }
  EXPECT_LT((mean - center).norm(), 0.01);
  // A uniform ball holds (1/2)^D of its volume within half the radius.
  EXPECT_NEAR(cast::to_double(inner) / cast::to_double(n), 0.125, 0.02);
}

TEST(test_space, test_reflect) {
  const EuclideanSpace space(2);
  Eigen::VectorXd x(2);
  x << 1.2, -0.1;
  const Eigen::VectorXd reflected = space.reflect(x);
  EXPECT_NEAR(reflected[0], 0.8, 1e-12);
  EXPECT_NEAR(reflected[1], 0.1, 1e-12);

  Eigen::VectorXd inside(2);
  inside << 0.3, 0.7;
  EXPECT_EQ(space.reflect(inside), inside);
  EXPECT_TRUE(space.contains(reflected));
}

TEST(test_space, test_gaussian_mixture_potential) {
  Eigen::MatrixXd means(1, 2);
  means << 0.5, 0.5;
  const double sd = 0.1;
  const GaussianMixture target(means, Eigen::VectorXd::Constant(1, sd),
                               Eigen::VectorXd::Constant(1, 3.));
  EXPECT_DOUBLE_EQ(target.get_weights()[0], 1.);

  Eigen::MatrixXd points(2, 2);
  points << 0.5, 0.5, 0.6, 0.5;
  const Eigen::VectorXd potentials = target.potential(points);
  const double log_normalizer = std::log(2. * M_PI * sd * sd);
  EXPECT_NEAR(potentials[0], log_normalizer, 1e-10);
  EXPECT_NEAR(potentials[1], log_normalizer + 0.5, 1e-10);
}

TEST(test_space, test_gaussian_mixture_sample) {
  Eigen::MatrixXd means(2, 1);
  means << 0., 10.;
  const GaussianMixture target(means, Eigen::VectorXd::Constant(2, 1.),
                               Eigen::VectorXd::Ones(2));
  std::default_random_engine gen(2012);
  const Eigen::MatrixXd samples = target.sample(4000, gen);
  EXPECT_TRUE(target.has_sampler());
  EXPECT_NEAR(samples.mean(), 5., 0.3);
  const double fraction_high =
      (samples.array() > 5.).cast<double>().mean();
  EXPECT_NEAR(fraction_high, 0.5, 0.05);
}

TEST(test_space, test_unit_potential) {
  const UnitPotential target(
      2, [](const Eigen::VectorXd &x) { return x.squaredNorm(); });
  Eigen::MatrixXd points(3, 2);
  points << 0.5, 0.5, 1.5, 0.5, 0., 1.;
  const Eigen::VectorXd potentials = target.potential(points);
  EXPECT_DOUBLE_EQ(potentials[0], 0.5);
  EXPECT_EQ(potentials[1], HUGE_VAL);
  EXPECT_DOUBLE_EQ(potentials[2], 1.);
  EXPECT_FALSE(target.has_sampler());
}

TEST(test_space, test_uniform_density) {
  const EuclideanSpace space(2, 0., 2.);
  const UniformDensity density(space);
  Eigen::MatrixXd points(2, 2);
  points << 1., 1., 3., 1.;
  const Eigen::VectorXd potentials = density.potential(points);
  // exp(-V) = 1 / 4 inside the box.
  EXPECT_NEAR(potentials[0], std::log(4.), 1e-12);
  EXPECT_EQ(potentials[1], HUGE_VAL);

  std::default_random_engine gen(2012);
  const Eigen::MatrixXd samples = density.sample(100, gen);
  EXPECT_EQ(samples.rows(), 100);
  EXPECT_TRUE(density.potential(samples).allFinite());
}

} // namespace monaco
