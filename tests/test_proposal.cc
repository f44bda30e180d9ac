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

TEST(test_proposal, test_prior_weights_are_normalized) {
  const EuclideanSpace space(2);
  const BallProposal uniform(space, {0.01, 0.1});
  EXPECT_EQ(uniform.size(), 2);
  EXPECT_DOUBLE_EQ(uniform.get_prior_weights()[0], 0.5);
  EXPECT_DOUBLE_EQ(uniform.get_prior_weights()[1], 0.5);

  const BallProposal weighted(space, {0.01, 0.1, 1.}, {1., 3., 0.});
  EXPECT_DOUBLE_EQ(weighted.get_prior_weights()[1], 0.75);
  EXPECT_DOUBLE_EQ(weighted.get_prior_weights()[2], 0.);
  EXPECT_EQ(weighted.get_boundary(), BoundaryMode::none);
}

TEST(test_proposal, test_samples_stay_within_scale) {
  const EuclideanSpace space(2);
  const BallProposal proposal(space, {0.01, 0.1});
  std::default_random_engine gen(2012);

  const Eigen::MatrixXd xs = space.sample_uniform(500, gen);
  const auto moves = proposal.sample(xs, proposal.get_prior_weights(), gen);
  ASSERT_EQ(moves.size(), 500);
  std::size_t small = 0;
  for (Eigen::Index i = 0; i < xs.rows(); ++i) {
    const std::size_t k = moves.scale_indices[cast::to_size(i)];
    ASSERT_LT(k, 2);
    EXPECT_LE(space.distance(xs.row(i).transpose(),
                             moves.candidates.row(i).transpose()),
              proposal.get_scales()[cast::to_index(k)]);
    small += (k == 0) ? 1 : 0;
  }
  EXPECT_NEAR(cast::to_double(small) / 500., 0.5, 0.1);
}

TEST(test_proposal, test_reflected_samples_stay_in_box) {
  const EuclideanSpace space(2);
  const BallProposal proposal(space, {0.3}, BoundaryMode::reflect);
  std::default_random_engine gen(2012);
  Eigen::VectorXd corner = Eigen::VectorXd::Zero(2);
  for (std::size_t i = 0; i < 200; ++i) {
    const Eigen::VectorXd y = proposal.sample(corner, 0, gen);
    EXPECT_TRUE(space.contains(y));
    EXPECT_LE(space.distance(corner, y), 0.3);
  }
}

TEST(test_proposal, test_log_density) {
  const EuclideanSpace space(2);
  const BallProposal proposal(space, {0.1, 0.2});
  const Eigen::VectorXd weights = proposal.get_prior_weights();

  const double inner = 0.5 / (M_PI * 0.01) + 0.5 / (M_PI * 0.04);
  EXPECT_NEAR(proposal.log_density(0., weights), std::log(inner), 1e-10);
  EXPECT_NEAR(proposal.log_density(0.05, weights), std::log(inner), 1e-10);
  EXPECT_NEAR(proposal.log_density(0.15, weights),
              std::log(0.5 / (M_PI * 0.04)), 1e-10);
  EXPECT_EQ(proposal.log_density(0.25, weights), -HUGE_VAL);
}

TEST(test_proposal, test_kernel_integrates_to_one) {
  const EuclideanSpace space(2, -0.35, 0.35);
  const BallProposal proposal(space, {0.1, 0.3});
  const Eigen::VectorXd weights = proposal.get_prior_weights();
  std::default_random_engine gen(2012);

  const Eigen::VectorXd origin = Eigen::VectorXd::Zero(2);
  const std::size_t n = 40000;
  const Eigen::MatrixXd points = space.sample_uniform(n, gen);
  double total = 0.;
  for (Eigen::Index i = 0; i < points.rows(); ++i) {
    total += std::exp(
        proposal.log_density(origin, points.row(i).transpose(), weights));
  }
  EXPECT_NEAR(total / cast::to_double(n) * space.box_volume(), 1., 0.05);
}

TEST(test_proposal, test_log_density_ratio) {
  const EuclideanSpace space(2);
  const BallProposal proposal(space, {0.1, 0.2});
  Eigen::VectorXd x(2);
  x << 0.5, 0.5;
  Eigen::VectorXd y(2);
  y << 0.55, 0.5;

  const Eigen::VectorXd shared = proposal.get_prior_weights();
  EXPECT_DOUBLE_EQ(proposal.log_density_ratio(x, y, shared, shared), 0.);

  Eigen::VectorXd forward(2);
  forward << 0.9, 0.1;
  Eigen::VectorXd backward(2);
  backward << 0.2, 0.8;
  const double expected = proposal.log_density(y, x, backward) -
                          proposal.log_density(x, y, forward);
  EXPECT_NEAR(proposal.log_density_ratio(x, y, forward, backward), expected,
              1e-12);
  EXPECT_NE(expected, 0.);

  // Only the large scale reaches this far and it has no weight in the
  // reverse direction.
  Eigen::VectorXd small_only(2);
  small_only << 1., 0.;
  Eigen::VectorXd far(2);
  far << 0.65, 0.5;
  EXPECT_EQ(proposal.log_density_ratio(x, far, shared, small_only), -HUGE_VAL);
}

TEST(test_proposal, test_kernel_matrix) {
  const EuclideanSpace space(2);
  const BallProposal proposal(space, {0.05, 0.2});
  std::default_random_engine gen(2012);
  const Eigen::MatrixXd xs = space.sample_uniform(30, gen);
  const Eigen::VectorXd weights = proposal.get_prior_weights();

  const Eigen::MatrixXd K = proposal.kernel_matrix(xs, xs, weights);
  ASSERT_EQ(K.rows(), 30);
  ASSERT_EQ(K.cols(), 30);
  EXPECT_LT((K - K.transpose()).norm(), 1e-8);
  for (Eigen::Index i = 0; i < K.rows(); ++i) {
    for (Eigen::Index j = 0; j < K.cols(); ++j) {
      EXPECT_NEAR(K(i, j),
                  std::exp(proposal.log_density(xs.row(i).transpose(),
                                                xs.row(j).transpose(), weights)),
                  1e-8 * K(i, i));
    }
  }
}

TEST(test_proposal, test_reweight_scales_fixed_point) {
  const EuclideanSpace space(2);
  const BallProposal proposal(space, {0.001, 0.01, 0.1, 1.});
  Eigen::VectorXd weights(4);
  weights << 0.1, 0.2, 0.3, 0.4;
  const Eigen::VectorXd feedback = Eigen::VectorXd::Constant(4, 0.37);

  const Eigen::VectorXd updated = proposal.reweight_scales(weights, feedback);
  EXPECT_LT((updated - weights).norm(), 1e-12);

  const Eigen::VectorXd floored =
      proposal.reweight_scales(weights, feedback, 2., 1e-3);
  EXPECT_LT((floored - weights).norm(), 1e-12);
}

TEST(test_proposal, test_reweight_scales_favors_better_scales) {
  const EuclideanSpace space(2);
  const BallProposal proposal(space, {0.01, 0.1, 0.3});
  const Eigen::VectorXd weights = proposal.get_prior_weights();
  Eigen::VectorXd feedback(3);
  feedback << 0., 2., 1.;

  const Eigen::VectorXd updated =
      proposal.reweight_scales(weights, feedback, 1., 0.01);
  EXPECT_NEAR(updated.sum(), 1., 1e-12);
  EXPECT_GT(updated[0], 0.);
  EXPECT_GT(updated[1], updated[2]);
  EXPECT_GT(updated[2], updated[0]);

  // Without a floor a scale with no feedback at all is abandoned.
  const Eigen::VectorXd unfloored =
      proposal.reweight_scales(weights, feedback, 1., 0.);
  EXPECT_EQ(unfloored[0], 0.);
  EXPECT_NEAR(unfloored.sum(), 1., 1e-12);
}

TEST(test_proposal, test_reweight_scales_unobserved_scale) {
  const EuclideanSpace space(2);
  const BallProposal proposal(space, {0.01, 0.1, 0.3});
  const Eigen::VectorXd weights = proposal.get_prior_weights();
  Eigen::VectorXd feedback(3);
  feedback << std::numeric_limits<double>::quiet_NaN(), 1., 1.;

  const Eigen::VectorXd updated = proposal.reweight_scales(weights, feedback);
  EXPECT_LT((updated - weights).norm(), 1e-12);

  feedback << std::numeric_limits<double>::quiet_NaN(), 0., 0.;
  EXPECT_LT((proposal.reweight_scales(weights, feedback) - weights).norm(),
            1e-12);
}

TEST(test_proposal, test_invalid_proposals) {
  const EuclideanSpace space(2);
  EXPECT_THROW(BallProposal(space, std::vector<double>()), ConfigurationError);
  EXPECT_THROW(BallProposal(space, {0.1, -0.1}), ConfigurationError);
  EXPECT_THROW(BallProposal(space, {0.1, 0.2}, {1.}), ConfigurationError);
  EXPECT_THROW(BallProposal(space, {0.1, 0.2}, {0., 0.}), ConfigurationError);
}

} // namespace monaco
