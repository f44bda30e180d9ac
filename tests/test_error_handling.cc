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

#include "test_utils.h"

namespace monaco {

bool add_one(int *x) {
  (*x) += 1;
  return true;
}

TEST(test_error_handling, test_assert_evaluates) {
  int x = 0;
  MONACO_ASSERT(add_one(&x));
  EXPECT_EQ(x, 1);
}

TEST(test_error_handling, test_configuration_error_is_invalid_argument) {
  EXPECT_THROW(EuclideanSpace(0), std::invalid_argument);
  try {
    EuclideanSpace(2, 1., 0.);
    FAIL() << "expected a ConfigurationError";
  } catch (const ConfigurationError &error) {
    EXPECT_FALSE(std::string(error.what()).empty());
  }
}

TEST(test_error_handling, test_invalid_space_and_targets) {
  EXPECT_THROW(EuclideanSpace(-1), ConfigurationError);
  EXPECT_THROW(EuclideanSpace(2, 0., 0.), ConfigurationError);
  EXPECT_THROW(EuclideanSpace(2, 0., HUGE_VAL), ConfigurationError);

  const Eigen::MatrixXd means = Eigen::MatrixXd::Constant(2, 2, 0.5);
  const Eigen::VectorXd ones = Eigen::VectorXd::Ones(2);
  EXPECT_THROW(GaussianMixture(Eigen::MatrixXd(0, 2), Eigen::VectorXd(0),
                               Eigen::VectorXd(0)),
               ConfigurationError);
  EXPECT_THROW(GaussianMixture(means, Eigen::VectorXd::Ones(3), ones),
               ConfigurationError);
  EXPECT_THROW(GaussianMixture(means, Eigen::VectorXd::Zero(2), ones),
               ConfigurationError);
  EXPECT_THROW(GaussianMixture(means, ones, -ones), ConfigurationError);

  EXPECT_THROW(UnitPotential(0, [](const Eigen::VectorXd &) { return 0.; }),
               ConfigurationError);
  EXPECT_THROW(UnitPotential(2, UnitPotential::PotentialFunction()),
               ConfigurationError);
}

TEST(test_error_handling, test_invalid_proposals_and_schedules) {
  const EuclideanSpace space(2);
  EXPECT_THROW(BallProposal(space, std::vector<double>()),
               ConfigurationError);
  EXPECT_THROW(BallProposal(space, {0.1, -0.1}), ConfigurationError);
  EXPECT_THROW(BallProposal(space, {0.1, 0.2}, {1.}), ConfigurationError);
  EXPECT_THROW(BallProposal(space, {0.1, 0.2}, {0., 0.}), ConfigurationError);

  EXPECT_THROW(AnnealingSchedule::geometric(3, 0.), ConfigurationError);
  EXPECT_THROW(AnnealingSchedule::from_betas({0.5, 0.2}), ConfigurationError);
  EXPECT_THROW(AnnealingSchedule::from_betas({0.5, 1.5}), ConfigurationError);
}

TEST(test_error_handling, test_invalid_sampler_options) {
  const EuclideanSpace space(2);
  const BallProposal proposal(space, {0.01, 0.1, 0.3});
  std::default_random_engine gen(3);
  const Eigen::MatrixXd start = space.sample_uniform(5, gen);

  EXPECT_THROW(PMH(space, Eigen::MatrixXd(0, 2), proposal),
               ConfigurationError);
  EXPECT_THROW(PMH(space, Eigen::MatrixXd::Constant(5, 3, 0.5), proposal),
               ConfigurationError);
  EXPECT_THROW(PMH(EuclideanSpace(3), Eigen::MatrixXd::Constant(5, 3, 0.5),
                   proposal),
               ConfigurationError);

  KidsOptions kids;
  kids.iterations = 0;
  EXPECT_THROW(KidsCMC(space, start, proposal, 0, kids), ConfigurationError);

  MokaOptions moka;
  moka.scale_weight_floor = 0.5;
  EXPECT_THROW(MokaCMC(space, start, proposal, 0, moka), ConfigurationError);
  moka = MokaOptions();
  moka.adaptation_rate = -1.;
  EXPECT_THROW(MokaCMC(space, start, proposal, 0, moka), ConfigurationError);

  const auto q0 = UniformDensity(space);
  NpaisOptions npais;
  npais.population_size = 0;
  EXPECT_THROW(NPAIS(space, proposal, 0, q0, npais), ConfigurationError);
  npais = NpaisOptions();
  npais.q0_weight = 1.;
  EXPECT_THROW(NPAIS(space, proposal, 0, q0, npais), ConfigurationError);
  npais.q0_weight = 0.;
  EXPECT_THROW(NPAIS(space, proposal, 0, q0, npais), ConfigurationError);

  const UnitPotential no_sampler(2,
                                 [](const Eigen::VectorXd &) { return 0.; });
  EXPECT_THROW(NPAIS(space, proposal, 0, no_sampler, NpaisOptions()),
               ConfigurationError);
}

TEST(test_error_handling, test_invalid_run_requests) {
  const EuclideanSpace space(2);
  const BallProposal proposal(space, {0.1});
  std::default_random_engine gen(3);
  const Eigen::MatrixXd start = space.sample_uniform(5, gen);

  CMC sampler(space, start, proposal);
  EXPECT_FALSE(sampler.is_fit());
  EXPECT_THROW(sampler.run(2, gen), ConfigurationError);
  EXPECT_THROW(run_in_parallel(sampler, 2, 2, gen), ConfigurationError);

  sampler.fit(make_centered_gaussian(2));
  EXPECT_THROW(sampler.advance(2, gen), ConfigurationError);
  EXPECT_THROW(sampler.run(0, gen), ConfigurationError);
  EXPECT_THROW(sampler.run(2, 0, gen), ConfigurationError);
  EXPECT_NO_THROW(sampler.run(2, gen));
  EXPECT_NO_THROW(sampler.advance(1, gen));
  EXPECT_EQ(sampler.get_history().size(), 4);
}

} // namespace monaco
