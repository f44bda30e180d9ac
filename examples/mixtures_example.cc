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

#include <gflags/gflags.h>
#include <fstream>
#include <iostream>

#include <monaco/Core>
#include <monaco/Samplers>
#include <monaco/Stats>

DEFINE_int32(dimension, 2, "dimension of the unit cube.");
DEFINE_int32(components, 4, "number of gaussian components in the target.");
DEFINE_int32(n, 200, "number of particles.");
DEFINE_int32(iterations, 20, "number of iterations after initialization.");
DEFINE_int32(annealing, 5, "length of the linear annealing schedule.");
DEFINE_int32(kids_iterations, 30, "deconvolution iterations per step.");
DEFINE_int32(runs, 1, "number of independent runs of each sampler.");
DEFINE_int32(seed, 2012, "seed of the random number generator.");
DEFINE_string(algorithm, "all",
              "pmh, cmc, moka_cmc, kids_cmc, moka_kids_cmc, npais or all.");
DEFINE_string(output, "", "prefix of the csv files samples are written to.");

namespace monaco {

GaussianMixture random_mixture(Eigen::Index dimension, Eigen::Index components,
                               std::default_random_engine &gen) {
  std::uniform_real_distribution<double> location(0.2, 0.8);
  std::uniform_real_distribution<double> spread(0.02, 0.05);
  std::uniform_real_distribution<double> mass(0.5, 1.);

  Eigen::MatrixXd means(components, dimension);
  random_fill(means, location, gen);
  Eigen::VectorXd deviations(components);
  random_fill(deviations, spread, gen);
  Eigen::VectorXd weights(components);
  random_fill(weights, mass, gen);
  return GaussianMixture(means, deviations, weights);
}

template <typename SamplerType>
void run_sampler(SamplerType &sampler, const GaussianMixture &target,
                 std::default_random_engine &gen) {
  sampler.fit(target);
  const std::size_t iterations = static_cast<std::size_t>(FLAGS_iterations);
  const std::string name = sampler.get_name();

  std::cout << "==================" << std::endl;
  std::cout << name << std::endl;

  std::vector<RunHistory> histories;
  if (FLAGS_runs > 1) {
    histories = run_in_parallel(sampler, iterations,
                                static_cast<std::size_t>(FLAGS_runs), gen);
    for (std::size_t t = 0; t <= iterations; ++t) {
      std::cout << "iteration: " << t << " mean ess: "
                << mean_effective_sample_size(records_at(histories, t))
                << std::endl;
    }
  } else {
    ProgressLoggingCallback progress(std::cout);
    if (FLAGS_output.empty()) {
      histories.push_back(sampler.run(iterations, gen, progress));
    } else {
      auto csv = get_csv_writing_callback(FLAGS_output + name + ".csv");
      auto callback = [&](const IterationRecord &record) {
        progress(record);
        csv(record);
      };
      histories.push_back(sampler.run(iterations, gen, callback));
    }
  }

  const auto &space = sampler.get_space();
  for (Eigen::Index k = 0; k < target.get_means().rows(); ++k) {
    const Eigen::VectorXd center = target.get_means().row(k).transpose();
    std::cout << "  mass near mode " << k << " (expected "
              << target.get_weights()[k] << "): "
              << mass_within(space, histories.back().back(), center,
                             3. * target.get_deviations()[k])
              << std::endl;
  }
}

} // namespace monaco

int main(int argc, char *argv[]) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  using namespace monaco;

  const auto dimension = static_cast<Eigen::Index>(FLAGS_dimension);
  const auto n = static_cast<std::size_t>(FLAGS_n);
  const auto annealing = static_cast<std::size_t>(FLAGS_annealing);

  std::default_random_engine gen(static_cast<unsigned>(FLAGS_seed));

  std::cout << "Defining the target." << std::endl;
  const auto target = random_mixture(
      dimension, static_cast<Eigen::Index>(FLAGS_components), gen);

  const EuclideanSpace space(dimension);
  const BallProposal proposal(space, {0.001, 0.003, 0.01, 0.03, 0.1, 0.3},
                              BoundaryMode::reflect);
  const Eigen::MatrixXd start = space.sample_uniform(n, gen);

  KidsOptions kids;
  kids.iterations = static_cast<std::size_t>(FLAGS_kids_iterations);

  const std::string &algorithm = FLAGS_algorithm;
  const bool all = algorithm == "all";

  if (all || algorithm == "pmh") {
    ParallelMetropolisHastings sampler(space, start, proposal, annealing);
    run_sampler(sampler, target, gen);
  }
  if (all || algorithm == "cmc") {
    CMC sampler(space, start, proposal, annealing);
    run_sampler(sampler, target, gen);
  }
  if (all || algorithm == "moka_cmc") {
    MokaCMC sampler(space, start, proposal, annealing);
    run_sampler(sampler, target, gen);
  }
  if (all || algorithm == "kids_cmc") {
    KidsCMC sampler(space, start, proposal, annealing, kids);
    run_sampler(sampler, target, gen);
  }
  if (all || algorithm == "moka_kids_cmc") {
    MokaKidsCMC sampler(space, start, proposal, annealing, MokaOptions(), kids);
    run_sampler(sampler, target, gen);
  }
  if (all || algorithm == "npais") {
    NpaisOptions options;
    options.population_size = n;
    NPAIS sampler(space, proposal, annealing, UniformDensity(space), options);
    run_sampler(sampler, target, gen);
  }
}
