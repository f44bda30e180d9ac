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

#ifndef MONACO_SRC_SAMPLERS_REPEATED_HPP_
#define MONACO_SRC_SAMPLERS_REPEATED_HPP_

namespace monaco {

/*
 * Performs `repetitions` independent runs of a fit sampler, each in
 * its own thread with its own copy of the sampler.  Seeds are drawn
 * from `gen` up front in the same way the sequential
 * PopulationSampler::run does, so both produce identical histories.
 */
template <typename SamplerType>
inline std::vector<RunHistory>
run_in_parallel(const SamplerType &sampler, std::size_t iterations,
                std::size_t repetitions, std::default_random_engine &gen) {
  MONACO_CONFIG_CHECK(sampler.is_fit(),
                      "the sampler must be fit before it is run.");
  MONACO_CONFIG_CHECK(iterations > 0, "expected at least one iteration.");
  MONACO_CONFIG_CHECK(repetitions > 0, "expected at least one repetition.");

  std::vector<std::default_random_engine::result_type> seeds;
  for (std::size_t i = 0; i < repetitions; ++i) {
    seeds.push_back(gen());
  }

  auto run_one = [&sampler, iterations](
                     std::default_random_engine::result_type seed) {
    SamplerType copy(sampler);
    std::default_random_engine run_gen(seed);
    return copy.run(iterations, run_gen);
  };

  return async_apply(seeds, run_one);
}

/*
 * The records of every run at a given iteration.
 */
inline std::vector<IterationRecord>
records_at(const std::vector<RunHistory> &histories, std::size_t iteration) {
  std::vector<IterationRecord> output;
  for (const auto &history : histories) {
    output.push_back(history.at(iteration));
  }
  return output;
}

} // namespace monaco

#endif /* MONACO_SRC_SAMPLERS_REPEATED_HPP_ */
