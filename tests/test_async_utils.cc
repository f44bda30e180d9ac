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

#include <mutex>
#include <numeric>

namespace monaco {

TEST(test_async_utils, test_async_apply_preserves_order) {
  std::vector<int> xs = {0, 1, 2, 3, 4, 5};

  std::mutex mu;
  std::vector<int> processed;

  auto square = [&](const int x) {
    std::lock_guard<std::mutex> lock(mu);
    processed.push_back(x);
    return x * x;
  };

  const auto squares = async_apply(xs, square);
  ASSERT_EQ(squares.size(), xs.size());
  for (std::size_t i = 0; i < xs.size(); ++i) {
    EXPECT_EQ(squares[i], xs[i] * xs[i]);
  }
  std::sort(processed.begin(), processed.end());
  EXPECT_EQ(processed, xs);
}

TEST(test_async_utils, test_run_in_parallel_matches_sequential) {
  const EuclideanSpace space(2);
  const BallProposal proposal(space, {0.01, 0.1, 0.3});
  std::default_random_engine gen(7);
  const Eigen::MatrixXd start = space.sample_uniform(20, gen);

  MokaKidsCMC sampler(space, start, proposal, 3);
  sampler.fit(make_centered_gaussian(2));

  std::default_random_engine sequential_gen(42);
  const auto sequential = sampler.run(5, 4, sequential_gen);

  std::default_random_engine parallel_gen(42);
  const auto parallel = run_in_parallel(sampler, 5, 4, parallel_gen);

  ASSERT_EQ(parallel.size(), 4);
  for (std::size_t i = 0; i < parallel.size(); ++i) {
    EXPECT_EQ(parallel[i], sequential[i]);
  }
  // Independent runs shouldn't coincide.
  EXPECT_FALSE(parallel[0] == parallel[1]);

  const auto records = records_at(parallel, 5);
  ASSERT_EQ(records.size(), 4);
  for (const auto &record : records) {
    EXPECT_EQ(record.iteration, 5);
  }
  EXPECT_GT(mean_effective_sample_size(records), 0.);
}

} // namespace monaco
