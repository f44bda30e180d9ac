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

TEST(test_annealing, test_no_annealing) {
  const AnnealingSchedule schedule;
  EXPECT_EQ(schedule.length(), 0);
  for (std::size_t t = 0; t < 10; ++t) {
    EXPECT_EQ(schedule.beta(t), 1.);
    EXPECT_FALSE(schedule.is_annealed(t));
  }
}

TEST(test_annealing, test_linear_schedule) {
  const std::size_t length = 5;
  const AnnealingSchedule schedule(length);
  EXPECT_EQ(schedule.length(), length);
  EXPECT_LT(schedule.beta(0), 1.);
  EXPECT_GT(schedule.beta(0), 0.);
  EXPECT_DOUBLE_EQ(schedule.beta(0), 1. / 6.);
  EXPECT_DOUBLE_EQ(schedule.beta(4), 5. / 6.);

  for (std::size_t t = 1; t < 20; ++t) {
    EXPECT_GE(schedule.beta(t), schedule.beta(t - 1));
  }
  for (std::size_t t = length; t < 20; ++t) {
    EXPECT_EQ(schedule.beta(t), 1.);
    EXPECT_FALSE(schedule.is_annealed(t));
  }
  EXPECT_TRUE(schedule.is_annealed(length - 1));
}

TEST(test_annealing, test_geometric_schedule) {
  const std::size_t length = 4;
  const auto schedule = AnnealingSchedule::geometric(length, 0.01);
  EXPECT_DOUBLE_EQ(schedule.beta(0), 0.01);
  for (std::size_t t = 1; t < 10; ++t) {
    EXPECT_GE(schedule.beta(t), schedule.beta(t - 1));
  }
  EXPECT_LT(schedule.beta(length - 1), 1.);
  EXPECT_EQ(schedule.beta(length), 1.);
  // Constant ratio between consecutive steps.
  EXPECT_NEAR(schedule.beta(2) / schedule.beta(1),
              schedule.beta(1) / schedule.beta(0), 1e-12);
}

TEST(test_annealing, test_from_betas) {
  const auto schedule = AnnealingSchedule::from_betas({0.1, 0.1, 0.5});
  EXPECT_EQ(schedule.length(), 3);
  EXPECT_EQ(schedule.beta(1), 0.1);
  EXPECT_EQ(schedule.beta(3), 1.);
  EXPECT_EQ(schedule, AnnealingSchedule::from_betas(schedule.betas()));
  EXPECT_FALSE(schedule == AnnealingSchedule(3));
}

TEST(test_annealing, test_invalid_schedules) {
  EXPECT_THROW(AnnealingSchedule::from_betas({0.5, 0.3}), ConfigurationError);
  EXPECT_THROW(AnnealingSchedule::from_betas({0.}), ConfigurationError);
  EXPECT_THROW(AnnealingSchedule::from_betas({1.5}), ConfigurationError);
  EXPECT_THROW(AnnealingSchedule::geometric(3, 0.), ConfigurationError);
  EXPECT_THROW(AnnealingSchedule::geometric(3, 1.), ConfigurationError);
}

} // namespace monaco
