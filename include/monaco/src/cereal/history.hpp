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

#ifndef MONACO_SRC_CEREAL_HISTORY_HPP_
#define MONACO_SRC_CEREAL_HISTORY_HPP_

namespace cereal {

template <class Archive>
inline void serialize(Archive &archive, monaco::IterationRecord &record,
                      const std::uint32_t) {
  archive(cereal::make_nvp("iteration", record.iteration));
  archive(cereal::make_nvp("beta", record.beta));
  archive(cereal::make_nvp("positions", record.positions));
  archive(cereal::make_nvp("weights", record.weights));
  archive(cereal::make_nvp("scale_weights", record.scale_weights));
  archive(cereal::make_nvp("acceptance_rate", record.acceptance_rate));
  archive(cereal::make_nvp("effective_sample_size",
                           record.effective_sample_size));
  archive(cereal::make_nvp("importance_ess", record.importance_ess));
  archive(cereal::make_nvp("rejected", record.rejected));
  archive(cereal::make_nvp("clamped", record.clamped));
  archive(cereal::make_nvp("memory_size", record.memory_size));
  archive(cereal::make_nvp("resampled", record.resampled));
}

template <class Archive>
inline void save(Archive &archive, const monaco::RunHistory &history,
                 const std::uint32_t) {
  archive(cereal::make_nvp("records", history.records()));
}

template <class Archive>
inline void load(Archive &archive, monaco::RunHistory &history,
                 const std::uint32_t) {
  std::vector<monaco::IterationRecord> records;
  archive(cereal::make_nvp("records", records));
  history = monaco::RunHistory();
  for (const auto &record : records) {
    history.append(record);
  }
}

template <class Archive>
inline void save(Archive &archive, const monaco::AnnealingSchedule &schedule,
                 const std::uint32_t) {
  archive(cereal::make_nvp("betas", schedule.betas()));
}

template <class Archive>
inline void load(Archive &archive, monaco::AnnealingSchedule &schedule,
                 const std::uint32_t) {
  std::vector<double> betas;
  archive(cereal::make_nvp("betas", betas));
  schedule = monaco::AnnealingSchedule::from_betas(betas);
}

} // namespace cereal

#endif /* MONACO_SRC_CEREAL_HISTORY_HPP_ */
