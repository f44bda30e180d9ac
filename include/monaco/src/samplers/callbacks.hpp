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

#ifndef MONACO_SRC_SAMPLERS_CALLBACKS_HPP_
#define MONACO_SRC_SAMPLERS_CALLBACKS_HPP_

namespace monaco {

struct NullCallback {
  void operator()(const IterationRecord &){};
};

inline std::vector<std::string>
get_sampler_csv_columns(const IterationRecord &example) {
  std::vector<std::string> columns;
  columns.push_back("iteration");
  columns.push_back("particle");
  columns.push_back("weight");
  const auto coordinates = coordinate_columns(example.positions.cols());
  columns.insert(columns.end(), coordinates.begin(), coordinates.end());
  return columns;
}

inline void write_iteration_record(std::ostream &stream,
                                   const IterationRecord &record,
                                   const std::vector<std::string> &columns) {
  const auto coordinates = coordinate_columns(record.positions.cols());
  for (Eigen::Index i = 0; i < record.positions.rows(); ++i) {
    std::map<std::string, std::string> row;
    row["iteration"] = std::to_string(record.iteration);
    row["particle"] = std::to_string(i);
    row["weight"] = std::to_string(record.weights[i]);
    for (std::size_t d = 0; d < coordinates.size(); ++d) {
      row[coordinates[d]] =
          std::to_string(record.positions(i, cast::to_index(d)));
    }
    write_row(stream, row, columns);
  }
}

/*
 * Writes one line of diagnostics per iteration.
 */
struct ProgressLoggingCallback {

  explicit ProgressLoggingCallback(std::ostream &stream_ = std::cout)
      : stream(&stream_){};

  void operator()(const IterationRecord &record) {
    (*stream) << "iteration: " << record.iteration << " beta: " << record.beta
              << " acceptance: " << record.acceptance_rate
              << " ess: " << record.effective_sample_size;
    if (record.memory_size > 0) {
      (*stream) << " memory: " << record.memory_size;
    }
    if (record.rejected > 0 || record.clamped > 0) {
      (*stream) << " rejected: " << record.rejected
                << " clamped: " << record.clamped;
    }
    (*stream) << std::endl;
  }

  std::ostream *stream;
};

struct CsvWritingCallback {

  explicit CsvWritingCallback(std::shared_ptr<std::ostream> &stream_)
      : stream(stream_), columns(){};

  explicit CsvWritingCallback(std::shared_ptr<std::ostream> &&stream_)
      : stream(std::move(stream_)), columns(){};

  void operator()(const IterationRecord &record) {
    if (columns.empty()) {
      columns = get_sampler_csv_columns(record);
      write_header(*stream, columns);
    }
    write_iteration_record(*stream, record, columns);
  }

  std::shared_ptr<std::ostream> stream;
  std::vector<std::string> columns;
};

inline CsvWritingCallback get_csv_writing_callback(const std::string &path) {
  return CsvWritingCallback(std::make_shared<std::ofstream>(path));
}

inline CsvWritingCallback
get_csv_writing_callback(std::shared_ptr<std::ostream> &stream) {
  return CsvWritingCallback(stream);
}

} // namespace monaco

#endif /* MONACO_SRC_SAMPLERS_CALLBACKS_HPP_ */
