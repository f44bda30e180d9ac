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

#ifndef MONACO_SRC_UTILS_CSV_UTILS_HPP_
#define MONACO_SRC_UTILS_CSV_UTILS_HPP_

/*
 * Minimal tools for dumping populations to CSV so they can be
 * inspected (or plotted) with external tools.
 */

namespace monaco {

/*
 * This helper function makes it easier to use range based
 * for loops that append a delimeter which can be followed
 * by this function to turn the last delimeter into a new line
 */
inline void replace_last_character_with_newline(std::ostream &stream) {
  stream.seekp(-1, std::ios_base::end);
  stream << std::endl;
}

inline void write_row(std::ostream &stream,
                      const std::map<std::string, std::string> &row,
                      const std::vector<std::string> &columns) {
  for (const auto &col : columns) {
    const auto iter = row.find(col);
    if (iter != row.end()) {
      stream << iter->second;
    }
    stream << ",";
  }
  replace_last_character_with_newline(stream);
}

inline void write_header(std::ostream &stream,
                         const std::vector<std::string> &columns) {
  for (const auto &col : columns) {
    stream << col << ",";
  }
  replace_last_character_with_newline(stream);
}

inline std::vector<std::string> coordinate_columns(Eigen::Index dimension) {
  std::vector<std::string> columns;
  for (Eigen::Index d = 0; d < dimension; ++d) {
    columns.push_back("x" + std::to_string(d));
  }
  return columns;
}

template <typename _Scalar, int _Rows, int _Cols>
inline void write_to_csv(std::ostream &stream,
                         const Eigen::Matrix<_Scalar, _Rows, _Cols> &x) {
  for (Eigen::Index i = 0; i < x.rows(); ++i) {
    for (Eigen::Index j = 0; j < x.cols(); ++j) {
      stream << x(i, j);
      if (j < x.cols() - 1) {
        stream << ",";
      }
    }
    if (i < x.rows() - 1) {
      stream << std::endl;
    }
  }
}

} // namespace monaco

#endif /* MONACO_SRC_UTILS_CSV_UTILS_HPP_ */
