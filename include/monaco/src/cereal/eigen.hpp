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

#ifndef MONACO_SRC_CEREAL_EIGEN_HPP_
#define MONACO_SRC_CEREAL_EIGEN_HPP_

namespace cereal {

template <class Archive, class _Scalar, int _Rows, int _Cols>
inline void save(Archive &ar, Eigen::Matrix<_Scalar, _Rows, _Cols> const &m,
                 const std::uint32_t) {
  Eigen::Index rows = m.rows();
  Eigen::Index cols = m.cols();
  const std::size_t size = monaco::cast::to_size(rows * cols);
  const std::vector<_Scalar> data(m.data(), m.data() + size);

  ar(CEREAL_NVP(rows));
  ar(CEREAL_NVP(cols));
  ar(CEREAL_NVP(data));
}

template <class Archive, class _Scalar, int _Rows, int _Cols>
inline void load(Archive &ar, Eigen::Matrix<_Scalar, _Rows, _Cols> &m,
                 const std::uint32_t) {
  Eigen::Index rows;
  Eigen::Index cols;
  std::vector<_Scalar> data;

  ar(CEREAL_NVP(rows));
  ar(CEREAL_NVP(cols));
  ar(CEREAL_NVP(data));

  MONACO_ASSERT(data.size() == monaco::cast::to_size(rows * cols));
  m.resize(rows, cols);
  if (!data.empty()) {
    m = Eigen::Map<const Eigen::Matrix<_Scalar, _Rows, _Cols>>(data.data(),
                                                               rows, cols);
  }
}

} // namespace cereal

#endif /* MONACO_SRC_CEREAL_EIGEN_HPP_ */
