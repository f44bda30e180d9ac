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

#ifndef MONACO_SRC_UTILS_EIGEN_UTILS_HPP_
#define MONACO_SRC_UTILS_EIGEN_UTILS_HPP_

namespace monaco {

/*
 * Eigen's operator== asserts that both sides have the same shape,
 * this one simply reports a mismatch as inequality.
 */
template <typename _Scalar, int _Rows, int _Cols>
inline bool same_matrix(const Eigen::Matrix<_Scalar, _Rows, _Cols> &x,
                        const Eigen::Matrix<_Scalar, _Rows, _Cols> &y) {
  return x.rows() == y.rows() && x.cols() == y.cols() && x == y;
}

} // namespace monaco

#endif /* MONACO_SRC_UTILS_EIGEN_UTILS_HPP_ */
