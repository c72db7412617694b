#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Conversion utilities between Cap'n Proto lists and Eigen types.
 *
 * Matrices travel as flat row-major @c List(Float64) with separate row and
 * column counts.
 */

#include <cstddef>

#include <Eigen/Dense>
#include <capnp/list.h>

namespace acefit {
namespace types {
namespace adapt {
namespace capnp {

// --- Functions to convert from Cap'n Proto Readers to Native Types ---

/**
 * @brief Converts a Cap'n Proto list to an Eigen vector.
 * @param capnpList The reader for the list.
 * @return A @c Eigen::VectorXd of the same length.
 */
inline Eigen::VectorXd
convertVectorFromCapnp(const ::capnp::List<double>::Reader &capnpList) {
  Eigen::VectorXd native(capnpList.size());
  for (size_t i = 0; i < capnpList.size(); ++i) {
    native[i] = capnpList[i];
  }
  return native;
}

/**
 * @brief Converts a row-major Cap'n Proto list to an Eigen matrix.
 * @param capnpList The reader for the list, @a rows * @a cols long.
 * @param rows      Number of rows.
 * @param cols      Number of columns.
 * @return A @c Eigen::MatrixXd.
 */
inline Eigen::MatrixXd
convertMatrixFromCapnp(const ::capnp::List<double>::Reader &capnpList,
                       size_t rows, size_t cols) {
  Eigen::MatrixXd native(rows, cols);
  for (size_t i = 0; i < rows; ++i) {
    for (size_t j = 0; j < cols; ++j) {
      native(i, j) = capnpList[i * cols + j];
    }
  }
  return native;
}

// --- Functions to convert from Native Types to Cap'n Proto Builders ---

/**
 * @brief Serializes an Eigen vector to a Cap'n Proto builder.
 * @param capnpList The builder, already sized.
 * @param values    The source vector.
 * @return Void.
 */
inline void populateVectorToCapnp(::capnp::List<double>::Builder &capnpList,
                                  const Eigen::VectorXd &values) {
  for (Eigen::Index i = 0; i < values.size(); ++i) {
    capnpList.set(i, values[i]);
  }
}

/**
 * @brief Serializes an Eigen matrix row by row to a Cap'n Proto builder.
 * @param capnpList The builder, already sized to rows * cols.
 * @param matrix    The source matrix.
 * @return Void.
 */
inline void populateMatrixToCapnp(::capnp::List<double>::Builder &capnpList,
                                  const Eigen::MatrixXd &matrix) {
  const Eigen::Index cols = matrix.cols();
  for (Eigen::Index i = 0; i < matrix.rows(); ++i) {
    for (Eigen::Index j = 0; j < cols; ++j) {
      capnpList.set(i * cols + j, matrix(i, j));
    }
  }
}

} // namespace capnp
} // namespace adapt
} // namespace types
} // namespace acefit
