#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Conversion utilities between Eigen and native types.
 *
 * The linear model and the error aggregator work on Eigen types; these
 * helpers move per-atom data and 3x3 tensors in and out of Eigen without
 * changing the row-major (atom-major) ordering used for observation rows.
 */

// clang-format off
#include <Eigen/Dense>
// clang-format on
#include "acefit/types/AtomMatrix.hpp"

namespace acefit {
namespace types {
namespace adapt {
namespace eigen {

/**
 * @brief Row-major dynamic matrix type matching @c AtomMatrix storage.
 */
using RowMatrixXd =
    Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/**
 * @brief Converts an Eigen matrix to a native AtomMatrix.
 * @param matrix  The source Eigen matrix.
 * @return An @c AtomMatrix instance with copied data.
 */
inline AtomMatrix convertToAtomMatrix(const Eigen::MatrixXd &matrix) {
  AtomMatrix result(matrix.rows(), matrix.cols());
  for (Eigen::Index i = 0; i < matrix.rows(); ++i) {
    for (Eigen::Index j = 0; j < matrix.cols(); ++j) {
      result(i, j) = matrix(i, j);
    }
  }
  return result;
}

/**
 * @brief Converts a native AtomMatrix to an Eigen matrix.
 * @param atomMatrix  The source native matrix.
 * @return A column-major copy of the data.
 */
inline Eigen::MatrixXd convertToEigen(const AtomMatrix &atomMatrix) {
  return Eigen::Map<const RowMatrixXd>(atomMatrix.data(), atomMatrix.rows(),
                                       atomMatrix.cols());
}

/**
 * @brief Flattens an AtomMatrix row by row into a vector.
 * @param atomMatrix  The source native matrix.
 * @return A vector of length @c rows * @c cols, atom-major.
 */
inline Eigen::VectorXd flatten(const AtomMatrix &atomMatrix) {
  return Eigen::Map<const Eigen::VectorXd>(atomMatrix.data(),
                                           atomMatrix.size());
}

/**
 * @brief Converts a nested 3x3 array to an Eigen matrix.
 * @param tensor  The source tensor.
 * @return The matching @c Eigen::Matrix3d.
 */
inline Eigen::Matrix3d convertToEigen3d(const Tensor33 &tensor) {
  Eigen::Matrix3d result;
  for (int i = 0; i < 3; ++i) {
    for (int j = 0; j < 3; ++j) {
      result(i, j) = tensor[i][j];
    }
  }
  return result;
}

/**
 * @brief Converts a 3x3 Eigen matrix to a nested standard array.
 * @param matrix  The 3x3 Eigen matrix.
 * @return A @c Tensor33 representing the matrix.
 */
inline Tensor33 convertToTensor33(const Eigen::Matrix3d &matrix) {
  Tensor33 result;
  for (int i = 0; i < 3; ++i) {
    for (int j = 0; j < 3; ++j) {
      result[i][j] = matrix(i, j);
    }
  }
  return result;
}

} // namespace eigen
} // namespace adapt
} // namespace types
} // namespace acefit
