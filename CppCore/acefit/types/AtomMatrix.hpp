#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Definition of the native AtomMatrix class and tensor aliases.
 *
 * @c AtomMatrix is a lightweight, row-major matrix used for per-atom data:
 * positions and forces (N x 3), and virials stored as three row vectors
 * (3 x 3).  Flattening is always row-major, i.e. atom by atom with the
 * Cartesian components of one atom adjacent.
 */

#include <algorithm>
#include <array>
#include <cstddef>
#include <initializer_list>
#include <vector>

namespace acefit {
namespace types {

/**
 * @typedef Tensor33
 * @brief A dense 3x3 tensor (cell matrix, virial); rows are vectors.
 */
using Tensor33 = std::array<std::array<double, 3>, 3>;

/**
 * @class AtomMatrix
 * @brief A lightweight row-major matrix class for atomic data.
 */
class AtomMatrix {
public:
  /**
   * @brief Default constructor, an empty 0 x 0 matrix.
   */
  AtomMatrix() : m_rows(0), m_cols(0) {}

  /**
   * @brief Constructor for list initialization, one inner list per row.
   * @param list  The nested initializer list.
   */
  AtomMatrix(std::initializer_list<std::initializer_list<double>> list)
      : m_rows(list.size()), m_cols(list.size() ? list.begin()->size() : 0),
        m_data(m_rows * m_cols, 0.0) {
    size_t rowIdx = 0;
    for (const auto &rowList : list) {
      std::copy_n(rowList.begin(), std::min(rowList.size(), m_cols),
                  m_data.begin() + rowIdx * m_cols);
      ++rowIdx;
    }
  }

  /**
   * @brief Constructor for a zero-filled matrix of given dimensions.
   * @param rows  Number of rows.
   * @param cols  Number of columns.
   */
  AtomMatrix(size_t rows, size_t cols)
      : m_rows(rows), m_cols(cols), m_data(rows * cols, 0.0) {}

  /**
   * @brief Creates a matrix initialized with zeroes.
   * @param rows  Number of rows.
   * @param cols  Number of columns.
   * @return A zero-initialized @c AtomMatrix.
   */
  static AtomMatrix Zero(size_t rows, size_t cols) {
    return AtomMatrix(rows, cols);
  }

  /**
   * @brief Builds a matrix from a row-major flat buffer.
   * @param rows  Number of rows.
   * @param cols  Number of columns.
   * @param flat  Pointer to @c rows * @c cols values.
   * @return The populated matrix.
   */
  static AtomMatrix FromFlat(size_t rows, size_t cols, const double *flat) {
    AtomMatrix matrix(rows, cols);
    std::copy_n(flat, rows * cols, matrix.m_data.begin());
    return matrix;
  }

  double &operator()(size_t row, size_t col) {
    return m_data[row * m_cols + col];
  }

  const double &operator()(size_t row, size_t col) const {
    return m_data[row * m_cols + col];
  }

  /**
   * @brief Fetches the number of rows.
   * @return Row count.
   */
  size_t rows() const { return m_rows; }

  /**
   * @brief Fetches the number of columns.
   * @return Column count.
   */
  size_t cols() const { return m_cols; }

  /**
   * @brief Fetches the total number of elements.
   * @return @c rows() * @c cols().
   */
  size_t size() const { return m_rows * m_cols; }

  /**
   * @brief Checks the matrix dimensions.
   * @param rows  Expected row count.
   * @param cols  Expected column count.
   * @return True if both match.
   */
  bool hasShape(size_t rows, size_t cols) const {
    return m_rows == rows && m_cols == cols;
  }

  double *data() { return m_data.data(); }

  const double *data() const { return m_data.data(); }

  /**
   * @brief Element-wise comparison of shape and values.
   * @param other  Matrix to compare against.
   * @return True if both are identical.
   */
  bool operator==(const AtomMatrix &other) const {
    return m_rows == other.m_rows && m_cols == other.m_cols &&
           m_data == other.m_data;
  }

private:
  size_t m_rows; //!< The number of rows in the matrix.
  size_t m_cols; //!< The number of columns in the matrix.
  std::vector<double>
      m_data; //!< The underlying flat container for row-major data.
};

} // namespace types
} // namespace acefit
