#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Virial storage normalization and Voigt component extraction.
 *
 * Virials contribute six rows per configuration, taken from a symmetric
 * 3x3 tensor in the fixed order @c [xx, yy, zz, yz, xz, xy].
 */

#include <array>
#include <cstddef>

#include "acefit/Configuration.hpp"

namespace acefit {

/**
 * @brief Row-major flat positions of the six Voigt components.
 *
 * @c xx, @c yy, @c zz, @c yz, @c xz, @c xy.
 */
inline constexpr std::array<size_t, 6> kVoigtOrder = {0, 4, 8, 5, 2, 1};

/**
 * @brief Normalizes a stored virial into a row-major flat tensor.
 *
 * Two layouts are accepted:
 * - a flat vector of nine values (row-major), the regular layout;
 * - a 3 x 3 @c AtomMatrix whose rows are the tensor rows.  Some upstream
 *   readers store the virial of 3-atom cells as a list of row vectors
 *   instead of a tensor; concatenating the rows recovers the flat tensor.
 *   This is the only place that knows about that layout.
 *
 * @param value The stored value.
 * @return The nine tensor components, row-major.
 * @throws acefit::ShapeError for any other type or shape.
 */
std::array<double, 9> flatten_virial(const DataValue &value);

/**
 * @brief Extracts the six Voigt components of a flat tensor.
 * @param flat Row-major 3x3 tensor.
 * @return @c [xx, yy, zz, yz, xz, xy].
 */
std::array<double, 6> voigt(const std::array<double, 9> &flat);

/**
 * @brief Extracts the six Voigt components of a nested tensor.
 * @param tensor The 3x3 tensor.
 * @return @c [xx, yy, zz, yz, xz, xy].
 */
std::array<double, 6> voigt(const Tensor33 &tensor);

} // namespace acefit
