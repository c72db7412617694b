#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief POD structures for basis evaluation requests.
 *
 * Defines the flat data exchange used between the typed @c Basis wrapper
 * and the low-level evaluation kernels of concrete bases.
 */

#include <cstddef>

#include "acefit/basis_types.hpp"

namespace acefit {

/**
 * @brief Data structure describing one evaluation request.
 * @ingroup acefit
 */
typedef struct {
  const size_t nAtoms; //!< Total number of atoms in the system.
  const double *pos;   //!< Pointer to the flat array of atomic positions.
  const int *atmnrs;   //!< Pointer to the array of atomic numbers.
  const double *box;   //!< Pointer to the row-major 3x3 cell matrix.
  const EvalKind kind; //!< Quantity to evaluate.
  const size_t atom;   //!< Atom index, only read for site energies.
} EvalInput;

/**
 * @brief Data structure receiving the flat evaluation results.
 * @ingroup acefit
 */
typedef struct {
  double *values;    //!< Output buffer, zero-initialized by the caller.
  const size_t size; //!< Number of values the buffer holds.
} EvalOut;

} // namespace acefit
