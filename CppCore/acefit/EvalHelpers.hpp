#pragma once
// MIT License
// Copyright 2023--present acefit developers
#include "EvalStructs.hpp"
#include <cstddef>

/**
 * @brief Utility templates and functions for basis evaluation.
 *
 * Defines a static registry counting real kernel evaluations per basis
 * type, plus validation of evaluation requests.
 */

namespace acefit {

/**
 * @class registry
 * @brief Static per-type evaluation counter.
 *
 * The evaluation counter only counts kernel calls, so tests can tell cache
 * hits from recomputations.
 */
template <typename T> class registry {
public:
  static size_t evaluations; //!< Global counter for kernel evaluations.

  /**
   * @brief Increments the evaluation counter.
   * @return Void.
   */
  static void incrementEvaluations() { ++evaluations; }
};

template <typename T> size_t registry<T>::evaluations = 0;

/**
 * @brief Number of flat output values for a request.
 * @param kind    The requested quantity.
 * @param nbasis  Number of basis functions.
 * @param nAtoms  Number of atoms.
 * @return Size of the flat output buffer.
 */
size_t evalOutSize(EvalKind kind, size_t nbasis, size_t nAtoms);

/**
 * @brief Validates an evaluation request.
 * @param in The request to check.
 * @return Void.
 */
void checkInput(const EvalInput &in);

} // namespace acefit
