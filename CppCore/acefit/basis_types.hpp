/**
 * @brief Identifiers for basis implementations and evaluation requests.
 *
 * @c BasisType tags every concrete basis so cached evaluations of different
 * bases never collide.  @c EvalKind selects which quantity a basis
 * evaluation produces.
 */

#pragma once
// MIT License
// Copyright 2023--present acefit developers

namespace acefit {

/**
 * @brief Concrete basis families known to the library.
 */
enum class BasisType {
  InversePower = 1, //!<  Truncated inverse-power pair basis.
};

/**
 * @brief Quantity requested from a basis evaluation.
 *
 * Flat output sizes for @c nb basis functions and @c N atoms are
 * @c nb, @c nb*N*3, @c nb*9 and @c nb respectively.
 */
enum class EvalKind {
  Energy = 0, //!< Total energy per function.
  Forces,     //!< Forces per function, atom-major.
  Virial,     //!< Row-major 3x3 virial per function.
  SiteEnergy  //!< Site energy of one atom per function.
};

} // namespace acefit
