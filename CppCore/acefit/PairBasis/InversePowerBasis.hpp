#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Header file for the inverse-power pair basis.
 *
 * This file defines the @c InversePowerBasis class, a small linear pair
 * basis whose functions are shifted inverse powers of the interatomic
 * distance.  With exponents {12, 6} its span contains the 12-6
 * Lennard-Jones potential, which makes it a convenient exactly fittable
 * basis for exercising the assembly and error pipelines.
 */

// clang-format off
#include <vector>
// clang-format on
#include "acefit/Basis.hpp"

namespace acefit {

/**
 * @class InversePowerBasis
 * @brief Pair basis @f$\phi_k(r) = r^{-p_k} - r_c^{-p_k}@f$ for @f$r<r_c@f$.
 * @ingroup acefit_bases
 */
class InversePowerBasis : public Basis<InversePowerBasis> {
public:
  /**
   * @brief Constructor.
   * @param exponents Positive exponents @f$p_k@f$, one per basis function.
   * @param cutoff    Cutoff radius @f$r_c > 0@f$.
   * @throws acefit::Error on an empty exponent list, a non-positive exponent
   *         or a non-positive cutoff.
   */
  InversePowerBasis(std::vector<double> exponents, double cutoff);

  /**
   * @brief Evaluates energies, forces, virials or site energies.
   * @param in  Structure containing coordinates, cell and request.
   * @param out Pointer to the flat results.
   * @return Void.
   */
  void evaluateImpl(const EvalInput &in, EvalOut *out) const override;

  size_t fingerprint() const override;

  const std::vector<double> &exponents() const { return m_exponents; }
  double cutoff() const { return m_cutoff; }

private:
  std::vector<double> m_exponents; //!< Exponent of each basis function.
  double m_cutoff;                 //!< Interaction cutoff radius.
  std::vector<double> m_shift;     //!< Function values at the cutoff.
};

} // namespace acefit
