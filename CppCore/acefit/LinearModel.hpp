#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief A fitted linear model over a basis.
 */

#include <Eigen/Dense>

#include "acefit/Evaluators.hpp"

namespace acefit {

/**
 * @class LinearModel
 * @brief Model evaluation @f$\sum_k c_k B_k@f$ plus an optional reference.
 * @ingroup acefit_capabilities
 *
 * The reference energy enters energies and, split evenly over the atoms,
 * site energies.  It does not depend on positions and so contributes no
 * forces or virial.  Basis and reference are borrowed.
 */
class LinearModel : public ModelEvaluator {
public:
  /**
   * @brief Constructor.
   * @param basis        The basis.
   * @param coefficients One coefficient per basis function.
   * @param reference    Optional reference energy.
   * @throws acefit::ShapeError if the coefficient count differs from the
   *         basis length.
   */
  LinearModel(const BasisEvaluator &basis, Eigen::VectorXd coefficients,
              const ReferenceEnergy *reference = nullptr);

  double energy(const Configuration &config) const override;
  AtomMatrix forces(const Configuration &config) const override;
  Tensor33 virial(const Configuration &config) const override;
  double site_energy(const Configuration &config, size_t atom) const override;

  const Eigen::VectorXd &coefficients() const { return m_coefficients; }

private:
  const BasisEvaluator *m_basis;      //!< Borrowed basis.
  Eigen::VectorXd m_coefficients;     //!< Fitted coefficients.
  const ReferenceEnergy *m_reference; //!< Borrowed reference, may be null.
};

} // namespace acefit
