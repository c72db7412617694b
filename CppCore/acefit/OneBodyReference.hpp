#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Isolated-atom reference energies.
 */

#include <map>
#include <utility>

#include "acefit/Evaluators.hpp"

namespace acefit {

/**
 * @class OneBodyReference
 * @brief Reference energy @f$\sum_i E_0(Z_i)@f$ from per-species constants.
 * @ingroup acefit_capabilities
 */
class OneBodyReference : public ReferenceEnergy {
public:
  /**
   * @brief Constructor.
   * @param e0 Isolated-atom energy per atomic number.
   */
  explicit OneBodyReference(std::map<int, double> e0) : m_e0(std::move(e0)) {}

  /**
   * @brief Sums the isolated-atom energies of a configuration.
   * @param config The configuration.
   * @return The reference energy.
   * @throws acefit::Error for a species without an entry.
   */
  double energy(const Configuration &config) const override;

  const std::map<int, double> &table() const { return m_e0; }

private:
  std::map<int, double> m_e0; //!< Isolated-atom energies by atomic number.
};

} // namespace acefit
