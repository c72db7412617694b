#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Abstract evaluation capabilities consumed by the fitting core.
 *
 * The assembler and the error aggregator never compute physics themselves.
 * They are written against these interfaces, and any basis or model
 * implementation that satisfies them can be plugged in at the call site.
 */

#include <cstddef>
#include <vector>

#include "acefit/Configuration.hpp"

namespace acefit {

/**
 * @class BasisEvaluator
 * @brief Evaluates every function of a linear basis on a configuration.
 * @ingroup acefit_capabilities
 *
 * Each query returns one result per basis function, in basis order.
 */
class BasisEvaluator {
public:
  virtual ~BasisEvaluator() = default;

  /**
   * @brief Number of basis functions (design matrix columns).
   * @return The basis length.
   */
  virtual size_t length() const = 0;

  /**
   * @brief Total energy of each basis function.
   * @param config The configuration.
   * @return @c length() energies.
   */
  virtual std::vector<double> energy(const Configuration &config) const = 0;

  /**
   * @brief Forces of each basis function.
   * @param config The configuration.
   * @return @c length() matrices of shape N x 3.
   */
  virtual std::vector<AtomMatrix>
  forces(const Configuration &config) const = 0;

  /**
   * @brief Virial tensor of each basis function.
   * @param config The configuration.
   * @return @c length() symmetric 3x3 tensors.
   */
  virtual std::vector<Tensor33> virial(const Configuration &config) const = 0;

  /**
   * @brief Site energy of one atom for each basis function.
   * @param config The configuration.
   * @param atom   Zero-based atom index.
   * @return @c length() site energies.
   */
  virtual std::vector<double> site_energy(const Configuration &config,
                                          size_t atom) const = 0;
};

/**
 * @class ModelEvaluator
 * @brief Evaluates a single fitted model on a configuration.
 * @ingroup acefit_capabilities
 */
class ModelEvaluator {
public:
  virtual ~ModelEvaluator() = default;

  virtual double energy(const Configuration &config) const = 0;

  /**
   * @brief Forces on every atom.
   * @param config The configuration.
   * @return An N x 3 matrix.
   */
  virtual AtomMatrix forces(const Configuration &config) const = 0;

  virtual Tensor33 virial(const Configuration &config) const = 0;

  virtual double site_energy(const Configuration &config,
                             size_t atom) const = 0;
};

/**
 * @class ReferenceEnergy
 * @brief Baseline energy subtracted from energy-like targets.
 * @ingroup acefit_capabilities
 */
class ReferenceEnergy {
public:
  virtual ~ReferenceEnergy() = default;

  /**
   * @brief Baseline energy of a configuration.
   * @param config The configuration.
   * @return The reference energy.
   */
  virtual double energy(const Configuration &config) const = 0;
};

} // namespace acefit
