#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Fit driver: records in, coefficients out.
 */

#include <vector>

#include <Eigen/Dense>

#include "acefit/Assembler.hpp"
#include "acefit/Evaluators.hpp"
#include "acefit/LinearSolver.hpp"
#include "acefit/ObservationRecord.hpp"
#include "acefit/config/FitSettings.hpp"

namespace acefit {

/**
 * @struct FitResult
 * @brief Outcome of a linear fit.
 */
struct FitResult {
  Eigen::VectorXd coefficients; //!< One coefficient per basis function.
  LinearSystem system;          //!< The unweighted assembled system.
  double residual_norm = 0.0;   //!< @f$\|W (A c - y)\|_2@f$.
};

/**
 * @brief Builds records with the keys, weights and group key of @a settings.
 * @param configs   Configurations, which must outlive the records.
 * @param settings  Fit settings.
 * @param reference Optional reference energy.
 * @return One record per configuration, in order.
 */
std::vector<ObservationRecord>
make_records(const std::vector<Configuration> &configs,
             const config::FitSettings &settings,
             const ReferenceEnergy *reference = nullptr);

/**
 * @brief Assembles, weights and solves.
 * @param records The training records.
 * @param basis   The basis.
 * @param solver  The least-squares solver.
 * @return The fit result.
 * @throws acefit::Error if the system has no rows or no columns.
 */
FitResult fit(const std::vector<ObservationRecord> &records,
              const BasisEvaluator &basis, const LinearSolver &solver);

/**
 * @brief Full pipeline from configurations and settings.
 * @param configs   Training configurations.
 * @param basis     The basis.
 * @param settings  Fit settings, including the solver.
 * @param reference Optional reference energy subtracted from targets.
 * @return The fit result.
 */
FitResult fit(const std::vector<Configuration> &configs,
              const BasisEvaluator &basis, const config::FitSettings &settings,
              const ReferenceEnergy *reference = nullptr);

} // namespace acefit
