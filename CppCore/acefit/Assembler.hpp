#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Assembly of the weighted linear regression problem.
 *
 * Every record contributes the rows of its @c RowLayout.  Rows of all
 * records are concatenated in record order, so assembling @c [a, b] equals
 * stacking the assemblies of @c [a] and @c [b].
 *
 * Row values per block:
 *
 * | block  | design matrix              | target                  | weight             |
 * |--------|----------------------------|-------------------------|--------------------|
 * | E      | basis energies             | E - E_ref               | w.E / sqrt(N)      |
 * | F      | basis forces, masked       | stored forces, masked   | w.F                |
 * | V      | basis virial, Voigt order  | stored virial, Voigt    | w.V / sqrt(N)      |
 * | PAE    | basis site energies, masked| e_i - E_ref / N, masked | 1.0                |
 *
 * Per-atom energy rows carry a fixed weight of 1.0 rather than the record's
 * energy weight.
 */

#include <Eigen/Dense>
#include <vector>

#include "acefit/Evaluators.hpp"
#include "acefit/ObservationRecord.hpp"

namespace acefit {

/**
 * @struct LinearSystem
 * @brief Row-aligned design matrix, targets and weights.
 */
struct LinearSystem {
  Eigen::MatrixXd A; //!< Design matrix, one column per basis function.
  Eigen::VectorXd y; //!< Target vector.
  Eigen::VectorXd w; //!< Weight vector.

  Eigen::Index rows() const { return A.rows(); }
  Eigen::Index cols() const { return A.cols(); }
};

/**
 * @brief Builds the design matrix.
 * @param records The records, in row order.
 * @param basis   The basis evaluation capability.
 * @return A matrix of @c count_observations(records) x @c basis.length().
 * @throws acefit::ShapeError if the basis returns results of the wrong size.
 */
Eigen::MatrixXd feature_matrix(const std::vector<ObservationRecord> &records,
                               const BasisEvaluator &basis);

/**
 * @brief Builds the target vector from the stored reference data.
 * @param records The records, in row order.
 * @return A vector of @c count_observations(records) values.
 * @throws acefit::ShapeError on malformed stored data.
 */
Eigen::VectorXd target_vector(const std::vector<ObservationRecord> &records);

/**
 * @brief Builds the weight vector.
 * @param records The records, in row order.
 * @return A vector of @c count_observations(records) values.
 */
Eigen::VectorXd weight_vector(const std::vector<ObservationRecord> &records);

/**
 * @brief Builds design matrix, targets and weights in one pass.
 * @param records The records, in row order.
 * @param basis   The basis evaluation capability.
 * @return The assembled system.
 */
LinearSystem assemble(const std::vector<ObservationRecord> &records,
                      const BasisEvaluator &basis);

} // namespace acefit
