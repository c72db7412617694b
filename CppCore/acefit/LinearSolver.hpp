#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Least-squares solvers for the weighted linear system.
 */

#include <memory>
#include <string>

#include <Eigen/Dense>

#include "acefit/config/FitSettings.hpp"

namespace acefit {

/**
 * @class LinearSolver
 * @brief Solves @f$\min_c \|A c - y\|_2@f$ for already weighted @a A, @a y.
 * @ingroup acefit_capabilities
 */
class LinearSolver {
public:
  virtual ~LinearSolver() = default;

  /**
   * @brief Computes the coefficients.
   * @param A Weighted design matrix.
   * @param y Weighted target vector.
   * @return One coefficient per column of @a A.
   */
  virtual Eigen::VectorXd solve(const Eigen::MatrixXd &A,
                                const Eigen::VectorXd &y) const = 0;

  virtual std::string name() const = 0;
};

/**
 * @class QRSolver
 * @brief Column-pivoting Householder QR; handles rank deficient systems.
 */
class QRSolver : public LinearSolver {
public:
  Eigen::VectorXd solve(const Eigen::MatrixXd &A,
                        const Eigen::VectorXd &y) const override;
  std::string name() const override { return "qr"; }
};

/**
 * @class DampedSolver
 * @brief Tikhonov regularized normal equations
 *        @f$(A^T A + \lambda I) c = A^T y@f$.
 */
class DampedSolver : public LinearSolver {
public:
  /**
   * @brief Constructor.
   * @param lambda Damping parameter.
   * @throws acefit::Error if @a lambda is negative.
   */
  explicit DampedSolver(double lambda);

  Eigen::VectorXd solve(const Eigen::MatrixXd &A,
                        const Eigen::VectorXd &y) const override;
  std::string name() const override;

  double lambda() const { return m_lambda; }

private:
  double m_lambda; //!< Damping parameter.
};

/**
 * @brief Creates the solver named by the settings.
 * @param settings Solver settings.
 * @return The solver.
 */
std::unique_ptr<LinearSolver>
make_solver(const config::SolverSettings &settings);

} // namespace acefit
