// MIT License
// Copyright 2023--present acefit developers

#include "acefit/LinearSolver.hpp"

#include <fmt/format.h>

#include <limits>

#include "acefit/errors.hpp"

namespace acefit {

Eigen::VectorXd QRSolver::solve(const Eigen::MatrixXd &A,
                                const Eigen::VectorXd &y) const {
  return A.colPivHouseholderQr().solve(y);
}

DampedSolver::DampedSolver(double lambda) : m_lambda(lambda) {
  if (lambda < 0.0) {
    throw Error("damping parameter must not be negative");
  }
}

/**
 * @details
 * The normal matrix is symmetric positive semi-definite, positive definite
 * for any @f$\lambda > 0@f$; an LDLT factorization covers both cases.
 * A failed factorization or a vanishing pivot (a rank-deficient design
 * matrix without enough damping) raises an @c acefit::Error.
 */
Eigen::VectorXd DampedSolver::solve(const Eigen::MatrixXd &A,
                                    const Eigen::VectorXd &y) const {
  Eigen::MatrixXd normal = A.transpose() * A;
  normal.diagonal().array() += m_lambda;
  const Eigen::LDLT<Eigen::MatrixXd> ldlt(normal);
  if (ldlt.info() != Eigen::Success) {
    throw Error(
        "damped solver: LDLT factorization of the normal matrix failed");
  }
  const Eigen::VectorXd pivots = ldlt.vectorD().cwiseAbs();
  if (pivots.size() > 0 &&
      pivots.minCoeff() <=
          std::numeric_limits<double>::epsilon() * pivots.maxCoeff()) {
    throw Error(fmt::format("damped solver: normal matrix is singular with "
                            "lambda={:g}",
                            m_lambda));
  }
  return ldlt.solve(A.transpose() * y);
}

std::string DampedSolver::name() const {
  return fmt::format("damped(lambda={:g})", m_lambda);
}

std::unique_ptr<LinearSolver>
make_solver(const config::SolverSettings &settings) {
  switch (settings.kind) {
  case config::SolverSettings::Kind::Damped:
    return std::make_unique<DampedSolver>(settings.damping);
  case config::SolverSettings::Kind::QR:
    break;
  }
  return std::make_unique<QRSolver>();
}

} // namespace acefit
