// MIT License
// Copyright 2023--present acefit developers

#include "acefit/LinearModel.hpp"

#include <fmt/format.h>

#include <utility>
#include <vector>

#include "acefit/errors.hpp"
#include "acefit/types/adapters/eigen.hpp"

namespace acefit {

namespace eigen = types::adapt::eigen;

namespace {

template <typename T>
void require_functions(const std::vector<T> &values, Eigen::Index ncoeff,
                       const char *what) {
  if (static_cast<Eigen::Index>(values.size()) != ncoeff) {
    throw ShapeError(fmt::format("basis returned {} {} for a model with {} "
                                 "coefficients",
                                 values.size(), what, ncoeff));
  }
}

} // namespace

LinearModel::LinearModel(const BasisEvaluator &basis,
                         Eigen::VectorXd coefficients,
                         const ReferenceEnergy *reference)
    : m_basis(&basis), m_coefficients(std::move(coefficients)),
      m_reference(reference) {
  if (static_cast<size_t>(m_coefficients.size()) != basis.length()) {
    throw ShapeError(
        fmt::format("model has {} coefficients for a basis of length {}",
                    m_coefficients.size(), basis.length()));
  }
}

double LinearModel::energy(const Configuration &config) const {
  const auto e = m_basis->energy(config);
  require_functions(e, m_coefficients.size(), "energies");
  double total = m_reference ? m_reference->energy(config) : 0.0;
  for (size_t k = 0; k < e.size(); ++k) {
    total += m_coefficients[k] * e[k];
  }
  return total;
}

AtomMatrix LinearModel::forces(const Configuration &config) const {
  const auto f = m_basis->forces(config);
  require_functions(f, m_coefficients.size(), "force sets");
  Eigen::MatrixXd total = Eigen::MatrixXd::Zero(config.size(), 3);
  for (size_t k = 0; k < f.size(); ++k) {
    if (!f[k].hasShape(config.size(), 3)) {
      throw ShapeError(
          fmt::format("basis forces must be {} x 3", config.size()));
    }
    total += m_coefficients[k] * eigen::convertToEigen(f[k]);
  }
  return eigen::convertToAtomMatrix(total);
}

Tensor33 LinearModel::virial(const Configuration &config) const {
  const auto v = m_basis->virial(config);
  require_functions(v, m_coefficients.size(), "virials");
  Eigen::Matrix3d total = Eigen::Matrix3d::Zero();
  for (size_t k = 0; k < v.size(); ++k) {
    total += m_coefficients[k] * eigen::convertToEigen3d(v[k]);
  }
  return eigen::convertToTensor33(total);
}

double LinearModel::site_energy(const Configuration &config,
                                size_t atom) const {
  const auto s = m_basis->site_energy(config, atom);
  require_functions(s, m_coefficients.size(), "site energies");
  double total = m_reference ? m_reference->energy(config) /
                                   static_cast<double>(config.size())
                             : 0.0;
  for (size_t k = 0; k < s.size(); ++k) {
    total += m_coefficients[k] * s[k];
  }
  return total;
}

} // namespace acefit
