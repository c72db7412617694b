// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Implementation of the design matrix, target and weight assembly.
 */

#include "acefit/Assembler.hpp"

#include <fmt/format.h>

#include <cmath>

#include "acefit/Log.hpp"
#include "acefit/Mask.hpp"
#include "acefit/RowLayout.hpp"
#include "acefit/Virial.hpp"
#include "acefit/errors.hpp"

namespace acefit {

namespace {

void require_atoms(const ObservationRecord &record) {
  if (record.size() == 0) {
    throw Error("configuration without atoms cannot carry energy or virial "
                "observations");
  }
}

template <typename T>
void require_length(const std::vector<T> &values, size_t nbasis,
                    const char *what) {
  if (values.size() != nbasis) {
    throw ShapeError(fmt::format("basis returned {} {} for {} functions",
                                 values.size(), what, nbasis));
  }
}

/**
 * @brief Fills the rows of one record, starting at @a row0.
 */
void fill_features(const ObservationRecord &record, const BasisEvaluator &basis,
                   Eigen::MatrixXd &A, Eigen::Index row0) {
  const Configuration &config = record.configuration();
  const size_t nb = basis.length();
  const size_t nAtoms = record.size();
  const RowLayout layout(record);

  for (const RowBlock &blk : layout.blocks()) {
    const Eigen::Index r = row0 + static_cast<Eigen::Index>(blk.offset);
    switch (blk.kind) {
    case Observable::E: {
      auto e = basis.energy(config);
      require_length(e, nb, "energies");
      for (size_t j = 0; j < nb; ++j) {
        A(r, j) = e[j];
      }
      break;
    }
    case Observable::F: {
      auto f = basis.forces(config);
      require_length(f, nb, "force sets");
      const auto mask = force_mask(record);
      for (size_t j = 0; j < nb; ++j) {
        if (!f[j].hasShape(nAtoms, 3)) {
          throw ShapeError(fmt::format("basis forces must be {} x 3", nAtoms));
        }
        Eigen::Index idx = 0;
        for (size_t c = 0; c < mask.size(); ++c) {
          if (mask[c]) {
            A(r + idx++, j) = f[j].data()[c];
          }
        }
      }
      break;
    }
    case Observable::V: {
      auto v = basis.virial(config);
      require_length(v, nb, "virials");
      for (size_t j = 0; j < nb; ++j) {
        const auto components = voigt(v[j]);
        for (size_t c = 0; c < components.size(); ++c) {
          A(r + c, j) = components[c];
        }
      }
      break;
    }
    case Observable::PAE: {
      const auto mask = atom_mask(record);
      Eigen::Index idx = 0;
      for (size_t i = 0; i < nAtoms; ++i) {
        if (!mask[i]) {
          continue;
        }
        auto s = basis.site_energy(config, i);
        require_length(s, nb, "site energies");
        for (size_t j = 0; j < nb; ++j) {
          A(r + idx, j) = s[j];
        }
        ++idx;
      }
      break;
    }
    }
  }
}

void fill_targets(const ObservationRecord &record, Eigen::VectorXd &y,
                  Eigen::Index row0) {
  const RowLayout layout(record);
  for (const RowBlock &blk : layout.blocks()) {
    const Eigen::Index r = row0 + static_cast<Eigen::Index>(blk.offset);
    switch (blk.kind) {
    case Observable::E:
      y(r) = record.energy() - record.energy_reference();
      break;
    case Observable::F: {
      const AtomMatrix &f = record.forces();
      const auto mask = force_mask(record);
      Eigen::Index idx = 0;
      for (size_t c = 0; c < mask.size(); ++c) {
        if (mask[c]) {
          y(r + idx++) = f.data()[c];
        }
      }
      break;
    }
    case Observable::V: {
      const auto components = voigt(record.virial());
      for (size_t c = 0; c < components.size(); ++c) {
        y(r + c) = components[c];
      }
      break;
    }
    case Observable::PAE: {
      require_atoms(record);
      const auto &pae = record.site_energies();
      const auto mask = atom_mask(record);
      const double baseline =
          record.energy_reference() / static_cast<double>(record.size());
      Eigen::Index idx = 0;
      for (size_t i = 0; i < pae.size(); ++i) {
        if (mask[i]) {
          y(r + idx++) = pae[i] - baseline;
        }
      }
      break;
    }
    }
  }
}

void fill_weights(const ObservationRecord &record, Eigen::VectorXd &w,
                  Eigen::Index row0) {
  const RowLayout layout(record);
  const Weights &weights = record.weights();
  for (const RowBlock &blk : layout.blocks()) {
    const Eigen::Index r = row0 + static_cast<Eigen::Index>(blk.offset);
    const Eigen::Index n = static_cast<Eigen::Index>(blk.rows);
    switch (blk.kind) {
    case Observable::E:
      require_atoms(record);
      w(r) = weights.E / std::sqrt(static_cast<double>(record.size()));
      break;
    case Observable::F:
      w.segment(r, n).setConstant(weights.F);
      break;
    case Observable::V:
      require_atoms(record);
      w.segment(r, n).setConstant(
          weights.V / std::sqrt(static_cast<double>(record.size())));
      break;
    case Observable::PAE:
      w.segment(r, n).setConstant(1.0);
      break;
    }
  }
}

} // namespace

Eigen::MatrixXd feature_matrix(const std::vector<ObservationRecord> &records,
                               const BasisEvaluator &basis) {
  const auto nrows = static_cast<Eigen::Index>(count_observations(records));
  Eigen::MatrixXd A =
      Eigen::MatrixXd::Zero(nrows, static_cast<Eigen::Index>(basis.length()));
  Eigen::Index row = 0;
  for (const auto &record : records) {
    fill_features(record, basis, A, row);
    row += static_cast<Eigen::Index>(count_observations(record));
  }
  log::debug("assembled design matrix {} x {}", A.rows(), A.cols());
  return A;
}

Eigen::VectorXd target_vector(const std::vector<ObservationRecord> &records) {
  Eigen::VectorXd y = Eigen::VectorXd::Zero(
      static_cast<Eigen::Index>(count_observations(records)));
  Eigen::Index row = 0;
  for (const auto &record : records) {
    fill_targets(record, y, row);
    row += static_cast<Eigen::Index>(count_observations(record));
  }
  return y;
}

Eigen::VectorXd weight_vector(const std::vector<ObservationRecord> &records) {
  Eigen::VectorXd w = Eigen::VectorXd::Zero(
      static_cast<Eigen::Index>(count_observations(records)));
  Eigen::Index row = 0;
  for (const auto &record : records) {
    fill_weights(record, w, row);
    row += static_cast<Eigen::Index>(count_observations(record));
  }
  return w;
}

/**
 * @details
 * Each record's layout is computed once per output here; the three outputs
 * still agree row for row because every fill walks the same @c RowLayout.
 */
LinearSystem assemble(const std::vector<ObservationRecord> &records,
                      const BasisEvaluator &basis) {
  LinearSystem system;
  system.A = feature_matrix(records, basis);
  system.y = target_vector(records);
  system.w = weight_vector(records);
  log::debug("assembled {} rows from {} configurations", system.rows(),
             records.size());
  return system;
}

} // namespace acefit
