// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Implementation of the inverse-power pair basis.
 *
 * Pair loops and the minimum image convention follow the Lennard-Jones
 * kernel this basis generalizes.
 */

// clang-format off
#include <algorithm>
#include <cmath>
#include <functional>
#include <utility>
// clang-format on

#include <fmt/format.h>

#include "acefit/PairBasis/InversePowerBasis.hpp"
#include "acefit/errors.hpp"

namespace acefit {

InversePowerBasis::InversePowerBasis(std::vector<double> exponents,
                                     double cutoff)
    : Basis(BasisType::InversePower, exponents.size()),
      m_exponents(std::move(exponents)), m_cutoff{cutoff} {
  if (m_exponents.empty()) {
    throw Error("InversePowerBasis needs at least one exponent");
  }
  if (!(m_cutoff > 0.0)) {
    throw Error("InversePowerBasis cutoff must be positive");
  }
  m_shift.reserve(m_exponents.size());
  for (double p : m_exponents) {
    if (!(p > 0.0)) {
      throw Error("InversePowerBasis exponents must be positive");
    }
    m_shift.push_back(std::pow(m_cutoff, -p));
  }
}

size_t InversePowerBasis::fingerprint() const {
  size_t seed = std::hash<double>{}(m_cutoff);
  for (double p : m_exponents) {
    seed ^= std::hash<double>{}(p) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
  }
  return seed;
}

/**
 * @details
 * Every pair (i, j) with i < j inside the cutoff contributes, for each
 * function k,
 *
 * - @f$\phi_k(r)@f$ to the energy,
 * - @f$\mp\phi_k'(r)\,\mathbf{r}_{ij}/r@f$ to the forces on i and j,
 * - @f$-\phi_k'(r)\,\mathbf{r}_{ij}\otimes\mathbf{r}_{ij}/r@f$ to the virial,
 * - @f$\phi_k(r)/2@f$ to the site energy of each of the two atoms,
 *
 * with @f$\mathbf{r}_{ij} = \mathbf{R}_i - \mathbf{R}_j@f$ wrapped by the
 * minimum image convention.
 *
 * Only the nearest image of each pair is visited, so the cutoff may not
 * exceed half of the shortest cell edge.
 *
 * @warning The box is assumed to be orthogonal.  A non-positive diagonal
 * entry, or a cutoff longer than half an edge, raises an @c acefit::Error.
 */
void InversePowerBasis::evaluateImpl(const EvalInput &in, EvalOut *out) const {
  const long N = in.nAtoms;
  const double *R = in.pos;
  const double *box = in.box;
  double *V = out->values;
  const size_t nb = m_exponents.size();

  if (!(box[0] > 0.0 && box[4] > 0.0 && box[8] > 0.0)) {
    throw Error("InversePowerBasis requires an orthogonal cell with a "
                "positive diagonal");
  }
  const double shortest = std::min({box[0], box[4], box[8]});
  if (m_cutoff > 0.5 * shortest) {
    throw Error(fmt::format("InversePowerBasis cutoff {} exceeds half of the "
                            "shortest cell edge {}",
                            m_cutoff, shortest));
  }

  double diffR{0}, diffRX{0}, diffRY{0}, diffRZ{0};
  for (long i = 0; i < N - 1; i++) {
    for (long j = i + 1; j < N; j++) {
      if (in.kind == EvalKind::SiteEnergy &&
          static_cast<size_t>(i) != in.atom &&
          static_cast<size_t>(j) != in.atom) {
        continue;
      }
      diffRX = R[3 * i] - R[3 * j];
      diffRY = R[3 * i + 1] - R[3 * j + 1];
      diffRZ = R[3 * i + 2] - R[3 * j + 2];

      // Minimum image convention
      diffRX = diffRX - box[0] * floor(diffRX / box[0] + 0.5);
      diffRY = diffRY - box[4] * floor(diffRY / box[4] + 0.5);
      diffRZ = diffRZ - box[8] * floor(diffRZ / box[8] + 0.5);

      diffR = sqrt(diffRX * diffRX + diffRY * diffRY + diffRZ * diffRZ);
      if (diffR >= m_cutoff) {
        continue;
      }
      if (diffR == 0.0) {
        throw Error(
            fmt::format("InversePowerBasis: atoms {} and {} overlap", i, j));
      }
      const double d[3] = {diffRX, diffRY, diffRZ};

      for (size_t k = 0; k < nb; ++k) {
        const double p = m_exponents[k];
        const double phi = pow(diffR, -p) - m_shift[k];
        // d phi / d r
        const double dphi = -p * pow(diffR, -p - 1);

        switch (in.kind) {
        case EvalKind::Energy:
          V[k] += phi;
          break;
        case EvalKind::SiteEnergy:
          V[k] += 0.5 * phi;
          break;
        case EvalKind::Forces: {
          double *F = V + k * N * 3;
          for (int c = 0; c < 3; ++c) {
            F[3 * i + c] -= dphi * d[c] / diffR;
            F[3 * j + c] += dphi * d[c] / diffR;
          }
          break;
        }
        case EvalKind::Virial: {
          double *W = V + k * 9;
          for (int a = 0; a < 3; ++a) {
            for (int b = 0; b < 3; ++b) {
              W[a * 3 + b] -= dphi * d[a] * d[b] / diffR;
            }
          }
          break;
        }
        }
      }
    }
  }
}

} // namespace acefit
