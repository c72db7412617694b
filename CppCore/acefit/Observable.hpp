#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Observable kinds and the small fixed tables keyed by them.
 *
 * Per-observable quantities (keys, error sums, counts) live in an
 * @c ObsTable with one field per observable instead of string keyed maps.
 */

#include <array>
#include <cstddef>
#include <string_view>

namespace acefit {

/**
 * @brief The four observable kinds a configuration may carry.
 *
 * The enumerator order is the row-block order used by the assembler.
 */
enum class Observable {
  E = 0, //!< Total energy.
  F,     //!< Forces, three components per atom.
  V,     //!< Virial, six Voigt components.
  PAE    //!< Per-atom (site) energies.
};

/**
 * @brief All observables in row-block order.
 */
inline constexpr std::array<Observable, 4> kObservables = {
    Observable::E, Observable::F, Observable::V, Observable::PAE};

/**
 * @brief Short name used in tables and settings files.
 * @param obs The observable.
 * @return @c "E", @c "F", @c "V" or @c "PAE".
 */
constexpr std::string_view to_string(Observable obs) {
  switch (obs) {
  case Observable::E:
    return "E";
  case Observable::F:
    return "F";
  case Observable::V:
    return "V";
  case Observable::PAE:
    return "PAE";
  }
  return "?";
}

/**
 * @struct ObsTable
 * @brief One value of type @c T per observable.
 */
template <typename T> struct ObsTable {
  T E{};   //!< Energy entry.
  T F{};   //!< Force entry.
  T V{};   //!< Virial entry.
  T PAE{}; //!< Per-atom energy entry.

  T &operator[](Observable obs) {
    switch (obs) {
    case Observable::E:
      return E;
    case Observable::F:
      return F;
    case Observable::V:
      return V;
    case Observable::PAE:
      break;
    }
    return PAE;
  }

  const T &operator[](Observable obs) const {
    return const_cast<ObsTable &>(*this)[obs];
  }
};

/**
 * @struct Weights
 * @brief Regression weights for one group of configurations.
 *
 * Per-atom energy rows do not use these weights; see
 * @c acefit::weight_vector.
 */
struct Weights {
  double E = 1.0; //!< Energy weight, divided by sqrt(N) per row.
  double F = 1.0; //!< Force weight, applied to every force row.
  double V = 1.0; //!< Virial weight, divided by sqrt(N) per row.

  bool operator==(const Weights &other) const {
    return E == other.E && F == other.F && V == other.V;
  }
};

} // namespace acefit
