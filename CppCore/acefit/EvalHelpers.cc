// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Implementation of utility functions for basis evaluation.
 */

#include "EvalHelpers.hpp"

#include <string>

#include "acefit/errors.hpp"

namespace acefit {

size_t evalOutSize(EvalKind kind, size_t nbasis, size_t nAtoms) {
  switch (kind) {
  case EvalKind::Energy:
  case EvalKind::SiteEnergy:
    return nbasis;
  case EvalKind::Forces:
    return nbasis * nAtoms * 3;
  case EvalKind::Virial:
    return nbasis * 9;
  }
  return 0;
}

/**
 * @details
 * A request must describe at least one atom, and a site energy request must
 * name an atom inside the configuration.
 *
 * @warning Throws an @c acefit::Error otherwise.
 */
void checkInput(const EvalInput &in) {
  if (in.nAtoms == 0) {
    throw Error("Can't evaluate a basis on a configuration without atoms");
  }
  if (in.kind == EvalKind::SiteEnergy && in.atom >= in.nAtoms) {
    throw Error("site energy requested for atom " + std::to_string(in.atom) +
                " of a configuration with " + std::to_string(in.nAtoms) +
                " atoms");
  }
}

} // namespace acefit
