// MIT License
// Copyright 2023--present acefit developers

#include "acefit/Mask.hpp"

#include <algorithm>
#include <string>

#include "acefit/errors.hpp"

namespace acefit {

std::vector<bool> atom_mask(const ObservationRecord &record) {
  const size_t nAtoms = record.size();
  if (!record.mask_key()) {
    return std::vector<bool>(nAtoms, true);
  }
  const DataValue &value =
      record.configuration().data().at(*record.mask_key());
  const auto *stored = std::get_if<std::vector<double>>(&value);
  details::require_shape(stored != nullptr && stored->size() == nAtoms,
                         "mask '{}' must hold {} values", *record.mask_key(),
                         nAtoms);
  std::vector<bool> mask(nAtoms);
  for (size_t i = 0; i < nAtoms; ++i) {
    mask[i] = (*stored)[i] != 0.0;
  }
  return mask;
}

std::vector<bool> force_mask(const ObservationRecord &record) {
  const auto atoms = atom_mask(record);
  std::vector<bool> mask;
  mask.reserve(3 * atoms.size());
  for (bool selected : atoms) {
    mask.insert(mask.end(), 3, selected);
  }
  return mask;
}

size_t count_selected(const std::vector<bool> &mask) {
  return static_cast<size_t>(std::count(mask.begin(), mask.end(), true));
}

} // namespace acefit
