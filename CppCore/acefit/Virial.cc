// MIT License
// Copyright 2023--present acefit developers

#include "acefit/Virial.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "acefit/errors.hpp"

namespace acefit {

std::array<double, 9> flatten_virial(const DataValue &value) {
  std::array<double, 9> flat{};
  if (const auto *vec = std::get_if<std::vector<double>>(&value)) {
    details::require_shape(vec->size() == 9,
                           "virial must have 9 components, got {}",
                           vec->size());
    std::copy(vec->begin(), vec->end(), flat.begin());
    return flat;
  }
  if (const auto *rows = std::get_if<AtomMatrix>(&value)) {
    // Row vectors of a 3-atom cell: concatenate to the flat tensor.
    details::require_shape(
        rows->hasShape(3, 3),
        "virial row vectors must form a 3 x 3 matrix, got {} x {}",
        rows->rows(), rows->cols());
    std::copy_n(rows->data(), 9, flat.begin());
    return flat;
  }
  throw ShapeError(std::string("virial stored as a ") + describe(value) +
                   ", expected 9 components");
}

std::array<double, 6> voigt(const std::array<double, 9> &flat) {
  std::array<double, 6> v{};
  for (size_t c = 0; c < kVoigtOrder.size(); ++c) {
    v[c] = flat[kVoigtOrder[c]];
  }
  return v;
}

std::array<double, 6> voigt(const Tensor33 &tensor) {
  std::array<double, 9> flat{};
  for (size_t i = 0; i < 3; ++i) {
    for (size_t j = 0; j < 3; ++j) {
      flat[i * 3 + j] = tensor[i][j];
    }
  }
  return voigt(flat);
}

} // namespace acefit
