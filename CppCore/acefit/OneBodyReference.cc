// MIT License
// Copyright 2023--present acefit developers

#include "acefit/OneBodyReference.hpp"

#include <string>

#include "acefit/errors.hpp"

namespace acefit {

double OneBodyReference::energy(const Configuration &config) const {
  double e = 0.0;
  for (int z : config.species()) {
    auto it = m_e0.find(z);
    if (it == m_e0.end()) {
      throw Error("no reference energy for atomic number " +
                  std::to_string(z));
    }
    e += it->second;
  }
  return e;
}

} // namespace acefit
