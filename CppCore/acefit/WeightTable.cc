// MIT License
// Copyright 2023--present acefit developers

#include "acefit/WeightTable.hpp"

#include "acefit/Configuration.hpp"

namespace acefit {

WeightTable::WeightTable(
    std::initializer_list<std::pair<std::string, Weights>> entries) {
  for (const auto &[label, weights] : entries) {
    set(label, weights);
  }
}

WeightTable WeightTable::uniform() {
  return WeightTable{{std::string(kDefaultLabel), Weights{}}};
}

void WeightTable::set(const std::string &label, Weights weights) {
  for (auto &entry : m_entries) {
    if (iequals(entry.first, label)) {
      entry.second = weights;
      return;
    }
  }
  m_entries.emplace_back(label, weights);
}

std::optional<Weights> WeightTable::find(std::string_view label) const {
  for (const auto &[name, weights] : m_entries) {
    if (iequals(name, label)) {
      return weights;
    }
  }
  return std::nullopt;
}

Weights WeightTable::resolve(const std::optional<std::string> &label) const {
  if (label) {
    if (auto hit = find(*label)) {
      return *hit;
    }
  }
  return find(kDefaultLabel).value_or(Weights{});
}

WeightTable default_fit_weights() {
  return WeightTable{
      {std::string(WeightTable::kDefaultLabel), Weights{30.0, 1.0, 1.0}}};
}

} // namespace acefit
