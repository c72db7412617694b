// MIT License
// Copyright 2023--present acefit developers

#include "acefit/RowLayout.hpp"

#include "acefit/Mask.hpp"

namespace acefit {

RowLayout::RowLayout(const ObservationRecord &record) {
  auto push = [this](Observable kind, size_t rows) {
    m_blocks.push_back(RowBlock{kind, m_rows, rows});
    m_rows += rows;
  };
  if (record.has(Observable::E)) {
    push(Observable::E, 1);
  }
  if (record.has(Observable::F)) {
    push(Observable::F, count_selected(force_mask(record)));
  }
  if (record.has(Observable::V)) {
    push(Observable::V, 6);
  }
  if (record.has(Observable::PAE)) {
    push(Observable::PAE, count_selected(atom_mask(record)));
  }
}

std::optional<RowBlock> RowLayout::block(Observable obs) const {
  for (const auto &b : m_blocks) {
    if (b.kind == obs) {
      return b;
    }
  }
  return std::nullopt;
}

size_t count_observations(const ObservationRecord &record) {
  return RowLayout(record).rows();
}

size_t count_observations(const std::vector<ObservationRecord> &records) {
  size_t total = 0;
  for (const auto &record : records) {
    total += count_observations(record);
  }
  return total;
}

} // namespace acefit
