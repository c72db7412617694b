// MIT License
// Copyright 2023--present acefit developers

#include "acefit/DatasetAssessment.hpp"

namespace acefit {

AssessmentRow &AssessmentRow::operator+=(const AssessmentRow &other) {
  configs += other.configs;
  environments += other.environments;
  energies += other.energies;
  forces += other.forces;
  virials += other.virials;
  return *this;
}

bool AssessmentRow::operator==(const AssessmentRow &other) const {
  return configs == other.configs && environments == other.environments &&
         energies == other.energies && forces == other.forces &&
         virials == other.virials;
}

/**
 * @details
 * Force counts use all 3N components regardless of any atom mask, matching
 * the maximum in the @c missing row.
 */
DatasetAssessment assess_dataset(const std::vector<ObservationRecord> &records,
                                 const std::string &group_key) {
  DatasetAssessment out;
  for (const auto &record : records) {
    const size_t nAtoms = record.size();
    AssessmentRow row;
    row.configs = 1;
    row.environments = nAtoms;
    row.energies = record.has(Observable::E) ? 1 : 0;
    row.forces = record.has(Observable::F) ? 3 * nAtoms : 0;
    row.virials = record.has(Observable::V) ? 6 : 0;
    out.groups[group_label(record, group_key)] += row;
    out.total += row;
  }
  const AssessmentRow &t = out.total;
  out.missing.energies = t.configs - t.energies;
  out.missing.forces = 3 * t.environments - t.forces;
  out.missing.virials = 6 * t.configs - t.virials;
  return out;
}

} // namespace acefit
