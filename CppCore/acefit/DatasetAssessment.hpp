#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Observation counts of a training set, per group.
 */

#include <cstddef>
#include <string>
#include <vector>

#include "acefit/Grouping.hpp"
#include "acefit/ObservationRecord.hpp"

namespace acefit {

/**
 * @struct AssessmentRow
 * @brief Counts of one group.
 */
struct AssessmentRow {
  size_t configs = 0;      //!< Configurations.
  size_t environments = 0; //!< Atoms.
  size_t energies = 0;     //!< Energy observations, one per configuration.
  size_t forces = 0;       //!< Force observations, 3N per configuration.
  size_t virials = 0;      //!< Virial observations, six per configuration.

  AssessmentRow &operator+=(const AssessmentRow &other);
  bool operator==(const AssessmentRow &other) const;
};

/**
 * @struct DatasetAssessment
 * @brief Per-group counts with totals and the observations not present.
 */
struct DatasetAssessment {
  GroupedTable<AssessmentRow> groups; //!< First-seen group order.
  AssessmentRow total;                //!< Sum over every group.
  /**
   * @brief Observations the dataset could carry but does not.
   *
   * @c [0, 0, configs - E, 3 * envs - F, 6 * configs - V].
   */
  AssessmentRow missing;
};

/**
 * @brief Counts configurations, atoms and observations.
 * @param records   The records.
 * @param group_key Data key holding the group label.
 * @return The assessment.
 */
DatasetAssessment
assess_dataset(const std::vector<ObservationRecord> &records,
               const std::string &group_key = kDefaultGroupKey);

} // namespace acefit
