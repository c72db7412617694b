#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Training and test error statistics of a fitted model.
 *
 * Errors are accumulated as plain sums so partial results over disjoint
 * record sets merge by addition.  Finalization turns sums into MAE and RMSE.
 *
 * Deviations per observable:
 *   - E: @f$ E_{pred}/N - E_{ref}/N @f$, one per record;
 *   - F: every Cartesian component of every atom, @f$ 3N @f$ per record,
 *        without the atom mask;
 *   - V: the six Voigt components, both sides divided by N;
 *   - PAE: site energies of the masked atoms.
 */

#include <cstddef>
#include <string>
#include <vector>

#include "acefit/Evaluators.hpp"
#include "acefit/Grouping.hpp"
#include "acefit/Observable.hpp"
#include "acefit/ObservationRecord.hpp"

namespace acefit {

/**
 * @brief Label of the whole-dataset entry of an error report.
 */
inline constexpr const char *kSetLabel = "set";

/**
 * @struct ErrorAccumulator
 * @brief Running sums of absolute and squared deviations.
 */
struct ErrorAccumulator {
  double sum_abs = 0.0; //!< Sum of |d|.
  double sum_sq = 0.0;  //!< Sum of d^2.
  size_t count = 0;     //!< Number of deviations.

  void add(double deviation);

  ErrorAccumulator &operator+=(const ErrorAccumulator &other);

  /**
   * @brief Mean absolute error.
   * @return @c sum_abs / count, or 0 if nothing was accumulated.
   */
  double mae() const;

  /**
   * @brief Root mean square error.
   * @return @c sqrt(sum_sq / count), or 0 if nothing was accumulated.
   */
  double rmse() const;
};

using ObsAccumulators = ObsTable<ErrorAccumulator>;

ObsAccumulators &operator+=(ObsAccumulators &lhs, const ObsAccumulators &rhs);

/**
 * @struct GroupedAccumulators
 * @brief Unfinalized errors per group and for the whole set.
 */
struct GroupedAccumulators {
  GroupedTable<ObsAccumulators> groups; //!< Per-group sums, first-seen order.
  ObsAccumulators total;                //!< Sums over every record.

  /**
   * @brief Adds another partial result.
   * @param other Accumulators over a disjoint set of records.
   * @return This object.
   */
  GroupedAccumulators &merge(const GroupedAccumulators &other);
};

/**
 * @struct ErrorStats
 * @brief Finalized statistics of one group.
 */
struct ErrorStats {
  ObsTable<double> mae;   //!< Mean absolute error per observable.
  ObsTable<double> rmse;  //!< Root mean square error per observable.
  ObsTable<size_t> count; //!< Number of deviations per observable.
};

/**
 * @brief Finalized errors: groups in first-seen order, then @c "set".
 *
 * A user group literally labelled @c "set" is replaced by the whole-set
 * entry.
 */
using ErrorReport = GroupedTable<ErrorStats>;

ErrorStats finalize(const ObsAccumulators &acc);

/**
 * @brief Turns accumulated sums into a report.
 * @param acc Grouped sums.
 * @return The report.
 */
ErrorReport finalize(const GroupedAccumulators &acc);

/**
 * @brief Accumulates model deviations without finalizing them.
 * @param records   The records to evaluate.
 * @param model     The model evaluation capability.
 * @param group_key Data key holding the group label.
 * @return Grouped sums.
 * @throws acefit::ShapeError if the model returns wrongly shaped forces.
 */
GroupedAccumulators
accumulate_errors(const std::vector<ObservationRecord> &records,
                  const ModelEvaluator &model,
                  const std::string &group_key = kDefaultGroupKey);

/**
 * @brief MAE, RMSE and counts per group and for the whole set.
 * @param records   The records to evaluate.
 * @param model     The model evaluation capability.
 * @param group_key Data key holding the group label.
 * @return The finalized report.
 */
ErrorReport compute_errors(const std::vector<ObservationRecord> &records,
                           const ModelEvaluator &model,
                           const std::string &group_key = kDefaultGroupKey);

} // namespace acefit
