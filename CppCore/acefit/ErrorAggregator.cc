// MIT License
// Copyright 2023--present acefit developers

#include "acefit/ErrorAggregator.hpp"

#include <fmt/format.h>

#include <cmath>

#include "acefit/Log.hpp"
#include "acefit/Mask.hpp"
#include "acefit/Virial.hpp"
#include "acefit/errors.hpp"
#include "acefit/types/adapters/eigen.hpp"

namespace acefit {

void ErrorAccumulator::add(double deviation) {
  sum_abs += std::abs(deviation);
  sum_sq += deviation * deviation;
  ++count;
}

ErrorAccumulator &ErrorAccumulator::operator+=(const ErrorAccumulator &other) {
  sum_abs += other.sum_abs;
  sum_sq += other.sum_sq;
  count += other.count;
  return *this;
}

double ErrorAccumulator::mae() const {
  return count == 0 ? 0.0 : sum_abs / static_cast<double>(count);
}

double ErrorAccumulator::rmse() const {
  return count == 0 ? 0.0 : std::sqrt(sum_sq / static_cast<double>(count));
}

ObsAccumulators &operator+=(ObsAccumulators &lhs, const ObsAccumulators &rhs) {
  for (Observable obs : kObservables) {
    lhs[obs] += rhs[obs];
  }
  return lhs;
}

GroupedAccumulators &
GroupedAccumulators::merge(const GroupedAccumulators &other) {
  for (const auto &[label, acc] : other.groups.items()) {
    groups[label] += acc;
  }
  total += other.total;
  return *this;
}

ErrorStats finalize(const ObsAccumulators &acc) {
  ErrorStats stats;
  for (Observable obs : kObservables) {
    stats.mae[obs] = acc[obs].mae();
    stats.rmse[obs] = acc[obs].rmse();
    stats.count[obs] = acc[obs].count;
  }
  return stats;
}

ErrorReport finalize(const GroupedAccumulators &acc) {
  ErrorReport report;
  for (const auto &[label, sums] : acc.groups.items()) {
    if (label == kSetLabel) {
      log::warn("group label '{}' is reserved, its entry is replaced by the "
                "whole-set errors",
                label);
      continue;
    }
    report[label] = finalize(sums);
  }
  report[kSetLabel] = finalize(acc.total);
  return report;
}

namespace {

/**
 * @brief Deviations of one record.
 */
ObsAccumulators record_errors(const ObservationRecord &record,
                              const ModelEvaluator &model) {
  ObsAccumulators acc;
  const Configuration &config = record.configuration();
  const size_t nAtoms = record.size();
  const double n = static_cast<double>(nAtoms);

  if (record.has(Observable::E)) {
    if (nAtoms == 0) {
      throw Error("configuration without atoms cannot carry an energy");
    }
    acc.E.add(model.energy(config) / n - record.energy() / n);
  }

  if (record.has(Observable::F)) {
    const AtomMatrix &ref = record.forces();
    const AtomMatrix pred = model.forces(config);
    if (!pred.hasShape(nAtoms, 3)) {
      throw ShapeError(fmt::format("model forces must be {} x 3", nAtoms));
    }
    const Eigen::VectorXd diff =
        types::adapt::eigen::flatten(pred) - types::adapt::eigen::flatten(ref);
    for (Eigen::Index c = 0; c < diff.size(); ++c) {
      acc.F.add(diff[c]);
    }
  }

  if (record.has(Observable::V)) {
    if (nAtoms == 0) {
      throw Error("configuration without atoms cannot carry a virial");
    }
    const auto pred = voigt(model.virial(config));
    const auto ref = voigt(record.virial());
    for (size_t c = 0; c < pred.size(); ++c) {
      acc.V.add(pred[c] / n - ref[c] / n);
    }
  }

  if (record.has(Observable::PAE)) {
    const auto &ref = record.site_energies();
    const auto mask = atom_mask(record);
    for (size_t i = 0; i < nAtoms; ++i) {
      if (mask[i]) {
        acc.PAE.add(model.site_energy(config, i) - ref[i]);
      }
    }
  }
  return acc;
}

} // namespace

GroupedAccumulators
accumulate_errors(const std::vector<ObservationRecord> &records,
                  const ModelEvaluator &model, const std::string &group_key) {
  GroupedAccumulators out;
  for (const auto &record : records) {
    const ObsAccumulators acc = record_errors(record, model);
    out.groups[group_label(record, group_key)] += acc;
    out.total += acc;
  }
  return out;
}

ErrorReport compute_errors(const std::vector<ObservationRecord> &records,
                           const ModelEvaluator &model,
                           const std::string &group_key) {
  auto report = finalize(accumulate_errors(records, model, group_key));
  log::debug("computed errors of {} configurations in {} groups",
             records.size(), report.size() - 1);
  return report;
}

} // namespace acefit
