// MIT License
// Copyright 2023--present acefit developers

#include "acefit/Fit.hpp"

#include <string>

#include "acefit/DatasetAssessment.hpp"
#include "acefit/Log.hpp"
#include "acefit/Report.hpp"
#include "acefit/errors.hpp"

namespace acefit {

std::vector<ObservationRecord>
make_records(const std::vector<Configuration> &configs,
             const config::FitSettings &settings,
             const ReferenceEnergy *reference) {
  const RecordKeys keys = settings.record_keys();
  std::vector<ObservationRecord> records;
  records.reserve(configs.size());
  for (const auto &config : configs) {
    records.emplace_back(config, keys, settings.weights, reference,
                         settings.group_key);
  }
  return records;
}

FitResult fit(const std::vector<ObservationRecord> &records,
              const BasisEvaluator &basis, const LinearSolver &solver) {
  FitResult result;
  result.system = assemble(records, basis);
  const LinearSystem &sys = result.system;
  if (sys.rows() == 0 || sys.cols() == 0) {
    throw Error("cannot fit a linear system of " + std::to_string(sys.rows()) +
                " x " + std::to_string(sys.cols()));
  }
  log::info("solving {} x {} system with {}", sys.rows(), sys.cols(),
            solver.name());

  const Eigen::MatrixXd Aw = sys.w.asDiagonal() * sys.A;
  const Eigen::VectorXd yw = sys.w.cwiseProduct(sys.y);
  result.coefficients = solver.solve(Aw, yw);
  result.residual_norm = (Aw * result.coefficients - yw).norm();
  log::info("weighted residual norm {:.6g}", result.residual_norm);
  return result;
}

FitResult fit(const std::vector<Configuration> &configs,
              const BasisEvaluator &basis, const config::FitSettings &settings,
              const ReferenceEnergy *reference) {
  const auto records = make_records(configs, settings, reference);
  if (log::enabled(log::Level::Info)) {
    log::info("training set\n{}",
              format_assessment(assess_dataset(records, settings.group_key)));
  }
  const auto solver = make_solver(settings.solver);
  return fit(records, basis, *solver);
}

} // namespace acefit
