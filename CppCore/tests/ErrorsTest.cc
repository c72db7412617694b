// MIT License
// Copyright 2023--present acefit developers
#include <catch2/catch_all.hpp>
#include <cmath>
#include <string>
#include <vector>

#include "TestHelpers.hpp"
#include "acefit/ErrorAggregator.hpp"

using namespace Catch::Matchers;
using acefit::Observable;
using acefit::testing::ConstantModel;
using acefit::testing::filled;
using acefit::testing::line_config;

namespace {

const acefit::RecordKeys kKeys{.energy = "energy",
                               .force = "force",
                               .virial = "virial",
                               .pae = "pae",
                               .mask = "mask"};

acefit::Configuration labelled(size_t nAtoms, const std::string &group,
                               double energy) {
  auto config = line_config(nAtoms);
  config.set("energy", energy)
      .set("force", filled(nAtoms, 3, 0.0))
      .set("config_type", group);
  return config;
}

} // namespace

TEST_CASE("Accumulator statistics", "[errors]") {
  acefit::ErrorAccumulator acc;
  REQUIRE(acc.mae() == 0.0);
  REQUIRE(acc.rmse() == 0.0);

  acc.add(3.0);
  acc.add(-4.0);
  REQUIRE(acc.count == 2);
  REQUIRE_THAT(acc.mae(), WithinAbs(3.5, 1e-12));
  REQUIRE_THAT(acc.rmse(), WithinAbs(std::sqrt(12.5), 1e-12));
}

TEST_CASE("Empty record sets give a zero report", "[errors]") {
  const ConstantModel model(0.0, 0.0, 0.0, 0.0);
  const auto report = acefit::compute_errors({}, model);
  REQUIRE(report.labels() == std::vector<std::string>{"set"});
  const auto &set = report.at("set");
  for (Observable obs : acefit::kObservables) {
    REQUIRE(set.mae[obs] == 0.0);
    REQUIRE(set.rmse[obs] == 0.0);
    REQUIRE(set.count[obs] == 0);
  }
}

TEST_CASE("Deviations per observable", "[errors]") {
  auto config = line_config(2);
  config.set("energy", -10.0)
      .set("force", filled(2, 3, 0.0))
      .set("virial", std::vector<double>(9, 0.0))
      .set("pae", std::vector<double>{0.0, 0.0})
      .set("mask", std::vector<double>{1.0, 0.0});
  std::vector<acefit::ObservationRecord> records{{config, kKeys}};
  const ConstantModel model(-8.0, 0.5, 2.0, 0.25);

  const auto report = acefit::compute_errors(records, model);
  const auto &set = report.at("set");

  // Energies per atom.
  REQUIRE(set.count.E == 1);
  REQUIRE_THAT(set.mae.E, WithinAbs(1.0, 1e-12));
  // Forces ignore the atom mask.
  REQUIRE(set.count.F == 6);
  REQUIRE_THAT(set.mae.F, WithinAbs(0.5, 1e-12));
  REQUIRE_THAT(set.rmse.F, WithinAbs(0.5, 1e-12));
  // Virials divided by N.
  REQUIRE(set.count.V == 6);
  REQUIRE_THAT(set.mae.V, WithinAbs(1.0, 1e-12));
  // Site energies of masked atoms only.
  REQUIRE(set.count.PAE == 1);
  REQUIRE_THAT(set.rmse.PAE, WithinAbs(0.25, 1e-12));

  // Single group mirrors the set.
  REQUIRE(report.labels() == std::vector<std::string>{"default", "set"});
  REQUIRE(report.at("default").count.F == 6);
}

TEST_CASE("Groups keep first-seen order", "[errors]") {
  const auto b1 = labelled(2, "b", -2.0);
  const auto a1 = labelled(2, "a", -4.0);
  const auto b2 = labelled(4, "b", -4.0);
  std::vector<acefit::ObservationRecord> records{
      {b1, kKeys}, {a1, kKeys}, {b2, kKeys}};
  const ConstantModel model(0.0, 0.0, 0.0, 0.0);

  const auto report = acefit::compute_errors(records, model);
  REQUIRE(report.labels() == std::vector<std::string>{"b", "a", "set"});
  REQUIRE(report.at("b").count.E == 2);
  REQUIRE_THAT(report.at("b").mae.E, WithinAbs(1.0, 1e-12));
  REQUIRE_THAT(report.at("a").mae.E, WithinAbs(2.0, 1e-12));
  REQUIRE(report.at("set").count.E == 3);
  REQUIRE(report.at("set").count.F == 6 + 6 + 12);
  REQUIRE_THAT(report.at("set").rmse.E, WithinAbs(std::sqrt(2.0), 1e-12));
}

TEST_CASE("Partial accumulators merge to the whole", "[errors]") {
  std::vector<acefit::Configuration> configs;
  for (size_t i = 0; i < 6; ++i) {
    configs.push_back(labelled(2 + i, i % 2 ? "odd" : "even",
                               -1.0 - static_cast<double>(i)));
  }
  std::vector<acefit::ObservationRecord> all, head, tail;
  for (size_t i = 0; i < configs.size(); ++i) {
    all.emplace_back(configs[i], kKeys);
    (i < 3 ? head : tail).emplace_back(configs[i], kKeys);
  }
  const ConstantModel model(0.5, 0.1, 0.0, 0.0);

  auto merged = acefit::accumulate_errors(head, model);
  merged.merge(acefit::accumulate_errors(tail, model));
  const auto whole = acefit::compute_errors(all, model);
  const auto split = acefit::finalize(merged);

  REQUIRE(split.labels() == whole.labels());
  for (const auto &label : whole.labels()) {
    for (Observable obs : acefit::kObservables) {
      REQUIRE(split.at(label).count[obs] == whole.at(label).count[obs]);
      REQUIRE_THAT(split.at(label).mae[obs],
                   WithinAbs(whole.at(label).mae[obs], 1e-12));
      REQUIRE_THAT(split.at(label).rmse[obs],
                   WithinAbs(whole.at(label).rmse[obs], 1e-12));
    }
  }
}

TEST_CASE("A user group named set is replaced", "[errors]") {
  const auto a = labelled(2, "set", -2.0);
  const auto b = labelled(2, "other", 0.0);
  std::vector<acefit::ObservationRecord> records{{a, kKeys}, {b, kKeys}};
  const ConstantModel model(0.0, 0.0, 0.0, 0.0);
  const auto report = acefit::compute_errors(records, model);
  REQUIRE(report.labels() == std::vector<std::string>{"other", "set"});
  REQUIRE(report.at("set").count.E == 2);
}
