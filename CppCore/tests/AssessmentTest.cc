// MIT License
// Copyright 2023--present acefit developers
#include <catch2/catch_all.hpp>
#include <string>
#include <vector>

#include "TestHelpers.hpp"
#include "acefit/DatasetAssessment.hpp"

using acefit::testing::filled;
using acefit::testing::line_config;

namespace {

const acefit::RecordKeys kKeys{
    .energy = "energy", .force = "force", .virial = "virial"};

} // namespace

TEST_CASE("Two groups with energies and forces but no virials",
          "[assessment]") {
  std::vector<acefit::Configuration> configs;
  for (size_t i = 0; i < 3; ++i) {
    auto c = line_config(4);
    c.set("energy", -1.0)
        .set("force", filled(4, 3, 0.0))
        .set("config_type", std::string("crystal"));
    configs.push_back(c);
  }
  for (size_t i = 0; i < 5; ++i) {
    auto c = line_config(2);
    c.set("energy", -1.0)
        .set("force", filled(2, 3, 0.0))
        .set("config_type", std::string("liquid"));
    configs.push_back(c);
  }
  std::vector<acefit::ObservationRecord> records;
  for (const auto &c : configs) {
    records.emplace_back(c, kKeys);
  }

  const auto assessment = acefit::assess_dataset(records);

  REQUIRE(assessment.groups.labels() ==
          std::vector<std::string>{"crystal", "liquid"});
  const auto &crystal = assessment.groups.at("crystal");
  REQUIRE(crystal.configs == 3);
  REQUIRE(crystal.environments == 12);
  REQUIRE(crystal.energies == 3);
  REQUIRE(crystal.forces == 36);
  REQUIRE(crystal.virials == 0);

  const auto &total = assessment.total;
  REQUIRE(total.configs == 8);
  REQUIRE(total.environments == 12 + 10);
  REQUIRE(total.energies == 8);
  REQUIRE(total.forces == 3 * 22);

  const auto &missing = assessment.missing;
  REQUIRE(missing.configs == 0);
  REQUIRE(missing.environments == 0);
  REQUIRE(missing.energies == 0);
  REQUIRE(missing.forces == 0);
  REQUIRE(missing.virials == 6 * 8);
}

TEST_CASE("Missing observations are counted against the maximum",
          "[assessment]") {
  auto with_virial = line_config(3);
  with_virial.set("virial", std::vector<double>(9, 0.0));
  auto bare = line_config(2);
  std::vector<acefit::ObservationRecord> records{{with_virial, kKeys},
                                                 {bare, kKeys}};

  const auto assessment = acefit::assess_dataset(records);
  REQUIRE(assessment.groups.labels() == std::vector<std::string>{"default"});
  REQUIRE(assessment.missing.energies == 2);
  REQUIRE(assessment.missing.forces == 15);
  REQUIRE(assessment.missing.virials == 6);
}
