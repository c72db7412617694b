// MIT License
// Copyright 2023--present acefit developers
#include <catch2/catch_all.hpp>
#include <map>
#include <string>
#include <vector>

#include "TestHelpers.hpp"
#include "acefit/ErrorAggregator.hpp"
#include "acefit/ObservationRecord.hpp"
#include "acefit/OneBodyReference.hpp"
#include "acefit/errors.hpp"

using namespace Catch::Matchers;
using acefit::testing::ConstantModel;
using acefit::testing::filled;
using acefit::testing::line_config;

TEST_CASE("Keys resolve case-insensitively", "[record]") {
  auto config = line_config(2);
  config.set("Energy", -3.0);

  SECTION("Differently cased request") {
    acefit::ObservationRecord rec(config, {.energy = "ENERGY"});
    REQUIRE(rec.has(acefit::Observable::E));
    REQUIRE(*rec.key(acefit::Observable::E) == "Energy");
    REQUIRE_THAT(rec.energy(), WithinAbs(-3.0, 1e-12));
  }

  SECTION("First stored match wins") {
    config.set("ENERGY", 7.0);
    acefit::ObservationRecord rec(config, {.energy = "energy"});
    REQUIRE(*rec.key(acefit::Observable::E) == "Energy");
    REQUIRE_THAT(rec.energy(), WithinAbs(-3.0, 1e-12));
  }

  SECTION("Absent keys disable the observable") {
    acefit::ObservationRecord rec(
        config, {.energy = "energy", .force = "force", .virial = "virial"});
    REQUIRE(rec.has(acefit::Observable::E));
    REQUIRE_FALSE(rec.has(acefit::Observable::F));
    REQUIRE_FALSE(rec.has(acefit::Observable::V));
    REQUIRE_FALSE(rec.has(acefit::Observable::PAE));
    REQUIRE_THROWS_AS(rec.forces(), acefit::Error);
  }

  SECTION("Unrequested observables stay inactive") {
    acefit::ObservationRecord rec(config, {});
    REQUIRE_FALSE(rec.has(acefit::Observable::E));
    REQUIRE_FALSE(rec.mask_key().has_value());
  }
}

TEST_CASE("Weights resolve through the group label", "[record]") {
  const acefit::WeightTable table{{"default", {30.0, 1.0, 1.0}},
                                  {"crystal", {100.0, 2.0, 3.0}}};

  SECTION("Matching group") {
    auto config = line_config(2);
    config.set("config_type", std::string("Crystal"));
    acefit::ObservationRecord rec(config, {}, table);
    REQUIRE(rec.weights() == acefit::Weights{100.0, 2.0, 3.0});
    REQUIRE(acefit::group_label(rec) == "Crystal");
  }

  SECTION("Unknown group falls back to default") {
    auto config = line_config(2);
    config.set("config_type", std::string("liquid"));
    acefit::ObservationRecord rec(config, {}, table);
    REQUIRE(rec.weights() == acefit::Weights{30.0, 1.0, 1.0});
  }

  SECTION("Missing label uses the default entry and label") {
    auto config = line_config(2);
    acefit::ObservationRecord rec(config, {}, table);
    REQUIRE(rec.weights() == acefit::Weights{30.0, 1.0, 1.0});
    REQUIRE(acefit::group_label(rec) == "default");
  }

  SECTION("No default entry gives unit weights") {
    auto config = line_config(2);
    config.set("config_type", std::string("liquid"));
    const acefit::WeightTable partial{{"crystal", {100.0, 2.0, 3.0}}};
    acefit::ObservationRecord rec(config, {}, partial);
    REQUIRE(rec.weights() == acefit::Weights{1.0, 1.0, 1.0});
  }

  SECTION("Non-string label is ignored") {
    auto config = line_config(2);
    config.set("config_type", 4.0);
    acefit::ObservationRecord rec(config, {}, table);
    REQUIRE(rec.weights() == acefit::Weights{30.0, 1.0, 1.0});
    REQUIRE(acefit::group_label(rec) == "default");
  }

  SECTION("Custom weight key") {
    auto config = line_config(2);
    config.set("phase", std::string("crystal"));
    acefit::ObservationRecord rec(config, {}, table, nullptr, "phase");
    REQUIRE(rec.weights() == acefit::Weights{100.0, 2.0, 3.0});
  }
}

TEST_CASE("Reference energy is evaluated at construction", "[record]") {
  auto config = line_config(3);
  config.set("energy", -10.0);
  const acefit::OneBodyReference ref(std::map<int, double>{{1, -0.5}});
  acefit::ObservationRecord rec(config, {.energy = "energy"},
                                acefit::WeightTable::uniform(), &ref);
  REQUIRE_THAT(rec.energy_reference(), WithinAbs(-1.5, 1e-12));

  acefit::ObservationRecord bare(config, {.energy = "energy"});
  REQUIRE_THAT(bare.energy_reference(), WithinAbs(0.0, 1e-12));

  const acefit::OneBodyReference other(std::map<int, double>{{8, -2.0}});
  REQUIRE_THROWS_AS(acefit::ObservationRecord(config, {.energy = "energy"},
                                              acefit::WeightTable::uniform(),
                                              &other),
                    acefit::Error);
}

TEST_CASE("Malformed stored data raises shape errors", "[record]") {
  auto config = line_config(2);
  config.set("energy", std::string("high"))
      .set("force", filled(3, 3, 0.0))
      .set("virial", std::vector<double>(6, 0.0))
      .set("pae", std::vector<double>{1.0});
  acefit::ObservationRecord rec(config, {.energy = "energy",
                                         .force = "force",
                                         .virial = "virial",
                                         .pae = "pae"});
  REQUIRE(rec.has(acefit::Observable::E));
  REQUIRE_THROWS_AS(rec.energy(), acefit::ShapeError);
  REQUIRE_THROWS_AS(rec.forces(), acefit::ShapeError);
  REQUIRE_THROWS_AS(rec.virial(), acefit::ShapeError);
  REQUIRE_THROWS_AS(rec.site_energies(), acefit::ShapeError);
}

TEST_CASE("Configurations validate their shapes", "[record]") {
  REQUIRE_THROWS_AS(acefit::Configuration(filled(2, 2, 0.0), {1, 1},
                                          acefit::testing::cubic_cell(5.0)),
                    acefit::ShapeError);
  REQUIRE_THROWS_AS(acefit::Configuration(filled(2, 3, 0.0), {1},
                                          acefit::testing::cubic_cell(5.0)),
                    acefit::ShapeError);
  auto config = line_config(2);
  config.set("Energy", 1.0).set("Energy", 2.0);
  REQUIRE(config.data().size() == 1);
  REQUIRE(config.data().contains("Energy"));
  REQUIRE_FALSE(config.data().contains("energy"));
  REQUIRE(config.data().resolve("energy") == "Energy");
  REQUIRE_THROWS_AS(config.data().at("nothing"), acefit::Error);
}

TEST_CASE("Group key matches stored keys case-insensitively", "[record]") {
  const acefit::WeightTable table{{"default", {30.0, 1.0, 1.0}},
                                  {"crystal", {100.0, 2.0, 3.0}}};
  auto config = line_config(2);
  config.set("Config_Type", std::string("crystal")).set("energy", -4.0);

  acefit::ObservationRecord rec(config, {.energy = "energy"}, table);
  REQUIRE(acefit::find_group(config, "config_type") == "crystal");
  REQUIRE(acefit::group_label(rec) == "crystal");
  REQUIRE(rec.weights() == acefit::Weights{100.0, 2.0, 3.0});

  const std::vector<acefit::ObservationRecord> records{rec};
  const auto report =
      acefit::compute_errors(records, ConstantModel(0.0, 0.0, 0.0, 0.0));
  REQUIRE(report.labels() == std::vector<std::string>{"crystal", "set"});
  REQUIRE_THAT(report.at("crystal").mae.E, WithinAbs(2.0, 1e-12));
}
