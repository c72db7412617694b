// MIT License
// Copyright 2023--present acefit developers
#include <catch2/catch_all.hpp>
#include <cmath>
#include <map>
#include <vector>

#include "TestHelpers.hpp"
#include "acefit/Assembler.hpp"
#include "acefit/OneBodyReference.hpp"
#include "acefit/RowLayout.hpp"
#include "acefit/errors.hpp"

using namespace Catch::Matchers;
using acefit::testing::FakeBasis;
using acefit::testing::filled;
using acefit::testing::line_config;

TEST_CASE("Energy only configuration", "[assembly]") {
  auto config = line_config(2);
  config.set("energy", -10.0);
  const auto weights = acefit::default_fit_weights();
  std::vector<acefit::ObservationRecord> records{
      {config, {.energy = "energy"}, weights}};

  REQUIRE(acefit::count_observations(records) == 1);
  const auto sys = acefit::assemble(records, FakeBasis{});
  REQUIRE(sys.rows() == 1);
  REQUIRE(sys.cols() == 2);
  REQUIRE_THAT(sys.y[0], WithinAbs(-10.0, 1e-12));
  REQUIRE_THAT(sys.w[0], WithinAbs(30.0 / std::sqrt(2.0), 1e-12));
  REQUIRE_THAT(sys.A(0, 0), WithinAbs(2.0, 1e-12));
  REQUIRE_THAT(sys.A(0, 1), WithinAbs(4.0, 1e-12));
}

TEST_CASE("Forces only configuration", "[assembly]") {
  auto config = line_config(3);
  auto forces = filled(3, 3, 0.0);
  forces(0, 0) = 1.0;
  config.set("force", forces);
  const acefit::WeightTable weights{{"default", {30.0, 2.5, 1.0}}};
  std::vector<acefit::ObservationRecord> records{
      {config, {.force = "force"}, weights}};

  REQUIRE(acefit::count_observations(records) == 9);
  const Eigen::VectorXd y = acefit::target_vector(records);
  const Eigen::VectorXd w = acefit::weight_vector(records);
  REQUIRE(y.size() == 9);
  REQUIRE_THAT(y[0], WithinAbs(1.0, 1e-12));
  for (Eigen::Index i = 1; i < 9; ++i) {
    REQUIRE_THAT(y[i], WithinAbs(0.0, 1e-12));
  }
  for (Eigen::Index i = 0; i < 9; ++i) {
    REQUIRE_THAT(w[i], WithinAbs(2.5, 1e-12));
  }

  const Eigen::MatrixXd A = acefit::feature_matrix(records, FakeBasis{});
  REQUIRE(A.rows() == 9);
  for (Eigen::Index c = 0; c < 9; ++c) {
    REQUIRE_THAT(A(c, 0), WithinAbs(static_cast<double>(c + 1), 1e-12));
    REQUIRE_THAT(A(c, 1), WithinAbs(2.0 * static_cast<double>(c + 1), 1e-12));
  }
}

TEST_CASE("Masked atoms drop their force and site energy rows",
          "[assembly]") {
  auto config = line_config(3);
  auto forces = filled(3, 3, 0.0);
  for (size_t c = 0; c < 9; ++c) {
    forces.data()[c] = 0.1 * static_cast<double>(c);
  }
  config.set("force", forces)
      .set("pae", std::vector<double>{-1.0, -2.0, -3.0})
      .set("mask", std::vector<double>{1.0, 0.0, 1.0});
  std::vector<acefit::ObservationRecord> records{
      {config, {.force = "force", .pae = "pae", .mask = "mask"}}};

  const auto sys = acefit::assemble(records, FakeBasis{});
  REQUIRE(sys.rows() == 6 + 2);

  // Force rows skip atom 1, flat components 3..5.
  const std::vector<double> expected_components{0, 1, 2, 6, 7, 8};
  for (size_t r = 0; r < expected_components.size(); ++r) {
    const double c = expected_components[r];
    REQUIRE_THAT(sys.y[r], WithinAbs(0.1 * c, 1e-12));
    REQUIRE_THAT(sys.A(r, 0), WithinAbs(c + 1.0, 1e-12));
  }

  // Site energy rows for atoms 0 and 2 carry weight one.
  REQUIRE_THAT(sys.y[6], WithinAbs(-1.0, 1e-12));
  REQUIRE_THAT(sys.y[7], WithinAbs(-3.0, 1e-12));
  REQUIRE_THAT(sys.A(6, 1), WithinAbs(10.0, 1e-12));
  REQUIRE_THAT(sys.A(7, 1), WithinAbs(30.0, 1e-12));
  REQUIRE_THAT(sys.w[6], WithinAbs(1.0, 1e-12));
  REQUIRE_THAT(sys.w[7], WithinAbs(1.0, 1e-12));
}

TEST_CASE("Virial rows use Voigt order", "[assembly]") {
  const acefit::WeightTable weights{{"default", {1.0, 1.0, 4.0}}};
  std::vector<double> flat(9);
  for (size_t e = 0; e < 9; ++e) {
    flat[e] = static_cast<double>(e + 1);
  }
  const std::vector<double> expected{1, 5, 9, 6, 3, 2};

  auto as_vector = line_config(4);
  as_vector.set("virial", flat);
  auto as_rows = line_config(4);
  as_rows.set("virial", acefit::AtomMatrix::FromFlat(3, 3, flat.data()));

  for (const auto *config : {&as_vector, &as_rows}) {
    std::vector<acefit::ObservationRecord> records{
        {*config, {.virial = "virial"}, weights}};
    const auto sys = acefit::assemble(records, FakeBasis{});
    REQUIRE(sys.rows() == 6);
    for (Eigen::Index c = 0; c < 6; ++c) {
      REQUIRE_THAT(sys.y[c], WithinAbs(expected[c], 1e-12));
      REQUIRE_THAT(sys.A(c, 0), WithinAbs(expected[c], 1e-12));
      REQUIRE_THAT(sys.A(c, 1), WithinAbs(2.0 * expected[c], 1e-12));
      REQUIRE_THAT(sys.w[c], WithinAbs(4.0 / 2.0, 1e-12));
    }
  }
}

TEST_CASE("Reference energy shifts energy-like targets", "[assembly]") {
  auto config = line_config(2);
  config.set("energy", -10.0).set("pae", std::vector<double>{-4.0, -6.0});
  const acefit::OneBodyReference ref(std::map<int, double>{{1, -1.0}});
  std::vector<acefit::ObservationRecord> records{
      {config,
       {.energy = "energy", .pae = "pae"},
       acefit::WeightTable::uniform(),
       &ref}};
  const Eigen::VectorXd y = acefit::target_vector(records);
  REQUIRE(y.size() == 3);
  REQUIRE_THAT(y[0], WithinAbs(-8.0, 1e-12));
  REQUIRE_THAT(y[1], WithinAbs(-3.0, 1e-12));
  REQUIRE_THAT(y[2], WithinAbs(-5.0, 1e-12));
}

TEST_CASE("Assembly is consistent across record sets", "[assembly]") {
  const acefit::RecordKeys keys{.energy = "energy",
                                .force = "force",
                                .virial = "virial",
                                .pae = "pae",
                                .mask = "mask"};
  auto a = line_config(2);
  a.set("energy", -3.0).set("force", filled(2, 3, 0.25));
  auto b = line_config(3);
  b.set("energy", -5.0)
      .set("virial", std::vector<double>(9, 0.5))
      .set("pae", std::vector<double>{1.0, 2.0, 3.0})
      .set("mask", std::vector<double>{0.0, 1.0, 1.0});
  auto c = line_config(1);
  c.set("mask", std::vector<double>{1.0});
  const FakeBasis basis;

  std::vector<acefit::ObservationRecord> first{{a, keys}};
  std::vector<acefit::ObservationRecord> second{{b, keys}, {c, keys}};
  std::vector<acefit::ObservationRecord> both{{a, keys}, {b, keys}, {c, keys}};

  const auto sa = acefit::assemble(first, basis);
  const auto sb = acefit::assemble(second, basis);
  const auto sab = acefit::assemble(both, basis);

  SECTION("Row counts agree") {
    const auto n = static_cast<Eigen::Index>(acefit::count_observations(both));
    REQUIRE(n == 1 + 6 + 1 + 6 + 2);
    REQUIRE(sab.A.rows() == n);
    REQUIRE(sab.y.size() == n);
    REQUIRE(sab.w.size() == n);
  }

  SECTION("Concatenation") {
    Eigen::MatrixXd A(sa.rows() + sb.rows(), sa.cols());
    A << sa.A, sb.A;
    Eigen::VectorXd y(sa.rows() + sb.rows());
    y << sa.y, sb.y;
    Eigen::VectorXd w(sa.rows() + sb.rows());
    w << sa.w, sb.w;
    REQUIRE(sab.A.isApprox(A));
    REQUIRE(sab.y.isApprox(y));
    REQUIRE(sab.w.isApprox(w));
  }
}

TEST_CASE("Records without observations give empty outputs", "[assembly]") {
  auto config = line_config(2);
  config.set("mask", std::vector<double>{1.0, 1.0});
  std::vector<acefit::ObservationRecord> records{
      {config, {.energy = "energy", .force = "force", .mask = "mask"}}};
  const auto sys = acefit::assemble(records, FakeBasis{});
  REQUIRE(sys.rows() == 0);
  REQUIRE(sys.cols() == 2);
  REQUIRE(sys.y.size() == 0);
  REQUIRE(sys.w.size() == 0);
}

namespace {

class ShortBasis : public FakeBasis {
public:
  std::vector<double> energy(const acefit::Configuration &) const override {
    return {1.0};
  }
};

} // namespace

TEST_CASE("Basis results of the wrong length are rejected", "[assembly]") {
  auto config = line_config(2);
  config.set("energy", -1.0);
  std::vector<acefit::ObservationRecord> records{
      {config, {.energy = "energy"}}};
  REQUIRE_THROWS_AS(acefit::feature_matrix(records, ShortBasis{}),
                    acefit::ShapeError);
  REQUIRE_THROWS_WITH(
      acefit::feature_matrix(records, ShortBasis{}),
      ContainsSubstring("basis returned 1 energies for 2 functions"));
}
