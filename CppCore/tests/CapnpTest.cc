// MIT License
// Copyright 2023--present acefit developers
#include <catch2/catch_all.hpp>
#include <filesystem>
#include <string>

#include "acefit/Assembler.hpp"

#ifdef ACEFIT_HAS_CAPNP
#include <capnp/message.h>

#include "acefit/errors.hpp"
#include "acefit/io/LinearSystem.capnp.h"
#include "acefit/io/LinearSystemIO.hpp"
#include "acefit/types/adapters/capnp/capnp_adapter.hpp"
#endif

namespace fs = std::filesystem;

TEST_CASE("CapnpAdapter: Matrix Conversion", "[capnp]") {
#ifdef ACEFIT_HAS_CAPNP
  Eigen::MatrixXd native(2, 3);
  native << 1.0, 2.0, 3.0, 4.0, 5.0, 6.0;

  ::capnp::MallocMessageBuilder message;
  auto root = message.initRoot<acefit::io::schema::LinearSystem>();
  auto builder = root.initDesignMatrix(6);
  acefit::types::adapt::capnp::populateMatrixToCapnp(builder, native);

  // Row-major on the wire.
  REQUIRE(builder[1] == 2.0);
  REQUIRE(builder[3] == 4.0);

  auto converted = acefit::types::adapt::capnp::convertMatrixFromCapnp(
      builder.asReader(), 2, 3);
  REQUIRE(converted == native);
#else
  SKIP("Cap'n Proto support disabled");
#endif
}

TEST_CASE("Linear systems survive a file round trip", "[capnp]") {
#ifdef ACEFIT_HAS_CAPNP
  acefit::LinearSystem system;
  system.A = Eigen::MatrixXd::Random(7, 3);
  system.y = Eigen::VectorXd::Random(7);
  system.w = Eigen::VectorXd::Constant(7, 0.5);

  const std::string path =
      (fs::temp_directory_path() / "acefit_system.bin").string();
  acefit::io::write_linear_system(path, system);
  const auto loaded = acefit::io::read_linear_system(path);
  fs::remove(path);

  REQUIRE(loaded.rows() == 7);
  REQUIRE(loaded.cols() == 3);
  REQUIRE(loaded.A == system.A);
  REQUIRE(loaded.y == system.y);
  REQUIRE(loaded.w == system.w);

  REQUIRE_THROWS_AS(acefit::io::read_linear_system("/nonexistent/system.bin"),
                    acefit::Error);
#else
  SKIP("Cap'n Proto support disabled");
#endif
}
