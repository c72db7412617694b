#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Fit settings and their YAML loader.
 *
 * A settings document is a flat mapping, every entry optional:
 *
 * @code{.yaml}
 * energy_key: energy      # null disables the observable
 * force_key: force
 * virial_key: virial
 * pae_key: null
 * mask_key: null
 * group_key: config_type
 * weights:
 *   default: {E: 30.0, F: 1.0, V: 1.0}
 *   crystal: {E: 100.0}   # missing components are 1.0
 * solver:
 *   type: damped          # qr or damped
 *   damping: 1.0e-8
 * @endcode
 */

#include <optional>
#include <string>
#include <string_view>

#include "acefit/ObservationRecord.hpp"
#include "acefit/WeightTable.hpp"

namespace acefit::config {

/**
 * @struct SolverSettings
 * @brief Choice of the least-squares solver.
 */
struct SolverSettings {
  enum class Kind { QR, Damped };

  Kind kind = Kind::QR; //!< Solver family.
  double damping = 0.0; //!< Tikhonov parameter, used by @c Kind::Damped.
};

/**
 * @struct FitSettings
 * @brief Everything needed to turn configurations into records and solve.
 */
struct FitSettings {
  std::optional<std::string> energy_key = "energy"; //!< Total energy key.
  std::optional<std::string> force_key = "force";   //!< Force key.
  std::optional<std::string> virial_key = "virial"; //!< Virial key.
  std::optional<std::string> pae_key;               //!< Per-atom energy key.
  std::optional<std::string> mask_key;              //!< Atom mask key.
  std::string group_key = kDefaultGroupKey;         //!< Group label key.
  WeightTable weights = default_fit_weights();      //!< Per-group weights.
  SolverSettings solver;                            //!< Solver choice.

  /**
   * @brief Requested keys in the form records consume.
   * @return The record keys.
   */
  RecordKeys record_keys() const;
};

/**
 * @brief Parses a settings document.
 * @param text YAML text; an empty document yields the defaults.
 * @return The settings.
 * @throws acefit::ConfigError on malformed YAML or invalid values.
 */
FitSettings load_settings_from_string(std::string_view text);

/**
 * @brief Reads and parses a settings file.
 * @param path File path.
 * @return The settings.
 * @throws acefit::ConfigError if the file cannot be read or is invalid.
 */
FitSettings load_settings_from_file(const std::string &path);

} // namespace acefit::config
