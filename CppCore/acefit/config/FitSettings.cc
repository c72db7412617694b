// MIT License
// Copyright 2023--present acefit developers

#include "acefit/config/FitSettings.hpp"

#include <string>

#include <yaml-cpp/yaml.h>

#include "acefit/Log.hpp"
#include "acefit/errors.hpp"

namespace acefit::config {

namespace {

std::string join(const std::string &parent, const std::string &child) {
  return parent.empty() ? child : parent + "." + child;
}

std::string scalar_string(const YAML::Node &node, const std::string &path) {
  if (!node.IsScalar()) {
    throw ConfigError(path, "expected a string");
  }
  return node.Scalar();
}

double scalar_double(const YAML::Node &node, const std::string &path) {
  if (!node.IsScalar()) {
    throw ConfigError(path, "expected a number");
  }
  try {
    return node.as<double>();
  } catch (const YAML::BadConversion &) {
    throw ConfigError(path, "'" + node.Scalar() + "' is not a number");
  }
}

/**
 * @brief Reads an observable key; null disables it.
 */
void read_key(const YAML::Node &root, const char *name,
              std::optional<std::string> &dest) {
  const YAML::Node node = root[name];
  if (!node) {
    return;
  }
  if (node.IsNull()) {
    dest.reset();
    return;
  }
  dest = scalar_string(node, name);
}

Weights read_weights(const YAML::Node &node, const std::string &path) {
  if (!node.IsMap()) {
    throw ConfigError(path, "expected a mapping of E, F and V");
  }
  Weights w;
  for (const auto &entry : node) {
    const std::string component = entry.first.as<std::string>();
    const std::string where = join(path, component);
    double *slot = nullptr;
    if (component == "E") {
      slot = &w.E;
    } else if (component == "F") {
      slot = &w.F;
    } else if (component == "V") {
      slot = &w.V;
    } else {
      log::warn("ignoring unknown weight component '{}'", where);
      continue;
    }
    *slot = scalar_double(entry.second, where);
    if (*slot < 0.0) {
      throw ConfigError(where, "weights must not be negative");
    }
  }
  return w;
}

WeightTable read_weight_table(const YAML::Node &node) {
  if (!node.IsMap()) {
    throw ConfigError("weights", "expected a mapping of group labels");
  }
  WeightTable table;
  for (const auto &entry : node) {
    const std::string label = entry.first.as<std::string>();
    table.set(label, read_weights(entry.second, join("weights", label)));
  }
  return table;
}

SolverSettings read_solver(const YAML::Node &node) {
  if (!node.IsMap()) {
    throw ConfigError("solver", "expected a mapping");
  }
  SolverSettings solver;
  for (const auto &entry : node) {
    const std::string name = entry.first.as<std::string>();
    const std::string where = join("solver", name);
    if (name == "type") {
      const std::string type = scalar_string(entry.second, where);
      if (type == "qr") {
        solver.kind = SolverSettings::Kind::QR;
      } else if (type == "damped") {
        solver.kind = SolverSettings::Kind::Damped;
      } else {
        throw ConfigError(where, "unknown solver '" + type +
                                     "', expected qr or damped");
      }
    } else if (name == "damping") {
      solver.damping = scalar_double(entry.second, where);
      if (solver.damping < 0.0) {
        throw ConfigError(where, "damping must not be negative");
      }
    } else {
      log::warn("ignoring unknown solver setting '{}'", where);
    }
  }
  return solver;
}

FitSettings parse(const YAML::Node &root) {
  FitSettings settings;
  if (!root || root.IsNull()) {
    return settings;
  }
  if (!root.IsMap()) {
    throw ConfigError("", "settings document must be a mapping");
  }
  read_key(root, "energy_key", settings.energy_key);
  read_key(root, "force_key", settings.force_key);
  read_key(root, "virial_key", settings.virial_key);
  read_key(root, "pae_key", settings.pae_key);
  read_key(root, "mask_key", settings.mask_key);
  if (const YAML::Node group = root["group_key"]) {
    settings.group_key = scalar_string(group, "group_key");
  }
  if (const YAML::Node weights = root["weights"]) {
    settings.weights = read_weight_table(weights);
  }
  if (const YAML::Node solver = root["solver"]) {
    settings.solver = read_solver(solver);
  }

  static const char *const known[] = {"energy_key", "force_key", "virial_key",
                                      "pae_key",    "mask_key",  "group_key",
                                      "weights",    "solver"};
  for (const auto &entry : root) {
    const std::string name = entry.first.as<std::string>();
    bool is_known = false;
    for (const char *k : known) {
      is_known = is_known || name == k;
    }
    if (!is_known) {
      log::warn("ignoring unknown setting '{}'", name);
    }
  }
  return settings;
}

} // namespace

RecordKeys FitSettings::record_keys() const {
  return RecordKeys{.energy = energy_key,
                    .force = force_key,
                    .virial = virial_key,
                    .pae = pae_key,
                    .mask = mask_key};
}

FitSettings load_settings_from_string(std::string_view text) {
  YAML::Node root;
  try {
    root = YAML::Load(std::string(text));
  } catch (const YAML::ParserException &e) {
    throw ConfigError("", std::string("malformed YAML: ") + e.what());
  }
  return parse(root);
}

FitSettings load_settings_from_file(const std::string &path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::BadFile &) {
    throw ConfigError("", "cannot read settings file '" + path + "'");
  } catch (const YAML::ParserException &e) {
    throw ConfigError("", "malformed YAML in '" + path + "': " + e.what());
  }
  log::debug("loaded fit settings from {}", path);
  return parse(root);
}

} // namespace acefit::config
