// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Implementation of observation record construction.
 */

#include "acefit/ObservationRecord.hpp"

#include <fmt/format.h>

#include "acefit/Virial.hpp"
#include "acefit/errors.hpp"

namespace acefit {

namespace {

std::optional<std::string> resolve_key(const DataStore &store,
                                       const std::optional<std::string> &req) {
  if (!req) {
    return std::nullopt;
  }
  return store.resolve(*req);
}

} // namespace

/**
 * @details
 * Requested keys are folded and looked up once here.  Weights start from
 * the table's @c default entry (or unit weights) and are overridden by the
 * entry matching the configuration's group label, if any.
 */
ObservationRecord::ObservationRecord(const Configuration &config,
                                     const RecordKeys &requested,
                                     const WeightTable &weights,
                                     const ReferenceEnergy *reference,
                                     const std::string &weight_key)
    : m_config(&config), m_energy_ref{0.0} {
  const DataStore &store = config.data();
  m_keys.E = resolve_key(store, requested.energy);
  m_keys.F = resolve_key(store, requested.force);
  m_keys.V = resolve_key(store, requested.virial);
  m_keys.PAE = resolve_key(store, requested.pae);
  m_mask_key = resolve_key(store, requested.mask);

  m_weights = weights.resolve(find_group(config, weight_key));

  if (reference) {
    m_energy_ref = reference->energy(config);
  }
}

const DataValue &ObservationRecord::stored(Observable obs) const {
  const auto &k = m_keys[obs];
  if (!k) {
    throw Error("observable " + std::string(to_string(obs)) +
                " is not available for this configuration");
  }
  return m_config->data().at(*k);
}

double ObservationRecord::energy() const {
  const DataValue &value = stored(Observable::E);
  const auto *e = std::get_if<double>(&value);
  if (e == nullptr) {
    throw ShapeError(fmt::format("energy '{}' is a {}, expected a scalar",
                                 *m_keys.E, describe(value)));
  }
  return *e;
}

const AtomMatrix &ObservationRecord::forces() const {
  const DataValue &value = stored(Observable::F);
  const auto *f = std::get_if<AtomMatrix>(&value);
  details::require_shape(f != nullptr && f->hasShape(size(), 3),
                         "forces '{}' must be a {} x 3 matrix", *m_keys.F,
                         size());
  return *f;
}

std::array<double, 9> ObservationRecord::virial() const {
  return flatten_virial(stored(Observable::V));
}

const std::vector<double> &ObservationRecord::site_energies() const {
  const DataValue &value = stored(Observable::PAE);
  const auto *pae = std::get_if<std::vector<double>>(&value);
  details::require_shape(pae != nullptr && pae->size() == size(),
                         "per-atom energies '{}' must hold {} values",
                         *m_keys.PAE, size());
  return *pae;
}

std::optional<std::string> find_group(const Configuration &config,
                                      const std::string &group_key) {
  auto key = config.data().resolve(group_key);
  if (!key) {
    return std::nullopt;
  }
  const auto *label = std::get_if<std::string>(&config.data().at(*key));
  if (!label) {
    return std::nullopt;
  }
  return *label;
}

std::string group_label(const ObservationRecord &record,
                        const std::string &group_key) {
  return find_group(record.configuration(), group_key)
      .value_or(std::string(WeightTable::kDefaultLabel));
}

} // namespace acefit
