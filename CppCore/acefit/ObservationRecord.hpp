#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Observation records: one configuration entering the fit.
 *
 * A record resolves which observables a configuration provides, which
 * weights apply to it and which reference energy is subtracted from its
 * energy-like targets.  Everything is decided once at construction; the
 * record is immutable afterwards and every downstream consumer (row layout,
 * design matrix, targets, weights, errors) reads the same decisions.
 */

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "acefit/Configuration.hpp"
#include "acefit/Evaluators.hpp"
#include "acefit/Observable.hpp"
#include "acefit/WeightTable.hpp"

namespace acefit {

/**
 * @brief Default name of the data entry that labels configuration groups.
 */
inline constexpr const char *kDefaultGroupKey = "config_type";

/**
 * @struct RecordKeys
 * @brief Requested data keys; an empty optional disables the observable.
 */
struct RecordKeys {
  std::optional<std::string> energy; //!< Total energy key.
  std::optional<std::string> force;  //!< Force key.
  std::optional<std::string> virial; //!< Virial key.
  std::optional<std::string> pae;    //!< Per-atom energy key.
  std::optional<std::string> mask;   //!< Atom mask key.
};

/**
 * @class ObservationRecord
 * @brief Immutable view of one configuration prepared for fitting.
 * @ingroup acefit
 *
 * Key resolution is case-insensitive and picks the first stored key that
 * matches.  This is intentional: training sets assembled from several
 * sources routinely mix @c "energy", @c "Energy" and @c "ENERGY".
 *
 * The record borrows the configuration, which must outlive it.
 */
class ObservationRecord {
public:
  /**
   * @brief Resolves keys, weights and the reference energy.
   * @param config     The configuration (borrowed).
   * @param requested  Requested data keys.
   * @param weights    Per-group weight table.
   * @param reference  Optional reference energy capability.
   * @param weight_key Data key whose value selects the weight table entry.
   */
  ObservationRecord(const Configuration &config, const RecordKeys &requested,
                    const WeightTable &weights = WeightTable::uniform(),
                    const ReferenceEnergy *reference = nullptr,
                    const std::string &weight_key = kDefaultGroupKey);

  const Configuration &configuration() const { return *m_config; }

  /**
   * @brief Number of atoms in the configuration.
   * @return N.
   */
  size_t size() const { return m_config->size(); }

  /**
   * @brief Whether an observable resolved to stored data.
   * @param obs The observable.
   * @return True if it contributes rows.
   */
  bool has(Observable obs) const { return m_keys[obs].has_value(); }

  /**
   * @brief Resolved stored key of an observable.
   * @param obs The observable.
   * @return The stored key or an empty optional.
   */
  const std::optional<std::string> &key(Observable obs) const {
    return m_keys[obs];
  }

  const std::optional<std::string> &mask_key() const { return m_mask_key; }

  const Weights &weights() const { return m_weights; }

  /**
   * @brief Reference energy subtracted from energy targets.
   * @return 0 when no reference capability was given.
   */
  double energy_reference() const { return m_energy_ref; }

  /**
   * @brief Stored total energy.
   * @return The energy.
   * @throws acefit::Error if absent, acefit::ShapeError if not a scalar.
   */
  double energy() const;

  /**
   * @brief Stored forces.
   * @return Reference to the stored N x 3 matrix.
   * @throws acefit::Error if absent, acefit::ShapeError if not N x 3.
   */
  const AtomMatrix &forces() const;

  /**
   * @brief Stored virial as a row-major flat tensor.
   * @return Nine components.
   * @throws acefit::Error if absent, acefit::ShapeError on a bad layout.
   */
  std::array<double, 9> virial() const;

  /**
   * @brief Stored per-atom energies.
   * @return Reference to the N stored values.
   * @throws acefit::Error if absent, acefit::ShapeError if not length N.
   */
  const std::vector<double> &site_energies() const;

private:
  /**
   * @brief Fetches the stored value of an observable.
   * @param obs The observable.
   * @return Reference to the value.
   */
  const DataValue &stored(Observable obs) const;

  const Configuration *m_config;               //!< Borrowed configuration.
  ObsTable<std::optional<std::string>> m_keys; //!< Resolved observable keys.
  std::optional<std::string> m_mask_key;       //!< Resolved mask key.
  Weights m_weights;                           //!< Resolved weights.
  double m_energy_ref;                         //!< Reference energy.
};

/**
 * @brief Group label of a configuration.
 * @param config    The configuration.
 * @param group_key Data key holding the label, matched case-insensitively.
 * @return The stored label, or an empty optional when the key is absent
 *         or its value is not a string.
 */
std::optional<std::string> find_group(const Configuration &config,
                                      const std::string &group_key);

/**
 * @brief Group label used for grouped statistics.
 * @param record    The record.
 * @param group_key Data key holding the label.
 * @return The stored label or @c "default".
 */
std::string group_label(const ObservationRecord &record,
                        const std::string &group_key = kDefaultGroupKey);

} // namespace acefit
