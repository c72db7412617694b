#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Atomic configurations and their free-form reference data.
 *
 * A @c Configuration holds positions, atomic numbers and a periodic cell,
 * plus a @c DataStore of auxiliary values (reference energy, forces, virial,
 * per-atom energies, masks, group labels) keyed by arbitrary strings.
 *
 * Keys are case-folded once when inserted.  Lookups by folded key return the
 * first inserted entry whose key folds to the same string, which lets
 * inconsistently labelled datasets (@c "Energy", @c "ENERGY") be resolved
 * with a single requested name.
 */

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "acefit/types/AtomMatrix.hpp"

namespace acefit {

using types::AtomMatrix;
using types::Tensor33;

/**
 * @typedef DataValue
 * @brief A value stored in a configuration's data store.
 *
 * - @c double: scalars such as the reference energy.
 * - @c std::string: labels such as @c config_type.
 * - @c std::vector<double>: per-atom arrays and flat 3x3 virials.
 * - @c AtomMatrix: forces (N x 3) or virials stored as row vectors (3 x 3).
 */
using DataValue =
    std::variant<double, std::string, std::vector<double>, AtomMatrix>;

/**
 * @brief Lowercases an ASCII key.
 * @param key The key to fold.
 * @return The folded copy.
 */
std::string fold_case(std::string_view key);

/**
 * @brief Case-insensitive equality of two keys.
 * @param a First key.
 * @param b Second key.
 * @return True if both fold to the same string.
 */
bool iequals(std::string_view a, std::string_view b);

/**
 * @brief Human readable name of the alternative held by a value.
 * @param value The value to describe.
 * @return One of @c "scalar", @c "string", @c "vector", @c "matrix".
 */
const char *describe(const DataValue &value);

/**
 * @class DataStore
 * @brief Insertion-ordered key/value store with a folded-key index.
 * @ingroup acefit
 */
class DataStore {
public:
  /**
   * @brief One stored entry.
   */
  struct Entry {
    std::string key;    //!< Key as supplied by the caller.
    std::string folded; //!< Lowercase key used for resolution.
    DataValue value;    //!< The stored value.
  };

  /**
   * @brief Inserts or replaces a value.
   *
   * An entry with exactly the same key is replaced in place (its position in
   * the insertion order is kept); otherwise a new entry is appended.
   *
   * @param key   Entry key.
   * @param value Entry value.
   * @return Void.
   */
  void set(const std::string &key, DataValue value);

  /**
   * @brief Resolves a requested key case-insensitively.
   * @param key Requested key in any case.
   * @return The stored key of the first matching entry, or an empty
   *         optional when no key matches.
   */
  std::optional<std::string> resolve(std::string_view key) const;

  /**
   * @brief Whether an entry with exactly this key exists.
   * @param key Exact stored key.
   * @return True if present.
   */
  bool contains(const std::string &key) const;

  /**
   * @brief Fetches a value by exact stored key.
   * @param key Exact stored key, typically a result of @c resolve().
   * @return Reference to the stored value.
   * @throws acefit::Error if the key is absent.
   */
  const DataValue &at(const std::string &key) const;

  /**
   * @brief All entries in insertion order.
   * @return Reference to the entry list.
   */
  const std::vector<Entry> &entries() const { return m_entries; }

  size_t size() const { return m_entries.size(); }

private:
  std::vector<Entry> m_entries; //!< Entries in insertion order.
  std::unordered_map<std::string, size_t>
      m_exact; //!< Exact key to entry index.
  std::unordered_map<std::string, size_t>
      m_folded; //!< Folded key to index of its first entry.
};

/**
 * @class Configuration
 * @brief One atomic structure with attached reference data.
 * @ingroup acefit
 */
class Configuration {
public:
  /**
   * @brief Constructs a configuration.
   * @param positions N x 3 Cartesian positions.
   * @param species   Atomic numbers, one per atom.
   * @param cell      Cell vectors as rows.
   * @throws acefit::ShapeError if positions are not N x 3 or the species
   *         count differs from N.
   */
  Configuration(AtomMatrix positions, std::vector<int> species,
                Tensor33 cell);

  /**
   * @brief Number of atoms.
   * @return N.
   */
  size_t size() const { return m_positions.rows(); }

  const AtomMatrix &positions() const { return m_positions; }
  const std::vector<int> &species() const { return m_species; }
  const Tensor33 &cell() const { return m_cell; }

  DataStore &data() { return m_data; }
  const DataStore &data() const { return m_data; }

  /**
   * @brief Shorthand for @c data().set().
   * @param key   Entry key.
   * @param value Entry value.
   * @return Reference to @c *this for chaining.
   */
  Configuration &set(const std::string &key, DataValue value) {
    m_data.set(key, std::move(value));
    return *this;
  }

private:
  AtomMatrix m_positions;      //!< Atomic positions, one row per atom.
  std::vector<int> m_species;  //!< Atomic numbers.
  Tensor33 m_cell;             //!< Periodic cell, vectors as rows.
  DataStore m_data;            //!< Auxiliary reference data.
};

} // namespace acefit
