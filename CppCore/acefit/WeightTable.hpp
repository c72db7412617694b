#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Per-group regression weight tables.
 */

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "acefit/Observable.hpp"

namespace acefit {

/**
 * @class WeightTable
 * @brief Ordered mapping from group label to @c Weights.
 * @ingroup acefit
 *
 * Labels are matched case-insensitively.  The entry labelled @c "default"
 * is the fallback for configurations whose group has no entry of its own.
 */
class WeightTable {
public:
  /**
   * @brief Label of the fallback entry.
   */
  static constexpr std::string_view kDefaultLabel = "default";

  WeightTable() = default;

  /**
   * @brief Constructs from a list of (label, weights) pairs.
   * @param entries Entries in order; later duplicates replace earlier ones.
   */
  WeightTable(std::initializer_list<std::pair<std::string, Weights>> entries);

  /**
   * @brief Table with a single @c default entry of unit weights.
   * @return The table @c {default: {1, 1, 1}}.
   */
  static WeightTable uniform();

  /**
   * @brief Inserts or replaces the weights of a label.
   * @param label   Group label, compared case-insensitively.
   * @param weights Weights for that group.
   * @return Void.
   */
  void set(const std::string &label, Weights weights);

  /**
   * @brief Looks up a label case-insensitively.
   * @param label Group label.
   * @return The weights, or an empty optional.
   */
  std::optional<Weights> find(std::string_view label) const;

  /**
   * @brief Weights for a configuration of group @a label.
   *
   * Tries @a label, then the @c default entry, then unit weights.
   *
   * @param label Group label, or empty optional when the configuration has
   *              no group.
   * @return The resolved weights.
   */
  Weights resolve(const std::optional<std::string> &label) const;

  const std::vector<std::pair<std::string, Weights>> &entries() const {
    return m_entries;
  }

  bool empty() const { return m_entries.empty(); }

private:
  std::vector<std::pair<std::string, Weights>>
      m_entries; //!< Entries in insertion order.
};

/**
 * @brief Default weights of the fitting driver.
 * @return The table @c {default: {E: 30, F: 1, V: 1}}.
 */
WeightTable default_fit_weights();

} // namespace acefit
