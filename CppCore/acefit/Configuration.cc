// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Implementation of the configuration data store.
 */

#include "acefit/Configuration.hpp"

#include <algorithm>
#include <cctype>

#include "acefit/errors.hpp"

namespace acefit {

std::string fold_case(std::string_view key) {
  std::string folded(key);
  std::transform(folded.begin(), folded.end(), folded.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return folded;
}

bool iequals(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(),
                    [](unsigned char x, unsigned char y) {
                      return std::tolower(x) == std::tolower(y);
                    });
}

const char *describe(const DataValue &value) {
  switch (value.index()) {
  case 0:
    return "scalar";
  case 1:
    return "string";
  case 2:
    return "vector";
  default:
    return "matrix";
  }
}

/**
 * @details
 * The folded index only records the first entry for every folded key, so a
 * later @c "ENERGY" never shadows an earlier @c "Energy".
 */
void DataStore::set(const std::string &key, DataValue value) {
  auto it = m_exact.find(key);
  if (it != m_exact.end()) {
    m_entries[it->second].value = std::move(value);
    return;
  }
  const size_t idx = m_entries.size();
  std::string folded = fold_case(key);
  m_folded.emplace(folded, idx);
  m_exact.emplace(key, idx);
  m_entries.push_back(Entry{key, std::move(folded), std::move(value)});
}

std::optional<std::string> DataStore::resolve(std::string_view key) const {
  auto it = m_folded.find(fold_case(key));
  if (it == m_folded.end()) {
    return std::nullopt;
  }
  return m_entries[it->second].key;
}

bool DataStore::contains(const std::string &key) const {
  return m_exact.count(key) > 0;
}

const DataValue &DataStore::at(const std::string &key) const {
  auto it = m_exact.find(key);
  if (it == m_exact.end()) {
    throw Error("no data stored under key '" + key + "'");
  }
  return m_entries[it->second].value;
}

Configuration::Configuration(AtomMatrix positions, std::vector<int> species,
                             Tensor33 cell)
    : m_positions(std::move(positions)), m_species(std::move(species)),
      m_cell(cell) {
  details::require_shape(m_positions.cols() == 3 || m_positions.size() == 0,
                         "positions must be an N x 3 matrix");
  details::require_shape(m_species.size() == m_positions.rows(),
                         "species count does not match the number of atoms");
}

} // namespace acefit
